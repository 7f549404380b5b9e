#pragma once

#include <openssl/evp.h>

#include <cuproof/core/strext.h>

namespace cuproof::crypto {

enum class hash_e {
  none = NID_undef,
  sha256 = NID_sha256,
};

struct hash_alg_t {
  hash_e type;
  int size;
  const EVP_MD* md;

  bool valid() const { return type != hash_e::none; }

  static const hash_alg_t& get(hash_e type);
};

// Incremental digest over an EVP_MD_CTX.
class hash_t {
 public:
  explicit hash_t(hash_e type);
  ~hash_t() { free(); }

  hash_t(const hash_t&) = delete;
  hash_t& operator=(const hash_t&) = delete;

  void free();

  hash_t& init();
  hash_t& update(const_byte_ptr ptr, int size);
  hash_t& update(mem_t v) { return update(v.data, v.size); }
  hash_t& update(const std::string& v) { return update(strext::mem(v)); }
  buf_t final();

 private:
  const hash_alg_t& alg;
  EVP_MD_CTX* ctx_ptr = nullptr;
};

template <hash_e hash_type>
class hash_template_t {
 public:
  hash_template_t() : state(hash_type) { state.init(); }

  template <typename T>
  hash_template_t& update(const T& v) {
    state.update(v);
    return *this;
  }

  // Digest of the concatenation of args, with no separators.
  template <typename... ARGS>
  static buf_t hash(const ARGS&... args) {
    hash_template_t h;
    (h.update(args), ...);
    return h.final();
  }

  buf_t final() { return state.final(); }

 private:
  hash_t state;
};

typedef hash_template_t<hash_e::sha256> sha256_t;

}  // namespace cuproof::crypto
