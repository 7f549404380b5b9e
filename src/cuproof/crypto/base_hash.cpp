#include <cuproof/crypto/base.h>

namespace cuproof::crypto {

static const hash_alg_t alg_nohash = {hash_e::none, 0, nullptr};
static const hash_alg_t alg_sha256 = {hash_e::sha256, 32, EVP_sha256()};

const hash_alg_t& hash_alg_t::get(hash_e type) {  // static
  if (type == hash_e::sha256) return alg_sha256;
  return alg_nohash;
}

hash_t::hash_t(hash_e type) : alg(hash_alg_t::get(type)) {}

void hash_t::free() {
  if (ctx_ptr) EVP_MD_CTX_free(ctx_ptr);
  ctx_ptr = nullptr;
}

hash_t& hash_t::init() {
  cp_assert(alg.valid());
  if (!ctx_ptr) ctx_ptr = EVP_MD_CTX_new();
  if (!ctx_ptr) throw std::bad_alloc();
  int res = EVP_DigestInit_ex(ctx_ptr, alg.md, nullptr);
  cp_assert(res);
  return *this;
}

hash_t& hash_t::update(const_byte_ptr ptr, int size) {
  if (size == 0) return *this;
  int res = EVP_DigestUpdate(ctx_ptr, ptr, size);
  cp_assert(res);
  return *this;
}

buf_t hash_t::final() {
  buf_t out(alg.size);
  unsigned int n = 0;
  int res = EVP_DigestFinal_ex(ctx_ptr, out.data(), &n);
  cp_assert(res && int(n) == alg.size);
  return out;
}

}  // namespace cuproof::crypto
