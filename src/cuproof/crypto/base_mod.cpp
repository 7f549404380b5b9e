#include <cuproof/crypto/base.h>

namespace cuproof::crypto {

mod_t::mod_t() {}

mod_t::~mod_t() { free_mont(); }

void mod_t::free_mont() {
  if (mont) BN_MONT_CTX_free(mont);
  mont = nullptr;
}

void mod_t::convert(cuproof::converter_t& converter) {
  converter.convert(m);
  if (!converter.is_write()) {
    if (converter.is_error()) return;
    if (m <= 0) {
      converter.set_error();
      return;
    }
    init(m);
  }
}

mod_t::mod_t(const mod_t& src) : m(src.m) {
  if (src.mont) {
    mont = BN_MONT_CTX_new();
    if (!mont) throw std::bad_alloc();

    auto res = BN_MONT_CTX_copy(mont, src.mont);
    cp_assert(res);
  }
}

mod_t::mod_t(mod_t&& src) : m(std::move(src.m)), mont(src.mont) { src.mont = nullptr; }

mod_t& mod_t::operator=(const mod_t& src) {
  if (&src != this) {
    free_mont();
    if (src.mont) {
      mont = BN_MONT_CTX_new();
      if (!mont) throw std::bad_alloc();
      auto res = BN_MONT_CTX_copy(mont, src.mont);
      cp_assert(res);
    }
    m = src.m;
  }
  return *this;
}

mod_t& mod_t::operator=(mod_t&& src) {
  if (&src != this) {
    free_mont();
    mont = src.mont;
    src.mont = nullptr;
    m = std::move(src.m);
  }
  return *this;
}

void mod_t::init(const bn_t& m) {
  cp_assert(m > 0 && "modulus must be positive");
  free_mont();
  this->m = m;

  if (!m.is_odd() || m == 1) return;

  mont = BN_MONT_CTX_new();
  if (!mont) throw std::bad_alloc();

  int res = BN_MONT_CTX_set(mont, m, bn_t::thread_local_storage_bn_ctx());
  cp_assert(res && "BN_MONT_CTX_set failed");
}

void mod_t::_add(bn_t& r, const bn_t& a, const bn_t& b) const {
  int res = BN_mod_add(r, a, b, m, bn_t::thread_local_storage_bn_ctx());
  cp_assert(res);
}

void mod_t::_sub(bn_t& r, const bn_t& a, const bn_t& b) const {
  int res = BN_mod_sub(r, a, b, m, bn_t::thread_local_storage_bn_ctx());
  cp_assert(res);
}

void mod_t::_neg(bn_t& r, const bn_t& a) const { _sub(r, bn_t(0), a); }

void mod_t::_mul(bn_t& r, const bn_t& a, const bn_t& b) const {
  int res = BN_mod_mul(r, a, b, m, bn_t::thread_local_storage_bn_ctx());
  cp_assert(res);
}

void mod_t::_pow(bn_t& r, const bn_t& x, const bn_t& e) const {
  cp_assert(e.sign() >= 0 && "only support non-negative exponent");
  if (m == 1) {
    r = 0;
    return;
  }

  bn_t x_mod = mod(x);
  int res;
  if (mont) res = BN_mod_exp_mont_consttime(r, x_mod, e, m, bn_t::thread_local_storage_bn_ctx(), mont);
  else res = BN_mod_exp(r, x_mod, e, m, bn_t::thread_local_storage_bn_ctx());
  cp_assert(res);
}

void mod_t::_mod(bn_t& r, const bn_t& a) const {
  int res = BN_nnmod(r, a, m, bn_t::thread_local_storage_bn_ctx());
  cp_assert(res);
}

bn_t mod_t::rand() const { return bn_t::rand(m); }

bool mod_t::coprime(const bn_t& a, const mod_t& m) {  // static
  return bn_t::gcd(m.mod(a), m.m) == 1;
}

}  // namespace cuproof::crypto
