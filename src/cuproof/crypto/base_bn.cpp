#include <cuproof/crypto/base.h>

namespace cuproof::crypto {

static thread_local BN_CTX* g_tls_bn_ctx = nullptr;

static thread_local const mod_t* g_thread_local_storage_mod = nullptr;
static const mod_t* thread_local_storage_mod() { return g_thread_local_storage_mod; }

// Only set by the MODULO macro: the pointer stays valid for the duration of the block.
static void thread_local_storage_set_mod(const mod_t* ptr) { g_thread_local_storage_mod = ptr; }

BN_CTX* bn_t::thread_local_storage_bn_ctx() {  // static
  BN_CTX* ctx = g_tls_bn_ctx;
  if (!ctx) {
    g_tls_bn_ctx = ctx = BN_CTX_new();
    if (!ctx) throw std::bad_alloc();
  }
  return ctx;
}

BIGNUM* bn_t::ptr() const {
  if (!val) {
    val = BN_new();
    if (!val) throw std::bad_alloc();
  }
  return val;
}

bn_t::bn_t() {}

bn_t::~bn_t() { BN_clear_free(val); }

bn_t::bn_t(int src) { set_int64(src); }

bn_t::bn_t(const bn_t& src) { cp_assert(BN_copy(ptr(), src)); }

bn_t::bn_t(bn_t&& src) noexcept(true) : val(src.val) { src.val = nullptr; }

bn_t& bn_t::operator=(const bn_t& src) {
  if (this != &src) cp_assert(BN_copy(ptr(), src));
  return *this;
}

bn_t& bn_t::operator=(bn_t&& src) noexcept(true) {
  if (this != &src) {
    BN_clear_free(val);
    val = src.val;
    src.val = nullptr;
  }
  return *this;
}

void bn_t::set_int64(int64_t src) {
  bool neg = src < 0;
  uint64_t magnitude = neg ? uint64_t(0) - uint64_t(src) : uint64_t(src);
  int res = BN_set_word(ptr(), (BN_ULONG)magnitude);
  cp_assert(res);
  if (neg) BN_set_negative(ptr(), 1);
}

bn_t& bn_t::operator=(int src) {
  set_int64(src);
  return *this;
}

bool bn_t::operator==(const bn_t& src2) const { return compare(*this, src2) == 0; }
bool bn_t::operator!=(const bn_t& src2) const { return compare(*this, src2) != 0; }
bool bn_t::operator>(const bn_t& src2) const { return compare(*this, src2) > 0; }
bool bn_t::operator<(const bn_t& src2) const { return compare(*this, src2) < 0; }
bool bn_t::operator>=(const bn_t& src2) const { return compare(*this, src2) >= 0; }
bool bn_t::operator<=(const bn_t& src2) const { return compare(*this, src2) <= 0; }

bool bn_t::operator==(int src2) const { return compare(*this, bn_t(src2)) == 0; }
bool bn_t::operator!=(int src2) const { return compare(*this, bn_t(src2)) != 0; }
bool bn_t::operator>(int src2) const { return compare(*this, bn_t(src2)) > 0; }
bool bn_t::operator<(int src2) const { return compare(*this, bn_t(src2)) < 0; }
bool bn_t::operator>=(int src2) const { return compare(*this, bn_t(src2)) >= 0; }
bool bn_t::operator<=(int src2) const { return compare(*this, bn_t(src2)) <= 0; }

bn_t& bn_t::operator+=(const bn_t& src2) { return *this = *this + src2; }

bn_t operator+(const bn_t& src1, const bn_t& src2) {
  const mod_t* mod = thread_local_storage_mod();
  if (mod) return mod->add(src1, src2);

  bn_t result;
  int res = BN_add(result, src1, src2);
  cp_assert(res);
  return result;
}

bn_t operator-(const bn_t& src1, const bn_t& src2) {
  const mod_t* mod = thread_local_storage_mod();
  if (mod) return mod->sub(src1, src2);

  bn_t result;
  int res = BN_sub(result, src1, src2);
  cp_assert(res);
  return result;
}

bn_t operator*(const bn_t& src1, const bn_t& src2) {
  const mod_t* mod = thread_local_storage_mod();
  if (mod) return mod->mul(src1, src2);

  bn_t result;
  int res = BN_mul(result, src1, src2, bn_t::thread_local_storage_bn_ctx());
  cp_assert(res);
  return result;
}

bn_t operator+(const bn_t& src1, int src2) { return src1 + bn_t(src2); }
bn_t operator-(const bn_t& src1, int src2) { return src1 - bn_t(src2); }
bn_t operator*(const bn_t& src1, int src2) { return src1 * bn_t(src2); }

bn_t operator%(const bn_t& src1, const mod_t& src2) { return src2.mod(src1); }

bn_t operator-(const bn_t& src1) { return src1.neg(); }

bn_t& bn_t::operator<<=(int value) { return *this = lshift(value); }
bn_t& bn_t::operator>>=(int value) { return *this = rshift(value); }

bn_t bn_t::lshift(int n) const {
  bn_t result;
  int res = BN_lshift(result, *this, n);
  cp_assert(res);
  return result;
}

bn_t bn_t::rshift(int n) const {
  bn_t result;
  int res = BN_rshift(result, *this, n);
  cp_assert(res);
  return result;
}

bn_t operator<<(const bn_t& src1, int src2) { return src1.lshift(src2); }
bn_t operator>>(const bn_t& src1, int src2) { return src1.rshift(src2); }

void bn_t::set_bit(int n, bool bit) {
  int res = bit ? BN_set_bit(ptr(), n) : BN_clear_bit(ptr(), n);
  if (bit) cp_assert(res);
}

bool bn_t::is_bit_set(int n) const { return BN_is_bit_set(*this, n) ? true : false; }

bool bn_t::is_odd() const { return BN_is_odd(*this) ? true : false; }

bn_t bn_t::neg() const {
  const mod_t* mod = thread_local_storage_mod();
  if (mod) return mod->neg(*this);

  if (BN_is_zero(*this)) return *this;

  bn_t result = *this;
  BN_set_negative(result, !BN_is_negative(*this));
  return result;
}

bn_t bn_t::abs() const {
  bn_t result = *this;
  BN_set_negative(result, 0);
  return result;
}

bn_t bn_t::rand_bitlen(int bits, bool top_bit_set) {  // static
  bn_t result;
  int top = top_bit_set ? BN_RAND_TOP_ONE : BN_RAND_TOP_ANY;
  int res = BN_rand(result, bits, top, BN_RAND_BOTTOM_ANY);
  cp_assert(res > 0);
  return result;
}

bn_t bn_t::rand(const bn_t& range) {  // static
  bn_t result;
  int res = BN_rand_range(result, range);
  cp_assert(res > 0);
  return result;
}

int bn_t::get_bin_size() const { return BN_num_bytes(*this); }

int bn_t::get_bits_count() const { return BN_num_bits(*this); }

// Magnitude only, big-endian.
buf_t bn_t::to_bin() const {
  buf_t out(get_bin_size());
  BN_bn2bin(*this, out.data());
  return out;
}

buf_t bn_t::to_bin(int size) const {
  cp_assert(size >= get_bin_size());
  buf_t out(size);
  BN_bn2binpad(*this, out.data(), size);
  return out;
}

bn_t bn_t::from_bin(mem_t mem) {  // static
  bn_t result;
  if (!BN_bin2bn(mem.data, mem.size, result)) throw std::bad_alloc();
  return result;
}

std::string bn_t::to_string() const {
  char* s = BN_bn2dec(*this);
  if (!s) throw std::bad_alloc();
  std::string result = s;
  OPENSSL_free(s);
  return result;
}

bn_t bn_t::from_string(const_char_ptr str) {  // static
  bn_t result;
  BIGNUM* p = result;
  int n = BN_dec2bn(&p, str);
  cp_assert(n > 0 && str[n] == 0);
  return result;
}

bn_t bn_t::from_hex(const_char_ptr str) {  // static
  bn_t result;
  BIGNUM* p = result;
  int n = BN_hex2bn(&p, str);
  cp_assert(n > 0 && str[n] == 0);
  return result;
}

int bn_t::compare(const bn_t& src1, const bn_t& src2) {  // static
  return BN_cmp(src1, src2);
}

int bn_t::sign() const {
  if (BN_is_zero(*this)) return 0;
  if (BN_is_negative(*this)) return -1;
  return +1;
}

// Header is (magnitude size << 1) | sign, followed by the big-endian magnitude.
void bn_t::convert(cuproof::converter_t& converter) {
  uint32_t neg = sign() < 0;
  uint32_t value_size = get_bin_size();
  uint32_t header = (value_size << 1) | neg;
  converter.convert_len(header);

  if (converter.is_write()) {
    if (!converter.is_calc_size()) BN_bn2bin(*this, converter.current());
  } else {
    neg = header & 1;
    value_size = header >> 1;
    if (converter.is_error() || !converter.at_least(value_size)) {
      converter.set_error();
      return;
    }
    if (value_size == 0 && neg) {
      converter.set_error();
      return;
    }
    // a non-canonical leading zero byte would break the re-encoding
    if (value_size > 0 && converter.current()[0] == 0) {
      converter.set_error();
      return;
    }
    auto res = BN_bin2bn(converter.current(), value_size, ptr());
    if (!res) throw std::bad_alloc();
    if (neg) BN_set_negative(ptr(), 1);
  }
  converter.forward(value_size);
}

bn_t bn_t::generate_prime(int bits) {  // static
  bn_t result;
  int res = BN_generate_prime_ex2(result, bits, 0, NULL, NULL, NULL, thread_local_storage_bn_ctx());
  cp_assert(res);
  cp_assert(result.get_bits_count() == bits);
  return result;
}

bool bn_t::prime() const { return BN_check_prime(*this, thread_local_storage_bn_ctx(), NULL) == 1; }

bn_t bn_t::gcd(const bn_t& src1, const bn_t& src2) {  // static
  bn_t result;
  int res = BN_gcd(result, src1, src2, thread_local_storage_bn_ctx());
  // the GCD is never 0 for nonzero input, so 0 signals the failure
  if (res == 0) return 0;
  return result;
}

void bn_t::set_modulo(const mod_t& mod) { thread_local_storage_set_mod(&mod); }
bool bn_t::check_modulo(const mod_t& mod) { return thread_local_storage_mod() != nullptr; }
void bn_t::reset_modulo(const mod_t& mod) { thread_local_storage_set_mod(nullptr); }

std::ostream& operator<<(std::ostream& os, const bn_t& obj) {
  os << obj.to_string();
  return os;
}

// min <= x < max
error_t check_right_open_range(const bn_t& min, const bn_t& x, const bn_t& max) {
  if (x < min || x >= max) return cuproof::error(E_CRYPTO, "check_right_open_range failed");
  return SUCCESS;
}

}  // namespace cuproof::crypto
