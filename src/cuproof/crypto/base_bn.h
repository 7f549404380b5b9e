#pragma once

namespace cuproof::crypto {

class mod_t;

// Arbitrary-precision signed integer over an OpenSSL BIGNUM.
//
// Arithmetic is plain integer arithmetic, except inside a MODULO(n) block where +, -, * and neg
// are reduced modulo n by the thread-local modulus.
class bn_t {
  friend std::ostream& operator<<(std::ostream& os, const bn_t& obj);

 public:
  operator const BIGNUM*() const { return ptr(); }
  operator BIGNUM*() { return ptr(); }
  bn_t();

  ~bn_t();
  bn_t(int src);
  bn_t(const bn_t& src);
  bn_t(bn_t&& src) noexcept(true);

  bn_t& operator=(int src);
  bn_t& operator=(const bn_t& src);
  bn_t& operator=(bn_t&& src) noexcept(true);
  bool operator==(const bn_t& val) const;
  bool operator!=(const bn_t& val) const;
  bool operator>(const bn_t& val) const;
  bool operator<(const bn_t& val) const;
  bool operator>=(const bn_t& val) const;
  bool operator<=(const bn_t& val) const;
  bool operator==(int val) const;
  bool operator!=(int val) const;
  bool operator>(int val) const;
  bool operator<(int val) const;
  bool operator>=(int val) const;
  bool operator<=(int val) const;

  bn_t& operator+=(const bn_t& val);
  bn_t& operator<<=(int val);
  bn_t& operator>>=(int val);

  static bn_t rand(const bn_t& range);
  static bn_t rand_bitlen(int bits, bool top_bit_set = false);

  bn_t neg() const;
  bn_t abs() const;  // never reduced, even inside MODULO
  bool is_odd() const;

  bn_t lshift(int n) const;
  bn_t rshift(int n) const;
  bool is_bit_set(int n) const;
  void set_bit(int n, bool bit);

  static bn_t generate_prime(int bits);
  bool prime() const;
  static bn_t gcd(const bn_t& val1, const bn_t& val2);

  int get_bin_size() const;
  int get_bits_count() const;
  buf_t to_bin() const;
  buf_t to_bin(int size) const;
  static bn_t from_bin(mem_t mem);

  std::string to_string() const;

  static bn_t from_string(const_char_ptr str);
  static bn_t from_string(const std::string& str) { return from_string(str.c_str()); }
  static bn_t from_hex(const_char_ptr str);
  static bn_t from_hex(const std::string& str) { return from_hex(str.c_str()); }

  static int compare(const bn_t& b1, const bn_t& b2);
  int sign() const;

  static void set_modulo(const bn_t& n) = delete;
  static bool check_modulo(const bn_t& n) = delete;
  static void reset_modulo(const bn_t& n) = delete;

  static void set_modulo(const mod_t& n);
  static bool check_modulo(const mod_t& n);
  static void reset_modulo(const mod_t& n);

  void convert(cuproof::converter_t& converter);

  // thread local storage for BN_CTX
  static BN_CTX* thread_local_storage_bn_ctx();

 private:
  mutable BIGNUM* val = nullptr;  // allocated on first use, null after a move
  BIGNUM* ptr() const;
  void set_int64(int64_t value);
};

#define MODULO(n)                                                                    \
  for (cuproof::crypto::bn_t::set_modulo(n); cuproof::crypto::bn_t::check_modulo(n); \
       cuproof::crypto::bn_t::reset_modulo(n))

bn_t operator+(const bn_t& b1, const bn_t& b2);
bn_t operator-(const bn_t& b1, const bn_t& b2);
bn_t operator*(const bn_t& b1, const bn_t& b2);
bn_t operator%(const bn_t& b1, const mod_t& b2);
bn_t operator-(const bn_t& b1);

bn_t operator+(const bn_t& b1, int b2);
bn_t operator-(const bn_t& b1, int b2);
bn_t operator*(const bn_t& b1, int b2);

bn_t operator<<(const bn_t& val1, int val2);
bn_t operator>>(const bn_t& val1, int val2);

error_t check_right_open_range(const bn_t& min, const bn_t& x, const bn_t& max);  // min <= x < max

}  // namespace cuproof::crypto
