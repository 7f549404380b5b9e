#pragma once

namespace cuproof::crypto {

// Positive modulus with the arithmetic reduced by it. Results are always in [0, m).
class mod_t {
 public:
  mod_t();
  ~mod_t();

  mod_t(const mod_t& src);
  mod_t(mod_t&& src);

  mod_t& operator=(const mod_t& src);
  mod_t& operator=(mod_t&& src);

  mod_t(const bn_t& m) { init(m); }

  void convert(cuproof::converter_t&);

  // clang-format off
  bn_t add(const bn_t& a, const bn_t& b) const { bn_t r; _add(r, a, b); return r; }
  bn_t sub(const bn_t& a, const bn_t& b) const { bn_t r; _sub(r, a, b); return r; }
  bn_t neg(const bn_t& a) const                { bn_t r; _neg(r, a);    return r; }
  bn_t mul(const bn_t& a, const bn_t& b) const { bn_t r; _mul(r, a, b); return r; }
  bn_t pow(const bn_t& x, const bn_t& e) const { bn_t r; _pow(r, x, e); return r; }
  bn_t mod(const bn_t& a) const                { bn_t r; _mod(r, a);    return r; }
  bn_t mod(int a) const { return mod(bn_t(a)); }
  // clang-format on

  static bool coprime(const bn_t& a, const mod_t& m);

  // uniform in [0, m)
  bn_t rand() const;

  operator const bn_t&() const { return m; }
  int get_bin_size() const { return m.get_bin_size(); }
  int get_bits_count() const { return m.get_bits_count(); }

  bool operator==(const bn_t& val) const { return m == val; }
  bool operator!=(const bn_t& val) const { return m != val; }
  bool operator==(int val) const { return m == val; }
  bool operator!=(int val) const { return m != val; }
  bool operator>(int val) const { return m > val; }

  const bn_t& value() const { return m; }

 private:
  bn_t m;
  BN_MONT_CTX* mont = nullptr;  // only for odd m > 1

  void init(const bn_t& m);
  void free_mont();

  void _add(bn_t& r, const bn_t& a, const bn_t& b) const;
  void _sub(bn_t& r, const bn_t& a, const bn_t& b) const;
  void _neg(bn_t& r, const bn_t& a) const;
  void _mul(bn_t& r, const bn_t& a, const bn_t& b) const;
  void _pow(bn_t& r, const bn_t& x, const bn_t& e) const;
  void _mod(bn_t& r, const bn_t& a) const;
};

}  // namespace cuproof::crypto
