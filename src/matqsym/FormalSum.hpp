// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_FORMAL_SUM_GUARD
#define MATQSYM_FORMAL_SUM_GUARD

#include "Coefficient.hpp"
#include <map>
#include <string>
#include <sstream>
#include <ostream>

MATQSYM_NAMESPACE_BEGIN

/// A finite integer linear combination of monomials M_k where k is a Key.
/// Key is Composition for QSym and SetComposition for NCQSym.
///
/// Multiplication is the bilinear extension of the quasi-shuffle product
/// that Cache::quasiShuffle computes. Terms with coefficient zero may be
/// present, but they are ignored by equality and are not printed.
///
/// Formal sums are values. No operation changes its operands.
template<class K, class C>
class FormalSum {
public:
  typedef K Key;
  typedef C Cache;
  typedef std::map<Key, Coefficient> Terms;

  /// Constructs the zero function.
  FormalSum() {}

  /// Constructs the monomial M_key.
  explicit FormalSum(const Key& key) {mTerms[key] = 1;}

  explicit FormalSum(Terms terms): mTerms(std::move(terms)) {}

  /// Parses each key with Key::parse. Keys that parse to the same value
  /// have their coefficients added.
  explicit FormalSum(const std::map<std::string, Coefficient>& terms) {
    for (auto it = terms.begin(); it != terms.end(); ++it)
      mTerms[Key::parse(it->first)] += it->second;
  }

  const Terms& terms() const {return mTerms;}

  /// Returns the coefficient of M_key, which is zero if there is no such
  /// term.
  Coefficient coefficient(const Key& key) const {
    const auto it = mTerms.find(key);
    return it == mTerms.end() ? Coefficient(0) : it->second;
  }

  /// Returns true if every coefficient is zero.
  bool isZero() const {
    for (auto it = mTerms.begin(); it != mTerms.end(); ++it)
      if (it->second != 0)
        return false;
    return true;
  }

  FormalSum operator+(const FormalSum& g) const {
    FormalSum sum(*this);
    for (auto it = g.mTerms.begin(); it != g.mTerms.end(); ++it)
      sum.mTerms[it->first] += it->second;
    return sum;
  }

  FormalSum operator*(const Coefficient& scalar) const {
    FormalSum product(*this);
    for (auto it = product.mTerms.begin(); it != product.mTerms.end(); ++it)
      it->second *= scalar;
    return product;
  }

  /// Returns the product of this and g using the quasi-shuffle products
  /// in cache.
  FormalSum multiply(const FormalSum& g, Cache& cache) const {
    FormalSum product;
    for (auto t = mTerms.begin(); t != mTerms.end(); ++t) {
      for (auto q = g.mTerms.begin(); q != g.mTerms.end(); ++q) {
        const Coefficient c = t->second * q->second;
        if (c == 0)
          continue;
        const auto& shuffle = cache.quasiShuffle(t->first, q->first);
        for (auto r = shuffle.begin(); r != shuffle.end(); ++r)
          product.mTerms[r->first] += c * r->second;
      }
    }
    return product;
  }

  /// Returns the product of this and g using Cache::global().
  FormalSum operator*(const FormalSum& g) const {
    return multiply(g, Cache::global());
  }

  /// Two formal sums are equal if they have the same non-zero terms.
  bool operator==(const FormalSum& g) const {
    return nonZeroTerms() == g.nonZeroTerms();
  }
  bool operator!=(const FormalSum& g) const {return !(*this == g);}

  /// Writes the terms in key order in the format 2 M(1,1) - M(2). The zero
  /// function is written as 0.
  void write(std::ostream& out) const {
    bool first = true;
    for (auto it = mTerms.begin(); it != mTerms.end(); ++it) {
      const auto sign = sgn(it->second);
      if (sign == 0)
        continue;
      if (sign < 0)
        out << (first ? "- " : " - ");
      else if (!first)
        out << " + ";
      first = false;

      const Coefficient magnitude = abs(it->second);
      if (magnitude != 1)
        out << magnitude << ' ';
      out << 'M' << it->first;
    }
    if (first)
      out << '0';
  }

  std::string toString() const {
    std::ostringstream out;
    write(out);
    return out.str();
  }

private:
  Terms nonZeroTerms() const {
    Terms terms;
    for (auto it = mTerms.begin(); it != mTerms.end(); ++it)
      if (it->second != 0)
        terms.insert(terms.end(), *it);
    return terms;
  }

  Terms mTerms;
};

template<class K, class C>
FormalSum<K, C> operator*(
  const Coefficient& scalar,
  const FormalSum<K, C>& f
) {
  return f * scalar;
}

template<class K, class C>
std::ostream& operator<<(std::ostream& out, const FormalSum<K, C>& f) {
  f.write(out);
  return out;
}

MATQSYM_NAMESPACE_END

#endif
