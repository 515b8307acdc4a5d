// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_MATROID_GUARD
#define MATQSYM_MATROID_GUARD

#include <vector>
#include <set>
#include <map>
#include <string>
#include <ostream>

MATQSYM_NAMESPACE_BEGIN

class BasisValidator;

/// A matroid given by its ground set and its family of bases.
///
/// The family of bases is non-empty, all bases have the same size, the rank,
/// and every basis is a subset of the ground set. The family also satisfies
/// the basis exchange axiom: for any two distinct bases B1 and B2 and any i
/// in B2 \ B1 there is some j in B1 \ B2 such that (B2 + j) - i is a basis.
/// A Matroid object cannot be constructed from a family that violates these
/// conditions.
///
/// Matroids are values. extend() and relabel() return new matroids.
class Matroid {
public:
  typedef int32 Element;

  /// A set of elements as a vector sorted in ascending order.
  typedef std::vector<Element> ElementSet;

  typedef std::set<ElementSet> BasisFamily;
  typedef std::map<Element, Element> Relabeling;

  /// The sets passed in need not be sorted and repeated elements are
  /// ignored. Throws MalformedInputError if an element is not positive and
  /// InvalidMatroidError if bases is not the family of bases of a matroid
  /// on groundSet. The exchange axiom is checked by an
  /// ExchangeAxiomValidator.
  Matroid(ElementSet groundSet, const std::vector<ElementSet>& bases);

  /// As above, but the exchange axiom is checked by validator.
  Matroid(
    ElementSet groundSet,
    const std::vector<ElementSet>& bases,
    const BasisValidator& validator
  );

  const ElementSet& groundSet() const {return mGroundSet;}
  const BasisFamily& bases() const {return mBases;}

  bool isBasis(const ElementSet& set) const;

  /// Returns the size of the bases.
  size_t rank() const {return mBases.begin()->size();}

  /// Returns the maximal size of the intersection of subset with a basis.
  /// subset need not be sorted.
  size_t rank(const ElementSet& subset) const;

  /// Returns every subset of every basis. This is exponential in the rank.
  /// Throws DomainMismatchError if the rank is 64 or more.
  std::set<ElementSet> independentSets() const;

  /// Adds the elements to the ground set one at a time. For each new
  /// element e, every basis B of the matroid built so far and every i in B
  /// that belongs to the original ground set contributes the basis
  /// (B - i) + e. Throws StructuralViolationError if an element is already
  /// in the ground set.
  Matroid extend(const std::vector<Element>& elements) const;

  /// Replaces each element e by bijection[e]. Throws
  /// StructuralViolationError if bijection does not map every element of
  /// the ground set or maps two of them to the same element.
  Matroid relabel(const Relabeling& bijection) const;

  std::string toString() const;

  /// Writes the format ({1,2,3}, {{1,2},{1,3},{2,3}}).
  void write(std::ostream& out) const;

  bool operator==(const Matroid& m) const {
    return mGroundSet == m.mGroundSet && mBases == m.mBases;
  }
  bool operator!=(const Matroid& m) const {return !(*this == m);}

private:
  void construct(
    ElementSet groundSet,
    const std::vector<ElementSet>& bases,
    const BasisValidator& validator
  );

  ElementSet mGroundSet;
  BasisFamily mBases;
};

std::ostream& operator<<(std::ostream& out, const Matroid& matroid);

/// Checks the basis exchange axiom of a family of bases. Derive from this
/// class to replace the brute force check of ExchangeAxiomValidator.
class BasisValidator {
public:
  virtual ~BasisValidator();

  /// Throws InvalidMatroidError if the exchange axiom does not hold for
  /// bases. When this is called, bases is non-empty, its sets all have the
  /// same size and they are all subsets of groundSet.
  virtual void validate(
    const Matroid::ElementSet& groundSet,
    const Matroid::BasisFamily& bases
  ) const = 0;
};

/// Checks every i in B2 \ B1 for every ordered pair (B1, B2) of distinct
/// bases. This takes O(b^2 r^2) lookups for b bases of rank r, so it is
/// expensive for matroids with many bases.
class ExchangeAxiomValidator : public BasisValidator {
public:
  virtual void validate(
    const Matroid::ElementSet& groundSet,
    const Matroid::BasisFamily& bases
  ) const;
};

MATQSYM_NAMESPACE_END

#endif
