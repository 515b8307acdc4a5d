// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Matroid.hpp"

#include "AlgebraIO.hpp"
#include "Error.hpp"
#include "LogDomain.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>

MATQSYM_DEFINE_LOG_DOMAIN(
  MatroidValidate,
  "Displays the time spent checking the basis exchange axiom and counts the "
  "number of ordered pairs of bases that were checked."
);

MATQSYM_NAMESPACE_BEGIN

namespace {
  typedef Matroid::Element Element;
  typedef Matroid::ElementSet ElementSet;

  void writeSet(std::ostream& out, const ElementSet& set) {
    AlgebraIO().writeElementSet(set, out);
  }

  std::string setToString(const ElementSet& set) {
    std::ostringstream out;
    writeSet(out, set);
    return out.str();
  }

  // Sorts set, removes repeated elements and reports non-positive ones.
  void normalize(ElementSet& set) {
    std::sort(set.begin(), set.end());
    set.erase(std::unique(set.begin(), set.end()), set.end());
    if (!set.empty() && set.front() <= 0) {
      std::ostringstream err;
      err << "The elements of a matroid must be positive integers, got "
        << set.front() << '.';
      reportMalformedInput(err.str());
    }
  }

  bool contains(const ElementSet& set, const Element e) {
    return std::binary_search(set.begin(), set.end(), e);
  }

  ElementSet difference(const ElementSet& a, const ElementSet& b) {
    ElementSet diff;
    std::set_difference(
      a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(diff)
    );
    return diff;
  }

  // Returns (set - remove) + add, where remove is in set and add is not.
  ElementSet exchange(
    const ElementSet& set,
    const Element remove,
    const Element add
  ) {
    ElementSet result;
    result.reserve(set.size());
    for (auto it = set.begin(); it != set.end(); ++it)
      if (*it != remove)
        result.push_back(*it);
    result.insert(std::lower_bound(result.begin(), result.end(), add), add);
    return result;
  }
}

Matroid::Matroid(ElementSet groundSet, const std::vector<ElementSet>& bases) {
  construct(std::move(groundSet), bases, ExchangeAxiomValidator());
}

Matroid::Matroid(
  ElementSet groundSet,
  const std::vector<ElementSet>& bases,
  const BasisValidator& validator
) {
  construct(std::move(groundSet), bases, validator);
}

void Matroid::construct(
  ElementSet groundSet,
  const std::vector<ElementSet>& bases,
  const BasisValidator& validator
) {
  normalize(groundSet);
  mGroundSet = std::move(groundSet);

  for (auto it = bases.begin(); it != bases.end(); ++it) {
    ElementSet basis(*it);
    normalize(basis);
    mBases.insert(std::move(basis));
  }

  if (mBases.empty())
    reportInvalidMatroid("A matroid must have at least one basis.");
  const auto rank = mBases.begin()->size();
  for (auto it = mBases.begin(); it != mBases.end(); ++it) {
    if (it->size() != rank) {
      reportInvalidMatroid("The bases " + setToString(*mBases.begin()) +
        " and " + setToString(*it) + " do not have the same size.");
    }
    if (!std::includes
      (mGroundSet.begin(), mGroundSet.end(), it->begin(), it->end())) {
      reportInvalidMatroid("The basis " + setToString(*it) +
        " is not a subset of the ground set " + setToString(mGroundSet) + '.');
    }
  }

  validator.validate(mGroundSet, mBases);
}

bool Matroid::isBasis(const ElementSet& set) const {
  return mBases.find(set) != mBases.end();
}

size_t Matroid::rank(const ElementSet& subset) const {
  ElementSet sorted(subset);
  std::sort(sorted.begin(), sorted.end());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

  size_t maxRank = 0;
  for (auto basis = mBases.begin(); basis != mBases.end(); ++basis) {
    size_t common = 0;
    for (auto it = basis->begin(); it != basis->end(); ++it)
      if (contains(sorted, *it))
        ++common;
    maxRank = std::max(maxRank, common);
  }
  return maxRank;
}

std::set<ElementSet> Matroid::independentSets() const {
  if (rank() >= 64) {
    std::ostringstream err;
    err << "Cannot list the independent sets of a matroid of rank "
      << rank() << ". The rank must be less than 64.";
    reportDomainMismatch(err.str());
  }
  std::set<ElementSet> independent;
  const uint64 subsetCount = static_cast<uint64>(1) << rank();
  for (auto basis = mBases.begin(); basis != mBases.end(); ++basis) {
    for (uint64 mask = 0; mask < subsetCount; ++mask) {
      ElementSet subset;
      for (size_t i = 0; i < basis->size(); ++i)
        if ((mask >> i) & 1)
          subset.push_back((*basis)[i]);
      independent.insert(std::move(subset));
    }
  }
  return independent;
}

Matroid Matroid::extend(const std::vector<Element>& elements) const {
  ElementSet groundSet(mGroundSet);
  BasisFamily bases(mBases);
  for (auto e = elements.begin(); e != elements.end(); ++e) {
    if (contains(groundSet, *e)) {
      std::ostringstream err;
      err << "Cannot extend a matroid by " << *e
        << " since it is already in the ground set.";
      reportStructuralViolation(err.str());
    }
    groundSet.insert
      (std::lower_bound(groundSet.begin(), groundSet.end(), *e), *e);

    // Iterate over the family as it was before e was added.
    const BasisFamily before(bases);
    for (auto basis = before.begin(); basis != before.end(); ++basis)
      for (auto i = basis->begin(); i != basis->end(); ++i)
        if (contains(mGroundSet, *i))
          bases.insert(exchange(*basis, *i, *e));
  }
  return Matroid(
    std::move(groundSet),
    std::vector<ElementSet>(bases.begin(), bases.end())
  );
}

Matroid Matroid::relabel(const Relabeling& bijection) const {
  ElementSet groundSet;
  for (auto it = mGroundSet.begin(); it != mGroundSet.end(); ++it) {
    const auto image = bijection.find(*it);
    if (image == bijection.end()) {
      std::ostringstream err;
      err << "The relabeling does not say where to send " << *it << '.';
      reportStructuralViolation(err.str());
    }
    groundSet.push_back(image->second);
  }
  ElementSet sorted(groundSet);
  std::sort(sorted.begin(), sorted.end());
  if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
    reportStructuralViolation("The relabeling is not injective.");

  std::vector<ElementSet> bases;
  bases.reserve(mBases.size());
  for (auto basis = mBases.begin(); basis != mBases.end(); ++basis) {
    ElementSet image;
    image.reserve(basis->size());
    for (auto it = basis->begin(); it != basis->end(); ++it)
      image.push_back(bijection.find(*it)->second);
    bases.push_back(std::move(image));
  }
  return Matroid(std::move(groundSet), bases);
}

std::string Matroid::toString() const {
  std::ostringstream out;
  write(out);
  return out.str();
}

void Matroid::write(std::ostream& out) const {
  AlgebraIO().writeMatroid(*this, out);
}

std::ostream& operator<<(std::ostream& out, const Matroid& matroid) {
  matroid.write(out);
  return out;
}

BasisValidator::~BasisValidator() {}

void ExchangeAxiomValidator::validate(
  const Matroid::ElementSet& groundSet,
  const Matroid::BasisFamily& bases
) const {
  MATQSYM_LOG_TIME(MatroidValidate)
    << "Checking the exchange axiom for " << bases.size() << " bases on "
    << groundSet.size() << " elements.\n";

  const auto end = bases.end();
  for (auto b1 = bases.begin(); b1 != end; ++b1) {
    for (auto b2 = bases.begin(); b2 != end; ++b2) {
      if (b1 == b2)
        continue;
      MATQSYM_LOG_INCREMENT(MatroidValidate);

      const auto onlyIn1 = difference(*b1, *b2);
      const auto onlyIn2 = difference(*b2, *b1);
      for (auto i = onlyIn2.begin(); i != onlyIn2.end(); ++i) {
        bool found = false;
        for (auto j = onlyIn1.begin(); j != onlyIn1.end() && !found; ++j)
          found = bases.find(exchange(*b2, *i, *j)) != end;
        if (!found) {
          std::ostringstream err;
          err << "The bases violate the exchange axiom: for B1 = ";
          writeSet(err, *b1);
          err << ", B2 = ";
          writeSet(err, *b2);
          err << " and i = " << *i << " there is no j in B1 \\ B2 such "
            "that (B2 + j) - i is a basis.";
          reportInvalidMatroid(err.str());
        }
      }
    }
  }
}

MATQSYM_NAMESPACE_END
