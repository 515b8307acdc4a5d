// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "MatroidFamilies.hpp"

#include "Subsets.hpp"
#include "Error.hpp"
#include <algorithm>
#include <sstream>

MATQSYM_NAMESPACE_BEGIN

namespace {
  typedef Matroid::Element Element;
  typedef Matroid::ElementSet ElementSet;

  ElementSet range(const Element n) {
    ElementSet set;
    for (Element e = 1; e <= n; ++e)
      set.push_back(e);
    return set;
  }

  void checkSize(const Element n) {
    if (n < 0) {
      std::ostringstream err;
      err << "The size of a ground set cannot be negative, got " << n << '.';
      reportMalformedInput(err.str());
    }
  }
}

Matroid uniformMatroid(const Element n, const Element r) {
  checkSize(n);
  if (r < 0 || r > n) {
    std::ostringstream err;
    err << "The rank of U(r, n) must satisfy 0 <= r <= n, but r = " << r
      << " and n = " << n << '.';
    reportMalformedInput(err.str());
  }

  std::vector<ElementSet> bases;
  for (SubsetIterator<Element> it(n, r); !it.atEnd(); it.next())
    bases.push_back(it.subset());
  return Matroid(range(n), bases);
}

Matroid schubertMatroid(const Element n, const ElementSet& a) {
  checkSize(n);
  ElementSet sorted(a);
  std::sort(sorted.begin(), sorted.end());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
  for (auto it = sorted.begin(); it != sorted.end(); ++it) {
    if (*it <= 0 || *it > n) {
      std::ostringstream err;
      err << "The Schubert matroid sh(" << n << ", A) needs A to be a subset "
        "of {1, ..., " << n << "}, but A contains " << *it << '.';
      reportMalformedInput(err.str());
    }
  }

  const auto rank = static_cast<Element>(sorted.size());
  std::vector<ElementSet> bases;
  for (SubsetIterator<Element> it(n, rank); !it.atEnd(); it.next()) {
    const auto& b = it.subset();
    if (std::equal(b.begin(), b.end(), sorted.begin(),
      [](const Element bi, const Element ai) {return bi <= ai;}))
      bases.push_back(b);
  }
  return Matroid(range(n), bases);
}

std::vector<Matroid> allSchubertMatroids(const Element n) {
  checkSize(n);
  std::vector<Matroid> matroids;
  for (Element rank = 0; rank <= n; ++rank)
    for (SubsetIterator<Element> it(n, rank); !it.atEnd(); it.next())
      matroids.push_back(schubertMatroid(n, it.subset()));
  return matroids;
}

std::vector<Matroid> allLooplessSchubertMatroids(const Element n) {
  checkSize(n);
  std::vector<Matroid> matroids;
  if (n == 0) {
    matroids.push_back(schubertMatroid(0, ElementSet()));
    return matroids;
  }
  for (Element rank = 0; rank < n; ++rank) {
    for (SubsetIterator<Element> it(n - 1, rank); !it.atEnd(); it.next()) {
      ElementSet a(it.subset());
      a.push_back(n);
      matroids.push_back(schubertMatroid(n, a));
    }
  }
  return matroids;
}

MATQSYM_NAMESPACE_END
