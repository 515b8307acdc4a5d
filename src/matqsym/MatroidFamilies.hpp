// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_MATROID_FAMILIES_GUARD
#define MATQSYM_MATROID_FAMILIES_GUARD

#include "Matroid.hpp"
#include <vector>

MATQSYM_NAMESPACE_BEGIN

/// Returns the uniform matroid U(r, n) on {1, ..., n} whose bases are all
/// r-subsets. Throws MalformedInputError unless 0 <= r <= n.
Matroid uniformMatroid(Matroid::Element n, Matroid::Element r);

/// Returns the Schubert matroid sh(n, A) on {1, ..., n}. If
/// A = {a1 < ... < ar} then B = {b1 < ... < br} is a basis if bi <= ai for
/// all i. Throws MalformedInputError if n is negative or if A has an
/// element outside {1, ..., n}.
Matroid schubertMatroid(Matroid::Element n, const Matroid::ElementSet& a);

/// Returns sh(n, A) for every subset A of {1, ..., n}, ordered by the size
/// of A and then lexicographically.
std::vector<Matroid> allSchubertMatroids(Matroid::Element n);

/// Returns the Schubert matroids sh(n, A) where A contains n. These are the
/// loopless ones. For n = 0 this is the matroid on the empty set.
std::vector<Matroid> allLooplessSchubertMatroids(Matroid::Element n);

MATQSYM_NAMESPACE_END

#endif
