// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_CHROMATIC_GUARD
#define MATQSYM_CHROMATIC_GUARD

#include "Matroid.hpp"
#include "QSymFunction.hpp"
#include "NCQSymFunction.hpp"
#include "Coefficient.hpp"
#include <vector>

MATQSYM_NAMESPACE_BEGIN

/// Returns the chromatic non-commutative quasisymmetric function of
/// matroid. Let g1 < ... < gn be the ground set. Then M_pi has coefficient 1
/// for every set composition pi of {1, ..., n}, relabeled by sending i to
/// gi, that is stable for the matroid. All other coefficients are zero.
///
/// The set compositions are enumerated using cache. The stability tests
/// run in parallel and the result does not depend on the number of threads.
NCQSymFunction chromaticNCQSym(
  const Matroid& matroid,
  SetCompositionCache& cache
);

/// As above using SetCompositionCache::global().
NCQSymFunction chromaticNCQSym(const Matroid& matroid);

/// Returns the chromatic quasisymmetric function of matroid, which is the
/// commutative image of its chromatic non-commutative quasisymmetric
/// function.
QSymFunction chromaticQSym(const Matroid& matroid, SetCompositionCache& cache);

/// As above using SetCompositionCache::global().
QSymFunction chromaticQSym(const Matroid& matroid);

/// Returns the coefficients of the chromatic polynomial of matroid, indexed
/// from 0 to the size of the ground set. Coefficient k is the sum of the
/// Moebius values mu(empty set, X) over the independent sets X of size k,
/// where mu is the Moebius function of the independent sets ordered by
/// inclusion.
std::vector<Coefficient> chromaticPolynomial(const Matroid& matroid);

MATQSYM_NAMESPACE_END

#endif
