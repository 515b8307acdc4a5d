// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_NCQSYM_FUNCTION_GUARD
#define MATQSYM_NCQSYM_FUNCTION_GUARD

#include "FormalSum.hpp"
#include "QSymFunction.hpp"
#include "SetComposition.hpp"
#include "SetCompositionCache.hpp"

MATQSYM_NAMESPACE_BEGIN

/// A non-commutative quasisymmetric function in the monomial basis M_pi
/// where pi runs over set compositions. The product of M_pi and M_sigma is
/// only defined if pi and sigma have disjoint ground sets.
typedef FormalSum<SetComposition, SetCompositionCache> NCQSymFunction;

/// Returns the commutative image of f, which sends M_pi to M_alpha(pi).
/// The coefficients of set compositions with the same alpha are added.
QSymFunction comu(const NCQSymFunction& f);

MATQSYM_NAMESPACE_END

#endif
