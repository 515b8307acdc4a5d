// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_QSYM_FUNCTION_GUARD
#define MATQSYM_QSYM_FUNCTION_GUARD

#include "FormalSum.hpp"
#include "Composition.hpp"
#include "CompositionCache.hpp"

MATQSYM_NAMESPACE_BEGIN

/// A quasisymmetric function in the monomial basis M_alpha where alpha
/// runs over compositions.
typedef FormalSum<Composition, CompositionCache> QSymFunction;

MATQSYM_NAMESPACE_END

#endif
