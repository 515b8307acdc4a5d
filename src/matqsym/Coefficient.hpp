// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_COEFFICIENT_GUARD
#define MATQSYM_COEFFICIENT_GUARD

#include <gmpxx.h>

MATQSYM_NAMESPACE_BEGIN

/// Exact integer coefficient of quasi-shuffle products and formal sums.
///
/// Do not use auto to hold the result of arithmetic on coefficients. gmpxx
/// returns expression templates that refer to their operands.
typedef mpz_class Coefficient;

MATQSYM_NAMESPACE_END

#endif
