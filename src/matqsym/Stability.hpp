// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_STABILITY_GUARD
#define MATQSYM_STABILITY_GUARD

MATQSYM_NAMESPACE_BEGIN

class Matroid;
class SetComposition;

/// The score of a basis B with respect to pi is the sum over i in B of the
/// 0-based index of the block of pi that contains i. pi is stable for the
/// matroid if exactly one basis has maximal score.
///
/// Throws DomainMismatchError if the ground set of pi does not contain the
/// ground set of the matroid.
bool isStable(const Matroid& matroid, const SetComposition& pi);

MATQSYM_NAMESPACE_END

#endif
