// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_SET_COMPOSITION_CACHE_GUARD
#define MATQSYM_SET_COMPOSITION_CACHE_GUARD

#include "SetComposition.hpp"
#include "Coefficient.hpp"
#include <map>
#include <deque>
#include <vector>
#include <utility>

MATQSYM_NAMESPACE_BEGIN

/// Memoizes the enumeration of set compositions of {1, ..., n} and the
/// quasi-shuffle product of set compositions with disjoint ground sets.
///
/// The quasi-shuffle product only depends on the relative structure of its
/// operands, so products are stored for canonical operands only. A
/// canonical pair (q, t) has q on {1, ..., |q|} and t on
/// {|q| + 1, ..., |q| + |t|}, both relabeled in ground set order. The
/// product of any other pair is found by relabeling the operands into
/// canonical form, looking up the canonical product and relabeling the
/// result back.
///
/// Entries are only ever added. A cache is not safe to use from more than
/// one thread at a time.
class SetCompositionCache {
public:
  typedef std::map<SetComposition, Coefficient> Shuffle;

  /// Calls precompute(precomputeSize) if precomputeSize is not zero.
  explicit SetCompositionCache(size_t precomputeSize = 0);

  /// Returns all set compositions of {1, ..., n}. The one-block set
  /// composition comes first. Then, for each size s = 1 to n - 1 of the
  /// rest, for each s-subset R of {1, ..., n} in lexicographic order and
  /// for each set composition of {1, ..., s} relabeled onto R by sending i
  /// to the i'th smallest element of R, comes that set composition with the
  /// complement of R prepended.
  const std::vector<SetComposition>& allSetCompositions(size_t n);

  /// Returns the quasi-shuffle product of q and t. Throws
  /// DomainMismatchError if the ground sets of q and t intersect.
  Shuffle quasiShuffle(const SetComposition& q, const SetComposition& t);

  /// Enumerates the set compositions of every size up to size and computes
  /// the quasi-shuffles of every pair of them, with the second operand
  /// shifted to be disjoint from the first.
  void precompute(size_t size);

  size_t enumeratedSizes() const {return mSetCompositions.size();}

  /// Returns the number of canonical quasi-shuffle products held in the
  /// cache.
  size_t shuffleCount() const {return mShuffles.size();}

  /// Returns a process-wide cache that is created on first use with the
  /// set compositions of size 3 and less precomputed.
  static SetCompositionCache& global();

private:
  SetCompositionCache(const SetCompositionCache&); // not available
  void operator=(const SetCompositionCache&); // not available

  typedef std::pair<SetComposition, SetComposition> Operands;

  /// Returns the product of a canonical pair of non-empty operands.
  const Shuffle& canonicalQuasiShuffle(
    const SetComposition& q,
    const SetComposition& t
  );

  std::deque<std::vector<SetComposition>> mSetCompositions;
  std::map<Operands, Shuffle> mShuffles;
};

MATQSYM_NAMESPACE_END

#endif
