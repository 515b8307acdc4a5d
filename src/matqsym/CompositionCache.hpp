// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_COMPOSITION_CACHE_GUARD
#define MATQSYM_COMPOSITION_CACHE_GUARD

#include "Composition.hpp"
#include "Coefficient.hpp"
#include <map>
#include <deque>
#include <vector>
#include <utility>

MATQSYM_NAMESPACE_BEGIN

/// Memoizes the enumeration of compositions and the quasi-shuffle product of
/// pairs of compositions. Entries are only ever added, so references
/// returned from a cache stay valid for the lifetime of the cache.
///
/// A cache is not safe to use from more than one thread at a time.
class CompositionCache {
public:
  /// The quasi-shuffle product of two compositions as a map from the
  /// compositions in the product to their positive coefficients.
  typedef std::map<Composition, Coefficient> Shuffle;

  /// Calls precompute(precomputeSize) if precomputeSize is not zero.
  explicit CompositionCache(size_t precomputeSize = 0);

  /// Returns all compositions of n. The first one is (n) and then, for
  /// k = 1 to n - 1, come the compositions of k with n - k prepended.
  const std::vector<Composition>& allCompositions(size_t n);

  /// Returns the quasi-shuffle product of q and t.
  const Shuffle& quasiShuffle(const Composition& q, const Composition& t);

  /// Enumerates the compositions of every size up to size and computes the
  /// quasi-shuffles of every pair of them.
  void precompute(size_t size);

  /// Returns the number of sizes n for which the compositions of n have
  /// been enumerated.
  size_t enumeratedSizes() const {return mCompositions.size();}

  /// Returns the number of quasi-shuffle products held in the cache.
  size_t shuffleCount() const {return mShuffles.size();}

  /// Returns a process-wide cache that is created on first use with the
  /// compositions of size 4 and less precomputed.
  static CompositionCache& global();

private:
  CompositionCache(const CompositionCache&); // not available
  void operator=(const CompositionCache&); // not available

  typedef std::pair<Composition, Composition> Operands;

  // mCompositions[n] holds all compositions of n. A deque does not move its
  // elements when it grows.
  std::deque<std::vector<Composition>> mCompositions;
  std::map<Operands, Shuffle> mShuffles;
};

MATQSYM_NAMESPACE_END

#endif
