// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "CompositionCache.hpp"

#include "Error.hpp"
#include "LogDomain.hpp"
#include <limits>
#include <sstream>

MATQSYM_DEFINE_LOG_DOMAIN(
  CompositionEnum,
  "Displays the time spent enumerating compositions and counts how many "
  "compositions have been generated."
);

MATQSYM_DEFINE_LOG_DOMAIN(
  CompositionShuffle,
  "Counts the number of quasi-shuffle products of compositions that had to "
  "be computed because they were not already cached. Also times "
  "precomputation."
);

MATQSYM_NAMESPACE_BEGIN

namespace {
  // Adds every composition of from with a prepended to into, together with
  // its coefficient.
  void addPrepended(
    const Composition::Part a,
    const CompositionCache::Shuffle& from,
    CompositionCache::Shuffle& into
  ) {
    const auto end = from.end();
    for (auto it = from.begin(); it != end; ++it)
      into[it->first.prepend(a)] += it->second;
  }
}

CompositionCache::CompositionCache(const size_t precomputeSize) {
  mCompositions.push_back(std::vector<Composition>(1, Composition()));
  if (precomputeSize != 0)
    precompute(precomputeSize);
}

const std::vector<Composition>& CompositionCache::allCompositions(
  const size_t n
) {
  if (n < mCompositions.size())
    return mCompositions[n];

  MATQSYM_LOG_TIME(CompositionEnum)
    << "Enumerating the compositions of " << n << ".\n";

  for (size_t size = mCompositions.size(); size <= n; ++size) {
    std::vector<Composition> all;
    all.push_back(Composition{static_cast<Composition::Part>(size)});
    for (size_t k = 1; k < size; ++k) {
      const auto first = static_cast<Composition::Part>(size - k);
      const auto& smaller = mCompositions[k];
      for (auto it = smaller.begin(); it != smaller.end(); ++it)
        all.push_back(it->prepend(first));
    }
    MATQSYM_LOG_INCREMENT_BY(CompositionEnum, all.size());
    mCompositions.push_back(std::move(all));
  }
  return mCompositions[n];
}

const CompositionCache::Shuffle& CompositionCache::quasiShuffle(
  const Composition& q,
  const Composition& t
) {
  auto it = mShuffles.find(Operands(q, t));
  if (it != mShuffles.end())
    return it->second;
  it = mShuffles.find(Operands(t, q));
  if (it != mShuffles.end())
    return it->second;

  Shuffle shuffle;
  if (q.empty())
    shuffle[t] = 1;
  else if (t.empty())
    shuffle[q] = 1;
  else {
    // qs(aq', bt') = a.qs(q', bt') + b.qs(aq', t') + (a+b).qs(q', t')
    const auto a = q.first();
    const auto b = t.first();
    const int64 merged = static_cast<int64>(a) + b;
    if (merged > std::numeric_limits<Composition::Part>::max()) {
      std::ostringstream err;
      err << "The merged part " << a << " + " << b
        << " of a quasi-shuffle product is too large.";
      reportMalformedInput(err.str());
    }
    const auto qRest = q.rest();
    const auto tRest = t.rest();
    addPrepended(a, quasiShuffle(qRest, t), shuffle);
    addPrepended(b, quasiShuffle(q, tRest), shuffle);
    addPrepended(static_cast<Composition::Part>(merged),
      quasiShuffle(qRest, tRest), shuffle);
  }
  MATQSYM_LOG_INCREMENT(CompositionShuffle);

  return mShuffles.insert
    (std::make_pair(Operands(q, t), std::move(shuffle))).first->second;
}

void CompositionCache::precompute(const size_t size) {
  MATQSYM_LOG_TIME(CompositionShuffle)
    << "Precomputing compositions and quasi-shuffles up to size "
    << size << ".\n";

  allCompositions(size);
  for (size_t i = 0; i <= size; ++i) {
    const auto& left = mCompositions[i];
    for (size_t j = 0; j <= size; ++j) {
      const auto& right = mCompositions[j];
      for (auto q = left.begin(); q != left.end(); ++q)
        for (auto t = right.begin(); t != right.end(); ++t)
          quasiShuffle(*q, *t);
    }
  }
}

CompositionCache& CompositionCache::global() {
  static CompositionCache cache(4);
  return cache;
}

MATQSYM_NAMESPACE_END
