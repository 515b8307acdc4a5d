// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "SetCompositionCache.hpp"

#include "Subsets.hpp"
#include "Error.hpp"
#include "LogDomain.hpp"
#include <algorithm>
#include <iterator>

MATQSYM_DEFINE_LOG_DOMAIN(
  SetCompositionEnum,
  "Displays the time spent enumerating set compositions and counts how many "
  "set compositions have been generated."
);

MATQSYM_DEFINE_LOG_DOMAIN(
  SetCompositionShuffle,
  "Counts the number of canonical quasi-shuffle products of set "
  "compositions that had to be computed. Also times precomputation."
);

MATQSYM_DEFINE_LOG_DOMAIN(
  SetCompositionShuffleHits,
  "Counts the number of canonical quasi-shuffle products of set "
  "compositions that were found in the cache."
);

MATQSYM_DEFINE_LOG_ALIAS(
  "cache",
  "CompositionEnum,CompositionShuffle,"
  "SetCompositionEnum,SetCompositionShuffle,SetCompositionShuffleHits"
);

MATQSYM_NAMESPACE_BEGIN

namespace {
  typedef SetComposition::Block Block;

  Block blockUnion(const Block& a, const Block& b) {
    Block u;
    u.reserve(a.size() + b.size());
    std::merge(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(u));
    return u;
  }

  void addPrepended(
    const Block& block,
    const SetCompositionCache::Shuffle& from,
    SetCompositionCache::Shuffle& into
  ) {
    const auto end = from.end();
    for (auto it = from.begin(); it != end; ++it)
      into[it->first.prepend(block)] += it->second;
  }
}

SetCompositionCache::SetCompositionCache(const size_t precomputeSize) {
  mSetCompositions.push_back(std::vector<SetComposition>(1));
  if (precomputeSize != 0)
    precompute(precomputeSize);
}

const std::vector<SetComposition>& SetCompositionCache::allSetCompositions(
  const size_t n
) {
  if (n < mSetCompositions.size())
    return mSetCompositions[n];

  MATQSYM_LOG_TIME(SetCompositionEnum)
    << "Enumerating the set compositions of {1, ..., " << n << "}.\n";

  typedef SetComposition::Element Element;
  for (size_t size = mSetCompositions.size(); size <= n; ++size) {
    const auto elementCount = static_cast<Element>(size);
    Block ground;
    for (Element e = 1; e <= elementCount; ++e)
      ground.push_back(e);

    std::vector<SetComposition> all;
    all.push_back(SetComposition{ground});
    for (Element restSize = 1; restSize < elementCount; ++restSize) {
      const auto& smaller = mSetCompositions[restSize];
      SubsetIterator<Element> rest(elementCount, restSize);
      for (; !rest.atEnd(); rest.next()) {
        Block first;
        std::set_difference(
          ground.begin(), ground.end(),
          rest.subset().begin(), rest.subset().end(),
          std::back_inserter(first)
        );
        SetComposition::Relabeling onto;
        for (Element i = 0; i < restSize; ++i)
          onto[i + 1] = rest.subset()[i];
        for (auto it = smaller.begin(); it != smaller.end(); ++it)
          all.push_back(it->relabel(onto).prepend(first));
      }
    }
    MATQSYM_LOG_INCREMENT_BY(SetCompositionEnum, all.size());
    mSetCompositions.push_back(std::move(all));
  }
  return mSetCompositions[n];
}

auto SetCompositionCache::quasiShuffle(
  const SetComposition& q,
  const SetComposition& t
) -> Shuffle {
  if (!q.disjointFrom(t)) {
    reportDomainMismatch("Cannot quasi-shuffle " + q.toString() + " and " +
      t.toString() + " since their ground sets intersect.");
  }

  Shuffle shuffle;
  if (q.empty()) {
    shuffle[t] = 1;
    return shuffle;
  }
  if (t.empty()) {
    shuffle[q] = 1;
    return shuffle;
  }

  // Relabel q onto 1..|q| and t onto |q|+1..|q|+|t| and remember how to go
  // back.
  const auto qSize = static_cast<SetComposition::Element>(q.size());
  SetComposition::Relabeling back;
  for (size_t i = 0; i < q.size(); ++i)
    back[static_cast<SetComposition::Element>(i + 1)] = q.groundSet()[i];
  std::vector<SetComposition::Element> shifted(t.size());
  for (size_t i = 0; i < t.size(); ++i) {
    shifted[i] = qSize + static_cast<SetComposition::Element>(i + 1);
    back[shifted[i]] = t.groundSet()[i];
  }

  const auto& canonical =
    canonicalQuasiShuffle(q.relabel(), t.relabel(shifted));
  const auto end = canonical.end();
  for (auto it = canonical.begin(); it != end; ++it)
    shuffle.insert(std::make_pair(it->first.relabel(back), it->second));
  return shuffle;
}

auto SetCompositionCache::canonicalQuasiShuffle(
  const SetComposition& q,
  const SetComposition& t
) -> const Shuffle& {
  MATQSYM_ASSERT(!q.empty());
  MATQSYM_ASSERT(!t.empty());
  MATQSYM_ASSERT(q == q.relabel());

  const auto it = mShuffles.find(Operands(q, t));
  if (it != mShuffles.end()) {
    MATQSYM_LOG_INCREMENT(SetCompositionShuffleHits);
    return it->second;
  }

  // qs(aq', bt') = a.qs(q', bt') + b.qs(aq', t') + (a u b).qs(q', t')
  const auto& a = q.first();
  const auto& b = t.first();
  const auto qRest = q.rest();
  const auto tRest = t.rest();
  Shuffle shuffle;
  addPrepended(a, quasiShuffle(qRest, t), shuffle);
  addPrepended(b, quasiShuffle(q, tRest), shuffle);
  addPrepended(blockUnion(a, b), quasiShuffle(qRest, tRest), shuffle);
  MATQSYM_LOG_INCREMENT(SetCompositionShuffle);

  return mShuffles.insert
    (std::make_pair(Operands(q, t), std::move(shuffle))).first->second;
}

void SetCompositionCache::precompute(const size_t size) {
  MATQSYM_LOG_TIME(SetCompositionShuffle)
    << "Precomputing set compositions and quasi-shuffles up to size "
    << size << ".\n";

  allSetCompositions(size);
  for (size_t i = 0; i <= size; ++i) {
    const auto& left = mSetCompositions[i];
    for (size_t j = 0; j <= size; ++j) {
      SetComposition::Relabeling shift;
      for (size_t e = 1; e <= j; ++e) {
        shift[static_cast<SetComposition::Element>(e)] =
          static_cast<SetComposition::Element>(e + i);
      }
      const auto& right = mSetCompositions[j];
      for (auto t = right.begin(); t != right.end(); ++t) {
        const auto shifted = t->relabel(shift);
        for (auto q = left.begin(); q != left.end(); ++q)
          quasiShuffle(*q, shifted);
      }
    }
  }
}

SetCompositionCache& SetCompositionCache::global() {
  static SetCompositionCache cache(3);
  return cache;
}

MATQSYM_NAMESPACE_END
