// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Chromatic.hpp"

#include "Stability.hpp"
#include "LogDomain.hpp"
#include "Subsets.hpp"
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <vector>
#include <map>

MATQSYM_DEFINE_LOG_DOMAIN(
  Chromatic,
  "Displays the time spent computing chromatic functions of matroids and "
  "counts the number of stable set compositions found."
);

MATQSYM_NAMESPACE_BEGIN

NCQSymFunction chromaticNCQSym(
  const Matroid& matroid,
  SetCompositionCache& cache
) {
  const auto& groundSet = matroid.groundSet();
  MATQSYM_LOG_TIME(Chromatic)
    << "Computing the chromatic function of a matroid of rank "
    << matroid.rank() << " on " << groundSet.size() << " elements.\n";

  // Enumerate before going parallel. The cache must only be touched from
  // this thread.
  const auto& all = cache.allSetCompositions(groundSet.size());
  SetComposition::Relabeling onto;
  for (size_t i = 0; i < groundSet.size(); ++i)
    onto[static_cast<SetComposition::Element>(i + 1)] = groundSet[i];

  tbb::enumerable_thread_specific<std::vector<SetComposition>>
    stablePerThread;
  tbb::parallel_for(tbb::blocked_range<size_t>(0, all.size()),
    [&](const tbb::blocked_range<size_t>& range)
    {for (auto it = range.begin(); it != range.end(); ++it)
  {
    auto pi = all[it].relabel(onto);
    if (isStable(matroid, pi))
      stablePerThread.local().push_back(std::move(pi));
  }});

  NCQSymFunction::Terms terms;
  for (auto local = stablePerThread.begin();
    local != stablePerThread.end(); ++local)
  {
    for (auto pi = local->begin(); pi != local->end(); ++pi)
      terms[*pi] = 1;
  }
  MATQSYM_LOG_INCREMENT_BY(Chromatic, terms.size());
  return NCQSymFunction(std::move(terms));
}

NCQSymFunction chromaticNCQSym(const Matroid& matroid) {
  return chromaticNCQSym(matroid, SetCompositionCache::global());
}

QSymFunction chromaticQSym(
  const Matroid& matroid,
  SetCompositionCache& cache
) {
  return comu(chromaticNCQSym(matroid, cache));
}

QSymFunction chromaticQSym(const Matroid& matroid) {
  return chromaticQSym(matroid, SetCompositionCache::global());
}

std::vector<Coefficient> chromaticPolynomial(const Matroid& matroid) {
  typedef Matroid::ElementSet ElementSet;
  MATQSYM_LOG_TIME(Chromatic)
    << "Computing the chromatic polynomial of a matroid of rank "
    << matroid.rank() << ".\n";

  // Order the independent sets by size so that mu(empty, Z) is known for
  // every proper subset Z of X when X is reached.
  const auto independent = matroid.independentSets();
  std::vector<std::vector<const ElementSet*>> bySize(matroid.rank() + 1);
  for (auto it = independent.begin(); it != independent.end(); ++it)
    bySize[it->size()].push_back(&*it);

  std::vector<Coefficient> coefficients(matroid.groundSet().size() + 1);
  std::map<ElementSet, Coefficient> mobius;
  for (size_t size = 0; size < bySize.size(); ++size) {
    for (auto x = bySize[size].begin(); x != bySize[size].end(); ++x) {
      const ElementSet& set = **x;
      // mu(empty, X) = -sum of mu(empty, Z) over Z properly inside X.
      Coefficient mu = size == 0 ? 1 : 0;
      const auto n = static_cast<int32>(size);
      for (int32 k = 0; k < n; ++k) {
        for (SubsetIterator<int32> it(n, k); !it.atEnd(); it.next()) {
          ElementSet subset;
          const auto& positions = it.subset();
          for (auto pos = positions.begin(); pos != positions.end(); ++pos)
            subset.push_back(set[*pos - 1]);
          const auto found = mobius.find(subset);
          MATQSYM_ASSERT(found != mobius.end());
          mu -= found->second;
        }
      }
      coefficients[size] += mu;
      mobius.insert(std::make_pair(set, mu));
    }
  }
  return coefficients;
}

MATQSYM_NAMESPACE_END
