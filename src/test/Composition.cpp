// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "matqsym/Composition.hpp"
#include "matqsym/CompositionCache.hpp"
#include "matqsym/Error.hpp"

#include <gtest/gtest.h>
#include <set>

using namespace mqs;

namespace {
  Coefficient coefficientSum(const CompositionCache::Shuffle& shuffle) {
    Coefficient sum = 0;
    for (auto it = shuffle.begin(); it != shuffle.end(); ++it)
      sum += it->second;
    return sum;
  }
}

TEST(Composition, Basics) {
  const Composition c{2, 1, 3};
  ASSERT_EQ(6, c.n());
  ASSERT_EQ(3u, c.partCount());
  ASSERT_EQ(2, c.first());
  ASSERT_EQ(Composition({1, 3}), c.rest());
  ASSERT_EQ(Composition({4, 2, 1, 3}), c.prepend(4));
  ASSERT_EQ("(2,1,3)", c.toString());

  const Composition empty;
  ASSERT_TRUE(empty.empty());
  ASSERT_EQ(0, empty.n());
  ASSERT_EQ("()", empty.toString());
  ASSERT_EQ(Composition({5}).rest(), empty);
}

TEST(Composition, Parse) {
  ASSERT_EQ(Composition({2, 1, 3}), Composition::parse("(2,1,3)"));
  ASSERT_EQ(Composition({2, 1}), Composition::parse(" ( 2 ,\n1 ) "));
  ASSERT_EQ(Composition(), Composition::parse("()"));

  const char* roundTrip[] = {"()", "(1)", "(3,1,1)", "(12,7)"};
  for (size_t i = 0; i < sizeof(roundTrip) / sizeof(*roundTrip); ++i)
    ASSERT_EQ(roundTrip[i], Composition::parse(roundTrip[i]).toString());
}

TEST(Composition, Errors) {
  ASSERT_THROW(Composition({2, 0}), MalformedInputError);
  ASSERT_THROW(Composition({-1}), MalformedInputError);
  ASSERT_THROW(Composition::parse("(1,0)"), MalformedInputError);
  ASSERT_THROW(Composition::parse("(1,2"), MalformedInputError);
  ASSERT_THROW(Composition::parse("1,2)"), MalformedInputError);
  ASSERT_THROW(Composition::parse("(a)"), MalformedInputError);
  ASSERT_THROW(Composition::parse("(1)(2)"), MalformedInputError);
  ASSERT_THROW(Composition::parse("(1|2)"), MalformedInputError);

  ASSERT_THROW(Composition().rest(), EmptyStructureError);
  ASSERT_THROW(Composition().first(), EmptyStructureError);
  ASSERT_THROW(Composition({1}).prepend(0), MalformedInputError);
}

TEST(Composition, Order) {
  // by size first, then by parts
  ASSERT_TRUE(Composition({5}) < Composition({1, 1, 1, 1, 1, 1}));
  ASSERT_TRUE(Composition({1, 2}) < Composition({2, 1}));
  ASSERT_TRUE(Composition({1, 1, 1}) < Composition({1, 2}));
  ASSERT_FALSE(Composition({1, 2}) < Composition({1, 2}));
}

TEST(CompositionCache, AllCompositions) {
  CompositionCache cache;
  ASSERT_EQ(1u, cache.allCompositions(0).size());
  size_t expected = 1;
  for (size_t n = 1; n <= 10; ++n) {
    const auto& all = cache.allCompositions(n);
    ASSERT_EQ(expected, all.size());
    expected *= 2;

    std::set<Composition> distinct(all.begin(), all.end());
    ASSERT_EQ(all.size(), distinct.size());
    for (auto it = all.begin(); it != all.end(); ++it)
      ASSERT_EQ(static_cast<int64>(n), it->n());
  }
  ASSERT_EQ(11u, cache.enumeratedSizes());
}

TEST(CompositionCache, AllCompositionsOrder) {
  CompositionCache cache;
  const auto& all = cache.allCompositions(3);
  ASSERT_EQ(4u, all.size());
  ASSERT_EQ(Composition({3}), all[0]);
  ASSERT_EQ(Composition({2, 1}), all[1]);
  ASSERT_EQ(Composition({1, 2}), all[2]);
  ASSERT_EQ(Composition({1, 1, 1}), all[3]);
}

TEST(CompositionCache, QuasiShuffle) {
  CompositionCache cache;
  const auto& s = cache.quasiShuffle(Composition({1}), Composition({1}));
  ASSERT_EQ(2u, s.size());
  ASSERT_EQ(2, s.find(Composition({1, 1}))->second);
  ASSERT_EQ(1, s.find(Composition({2}))->second);

  const auto& t = cache.quasiShuffle(Composition({1}), Composition({2}));
  ASSERT_EQ(3u, t.size());
  ASSERT_EQ(1, t.find(Composition({1, 2}))->second);
  ASSERT_EQ(1, t.find(Composition({2, 1}))->second);
  ASSERT_EQ(1, t.find(Composition({3}))->second);

  const auto& u = cache.quasiShuffle(Composition({1, 1}), Composition({1}));
  ASSERT_EQ(3u, u.size());
  ASSERT_EQ(3, u.find(Composition({1, 1, 1}))->second);
  ASSERT_EQ(1, u.find(Composition({2, 1}))->second);
  ASSERT_EQ(1, u.find(Composition({1, 2}))->second);
}

TEST(CompositionCache, QuasiShuffleEmpty) {
  CompositionCache cache;
  const Composition c{3, 1};
  const auto& left = cache.quasiShuffle(Composition(), c);
  ASSERT_EQ(1u, left.size());
  ASSERT_EQ(1, left.find(c)->second);
  const auto& right = cache.quasiShuffle(c, Composition());
  ASSERT_EQ(1u, right.size());
  ASSERT_EQ(1, right.find(c)->second);
}

TEST(CompositionCache, QuasiShuffleCommutesAndCounts) {
  // The number of quasi-shuffles of sequences of lengths k and l is the
  // Delannoy number D(k, l).
  const int delannoy[4][4] = {
    {1, 1, 1, 1},
    {1, 3, 5, 7},
    {1, 5, 13, 25},
    {1, 7, 25, 63}
  };
  CompositionCache cache;
  for (size_t a = 0; a <= 4; ++a) {
    for (size_t b = 0; b <= 4; ++b) {
      const auto& as = cache.allCompositions(a);
      const auto& bs = cache.allCompositions(b);
      for (auto q = as.begin(); q != as.end(); ++q) {
        for (auto t = bs.begin(); t != bs.end(); ++t) {
          if (q->partCount() > 3 || t->partCount() > 3)
            continue;
          const auto qt = cache.quasiShuffle(*q, *t);
          const auto tq = cache.quasiShuffle(*t, *q);
          ASSERT_EQ(qt, tq);
          ASSERT_EQ(delannoy[q->partCount()][t->partCount()],
            coefficientSum(qt));
          for (auto r = qt.begin(); r != qt.end(); ++r)
            ASSERT_EQ(q->n() + t->n(), r->first.n());
        }
      }
    }
  }
}

TEST(CompositionCache, QuasiShuffleMergedPartTooLarge) {
  CompositionCache cache;
  const auto largest = Composition::parse("(2147483647)");
  ASSERT_THROW(cache.quasiShuffle(largest, Composition({1})),
    MalformedInputError);
  ASSERT_THROW(cache.quasiShuffle(Composition({1}), largest),
    MalformedInputError);

  const auto shuffle = cache.quasiShuffle(Composition({2147483646}),
    Composition({1}));
  ASSERT_EQ(3u, shuffle.size());
  ASSERT_EQ(1, shuffle.at(Composition({2147483647})));
}

TEST(CompositionCache, GlobalIsPrecomputed) {
  auto& cache = CompositionCache::global();
  ASSERT_LE(5u, cache.enumeratedSizes());
  ASSERT_EQ(8u, cache.allCompositions(4).size());
  const auto shuffles = cache.shuffleCount();
  cache.quasiShuffle(Composition({1, 3}), Composition({2, 1, 1}));
  ASSERT_EQ(shuffles, cache.shuffleCount());
}

TEST(CompositionCache, Precompute) {
  CompositionCache cache(3);
  ASSERT_EQ(4u, cache.enumeratedSizes());
  const auto shuffles = cache.shuffleCount();
  ASSERT_LT(0u, shuffles);
  cache.quasiShuffle(Composition({1, 2}), Composition({2}));
  ASSERT_EQ(shuffles, cache.shuffleCount());
}
