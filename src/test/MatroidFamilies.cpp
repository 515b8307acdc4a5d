// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "matqsym/MatroidFamilies.hpp"
#include "matqsym/Error.hpp"

#include <gtest/gtest.h>
#include <set>

using namespace mqs;

namespace {
  typedef Matroid::ElementSet ElementSet;
  typedef std::vector<ElementSet> Bases;

  bool loopless(const Matroid& m) {
    std::set<Matroid::Element> covered;
    for (auto b = m.bases().begin(); b != m.bases().end(); ++b)
      covered.insert(b->begin(), b->end());
    return covered.size() == m.groundSet().size();
  }
}

TEST(MatroidFamilies, Uniform) {
  ASSERT_EQ(Matroid(ElementSet{1, 2, 3}, Bases{{1, 2}, {1, 3}, {2, 3}}),
    uniformMatroid(3, 2));
  ASSERT_EQ(6u, uniformMatroid(4, 2).bases().size());
  ASSERT_EQ(1u, uniformMatroid(4, 4).bases().size());
  ASSERT_EQ(4u, uniformMatroid(4, 1).bases().size());

  const auto empty = uniformMatroid(0, 0);
  ASSERT_TRUE(empty.groundSet().empty());
  ASSERT_EQ(0u, empty.rank());

  ASSERT_THROW(uniformMatroid(2, 3), MalformedInputError);
  ASSERT_THROW(uniformMatroid(2, -1), MalformedInputError);
  ASSERT_THROW(uniformMatroid(-1, 0), MalformedInputError);
}

TEST(MatroidFamilies, Schubert) {
  ASSERT_EQ(uniformMatroid(3, 2), schubertMatroid(3, ElementSet{2, 3}));
  ASSERT_EQ(Matroid(ElementSet{1, 2, 3}, Bases{{1, 2}, {1, 3}}),
    schubertMatroid(3, ElementSet{3, 1}));
  ASSERT_EQ(Matroid(ElementSet{1, 2, 3}, Bases{{1, 2}}),
    schubertMatroid(3, ElementSet{1, 2}));
  ASSERT_EQ(uniformMatroid(3, 0), schubertMatroid(3, ElementSet()));

  ASSERT_THROW(schubertMatroid(3, ElementSet{4}), MalformedInputError);
  ASSERT_THROW(schubertMatroid(3, ElementSet{0, 2}), MalformedInputError);
  ASSERT_THROW(schubertMatroid(-2, ElementSet()), MalformedInputError);
}

TEST(MatroidFamilies, AllSchubert) {
  for (Matroid::Element n = 0; n <= 4; ++n) {
    const auto all = allSchubertMatroids(n);
    ASSERT_EQ(static_cast<size_t>(1) << n, all.size());
    ASSERT_EQ(0u, all.front().rank());
    ASSERT_EQ(static_cast<size_t>(n), all.back().rank());
    for (size_t i = 1; i < all.size(); ++i)
      ASSERT_LE(all[i - 1].rank(), all[i].rank());
  }
}

TEST(MatroidFamilies, AllLooplessSchubert) {
  const auto none = allLooplessSchubertMatroids(0);
  ASSERT_EQ(1u, none.size());
  ASSERT_TRUE(none.front().groundSet().empty());

  for (Matroid::Element n = 1; n <= 4; ++n) {
    const auto all = allLooplessSchubertMatroids(n);
    ASSERT_EQ(static_cast<size_t>(1) << (n - 1), all.size());
    for (auto it = all.begin(); it != all.end(); ++it)
      ASSERT_TRUE(loopless(*it));

    size_t looplessCount = 0;
    const auto every = allSchubertMatroids(n);
    for (auto it = every.begin(); it != every.end(); ++it)
      if (loopless(*it))
        ++looplessCount;
    ASSERT_EQ(all.size(), looplessCount);
  }
}
