// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "matqsym/Chromatic.hpp"
#include "matqsym/MatroidFamilies.hpp"

#include <tbb/global_control.h>
#include <gtest/gtest.h>

using namespace mqs;

namespace {
  QSymFunction qsym(const char* str) {
    return QSymFunction(Composition::parse(str));
  }
}

TEST(Chromatic, Small) {
  SetCompositionCache cache;
  ASSERT_EQ(qsym("(1)"), chromaticQSym(uniformMatroid(1, 1), cache));
  ASSERT_EQ(qsym("(1)"), chromaticQSym(uniformMatroid(1, 0), cache));
  ASSERT_EQ(qsym("()"), chromaticQSym(uniformMatroid(0, 0), cache));

  // U(1,2) is stable exactly when 1 and 2 are in different blocks
  ASSERT_EQ(qsym("(1,1)") * Coefficient(2),
    chromaticQSym(uniformMatroid(2, 1), cache));

  // a single basis makes every set composition stable
  ASSERT_EQ(qsym("(2)") + qsym("(1,1)") * Coefficient(2),
    chromaticQSym(uniformMatroid(2, 2), cache));
}

TEST(Chromatic, Uniform23) {
  SetCompositionCache cache;
  const auto f = chromaticQSym(uniformMatroid(3, 2), cache);
  ASSERT_EQ("6 M(1,1,1) + 3 M(1,2)", f.toString());

  const auto nc = chromaticNCQSym(uniformMatroid(3, 2), cache);
  ASSERT_EQ(9u, nc.terms().size());
  ASSERT_EQ(1, nc.coefficient(SetComposition::parse("(3|1,2)")));
  ASSERT_EQ(0, nc.coefficient(SetComposition::parse("(1,2|3)")));
  ASSERT_EQ(f, comu(nc));
}

TEST(Chromatic, GroundSetLabels) {
  const Matroid m(Matroid::ElementSet{2, 5},
    std::vector<Matroid::ElementSet>{{2}, {5}});
  std::map<std::string, Coefficient> expected;
  expected["(2|5)"] = 1;
  expected["(5|2)"] = 1;
  ASSERT_EQ(NCQSymFunction(expected), chromaticNCQSym(m));
}

TEST(Chromatic, CoefficientsAreZeroOrOne) {
  SetCompositionCache cache;
  const auto all = allLooplessSchubertMatroids(4);
  for (auto it = all.begin(); it != all.end(); ++it) {
    const auto nc = chromaticNCQSym(*it, cache);
    for (auto t = nc.terms().begin(); t != nc.terms().end(); ++t)
      ASSERT_EQ(1, t->second);
  }
}

TEST(Chromatic, ThreadCountDoesNotMatter) {
  SetCompositionCache cache;
  const auto m = uniformMatroid(5, 2);
  NCQSymFunction serial;
  {
    tbb::global_control limit
      (tbb::global_control::max_allowed_parallelism, 1);
    serial = chromaticNCQSym(m, cache);
  }
  NCQSymFunction parallel;
  {
    tbb::global_control limit
      (tbb::global_control::max_allowed_parallelism, 4);
    parallel = chromaticNCQSym(m, cache);
  }
  ASSERT_EQ(serial, parallel);
  ASSERT_EQ(comu(serial), chromaticQSym(m, cache));
}

TEST(Chromatic, Polynomial) {
  std::vector<Coefficient> expected;

  expected = {1};
  ASSERT_EQ(expected, chromaticPolynomial(uniformMatroid(0, 0)));

  // a loop adds a zero coefficient
  expected = {1, 0};
  ASSERT_EQ(expected, chromaticPolynomial(uniformMatroid(1, 0)));

  expected = {1, -3, 3, 0};
  ASSERT_EQ(expected, chromaticPolynomial(uniformMatroid(3, 2)));

  expected = {1, -3, 3, -1};
  ASSERT_EQ(expected, chromaticPolynomial(uniformMatroid(3, 3)));

  // {1,3} and {2,3} are the bases, so {1,2} is dependent
  expected = {1, -3, 2, 0};
  const Matroid parallel(
    Matroid::ElementSet{1, 2, 3},
    std::vector<Matroid::ElementSet>{{1, 3}, {2, 3}}
  );
  ASSERT_EQ(expected, chromaticPolynomial(parallel));
}
