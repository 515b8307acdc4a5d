// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "matqsym/QSymFunction.hpp"
#include "matqsym/NCQSymFunction.hpp"
#include "matqsym/Error.hpp"

#include <gtest/gtest.h>

using namespace mqs;

namespace {
  QSymFunction m(const char* composition) {
    return QSymFunction(Composition::parse(composition));
  }

  NCQSymFunction nc(const char* setComposition) {
    return NCQSymFunction(SetComposition::parse(setComposition));
  }
}

TEST(QSymFunction, Construction) {
  const QSymFunction zero;
  ASSERT_TRUE(zero.isZero());
  ASSERT_EQ("0", zero.toString());

  const auto f = m("(2,1)");
  ASSERT_FALSE(f.isZero());
  ASSERT_EQ(1, f.coefficient(Composition({2, 1})));
  ASSERT_EQ(0, f.coefficient(Composition({1, 2})));

  std::map<std::string, Coefficient> terms;
  terms["(1,2)"] = 1;
  terms["( 1 , 2 )"] = 2;
  terms["(3)"] = -4;
  const QSymFunction g(terms);
  ASSERT_EQ(2u, g.terms().size());
  ASSERT_EQ(3, g.coefficient(Composition({1, 2})));
  ASSERT_EQ(-4, g.coefficient(Composition({3})));

  std::map<std::string, Coefficient> bad;
  bad["(1,0)"] = 1;
  ASSERT_THROW(QSymFunction{bad}, MalformedInputError);
}

TEST(QSymFunction, Arithmetic) {
  const auto f = m("(1)") + m("(2)");
  ASSERT_EQ(1, f.coefficient(Composition({1})));
  ASSERT_EQ(1, f.coefficient(Composition({2})));

  const auto g = f + m("(1)");
  ASSERT_EQ(2, g.coefficient(Composition({1})));
  // operands are unchanged
  ASSERT_EQ(1, f.coefficient(Composition({1})));

  const auto scaled = Coefficient(3) * g;
  ASSERT_EQ(6, scaled.coefficient(Composition({1})));
  ASSERT_EQ(3, scaled.coefficient(Composition({2})));
  ASSERT_EQ(scaled, g * Coefficient(3));

  const auto cancelled = m("(1)") + m("(1)") * Coefficient(-1);
  ASSERT_TRUE(cancelled.isZero());
  ASSERT_EQ(QSymFunction(), cancelled);
  ASSERT_EQ("0", cancelled.toString());
  ASSERT_NE(QSymFunction(), m("(1)"));
}

TEST(QSymFunction, ExactCoefficients) {
  Coefficient big("123456789012345678901234567890");
  const auto f = m("(1)") * big;
  const auto square = f.multiply(f, CompositionCache::global());
  const Coefficient bigSquare = big * big;
  ASSERT_EQ(Coefficient(2 * bigSquare),
    square.coefficient(Composition({1, 1})));
  ASSERT_EQ(bigSquare, square.coefficient(Composition({2})));
}

TEST(QSymFunction, Multiply) {
  CompositionCache cache;
  const auto product = m("(1)").multiply(m("(1)"), cache);
  std::map<std::string, Coefficient> expected;
  expected["(1,1)"] = 2;
  expected["(2)"] = 1;
  ASSERT_EQ(QSymFunction(expected), product);
  ASSERT_EQ(product, m("(1)") * m("(1)"));
  ASSERT_EQ("2 M(1,1) + M(2)", product.toString());

  // multiplication is bilinear, commutative and associative
  const auto f = m("(1)") + m("(2)") * Coefficient(2);
  const auto g = m("(1,1)") * Coefficient(-1) + m("(3)");
  const auto h = m("(2,1)");
  ASSERT_EQ(f.multiply(g, cache), g.multiply(f, cache));
  ASSERT_EQ(f.multiply(g, cache).multiply(h, cache),
    f.multiply(g.multiply(h, cache), cache));
  ASSERT_EQ((f + g).multiply(h, cache),
    f.multiply(h, cache) + g.multiply(h, cache));

  ASSERT_TRUE(QSymFunction().multiply(f, cache).isZero());
  ASSERT_EQ(f, f.multiply(m("()"), cache));
}

TEST(QSymFunction, Write) {
  ASSERT_EQ("M()", m("()").toString());
  const auto difference = m("(1)") + m("(2)") * Coefficient(-1);
  ASSERT_EQ("M(1) - M(2)", difference.toString());
  ASSERT_EQ("- 3 M(2)", (m("(2)") * Coefficient(-3)).toString());
  ASSERT_EQ("M(2) + 5 M(1,2)",
    (m("(2)") + m("(1,2)") * Coefficient(5)).toString());
}

TEST(NCQSymFunction, Multiply) {
  SetCompositionCache cache;
  const auto product = nc("(1)").multiply(nc("(2)"), cache);
  std::map<std::string, Coefficient> expected;
  expected["(1|2)"] = 1;
  expected["(2|1)"] = 1;
  expected["(1,2)"] = 1;
  ASSERT_EQ(NCQSymFunction(expected), product);
  ASSERT_EQ(product, nc("(2)") * nc("(1)"));

  ASSERT_THROW(nc("(1)").multiply(nc("(1|2)"), cache), DomainMismatchError);
}

TEST(NCQSymFunction, Comu) {
  std::map<std::string, Coefficient> terms;
  terms["(1|2)"] = 1;
  terms["(2|1)"] = 1;
  const auto projected = comu(NCQSymFunction(terms));
  ASSERT_EQ(1u, projected.terms().size());
  ASSERT_EQ(2, projected.coefficient(Composition({1, 1})));

  ASSERT_TRUE(comu(NCQSymFunction()).isZero());

  // comu is a ring homomorphism
  SetCompositionCache ncCache;
  CompositionCache cache;
  const auto f = nc("(1,3)") + nc("(3|1)") * Coefficient(2);
  const auto g = nc("(2|4)");
  ASSERT_EQ(comu(f.multiply(g, ncCache)),
    comu(f).multiply(comu(g), cache));
}
