// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "matqsym/AlgebraIO.hpp"
#include "matqsym/MatroidFamilies.hpp"
#include "matqsym/Error.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace mqs;

namespace {
  QSymFunction readQSym(const char* str) {
    Scanner in(str);
    auto f = AlgebraIO().readQSym(in);
    in.expectEOF();
    return f;
  }

  NCQSymFunction readNCQSym(const char* str) {
    Scanner in(str);
    auto f = AlgebraIO().readNCQSym(in);
    in.expectEOF();
    return f;
  }

  Matroid readMatroid(const char* str) {
    Scanner in(str);
    auto m = AlgebraIO().readMatroid(in);
    in.expectEOF();
    return m;
  }

  std::string errorMessage(const char* str) {
    try {
      readQSym(str);
    } catch (const MalformedInputError& e) {
      return e.what();
    }
    return "no error";
  }
}

TEST(Scanner, Basics) {
  Scanner in("  (12, -3)\n x");
  ASSERT_TRUE(in.match('('));
  ASSERT_EQ(12, in.readInteger<int>());
  ASSERT_FALSE(in.match(')'));
  in.expect(',');
  ASSERT_EQ(-3, in.readInteger<int>());
  in.expect(")");
  ASSERT_EQ(1u, in.lineCount());
  ASSERT_FALSE(in.matchEOF());
  in.expect('x');
  ASSERT_EQ(2u, in.lineCount());
  ASSERT_TRUE(in.matchEOF());
  in.expectEOF();
}

TEST(Scanner, Stream) {
  std::istringstream input("abc def\n 42");
  Scanner in(input);
  ASSERT_TRUE(in.match("abc"));
  ASSERT_FALSE(in.match("dex"));
  ASSERT_TRUE(in.match("def"));
  ASSERT_EQ(42u, in.readInteger<size_t>());
  in.expectEOF();
}

TEST(Scanner, Errors) {
  {
    Scanner in("4000000000");
    ASSERT_THROW(in.readInteger<int32>(), MalformedInputError);
  }
  {
    Scanner in("-1");
    ASSERT_THROW(in.readInteger<size_t>(), MalformedInputError);
  }
  {
    Scanner in("x");
    ASSERT_THROW(in.readInteger<int>(), MalformedInputError);
  }
  {
    Scanner in("a");
    ASSERT_THROW(in.expect('b'), MalformedInputError);
  }
  {
    Scanner in("a");
    ASSERT_THROW(in.expectEOF(), MalformedInputError);
  }
}

TEST(AlgebraIO, ElementSet) {
  Scanner in("{3,1} {}");
  AlgebraIO io;
  ASSERT_EQ(Matroid::ElementSet({3, 1}), io.readElementSet(in));
  ASSERT_TRUE(io.readElementSet(in).empty());

  std::ostringstream out;
  io.writeElementSet(Matroid::ElementSet{1, 2}, out);
  io.writeElementSet(Matroid::ElementSet(), out);
  ASSERT_EQ("{1,2}{}", out.str());
}

TEST(AlgebraIO, Matroid) {
  const auto m = readMatroid("({1,2,3}, {{1,2},{1,3},{2,3}})");
  ASSERT_EQ(uniformMatroid(3, 2), m);
  ASSERT_EQ(m, readMatroid(m.toString().c_str()));
  ASSERT_EQ(uniformMatroid(2, 0), readMatroid(" ( { 2 , 1 } , { { } } ) "));

  ASSERT_THROW(readMatroid("({1,2}, {})"), InvalidMatroidError);
  ASSERT_THROW(readMatroid("({1,2}, {{1},{1,2}})"), InvalidMatroidError);
  ASSERT_THROW(readMatroid("({1,2} {{1}})"), MalformedInputError);
  ASSERT_THROW(readMatroid("({1,2}, {{1}}"), MalformedInputError);
}

TEST(AlgebraIO, QSym) {
  const auto f = readQSym("2 M(1,1) + M(2)");
  ASSERT_EQ(2, f.coefficient(Composition({1, 1})));
  ASSERT_EQ(1, f.coefficient(Composition({2})));
  ASSERT_EQ(f, readQSym(f.toString().c_str()));

  const auto g = readQSym("- M(2) + 3M(1) - 2 M(1)");
  ASSERT_EQ(-1, g.coefficient(Composition({2})));
  ASSERT_EQ(1, g.coefficient(Composition({1})));
  ASSERT_EQ("M(1) - M(2)", g.toString());

  ASSERT_TRUE(readQSym("0").isZero());
  ASSERT_TRUE(readQSym("M(1) - M(1)").isZero());
  ASSERT_EQ(QSymFunction(Composition()), readQSym("M()"));

  const auto big = readQSym("123456789012345678901234567890 M(3)");
  ASSERT_EQ(Coefficient("123456789012345678901234567890"),
    big.coefficient(Composition({3})));

  std::ostringstream out;
  AlgebraIO().writeQSym(f, out);
  ASSERT_EQ("2 M(1,1) + M(2)", out.str());
}

TEST(AlgebraIO, NCQSym) {
  const auto f = readNCQSym("M(1|2) + M(2|1)");
  ASSERT_EQ(2u, f.terms().size());
  ASSERT_EQ(f, readNCQSym(f.toString().c_str()));
  ASSERT_EQ(readQSym("2 M(1,1)"), comu(f));

  std::ostringstream out;
  AlgebraIO().writeNCQSym(readNCQSym("3 M(2,4|1)"), out);
  ASSERT_EQ("3 M(2,4|1)", out.str());

  ASSERT_THROW(readNCQSym("M(1|1)"), StructuralViolationError);
}

TEST(AlgebraIO, Errors) {
  ASSERT_EQ("Syntax error on line 1: Expected 'M', but got 'X'.",
    errorMessage("2 X(1)"));
  ASSERT_THROW(readQSym(""), MalformedInputError);
  ASSERT_THROW(readQSym("M(1) +"), MalformedInputError);
  ASSERT_THROW(readQSym("M(1) M(2)"), MalformedInputError);
  ASSERT_THROW(readQSym("2"), MalformedInputError);
  ASSERT_THROW(readQSym("M(0)"), MalformedInputError);
  ASSERT_THROW(readQSym("0 M(1) 0"), MalformedInputError);
}
