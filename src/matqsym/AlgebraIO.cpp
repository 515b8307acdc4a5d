// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "AlgebraIO.hpp"

#include <string>
#include <vector>

MATQSYM_NAMESPACE_BEGIN

auto AlgebraIO::readElementSet(Scanner& in) -> ElementSet {
  in.expect('{');
  ElementSet set;
  if (!in.match('}')) {
    do {
      set.push_back(in.readInteger<Matroid::Element>());
    } while (in.match(','));
    in.expect('}');
  }
  return set;
}

void AlgebraIO::writeElementSet(const ElementSet& set, std::ostream& out) {
  out << '{';
  for (size_t i = 0; i < set.size(); ++i) {
    if (i > 0)
      out << ',';
    out << set[i];
  }
  out << '}';
}

Matroid AlgebraIO::readMatroid(Scanner& in) {
  in.expect('(');
  auto groundSet = readElementSet(in);
  in.expect(',');
  in.expect('{');
  std::vector<ElementSet> bases;
  if (!in.match('}')) {
    do {
      bases.push_back(readElementSet(in));
    } while (in.match(','));
    in.expect('}');
  }
  in.expect(')');
  return Matroid(std::move(groundSet), bases);
}

void AlgebraIO::writeMatroid(const Matroid& matroid, std::ostream& out) {
  out << '(';
  writeElementSet(matroid.groundSet(), out);
  out << ", {";
  const auto& bases = matroid.bases();
  for (auto it = bases.begin(); it != bases.end(); ++it) {
    if (it != bases.begin())
      out << ',';
    writeElementSet(*it, out);
  }
  out << "})";
}

Coefficient AlgebraIO::readCoefficient(Scanner& in) {
  in.eatWhite();
  if (!in.peekDigit())
    in.reportErrorUnexpectedToken("a coefficient", in.peek());
  std::string digits;
  while (in.peekDigit())
    digits += static_cast<char>(in.get());
  return Coefficient(digits);
}

template<class Sum>
Sum AlgebraIO::readFormalSum(Scanner& in) {
  typename Sum::Terms terms;
  bool first = true;
  while (true) {
    bool negate = false;
    if (in.match('-'))
      negate = true;
    else if (!first && !in.match('+'))
      break;

    in.eatWhite();
    Coefficient coefficient = 1;
    bool sawCoefficient = false;
    if (in.peekDigit()) {
      coefficient = readCoefficient(in);
      sawCoefficient = true;
    }
    if (!in.match('M')) {
      // A single 0 is the zero function.
      if (first && !negate && sawCoefficient && coefficient == 0)
        return Sum();
      in.reportErrorUnexpectedToken("'M'", in.peek());
    }

    const auto key = Sum::Key::read(in);
    if (negate)
      coefficient = -coefficient;
    terms[key] += coefficient;
    first = false;
  }
  return Sum(std::move(terms));
}

QSymFunction AlgebraIO::readQSym(Scanner& in) {
  return readFormalSum<QSymFunction>(in);
}

void AlgebraIO::writeQSym(const QSymFunction& f, std::ostream& out) {
  f.write(out);
}

NCQSymFunction AlgebraIO::readNCQSym(Scanner& in) {
  return readFormalSum<NCQSymFunction>(in);
}

void AlgebraIO::writeNCQSym(const NCQSymFunction& f, std::ostream& out) {
  f.write(out);
}

MATQSYM_NAMESPACE_END
