// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Composition.hpp"

#include "Scanner.hpp"
#include "Error.hpp"
#include <sstream>

MATQSYM_NAMESPACE_BEGIN

Composition::Composition(Parts parts):
  mParts(std::move(parts)),
  mN(0)
{
  validate();
}

Composition::Composition(std::initializer_list<Part> parts):
  mParts(parts),
  mN(0)
{
  validate();
}

void Composition::validate() {
  for (auto it = mParts.begin(); it != mParts.end(); ++it) {
    if (*it <= 0) {
      std::ostringstream err;
      err << "All parts of a composition must be positive integers, got "
        << *it << '.';
      reportMalformedInput(err.str());
    }
    mN += *it;
  }
}

Composition Composition::parse(const std::string& str) {
  Scanner in(str);
  auto c = read(in);
  in.expectEOF();
  return c;
}

Composition Composition::read(Scanner& in) {
  in.expect('(');
  Parts parts;
  if (!in.match(')')) {
    do {
      parts.push_back(in.readInteger<Part>());
    } while (in.match(','));
    in.expect(')');
  }
  return Composition(std::move(parts));
}

Composition::Part Composition::first() const {
  if (empty())
    reportEmptyStructure("The empty composition has no first part.");
  return mParts.front();
}

Composition Composition::rest() const {
  if (empty())
    reportEmptyStructure("Cannot take the rest of the empty composition.");
  Composition c;
  c.mParts.assign(mParts.begin() + 1, mParts.end());
  c.mN = mN - mParts.front();
  return c;
}

Composition Composition::prepend(const Part a) const {
  if (a <= 0) {
    std::ostringstream err;
    err << "Cannot prepend the non-positive part " << a << '.';
    reportMalformedInput(err.str());
  }
  Composition c;
  c.mParts.reserve(partCount() + 1);
  c.mParts.push_back(a);
  c.mParts.insert(c.mParts.end(), mParts.begin(), mParts.end());
  c.mN = mN + a;
  return c;
}

std::string Composition::toString() const {
  std::ostringstream out;
  write(out);
  return out.str();
}

void Composition::write(std::ostream& out) const {
  out << '(';
  for (size_t i = 0; i < mParts.size(); ++i) {
    if (i > 0)
      out << ',';
    out << mParts[i];
  }
  out << ')';
}

std::ostream& operator<<(std::ostream& out, const Composition& c) {
  c.write(out);
  return out;
}

MATQSYM_NAMESPACE_END
