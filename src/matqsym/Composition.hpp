// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_COMPOSITION_GUARD
#define MATQSYM_COMPOSITION_GUARD

#include <vector>
#include <string>
#include <ostream>
#include <initializer_list>

MATQSYM_NAMESPACE_BEGIN

class Scanner;

/// A composition of n is a sequence of positive integers, the parts, that sum
/// to n. The empty composition is the unique composition of 0.
///
/// Compositions are values: nothing changes a composition after it has been
/// constructed, rest() and prepend() return new compositions.
class Composition {
public:
  typedef int32 Part;
  typedef std::vector<Part> Parts;

  /// Constructs the empty composition.
  Composition(): mN(0) {}

  /// Throws MalformedInputError if a part is not positive.
  explicit Composition(Parts parts);
  Composition(std::initializer_list<Part> parts);

  /// Parses the format (2,1,3). The empty composition is ().
  static Composition parse(const std::string& str);

  /// Reads a composition in the format of parse() from in.
  static Composition read(Scanner& in);

  const Parts& parts() const {return mParts;}

  /// Returns the sum of the parts.
  int64 n() const {return mN;}

  size_t partCount() const {return mParts.size();}
  bool empty() const {return mParts.empty();}

  Part first() const;

  /// Returns the composition without its first part. Throws
  /// EmptyStructureError if this composition is empty.
  Composition rest() const;

  /// Returns the composition with a prepended as the first part.
  Composition prepend(Part a) const;

  std::string toString() const;
  void write(std::ostream& out) const;

  bool operator==(const Composition& c) const {return mParts == c.mParts;}
  bool operator!=(const Composition& c) const {return !(*this == c);}

  /// Orders by n and then lexicographically by parts.
  bool operator<(const Composition& c) const {
    if (mN != c.mN)
      return mN < c.mN;
    return mParts < c.mParts;
  }

private:
  void validate();

  Parts mParts;
  int64 mN;
};

std::ostream& operator<<(std::ostream& out, const Composition& c);

MATQSYM_NAMESPACE_END

#endif
