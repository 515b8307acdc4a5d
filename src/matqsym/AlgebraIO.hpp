// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_ALGEBRA_IO_GUARD
#define MATQSYM_ALGEBRA_IO_GUARD

#include "Scanner.hpp"
#include "Matroid.hpp"
#include "QSymFunction.hpp"
#include "NCQSymFunction.hpp"
#include <ostream>

MATQSYM_NAMESPACE_BEGIN

/// Class for input and output of matroids and formal sums in MatQSym's text
/// format. Compositions and set compositions read and write themselves.
///
/// The formats are
///   element set   {1,2,3}
///   matroid       ({1,2,3}, {{1,2},{1,3},{2,3}})
///   formal sum    2 M(1,1) - M(2)   or   0
/// with white space allowed between tokens.
class AlgebraIO {
public:
  typedef Matroid::ElementSet ElementSet;

  ElementSet readElementSet(Scanner& in);
  void writeElementSet(const ElementSet& set, std::ostream& out);

  Matroid readMatroid(Scanner& in);
  void writeMatroid(const Matroid& matroid, std::ostream& out);

  /// Reads a non-negative integer of any size.
  Coefficient readCoefficient(Scanner& in);

  QSymFunction readQSym(Scanner& in);
  void writeQSym(const QSymFunction& f, std::ostream& out);

  NCQSymFunction readNCQSym(Scanner& in);
  void writeNCQSym(const NCQSymFunction& f, std::ostream& out);

private:
  template<class Sum>
  Sum readFormalSum(Scanner& in);
};

MATQSYM_NAMESPACE_END

#endif
