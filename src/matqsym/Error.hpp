// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_ERROR_GUARD
#define MATQSYM_ERROR_GUARD

#include <mathic.h>
#include <string>

MATQSYM_NAMESPACE_BEGIN

/// Base of the exceptions that MatQSym throws for invalid input. Deriving
/// from mathic::MathicException lets the command line driver report these
/// the same way as errors from mathic itself.
class MatQSymError : public mathic::MathicException {
public:
  explicit MatQSymError(const std::string& message):
    mathic::MathicException(message) {}
};

/// Defines an exception class NAME##Error deriving from MatQSymError.
#define MATQSYM_DEFINE_ERROR(NAME) \
  class NAME##Error : public MatQSymError { \
  public: \
    explicit NAME##Error(const std::string& message): \
      MatQSymError(message) {} \
  }

/// Text that cannot be parsed, wrong element types or non-positive integers.
MATQSYM_DEFINE_ERROR(MalformedInput);

/// Non-disjoint blocks or a relabeling map that is not a total bijection.
MATQSYM_DEFINE_ERROR(StructuralViolation);

/// rest() of an empty composition or set composition.
MATQSYM_DEFINE_ERROR(EmptyStructure);

/// A basis family that violates the matroid basis axioms.
MATQSYM_DEFINE_ERROR(InvalidMatroid);

/// Operands whose ground sets are incompatible for the operation.
MATQSYM_DEFINE_ERROR(DomainMismatch);

#undef MATQSYM_DEFINE_ERROR

void reportMalformedInput(const std::string& message);
void reportStructuralViolation(const std::string& message);
void reportEmptyStructure(const std::string& message);
void reportInvalidMatroid(const std::string& message);
void reportDomainMismatch(const std::string& message);

MATQSYM_NAMESPACE_END

#endif
