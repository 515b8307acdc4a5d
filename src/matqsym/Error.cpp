// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Error.hpp"

MATQSYM_NAMESPACE_BEGIN

void reportMalformedInput(const std::string& message) {
  throw MalformedInputError(message);
}

void reportStructuralViolation(const std::string& message) {
  throw StructuralViolationError(message);
}

void reportEmptyStructure(const std::string& message) {
  throw EmptyStructureError(message);
}

void reportInvalidMatroid(const std::string& message) {
  throw InvalidMatroidError(message);
}

void reportDomainMismatch(const std::string& message) {
  throw DomainMismatchError(message);
}

MATQSYM_NAMESPACE_END
