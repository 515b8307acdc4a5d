// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "NCQSymFunction.hpp"

MATQSYM_NAMESPACE_BEGIN

QSymFunction comu(const NCQSymFunction& f) {
  QSymFunction::Terms terms;
  const auto& ncTerms = f.terms();
  for (auto it = ncTerms.begin(); it != ncTerms.end(); ++it)
    terms[it->first.alpha()] += it->second;
  return QSymFunction(std::move(terms));
}

MATQSYM_NAMESPACE_END
