// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "ShuffleAction.hpp"

#include "matqsym/QSymFunction.hpp"
#include "matqsym/NCQSymFunction.hpp"
#include <iostream>

MATQSYM_NAMESPACE_BEGIN

ShuffleAction::ShuffleAction():
  mSet(
    "set",
    "The operands are set compositions such as (1,3|2) instead of "
    "compositions such as (2,1). Their ground sets must be disjoint.",
    false),

  mParams(2, 2)
{}

void ShuffleAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void ShuffleAction::performAction() {
  mParams.perform();
  const auto& a = mParams.directParameter(0);
  const auto& b = mParams.directParameter(1);

  if (mSet.value()) {
    SetCompositionCache cache;
    const NCQSymFunction f(SetComposition::parse(a));
    const NCQSymFunction g(SetComposition::parse(b));
    std::cout << f.multiply(g, cache) << '\n';
  } else {
    CompositionCache cache;
    const QSymFunction f(Composition::parse(a));
    const QSymFunction g(Composition::parse(b));
    std::cout << f.multiply(g, cache) << '\n';
  }
}

const char* ShuffleAction::staticName() {
  return "shuffle";
}

const char* ShuffleAction::name() const {
  return staticName();
}

const char* ShuffleAction::description() const {
  return "Print the quasi-shuffle product M_A M_B as a sum of monomial "
    "quasisymmetric functions. A and B are the two direct parameters, "
    "written like (2,1) or, with -set, like (1,3|2).";
}

const char* ShuffleAction::shortDescription() const {
  return "Multiply two monomial functions.";
}

void ShuffleAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mSet);
}

MATQSYM_NAMESPACE_END
