// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "StableAction.hpp"

#include "matqsym/AlgebraIO.hpp"
#include "matqsym/Stability.hpp"
#include <iostream>

MATQSYM_NAMESPACE_BEGIN

StableAction::StableAction(): mParams(2, 2) {}

void StableAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void StableAction::performAction() {
  mParams.perform();

  Scanner in(mParams.directParameter(0));
  const auto matroid = AlgebraIO().readMatroid(in);
  in.expectEOF();
  const auto pi = SetComposition::parse(mParams.directParameter(1));

  std::cout << matroid << ' ' << pi
    << (isStable(matroid, pi) ? " is stable\n" : " is not stable\n");
}

const char* StableAction::staticName() {
  return "stable";
}

const char* StableAction::name() const {
  return staticName();
}

const char* StableAction::description() const {
  return "Decide if a set composition PI is stable for a matroid M, that is "
    "if exactly one basis of M maximizes the sum of the block indices of "
    "its elements. The direct parameters are M, written like "
    "\"({1,2,3}, {{1,2},{1,3},{2,3}})\", and PI, written like (1|2,3).";
}

const char* StableAction::shortDescription() const {
  return "Test a set composition for stability.";
}

void StableAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
}

MATQSYM_NAMESPACE_END
