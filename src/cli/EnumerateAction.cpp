// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "EnumerateAction.hpp"

#include "matqsym/CompositionCache.hpp"
#include "matqsym/SetCompositionCache.hpp"
#include "matqsym/Scanner.hpp"
#include <iostream>

MATQSYM_NAMESPACE_BEGIN

namespace {
  template<class T>
  void printAll(const std::vector<T>& all, std::ostream& out) {
    for (auto it = all.begin(); it != all.end(); ++it)
      out << *it << '\n';
  }
}

EnumerateAction::EnumerateAction():
  mSet(
    "set",
    "Enumerate the set compositions of {1,...,n} instead of the "
    "compositions of n.",
    false),

  mPrint(
    "print",
    "Print every enumerated object on its own line after the count.",
    false),

  mParams(1, 1)
{}

void EnumerateAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void EnumerateAction::performAction() {
  mParams.perform();

  Scanner in(mParams.directParameter(0));
  const auto n = in.readInteger<size_t>();
  in.expectEOF();

  if (mSet.value()) {
    SetCompositionCache cache;
    const auto& all = cache.allSetCompositions(n);
    std::cout << all.size() << '\n';
    if (mPrint.value())
      printAll(all, std::cout);
  } else {
    CompositionCache cache;
    const auto& all = cache.allCompositions(n);
    std::cout << all.size() << '\n';
    if (mPrint.value())
      printAll(all, std::cout);
  }
}

const char* EnumerateAction::staticName() {
  return "enumerate";
}

const char* EnumerateAction::name() const {
  return staticName();
}

const char* EnumerateAction::description() const {
  return "Count the compositions of n, or with -set the set compositions of "
    "{1,...,n}. The integer n is a required direct parameter.";
}

const char* EnumerateAction::shortDescription() const {
  return "Enumerate (set) compositions.";
}

void EnumerateAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mSet);
  parameters.push_back(&mPrint);
}

MATQSYM_NAMESPACE_END
