// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"

#include "EnumerateAction.hpp"
#include "ShuffleAction.hpp"
#include "StableAction.hpp"
#include "ChromaticAction.hpp"
#include "HelpAction.hpp"
#include "matqsym/LogDomainSet.hpp"
#include <mathic.h>
#include <iostream>
#include <exception>

int main(int argc, char **argv) {
  try {
    mathic::CliParser parser;
    parser.registerAction<mqs::EnumerateAction>();
    parser.registerAction<mqs::ShuffleAction>();
    parser.registerAction<mqs::StableAction>();
    parser.registerAction<mqs::ChromaticAction>();
    parser.registerAction<mqs::HelpAction>();

    std::vector<std::string> commandLine(argv, argv + argc);
    commandLine.erase(commandLine.begin());

    parser.parse(commandLine)->performAction();
  } catch (const mathic::MathicException& e) {
    mathic::display(e.what());
    return -1;
  } catch (std::exception& e) {
    mathic::display(e.what());
    return -1;
  } catch (...) {
    std::cout << "UNKNOWN ERROR" << std::endl;
    // an outer handler may know more about this exception.
    throw;
  }

  mqs::LogDomainSet::singleton().printReport(std::cerr);
  return 0;
}
