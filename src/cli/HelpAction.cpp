// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "HelpAction.hpp"

#include "matqsym/LogDomain.hpp"
#include "matqsym/LogDomainSet.hpp"
#include <algorithm>
#include <iostream>

MATQSYM_NAMESPACE_BEGIN

void HelpAction::performAction() {
  if (topic() != "logs") {
    mathic::HelpAction::performAction();
    return;
  }

  const char* header =
    "MatQSym keeps a set of logs that can be enabled or disabled "
    "individually. Most of them time and count the work done by the "
    "enumeration and quasi-shuffle caches, the matroid validation and the "
    "chromatic function computation.\n"
    "\n"
    "A log has a streaming component that prints messages as events occur "
    "and a summary component that is printed when the program ends. An "
    "enabled log prints its summary if it registered any events, and its "
    "streaming can be turned off separately.\n"
    "\n"
    "Specify the log configuration with -logs X, where X is a "
    "comma-separated list of log specifications such as\n"
    "\n"
    "    A,+B,-C,D+,E-\n"
    "\n"
    "which enables A, B, D and E and disables C. Streaming is turned on for "
    "D and off for E. A prefix of - disables a log while no prefix or a "
    "prefix of + enables it. A suffix of - turns off streaming and a suffix "
    "of + turns it on. A prefix or suffix of 0 means do nothing.\n"
    "\n"
    "These are the compile-time enabled logs. The prefixes and suffixes "
    "show the default state of each log.\n";
  mathic::display(header);
  auto& logs = LogDomainSet::singleton().logDomains();
  for (auto it = logs.begin(); it != logs.end(); ++it) {
    const auto toSign = [](const bool b) {return b ? '+' : '-';};
    std::cerr
      << "\n "
      << toSign((*it)->enabled())
      << (*it)->name()
      << toSign((*it)->streamEnabledPure())
      << '\n';
    mathic::display((*it)->description(), "   ");
  }

  const char* aliasDescription =
    "\nAn alias is a name that stands for several log specifications. "
    "Prefixes and suffixes apply to aliases too, so if X expands to A+,-B "
    "then +X- expands to +A-,+B-.\n"
    "\n"
    "These are the aliases.\n";
  mathic::display(aliasDescription);
  auto& aliases = LogDomainSet::singleton().aliases();
  for (auto it = aliases.begin(); it != aliases.end(); ++it) {
    std::cerr << "\n " << it->first << " expands to\n";
    std::string str = it->second;
    std::replace(str.begin(), str.end(), ',', ' ');
    mathic::display(str, "   ");
  }
  std::cerr <<
    "\n none expands to nothing\n"
    "\n"
    " all expands to all log names\n"
    "\n";
}

MATQSYM_NAMESPACE_END
