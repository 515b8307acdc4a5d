// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "LogDomainSet.hpp"

#include <mathic.h>
#include <algorithm>
#include <cstring>

MATQSYM_NAMESPACE_BEGIN

LogDomainSet::LogDomainSet():
  mStartTime(tbb::tick_count::now()) {
}

void LogDomainSet::registerLogDomain(LogDomain<true>& domain) {
  mLogDomains.push_back(&domain);
}

void LogDomainSet::registerLogAlias(const char* alias, const char* of) {
  MATQSYM_ASSERT(this->alias(alias) == 0);
  mAliases.push_back(std::make_pair(alias, of));
}

LogDomain<true>* LogDomainSet::logDomain(const char* const name) {
  const auto func = [&](const LogDomain<true>* const ld){
    return std::strcmp(ld->name(), name) == 0;
  };
  const auto it = std::find_if(mLogDomains.begin(), mLogDomains.end(), func);
  return it == mLogDomains.end() ? static_cast<LogDomain<true>*>(0) : *it;
}

const char* LogDomainSet::alias(const char* name) {
  const auto func = [&](const std::pair<const char*, const char*> p){
    return std::strcmp(p.first, name) == 0;
  };
  const auto it = std::find_if(mAliases.begin(), mAliases.end(), func);
  return it == mAliases.end() ? static_cast<const char*>(0) : it->second;
}

void LogDomainSet::performLogCommands(const std::string& cmds) {
  if (cmds.empty())
    return;
  size_t offset = 0;
  while (true) {
    const auto end = cmds.find(',', offset);
    performLogCommand(cmds.substr(offset, end - offset));
    if (end == std::string::npos)
      break;
    offset = end + 1;
  }
}

void LogDomainSet::performLogCommand(std::string cmd) {
  if (cmd.empty())
    mathic::reportError("Empty log command");

  const auto isSign = [](const char c) {
    return c == '+' || c == '-' || c == '0';
  };
  char prefix = '\0';
  if (isSign(cmd.front())) {
    prefix = cmd.front();
    cmd.erase(cmd.begin());
  }
  char suffix = '\0';
  if (!cmd.empty() && isSign(cmd.back())) {
    suffix = cmd.back();
    cmd.pop_back();
  }
  if (cmd.empty())
    mathic::reportError("Log command has no log name");

  if (cmd == "none")
    return;

  if (cmd == "all") {
    for (auto it = mLogDomains.begin(); it != mLogDomains.end(); ++it) {
      std::string expanded;
      if (prefix != '\0')
        expanded += prefix;
      expanded += (*it)->name();
      if (suffix != '\0')
        expanded += suffix;
      performLogCommand(expanded);
    }
    return;
  }

  const char* const expansion = alias(cmd.c_str());
  if (expansion != 0) {
    // The prefix and suffix of the alias overrides those in the expansion.
    std::string of(expansion);
    size_t offset = 0;
    while (true) {
      const auto end = of.find(',', offset);
      std::string sub = of.substr(offset, end - offset);
      if (!sub.empty()) {
        if (prefix != '\0') {
          if (isSign(sub.front()))
            sub.front() = prefix;
          else
            sub.insert(sub.begin(), prefix);
        }
        if (suffix != '\0') {
          if (sub.size() > 1 && isSign(sub.back()))
            sub.back() = suffix;
          else
            sub.push_back(suffix);
        }
        performLogCommand(sub);
      }
      if (end == std::string::npos)
        break;
      offset = end + 1;
    }
    return;
  }

  auto log = logDomain(cmd.c_str());
  if (log == 0)
    mathic::reportError("Unknown log \"" + cmd + "\".");

  if (prefix == '\0' || prefix == '+')
    log->setEnabled(true);
  else if (prefix == '-')
    log->setEnabled(false);

  if (suffix == '+')
    log->setStreamEnabled(true);
  else if (suffix == '-')
    log->setStreamEnabled(false);
}

void LogDomainSet::printReport(std::ostream& out) const {
  printCountReport(out);
  printTimeReport(out);
}

void LogDomainSet::printTimeReport(std::ostream& out) const {
  const auto allTime = (tbb::tick_count::now() - mStartTime).seconds();

  mathic::ColumnPrinter pr;
  auto& names = pr.addColumn(true);
  auto& times = pr.addColumn(false);
  auto& ratios = pr.addColumn(false);
  times.precision(3);
  times << std::fixed;
  ratios.precision(3);
  ratios << std::fixed;

  names << "Log name  \n";
  times << "  Time/s (real)\n";
  ratios << "  Ratio\n";
  pr.repeatToEndOfLine('-');

  double timeSum = 0;
  bool somethingToReport = false;
  const auto end = logDomains().cend();
  for (auto it = logDomains().cbegin(); it != end; ++it) {
    const auto& log = **it;
    if (!log.enabled() || !log.hasTime())
      continue;
    somethingToReport = true;

    const auto logTime = log.loggedSecondsReal();
    timeSum += logTime;
    names << log.name() << '\n';
    times << logTime << '\n';
    ratios << mathic::ColumnPrinter::percentDouble(logTime, allTime) << '\n';
  }
  if (!somethingToReport)
    return;
  pr.repeatToEndOfLine('-');
  names << "sum\n";
  times << timeSum;
  ratios << mathic::ColumnPrinter::percentDouble(timeSum, allTime) << '\n';

  const auto oldFlags = out.flags();
  const auto oldPrecision = out.precision();
  out << std::fixed;
  out.precision(3);
  out << "***** Time report *****\nTime elapsed: "
    << allTime << "s\n\n" << pr << '\n';
  out.precision(oldPrecision);
  out.flags(oldFlags);
}

void LogDomainSet::printCountReport(std::ostream& out) const {
  mathic::ColumnPrinter pr;
  auto& names = pr.addColumn(true);
  auto& counts = pr.addColumn(false);
  names << "Log name  \n";
  counts << "  Count\n";
  pr.repeatToEndOfLine('-');

  bool somethingToReport = false;
  const auto end = logDomains().cend();
  for (auto it = logDomains().cbegin(); it != end; ++it) {
    const auto& log = **it;
    if (!log.enabled() || !log.hasCount())
      continue;
    somethingToReport = true;
    names << log.name() << '\n';
    counts << log.count() << '\n';
  }
  if (!somethingToReport)
    return;

  out << "***** Count report *****\n\n" << pr << '\n';
}

void LogDomainSet::reset() {
  mStartTime = tbb::tick_count::now();
  const auto end = logDomains().cend();
  for (auto it = logDomains().cbegin(); it != end; ++it)
    (*it)->reset();
}

LogDomainSet& LogDomainSet::singleton() {
  static LogDomainSet set;
  return set;
}

MATQSYM_NAMESPACE_END
