// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_LOG_DOMAIN_SET_GUARD
#define MATQSYM_LOG_DOMAIN_SET_GUARD

#include "LogDomain.hpp"
#include <tbb/tick_count.h>
#include <string>
#include <vector>
#include <utility>
#include <ostream>

MATQSYM_NAMESPACE_BEGIN

class LogDomainSet {
public:
  void registerLogDomain(LogDomain<true>& domain);
  void registerLogDomain(const LogDomain<false>&) {}

  void registerLogAlias(const char* alias, const char* of);

  /// A log command has the format AXB, where
  ///   X       the name of a compile-time enabled log domain or an alias
  ///   A       a prefix
  ///   B       a suffix
  /// The possible values of A are
  ///           enable X (this is the empty string)
  ///   +       enable X
  ///   -       disable X
  ///   0       leave the enabled state of X as-is
  /// The possible values of B are
  ///           leave the streaming state as-is (this is the empty string)
  ///   +       stream-enable X
  ///   -       stream-disable X
  ///   0       leave the streaming state as-is
  ///
  /// X can also be "all", meaning every log, or "none", meaning nothing.
  /// No white-space is allowed. If the command cannot be parsed then you
  /// will get an exception.
  void performLogCommand(std::string cmd);

  /// Performs a comma-seperated list of commands. No white-space is allowed.
  void performLogCommands(const std::string& cmds);

  /// Returns the log with the given name, or null if there is no such log.
  LogDomain<true>* logDomain(const char* const name);

  /// Returns the expansion of the given alias, or null if there is no such
  /// alias.
  const char* alias(const char* name);

  const std::vector<LogDomain<true>*>& logDomains() const {return mLogDomains;}

  const std::vector<std::pair<const char*, const char*>>& aliases() const {
    return mAliases;
  }

  void printReport(std::ostream& out) const;
  void printTimeReport(std::ostream& out) const;
  void printCountReport(std::ostream& out) const;

  /// Resets the time and count of every log.
  void reset();

  static LogDomainSet& singleton();

private:
  LogDomainSet(); // private for singleton

  std::vector<LogDomain<true>*> mLogDomains;
  std::vector<std::pair<const char*, const char*>> mAliases;
  tbb::tick_count mStartTime;
};

MATQSYM_NAMESPACE_END

#endif
