// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_LOG_DOMAIN_GUARD
#define MATQSYM_LOG_DOMAIN_GUARD

#include <tbb/tick_count.h>
#include <ostream>

MATQSYM_NAMESPACE_BEGIN

/// A named area of logging that can be turned on or off at runtime and at
/// compile time.
///
/// A logger that is turned off at compile time emits no code
/// into the executable and all the code that writes to that logger is also
/// removed by the optimizer if it is written in the correct way. Use the
/// logging macroes to ensure proper use so that compile-time disabled
/// LogDomains properly have zero overhead. LogDomains can be turned on
/// and off at compile time and at runtime individually.
///
/// A log has a streaming component, which prints messages as they happen,
/// and a summary component of recorded time and a counter that is
/// printed in the report at the end of the program.
///
/// Compile-time enabled loggers automatically register themselves with
/// LogDomainSet::singleton().
template<bool CompileTimeEnabled>
class LogDomain {};

template<>
class LogDomain<true> {
public:
  static const bool compileTimeEnabled = true;
  typedef unsigned long long Counter;

  LogDomain(
    const char* const name,
    const char* const description,
    const bool enabled,
    const bool streamEnabled
  );

  const char* name() const {return mName;}
  const char* description() const {return mDescription;}
  bool enabled() const {return mEnabled;}
  bool streamEnabled() const {return enabled() && mStreamEnabled;}

  /// The streaming setting regardless of whether the log is enabled.
  bool streamEnabledPure() const {return mStreamEnabled;}

  void setEnabled(const bool enabled) {mEnabled = enabled;}
  void setStreamEnabled(const bool enabled) {mStreamEnabled = enabled;}

  std::ostream& stream();

  /// Class for recording time that is logged.
  class Timer;

  /// Returns a started timer that you can move from.
  Timer timer();

  /// Returns the number of seconds recorded on this log.
  double loggedSecondsReal() const;

  /// Returns true if any time has been recorded, even if it was 0 seconds.
  bool hasTime() const {return mHasTime;}

  Counter count() const {return mCount;}

  /// Returns true if the counter has been touched.
  bool hasCount() const {return mHasCount;}

  void setCount(const Counter counter) {
    if (enabled()) {
      mCount = counter;
      mHasCount = true;
    }
  }

  void increment(const Counter by = 1) {
    if (enabled()) {
      mCount += by;
      mHasCount = true;
    }
  }

  /// Sets the counter back to zero and forgets any recorded time.
  void reset();

private:
  struct TimeInterval {
    double realSeconds;

    void print(std::ostream& out) const;
  };
  void recordTime(TimeInterval interval);

  bool mEnabled;
  bool mStreamEnabled;
  const char* mName;
  const char* mDescription;

  TimeInterval mInterval; /// Total amount of time recorded on this log.

  /// Indicates if any period of time has been recorded, even if that period
  /// of time was recorded as 0 seconds.
  bool mHasTime;

  Counter mCount;
  bool mHasCount;
};

class LogDomain<true>::Timer {
public:
  /// Start the timer running. The elapsed time will be logged to the logger
  /// once the timer is stopped or destructed.
  Timer(LogDomain<true>& logger);

  /// Stops the timer.
  ~Timer();

  /// Returns true if the timer is currently recording time.
  bool running() const {return mTimerRunning;}

  /// Stops recording time and logs the elapsed time to the logger.
  ///
  /// This is a no-op if the timer is not running. If the logger
  /// is disabled then no time is logged.
  void stop();

  /// Start recording time on a stopped timer.
  ///
  /// This is a no-op is the timer is already running or if the logger is
  /// disabled.
  void start();

private:
  LogDomain<true>& mLogger;
  bool mTimerRunning;
  tbb::tick_count mRealTicks; // high precision
};

/// This is a compile-time disabled logger.
template<>
class LogDomain<false> {
public:
  static const bool compileTimeEnabled = false;
  typedef unsigned long long Counter;

  LogDomain(const char* const, const char* const, const bool, const bool) {}

  bool enabled() const {return false;}
  bool streamEnabled() const {return false;}

  class Timer {
  public:
    Timer(LogDomain<false>&) {}
    bool running() const {return false;}
    void stop() {}
    void start() {}
  };
  Timer timer() {return Timer(*this);}

  void setCount(const Counter) {}
  void increment(const Counter = 1) {}

  std::ostream& stream() {
    MATQSYM_ASSERT(false);
    return *static_cast<std::ostream*>(0);
  }
};

namespace LogDomainInternal {
  // Support code for the logging macroes

  template<class Tag, bool Default>
  struct SelectValue {static const bool value = Default;};

  template<class> struct Tag_ {};
  template<class> struct Tag_0 {};
  template<class> struct Tag_1 {};

  template<bool Default>
  struct SelectValue<Tag_0<int>, Default> {static const bool value = false;};

  template<bool Default>
  struct SelectValue<Tag_1<int>, Default> {static const bool value = true;};

  template<class L>
  struct LambdaRunner {L& log;};
  template<class L>
  LambdaRunner<L> lambdaRunner(L& log) {
    LambdaRunner<L> runner = {log};
    return runner;
  }
  template<class L, class T>
  void operator+(LambdaRunner<L> runner, T&& lambda) {lambda(runner.log);}

  struct LogAliasRegisterer {
    LogAliasRegisterer(const char* alias, const char* of);
  };
}

MATQSYM_NAMESPACE_END

/// Defines LogDomainInternal::value_##NAME to be equal to the value of
/// the macro MATQSYM_LOG_##NAME if that macro expands to 0 or 1. Otherwise
/// the macro MATQSYM_LOG_##NAME is ignored and instead DEFAULT_VALUE is used.
#define MATQSYM_CAPTURE_LOG_ENABLED(NAME, DEFAULT_VALUE) \
  namespace mqs { namespace LogDomainInternal { \
    template<class> struct Tag_MATQSYM_LOG_##NAME {}; \
    typedef MATQSYM_CONCATENATE_AFTER_EXPANSION(Tag_, MATQSYM_LOG_##NAME)<int> \
      SelectedTag_##NAME; \
    static const bool value_##NAME = \
      SelectValue<SelectedTag_##NAME, DEFAULT_VALUE>::value; \
  }}

/// Defines a LogDomain with the given name and description.
///
/// The logger is default compile-time enabled depending on MATQSYM_LOG_##NAME
/// (see MATQSYM_CAPTURE_LOG_ENABLED) and it is initially runtime
/// enabled depending on the value of DEFAULT_RUNTIME_ENABLED. Streaming is
/// initially on depending on DEFAULT_STREAM_ENABLED.
#define MATQSYM_DEFINE_LOG_DOMAIN_WITH_DEFAULTS( \
  NAME, DESCRIPTION, \
  DEFAULT_RUNTIME_ENABLED, \
  DEFAULT_STREAM_ENABLED, \
  DEFAULT_COMPILE_TIME_ENABLED \
) \
  MATQSYM_CAPTURE_LOG_ENABLED(NAME, DEFAULT_COMPILE_TIME_ENABLED) \
  namespace mqs { namespace logs { \
    typedef LogDomain< ::mqs::LogDomainInternal::value_##NAME> Type##NAME; \
    Type##NAME NAME( \
      #NAME, \
      DESCRIPTION, \
      DEFAULT_RUNTIME_ENABLED, \
      DEFAULT_STREAM_ENABLED \
    ); \
  }}

/// Defines a LogDomain with the given name and description.
///
/// By default, the logger is compile-time enabled and runtime disabled with
/// streaming turned on.
#define MATQSYM_DEFINE_LOG_DOMAIN(NAME, DESCRIPTION) \
  MATQSYM_DEFINE_LOG_DOMAIN_WITH_DEFAULTS(NAME, DESCRIPTION, 0, 1, 1)

/// Defines a LogAlias. An alias is a name that expands to a comma-separated
/// list of log commands. See LogDomainSet::performLogCommand.
#define MATQSYM_DEFINE_LOG_ALIAS(ALIAS, OF) \
  namespace mqs { namespace LogDomainInternal { \
    LogAliasRegisterer MATQSYM_CONCATENATE_AFTER_EXPANSION( \
      logAliasRegisterer, __LINE__)(ALIAS, OF); \
  }}

/// This expression yields an l-value reference to the indicated logger.
///
/// Example:
///   auto timer = MATQSYM_LOGGER(MyDomain).timer();
#define MATQSYM_LOGGER(DOMAIN) ::mqs::logs::DOMAIN

/// This expression yields the type of the indicated logger.
///
/// Example:
///   if (MATQSYM_LOGGER_TYPE(MyDomain)::compileTimeEnabled)
///     std::ostream << "MyDomain is compiled time enabled";
#define MATQSYM_LOGGER_TYPE(DOMAIN) ::mqs::logs::Type##DOMAIN

/// Runs the code in the following scope delimited by braces {} if the indicated
/// logger is enabled - otherwise does nothing. Within the following scope
/// there is a local reference variable log that refers to the indicated
/// logger.
///
/// Example:
///   MATQSYM_IF_LOG(MyDomain) {
///     std::string msg;
///     expensiveFunction(msg);
///     log.stream() << msg;
///   };
#define MATQSYM_IF_LOG(DOMAIN) \
  if (MATQSYM_LOGGER(DOMAIN).enabled()) \
    ::mqs::LogDomainInternal::lambdaRunner(MATQSYM_LOGGER(DOMAIN)) + \
      [&](MATQSYM_LOGGER_TYPE(DOMAIN)& log)

/// Display information to the log using <<.
/// If the domain is not stream enabled then the log message is not displayed
/// and the code after << is not executed.
///
/// Example: (f() only called if logger is enabled)
///   MATQSYM_LOG(domain) << "f() = " << f();
#define MATQSYM_LOG(DOMAIN) \
  if (MATQSYM_LOGGER(DOMAIN).streamEnabled()) MATQSYM_LOGGER(DOMAIN).stream()

/// Will log the time to execute the remaining code in the current scope
/// to the indicated domain. Also supports printing a message using <<.
/// The message is printed right away while the time is printed when
/// the scope ends.
///
/// Example:
///   MATQSYM_LOG_TIME(MyDomain) << "Starting timed task";
#define MATQSYM_LOG_TIME(DOMAIN) \
  auto MATQSYM_CONCATENATE_AFTER_EXPANSION(MATQSYM_timer##DOMAIN, __LINE__) = \
    MATQSYM_LOGGER(DOMAIN).timer(); \
  MATQSYM_LOG(DOMAIN)

/// Increments the count of DOMAIN by BY.
#define MATQSYM_LOG_INCREMENT_BY(DOMAIN, BY) \
  do { \
    if (MATQSYM_LOGGER(DOMAIN).enabled()) { \
      MATQSYM_LOGGER(DOMAIN).increment(BY); \
    } \
  } while (false)

/// Increments the count of DOMAIN by 1.
#define MATQSYM_LOG_INCREMENT(DOMAIN) MATQSYM_LOG_INCREMENT_BY(DOMAIN, 1)

#endif
