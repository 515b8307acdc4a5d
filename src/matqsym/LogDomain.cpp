// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "LogDomain.hpp"

#include "LogDomainSet.hpp"
#include <iostream>

MATQSYM_NAMESPACE_BEGIN

LogDomain<true>::LogDomain(
  const char* const name,
  const char* const description,
  const bool enabled,
  const bool streamEnabled
):
  mEnabled(enabled),
  mStreamEnabled(streamEnabled),
  mName(name),
  mDescription(description),
  mInterval(),
  mHasTime(false),
  mCount(0),
  mHasCount(false)
{
  LogDomainSet::singleton().registerLogDomain(*this);
}

std::ostream& LogDomain<true>::stream() {
  return std::cerr;
}

LogDomain<true>::Timer LogDomain<true>::timer() {
  return Timer(*this);
}

double LogDomain<true>::loggedSecondsReal() const {
  return mInterval.realSeconds;
}

void LogDomain<true>::reset() {
  mInterval.realSeconds = 0;
  mHasTime = false;
  mCount = 0;
  mHasCount = false;
}

void LogDomain<true>::TimeInterval::print(std::ostream& out) const {
  const auto oldFlags = out.flags();
  const auto oldPrecision = out.precision();
  out.precision(3);
  out << std::fixed << realSeconds << "s (real)";
  out.precision(oldPrecision);
  out.flags(oldFlags);
}

void LogDomain<true>::recordTime(TimeInterval interval) {
  if (!enabled())
    return;
  mInterval.realSeconds += interval.realSeconds;
  mHasTime = true;

  if (streamEnabled()) {
    MATQSYM_ASSERT(mName != 0);
    stream() << mName << " time recorded:        ";
    interval.print(stream());
    stream() << std::endl;
  }
}

LogDomain<true>::Timer::Timer(LogDomain<true>& logger):
  mLogger(logger),
  mTimerRunning(false),
  mRealTicks()
{
  start();
}

LogDomain<true>::Timer::~Timer() {
  stop();
}

void LogDomain<true>::Timer::stop() {
  if (!running())
    return;
  mTimerRunning = false;
  if (!mLogger.enabled())
    return;
  TimeInterval interval;
  interval.realSeconds = (tbb::tick_count::now() - mRealTicks).seconds();
  mLogger.recordTime(interval);
}

void LogDomain<true>::Timer::start() {
  if (!mLogger.enabled() || mTimerRunning)
    return;
  mTimerRunning = true;
  mRealTicks = tbb::tick_count::now();
}

namespace LogDomainInternal {
  LogAliasRegisterer::LogAliasRegisterer(const char* alias, const char* of) {
    LogDomainSet::singleton().registerLogAlias(alias, of);
  }
}

MATQSYM_NAMESPACE_END
