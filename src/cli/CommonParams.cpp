// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "CommonParams.hpp"

#include "matqsym/LogDomain.hpp"
#include "matqsym/LogDomainSet.hpp"

MATQSYM_NAMESPACE_BEGIN

CommonParams::CommonParams(size_t minDirectParams, size_t maxDirectParams):
  mThreadCount("threadCount",
    "Specifies how many threads to use at a time. A value of 0 lets tbb "
    "decide.",
    1),

  mLogs("logs",
    "Enable the specified log. Do \"help logs\" to see all available logs. "
    "To enable logs X, Y and Z, do \"-logs x,y,z\".",
    ""),

  mMinDirectParams(minDirectParams),
  mMaxDirectParams(maxDirectParams)
{
}

void CommonParams::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  if (tokens.size() < mMinDirectParams)
    mathic::reportError("Too few direct options");
  if (tokens.size() > mMaxDirectParams)
    mathic::reportError("Too many direct options");
  mDirectParameters = std::move(tokens);
}

void CommonParams::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  parameters.push_back(&mLogs);
  parameters.push_back(&mThreadCount);
}

void CommonParams::perform() {
  LogDomainSet::singleton().performLogCommands(mLogs.value());

  // delete the old limit first so that the new one takes control.
  mThreadLimit.reset();
  if (mThreadCount.value() != 0) {
    mThreadLimit = make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      mThreadCount.value()
    );
  }
}

void CommonParams::registerFileNameExtension(std::string extension) {
  MATQSYM_ASSERT(!extension.empty());
  mExtensions.push_back(std::move(extension));
}

size_t CommonParams::directParameterCount() const {
  return mDirectParameters.size();
}

const std::string& CommonParams::directParameter(size_t i) const {
  MATQSYM_ASSERT(i < directParameterCount());
  return mDirectParameters[i];
}

std::string CommonParams::fileNameStem(size_t i) const {
  MATQSYM_ASSERT(i < directParameterCount());
  const auto& str = mDirectParameters[i];
  const auto toStrip = fileNameExtension(i);
  MATQSYM_ASSERT(toStrip.size() <= str.size());
  return str.substr(0, str.size() - toStrip.size());
}

std::string CommonParams::fileNameExtension(size_t i) const {
  MATQSYM_ASSERT(i < directParameterCount());
  const auto& str = mDirectParameters[i];
  const auto end = mExtensions.end();
  for (auto it = mExtensions.begin(); it != end; ++it) {
    if (
      str.size() >= it->size() &&
      str.compare(str.size() - it->size(), it->size(), *it) == 0
    )
      return *it;
  }
  return std::string();
}

MATQSYM_NAMESPACE_END
