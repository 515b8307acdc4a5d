// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_COMMON_PARAMS_GUARD
#define MATQSYM_COMMON_PARAMS_GUARD

#include <tbb/global_control.h>
#include <mathic.h>
#include <memory>
#include <string>
#include <vector>

MATQSYM_NAMESPACE_BEGIN

/// The parameters that every action takes: the logs to enable, the number of
/// threads and the direct parameters.
class CommonParams {
public:
  CommonParams(size_t minDirectParams, size_t maxDirectParams);

  void directOptions
    (std::vector<std::string> tokens, mathic::CliParser& parser);

  void pushBackParameters(std::vector<mathic::CliParameter*>& parameters);

  /// Enables the requested logs and limits the number of threads that tbb
  /// will use.
  void perform();

  /// If called with string X, then X will be considered an extension
  /// for a file name instead of part of the file name.
  void registerFileNameExtension(std::string extension);

  /// Returns the number of direct parameters.
  size_t directParameterCount() const;

  /// Returns the direct parameter at offset i.
  const std::string& directParameter(size_t i) const;

  /// Returns the direct parameter at offset i with any registered extension
  /// stripped off.
  std::string fileNameStem(size_t i) const;

  /// Returns the registered extension of the direct parameter at offset i,
  /// if any.
  std::string fileNameExtension(size_t i) const;

private:
  mathic::IntegerParameter mThreadCount;
  mathic::StringParameter mLogs;

  std::vector<std::string> mExtensions;

  std::unique_ptr<tbb::global_control> mThreadLimit;
  size_t mMinDirectParams;
  size_t mMaxDirectParams;
  std::vector<std::string> mDirectParameters;
};

MATQSYM_NAMESPACE_END

#endif
