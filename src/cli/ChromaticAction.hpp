// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_CHROMATIC_ACTION_GUARD
#define MATQSYM_CHROMATIC_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

MATQSYM_NAMESPACE_BEGIN

/// Computes the chromatic quasisymmetric function of a matroid read from
/// a file, or of a uniform matroid.
class ChromaticAction : public mathic::Action {
public:
  ChromaticAction();

  virtual void directOptions(
    std::vector<std::string> tokens,
    mathic::CliParser& parser
  );

  virtual void performAction();

  static const char* staticName();

  virtual const char* name() const;
  virtual const char* description() const;
  virtual const char* shortDescription() const;

  virtual void pushBackParameters(
    std::vector<mathic::CliParameter*>& parameters
  );

private:
  mathic::BoolParameter mNonCommutative;
  mathic::BoolParameter mUniform;
  CommonParams mParams;
};

MATQSYM_NAMESPACE_END
#endif
