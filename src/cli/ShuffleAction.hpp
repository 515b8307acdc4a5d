// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_SHUFFLE_ACTION_GUARD
#define MATQSYM_SHUFFLE_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

MATQSYM_NAMESPACE_BEGIN

/// Prints the quasi-shuffle product of two compositions or of two set
/// compositions with disjoint ground sets.
class ShuffleAction : public mathic::Action {
public:
  ShuffleAction();

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
  mathic::BoolParameter mSet;
  CommonParams mParams;
};

MATQSYM_NAMESPACE_END
#endif
