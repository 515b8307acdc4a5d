// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_STABLE_ACTION_GUARD
#define MATQSYM_STABLE_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

MATQSYM_NAMESPACE_BEGIN

/// Decides if a set composition is stable for a matroid.
class StableAction : public mathic::Action {
public:
  StableAction();

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
  CommonParams mParams;
};

MATQSYM_NAMESPACE_END
#endif
