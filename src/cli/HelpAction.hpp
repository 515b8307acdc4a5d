// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_HELP_ACTION_GUARD
#define MATQSYM_HELP_ACTION_GUARD

#include <mathic.h>

MATQSYM_NAMESPACE_BEGIN

/// Adds the topic "logs" to the help that mathic provides.
class HelpAction : public mathic::HelpAction {
public:
  virtual void performAction();
};

MATQSYM_NAMESPACE_END

#endif
