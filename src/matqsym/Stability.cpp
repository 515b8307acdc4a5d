// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Stability.hpp"

#include "Matroid.hpp"
#include "SetComposition.hpp"
#include "Error.hpp"
#include <sstream>

MATQSYM_NAMESPACE_BEGIN

bool isStable(const Matroid& matroid, const SetComposition& pi) {
  const auto indices = pi.blockIndices();
  const auto& groundSet = matroid.groundSet();
  for (auto it = groundSet.begin(); it != groundSet.end(); ++it) {
    if (indices.find(*it) == indices.end()) {
      std::ostringstream err;
      err << "The set composition " << pi << " does not cover the element "
        << *it << " of the matroid.";
      reportDomainMismatch(err.str());
    }
  }

  uint64 maxScore = 0;
  size_t maxCount = 0;
  const auto& bases = matroid.bases();
  for (auto basis = bases.begin(); basis != bases.end(); ++basis) {
    uint64 score = 0;
    for (auto it = basis->begin(); it != basis->end(); ++it)
      score += indices.find(*it)->second;
    if (maxCount == 0 || score > maxScore) {
      maxScore = score;
      maxCount = 1;
    } else if (score == maxScore)
      ++maxCount;
  }
  return maxCount == 1;
}

MATQSYM_NAMESPACE_END
