// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_SUBSETS_GUARD
#define MATQSYM_SUBSETS_GUARD

#include <vector>

MATQSYM_NAMESPACE_BEGIN

/// Iterates through the k-subsets of {1, ..., n} in lexicographic order. Each
/// subset is a sorted vector. Example:
///
///   for (SubsetIterator<int> it(4, 2); !it.atEnd(); it.next())
///     use(it.subset());
///
/// visits {1,2}, {1,3}, {1,4}, {2,3}, {2,4}, {3,4}. There is exactly one
/// 0-subset, the empty set, and there are no k-subsets if k > n.
template<class E>
class SubsetIterator {
public:
  SubsetIterator(const E n, const E k): mN(n), mAtEnd(k > n) {
    for (E i = 1; i <= k && !mAtEnd; ++i)
      mSubset.push_back(i);
  }

  bool atEnd() const {return mAtEnd;}
  const std::vector<E>& subset() const {return mSubset;}

  void next() {
    MATQSYM_ASSERT(!atEnd());
    const auto k = static_cast<E>(mSubset.size());
    // Find the right-most element that can still be increased.
    E i = k;
    while (i > 0 && mSubset[i - 1] == mN - k + i)
      --i;
    if (i == 0) {
      mAtEnd = true;
      return;
    }
    ++mSubset[i - 1];
    for (E j = i; j < k; ++j)
      mSubset[j] = mSubset[j - 1] + 1;
  }

private:
  const E mN;
  bool mAtEnd;
  std::vector<E> mSubset;
};

MATQSYM_NAMESPACE_END

#endif
