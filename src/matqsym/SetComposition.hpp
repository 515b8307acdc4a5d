// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_SET_COMPOSITION_GUARD
#define MATQSYM_SET_COMPOSITION_GUARD

#include "Composition.hpp"
#include <vector>
#include <map>
#include <string>
#include <ostream>
#include <initializer_list>

MATQSYM_NAMESPACE_BEGIN

class Scanner;

/// A set composition is a sequence of non-empty pairwise disjoint sets of
/// positive integers called blocks. The union of the blocks is the ground
/// set. For example (2,4|1|3,5,6) is a set composition of {1, ..., 6} with
/// three blocks.
///
/// Each block is kept sorted in ascending order, so equal set compositions
/// have equal blocks and print the same way. The ground set is kept in
/// discovery order: the elements of the first block, then those of the
/// second block and so on. relabel() without a map depends on this order.
///
/// Set compositions are values. No method changes a set composition after
/// construction.
class SetComposition {
public:
  typedef int32 Element;
  typedef std::vector<Element> Block;
  typedef std::vector<Block> Blocks;

  /// Maps each element of a ground set to its new label.
  typedef std::map<Element, Element> Relabeling;

  /// Constructs the empty set composition.
  SetComposition() {}

  /// Throws MalformedInputError if a block is empty or has an element that
  /// is not positive. Throws StructuralViolationError if the blocks are not
  /// pairwise disjoint.
  explicit SetComposition(Blocks blocks);
  SetComposition(std::initializer_list<Block> blocks);

  /// Parses the format (2,4|1|3,5,6). The empty set composition is ().
  static SetComposition parse(const std::string& str);

  /// Reads a set composition in the format of parse() from in.
  static SetComposition read(Scanner& in);

  const Blocks& blocks() const {return mBlocks;}

  /// The union of the blocks in discovery order.
  const Block& groundSet() const {return mGroundSet;}

  /// Returns the number of elements in the ground set.
  size_t size() const {return mGroundSet.size();}

  size_t blockCount() const {return mBlocks.size();}
  bool empty() const {return mBlocks.empty();}

  /// Returns the first block. Throws EmptyStructureError if there is none.
  const Block& first() const;

  /// Returns the set composition without its first block. Throws
  /// EmptyStructureError if this set composition is empty.
  SetComposition rest() const;

  /// Returns the set composition with block prepended as the first block.
  /// The block must be disjoint from the ground set.
  SetComposition prepend(Block block) const;

  /// Relabels the ground set to 1, ..., size() in ground set order.
  SetComposition relabel() const;

  /// Relabels groundSet()[i] to positional[i]. Throws
  /// StructuralViolationError if positional does not have size() elements
  /// or if two of them are equal.
  SetComposition relabel(const std::vector<Element>& positional) const;

  /// Relabels e to map[e]. Throws StructuralViolationError if map does not
  /// have every element of the ground set as a key or if it maps two
  /// elements of the ground set to the same label. Keys outside the ground
  /// set are ignored.
  SetComposition relabel(const Relabeling& map) const;

  /// Returns the composition of block sizes.
  Composition alpha() const;

  /// Returns true if the ground sets of this and sc have no element in
  /// common.
  bool disjointFrom(const SetComposition& sc) const;

  /// Returns the index of the block that contains each element of the
  /// ground set.
  std::map<Element, size_t> blockIndices() const;

  std::string toString() const;
  void write(std::ostream& out) const;

  bool operator==(const SetComposition& sc) const {
    return mBlocks == sc.mBlocks;
  }
  bool operator!=(const SetComposition& sc) const {return !(*this == sc);}

  /// Orders by the size of the ground set and then lexicographically by
  /// blocks.
  bool operator<(const SetComposition& sc) const {
    if (size() != sc.size())
      return size() < sc.size();
    return mBlocks < sc.mBlocks;
  }

private:
  void validate();

  Blocks mBlocks;
  Block mGroundSet;
};

std::ostream& operator<<(std::ostream& out, const SetComposition& sc);

MATQSYM_NAMESPACE_END

#endif
