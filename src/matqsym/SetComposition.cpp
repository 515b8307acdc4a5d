// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "SetComposition.hpp"

#include "Scanner.hpp"
#include "Error.hpp"
#include <algorithm>
#include <sstream>

MATQSYM_NAMESPACE_BEGIN

SetComposition::SetComposition(Blocks blocks):
  mBlocks(std::move(blocks))
{
  validate();
}

SetComposition::SetComposition(std::initializer_list<Block> blocks):
  mBlocks(blocks)
{
  validate();
}

void SetComposition::validate() {
  mGroundSet.clear();
  for (auto block = mBlocks.begin(); block != mBlocks.end(); ++block) {
    if (block->empty())
      reportMalformedInput("A set composition cannot have an empty block.");
    std::sort(block->begin(), block->end());
    for (auto it = block->begin(); it != block->end(); ++it) {
      if (*it <= 0) {
        std::ostringstream err;
        err << "The elements of a set composition must be positive integers, "
          "got " << *it << '.';
        reportMalformedInput(err.str());
      }
    }
    mGroundSet.insert(mGroundSet.end(), block->begin(), block->end());
  }

  Block sorted(mGroundSet);
  std::sort(sorted.begin(), sorted.end());
  const auto repeat = std::adjacent_find(sorted.begin(), sorted.end());
  if (repeat != sorted.end()) {
    std::ostringstream err;
    err << "The blocks of a set composition must be disjoint, but "
      << *repeat << " appears twice.";
    reportStructuralViolation(err.str());
  }
}

SetComposition SetComposition::parse(const std::string& str) {
  Scanner in(str);
  auto sc = read(in);
  in.expectEOF();
  return sc;
}

SetComposition SetComposition::read(Scanner& in) {
  in.expect('(');
  Blocks blocks;
  if (!in.match(')')) {
    do {
      Block block;
      do {
        block.push_back(in.readInteger<Element>());
      } while (in.match(','));
      blocks.push_back(std::move(block));
    } while (in.match('|'));
    in.expect(')');
  }
  return SetComposition(std::move(blocks));
}

const SetComposition::Block& SetComposition::first() const {
  if (empty())
    reportEmptyStructure("The empty set composition has no first block.");
  return mBlocks.front();
}

SetComposition SetComposition::rest() const {
  if (empty())
    reportEmptyStructure("Cannot take the rest of the empty set composition.");
  SetComposition sc;
  sc.mBlocks.assign(mBlocks.begin() + 1, mBlocks.end());
  sc.mGroundSet.assign
    (mGroundSet.begin() + mBlocks.front().size(), mGroundSet.end());
  return sc;
}

SetComposition SetComposition::prepend(Block block) const {
  Blocks blocks;
  blocks.reserve(blockCount() + 1);
  blocks.push_back(std::move(block));
  blocks.insert(blocks.end(), mBlocks.begin(), mBlocks.end());
  return SetComposition(std::move(blocks));
}

SetComposition SetComposition::relabel() const {
  std::vector<Element> positional(size());
  for (size_t i = 0; i < positional.size(); ++i)
    positional[i] = static_cast<Element>(i + 1);
  return relabel(positional);
}

SetComposition SetComposition::relabel(
  const std::vector<Element>& positional
) const {
  if (positional.size() != size()) {
    std::ostringstream err;
    err << "Cannot relabel a ground set of " << size() << " elements with "
      << positional.size() << " labels.";
    reportStructuralViolation(err.str());
  }
  Relabeling map;
  for (size_t i = 0; i < positional.size(); ++i)
    map[mGroundSet[i]] = positional[i];
  return relabel(map);
}

SetComposition SetComposition::relabel(const Relabeling& map) const {
  Blocks blocks(mBlocks);
  for (auto block = blocks.begin(); block != blocks.end(); ++block) {
    for (auto it = block->begin(); it != block->end(); ++it) {
      const auto image = map.find(*it);
      if (image == map.end()) {
        std::ostringstream err;
        err << "The relabeling does not say where to send " << *it << '.';
        reportStructuralViolation(err.str());
      }
      *it = image->second;
    }
  }

  // The constructor reports two images in different blocks as a structural
  // violation, but not two images in the same block.
  for (auto block = blocks.begin(); block != blocks.end(); ++block) {
    Block sorted(*block);
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
      reportStructuralViolation("The relabeling is not injective.");
  }
  return SetComposition(std::move(blocks));
}

Composition SetComposition::alpha() const {
  Composition::Parts parts;
  parts.reserve(blockCount());
  for (auto it = mBlocks.begin(); it != mBlocks.end(); ++it)
    parts.push_back(static_cast<Composition::Part>(it->size()));
  return Composition(std::move(parts));
}

bool SetComposition::disjointFrom(const SetComposition& sc) const {
  Block a(mGroundSet);
  Block b(sc.mGroundSet);
  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  auto itA = a.begin();
  auto itB = b.begin();
  while (itA != a.end() && itB != b.end()) {
    if (*itA == *itB)
      return false;
    if (*itA < *itB)
      ++itA;
    else
      ++itB;
  }
  return true;
}

auto SetComposition::blockIndices() const -> std::map<Element, size_t> {
  std::map<Element, size_t> indices;
  for (size_t i = 0; i < mBlocks.size(); ++i)
    for (auto it = mBlocks[i].begin(); it != mBlocks[i].end(); ++it)
      indices[*it] = i;
  return indices;
}

std::string SetComposition::toString() const {
  std::ostringstream out;
  write(out);
  return out.str();
}

void SetComposition::write(std::ostream& out) const {
  out << '(';
  for (size_t i = 0; i < mBlocks.size(); ++i) {
    if (i > 0)
      out << '|';
    const auto& block = mBlocks[i];
    for (size_t j = 0; j < block.size(); ++j) {
      if (j > 0)
        out << ',';
      out << block[j];
    }
  }
  out << ')';
}

std::ostream& operator<<(std::ostream& out, const SetComposition& sc) {
  sc.write(out);
  return out;
}

MATQSYM_NAMESPACE_END
