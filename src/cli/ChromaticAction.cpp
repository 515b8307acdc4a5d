// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "matqsym/stdinc.h"
#include "ChromaticAction.hpp"

#include "matqsym/AlgebraIO.hpp"
#include "matqsym/Chromatic.hpp"
#include "matqsym/MatroidFamilies.hpp"
#include <fstream>
#include <iostream>

MATQSYM_NAMESPACE_BEGIN

namespace {
  static const char* MatroidExtension = ".matroid";

  Matroid readUniform(const std::string& param) {
    Scanner in(param);
    const auto n = in.readInteger<Matroid::Element>();
    in.expect(',');
    const auto r = in.readInteger<Matroid::Element>();
    in.expectEOF();
    return uniformMatroid(n, r);
  }

  Matroid readMatroidFile(const std::string& fileName) {
    std::ifstream file(fileName.c_str());
    if (file.fail())
      mathic::reportError("Could not read input file \"" + fileName + "\".");
    Scanner in(file);
    auto matroid = AlgebraIO().readMatroid(in);
    in.expectEOF();
    return matroid;
  }
}

ChromaticAction::ChromaticAction():
  mNonCommutative(
    "nc",
    "Print the chromatic function in the non-commutative algebra NCQSym "
    "instead of its image in QSym.",
    false),

  mUniform(
    "uniform",
    "The direct parameter is n,r instead of a file name and the matroid is "
    "the uniform matroid of rank r on {1,...,n}.",
    false),

  mParams(1, 1)
{
  mParams.registerFileNameExtension(MatroidExtension);
}

void ChromaticAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void ChromaticAction::performAction() {
  mParams.perform();

  const auto matroid = mUniform.value() ?
    readUniform(mParams.directParameter(0)) :
    readMatroidFile(mParams.fileNameStem(0) + MatroidExtension);

  if (mNonCommutative.value())
    std::cout << chromaticNCQSym(matroid) << '\n';
  else
    std::cout << chromaticQSym(matroid) << '\n';
}

const char* ChromaticAction::staticName() {
  return "chromatic";
}

const char* ChromaticAction::name() const {
  return staticName();
}

const char* ChromaticAction::description() const {
  return "Compute the chromatic quasisymmetric function of a matroid, the "
    "sum of M_pi over the set compositions pi of the ground set that are "
    "stable for the matroid. The matroid is read from the file X.matroid "
    "where X is the direct parameter.";
}

const char* ChromaticAction::shortDescription() const {
  return "Compute the chromatic function of a matroid.";
}

void ChromaticAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mNonCommutative);
  parameters.push_back(&mUniform);
}

MATQSYM_NAMESPACE_END
