// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Scanner.hpp"

#include "Error.hpp"
#include <sstream>
#include <cstring>

MATQSYM_NAMESPACE_BEGIN

static const size_t BufferSize = 10 * 1024;

Scanner::Scanner(std::istream& input):
  mStream(&input),
  mLineCount(1),
  mChar(' '),
  mBuffer(),
  mBufferPos(mBuffer.end())
{
  mBuffer.reserve(BufferSize);
  mBufferPos = mBuffer.end();
  get();
}

Scanner::Scanner(const char* const input):
  mStream(0),
  mLineCount(1),
  mChar(' '),
  mBuffer(input, input + std::strlen(input)),
  mBufferPos(mBuffer.begin())
{
  get();
}

Scanner::Scanner(const std::string& input):
  mStream(0),
  mLineCount(1),
  mChar(' '),
  mBuffer(input.begin(), input.end()),
  mBufferPos(mBuffer.begin())
{
  get();
}

bool Scanner::match(char c) {
  eatWhite();
  if (peek() != static_cast<unsigned char>(c))
    return false;
  get();
  return true;
}

bool Scanner::match(const char* const str) {
  MATQSYM_ASSERT(str != 0);
  eatWhite();
  if (*str == '\0')
    return true;
  if (peek() != static_cast<unsigned char>(*str))
    return false;

  // Only the next character can be peeked at, so look ahead in the buffer
  // for the rest of the string.
  const size_t length = std::strlen(str);
  if (static_cast<size_t>(mBuffer.end() - mBufferPos) < length - 1) {
    if (mStream == 0)
      return false;
    // Move the unread part of the buffer to the front and top it up.
    std::vector<char> rest(mBufferPos, mBuffer.end());
    const size_t missing = length - 1 - rest.size();
    rest.resize(rest.size() + missing);
    mStream->read(rest.data() + rest.size() - missing, missing);
    rest.resize(rest.size() - missing + mStream->gcount());
    mBuffer.swap(rest);
    mBufferPos = mBuffer.begin();
    if (static_cast<size_t>(mBuffer.end() - mBufferPos) < length - 1)
      return false;
  }
  if (!std::equal(str + 1, str + length, mBufferPos))
    return false;
  for (size_t i = 0; i < length; ++i)
    get();
  return true;
}

bool Scanner::matchEOF() {
  eatWhite();
  return peek() == EOF;
}

void Scanner::expect(char c) {
  eatWhite();
  const int got = get();
  if (got != static_cast<unsigned char>(c))
    errorExpectOne(c, got);
}

void Scanner::expect(const char* str) {
  MATQSYM_ASSERT(str != 0);

  eatWhite();

  const char* it = str;
  while (*it != '\0') {
    int character = get();
    if (static_cast<unsigned char>(*it) == character) {
      ++it;
      continue;
    }

    // Read the rest of what is there to improve error message.
    std::ostringstream got;
    if (character == EOF && it == str)
      got << "no more input";
    else {
      got << '\"' << std::string(str, it);
      if (std::isalnum(character))
        got << static_cast<char>(character);
      while (std::isalnum(peek()))
        got << static_cast<char>(get());
      got << '\"';
    }

    reportErrorUnexpectedToken(str, got.str());
  }
}

void Scanner::expectEOF() {
  eatWhite();
  if (peek() != EOF)
    reportErrorUnexpectedToken("no more input", peek());
}

void Scanner::eatWhite() {
  while (peekWhite())
    get();
}

void Scanner::reportError(std::string msg) const {
  std::ostringstream err;
  err << "Syntax error on line " << lineCount() << ": " << msg;
  reportMalformedInput(err.str());
}

void Scanner::errorExpectOne(char expected, int got) const {
  MATQSYM_ASSERT(static_cast<unsigned char>(expected) != got);
  std::ostringstream err;
  err << '\'' << expected << '\'';
  reportErrorUnexpectedToken(err.str(), got);
}

void Scanner::reportErrorUnexpectedToken(
  const std::string& expected,
  int got
) const {
  std::ostringstream gotDescription;
  if (got == EOF)
    gotDescription << "no more input";
  else
    gotDescription << '\'' << static_cast<char>(got) << '\'';
  reportErrorUnexpectedToken(expected, gotDescription.str());
}

void Scanner::reportErrorUnexpectedToken(
  const std::string& expected,
  const std::string& got
) const {
  std::ostringstream errorMsg;
  errorMsg << "Expected " << expected;
  if (got != "")
    errorMsg << ", but got " << got;
  errorMsg << '.';
  reportError(errorMsg.str());
}

int Scanner::readBuffer() {
  if (mStream == 0 || !mStream->good())
    return EOF;
  mBuffer.resize(BufferSize);
  mStream->read(mBuffer.data(), mBuffer.size());
  const auto read = static_cast<size_t>(mStream->gcount());
  mBuffer.resize(read);
  mBufferPos = mBuffer.begin();
  if (read == 0)
    return EOF;
  const char c = *mBufferPos;
  ++mBufferPos;
  return static_cast<unsigned char>(c);
}

MATQSYM_NAMESPACE_END
