// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATQSYM_SCANNER_GUARD
#define MATQSYM_SCANNER_GUARD

#include <string>
#include <vector>
#include <istream>
#include <limits>
#include <cstdio>
#include <cctype>

MATQSYM_NAMESPACE_BEGIN

/// Reads characters and tokens from a stream or a string. Every syntax
/// error is reported by throwing MalformedInputError with a message that
/// includes the current line number.
///
/// White space in front of a token is skipped by every method that reads a
/// token, but not by peek() and get().
class Scanner {
public:
  Scanner(std::istream& input);
  Scanner(const char* const input);
  Scanner(const std::string& input);

  /// Reads the character c if it is the next token. Returns true if c was
  /// read.
  bool match(char c);

  /// Reads the string str if it is the next token. Returns true if str was
  /// read. The string is only consumed if all of it matches.
  bool match(const char* const str);

  /// Returns true if there are no more tokens.
  bool matchEOF();

  /// Reads c as the next token or reports an error.
  void expect(char c);

  /// Reads str as the next token or reports an error.
  void expect(const char* str);

  void expect(const std::string& str) {expect(str.c_str());}

  /// Reports an error if there are more tokens.
  void expectEOF();

  /// Reads an integer that fits into the type T. A leading - is only
  /// accepted for signed T.
  template<class T>
  T readInteger();

  /// Returns the next character or EOF without consuming it.
  int peek() const {return mChar;}

  /// Returns the next character or EOF and consumes it.
  int get();

  bool peekDigit() const {return std::isdigit(peek()) != 0;}
  bool peekWhite() const {return std::isspace(peek()) != 0;}

  /// Skips over white space.
  void eatWhite();

  /// Returns the number of the line that the scanner is currently on,
  /// starting from 1.
  uint64 lineCount() const {return mLineCount;}

  void reportError(std::string msg) const;

  void reportErrorUnexpectedToken(const std::string& expected, int got) const;
  void reportErrorUnexpectedToken(
    const std::string& expected,
    const std::string& got
  ) const;

private:
  void errorExpectOne(char expected, int got) const;

  int readBuffer();

  std::istream* mStream;
  uint64 mLineCount;
  int mChar; // next character or EOF
  std::vector<char> mBuffer;
  std::vector<char>::iterator mBufferPos;
};

inline int Scanner::get() {
  const int c = mChar;
  if (c == '\n')
    ++mLineCount;
  if (mBufferPos != mBuffer.end()) {
    mChar = static_cast<unsigned char>(*mBufferPos);
    ++mBufferPos;
  } else
    mChar = readBuffer();
  return c;
}

template<class T>
T Scanner::readInteger() {
  static_assert(std::numeric_limits<T>::is_integer, "");

  eatWhite();
  const bool negate = match('-');
  if (negate && !std::numeric_limits<T>::is_signed)
    reportErrorUnexpectedToken("a non-negative integer", '-');
  if (!peekDigit())
    reportErrorUnexpectedToken("an integer", peek());

  const uint64 limit = negate ?
    static_cast<uint64>(std::numeric_limits<T>::max()) + 1 :
    static_cast<uint64>(std::numeric_limits<T>::max());
  uint64 value = 0;
  while (peekDigit()) {
    const uint64 digit = static_cast<uint64>(get() - '0');
    if (value > (limit - digit) / 10)
      reportError("Integer is too large.");
    value = value * 10 + digit;
  }
  if (!negate)
    return static_cast<T>(value);
  return static_cast<T>(-static_cast<int64>(value));
}

MATQSYM_NAMESPACE_END

#endif
