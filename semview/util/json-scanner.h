// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SEMVIEW_UTIL_JSON_SCANNER_H_
#define SEMVIEW_UTIL_JSON_SCANNER_H_

#include <string>

#include "semview/base/types.h"

namespace semview {

// Scanner chunking JSON text into tokens. The scanner reads from a memory
// buffer which must outlive the scanner.
class JsonScanner {
 public:
  // Token types in the range 0-255 are used for single-character tokens, i.e.
  // the structural characters '{', '}', '[', ']', ':', and ','.
  enum TokenType {
    ERROR = 256,
    END,
    STRING_TOKEN,
    INTEGER_TOKEN,
    FLOAT_TOKEN,
    TRUE_TOKEN,
    FALSE_TOKEN,
    NULL_TOKEN,
  };

  // Initializes scanner with input and reads the first token.
  JsonScanner(const char *data, size_t size);
  explicit JsonScanner(const string &text)
      : JsonScanner(text.data(), text.size()) {}

  // Reads the next token from the input and returns its type.
  int NextToken();

  // Checks if all input has been read.
  bool done() const { return token_ == END; }

  // Returns true if errors were found while parsing input.
  bool error() const { return token_ == ERROR; }

  // Returns current line and column.
  int line() const { return line_; }
  int column() const { return column_; }

  // Returns last error message.
  const string &error_message() const { return error_message_; }

  // Returns current input token.
  int token() const { return token_; }

  // Returns text for current token. This contains the unescaped contents of
  // string tokens and the digits of number tokens.
  const string &token_text() const { return token_text_; }

  // Records error at current input position.
  void SetError(const string &error_message);

  // Records error and returns the ERROR token.
  int Error(const string &error_message);

  // Returns error message with position information.
  string GetErrorMessage() const;

  // Returns a printable name for a token type.
  static string TokenName(int token);

 private:
  // Converts hexadecimal character to digit value.
  static int HexToDigit(int ch);

  // Gets the next input character.
  void NextChar();

  // Sets current token and returns it.
  int Token(int token) { token_ = token; return token; }

  // Consumes current input character and returns token.
  int Select(int token) { NextChar(); return Token(token); }

  // Parses a sequence of digits. Returns the number of digits parsed.
  int ParseDigits();

  // Parses a sequence of Unicode hex characters and appends these as UTF-8 to
  // the token buffer. Returns false on error.
  bool ParseUnicode(int digits);

  // Parses string token. The current character is the opening quote.
  int ParseString();

  // Parses number token with optional sign, fraction, and exponent.
  int ParseNumber();

  // Parses one of the keywords true, false, or null.
  int ParseKeyword();

  // Adds character to token buffer.
  void Append(char ch) { token_text_.push_back(ch); }

  // Input buffer.
  const char *current_input_;
  const char *end_input_;

  // Current input character or -1 if end of input has been reached.
  int current_;

  // Current position in input.
  int line_;
  int column_;

  // Last read token type. This is either a single-character token or one of the
  // values from the TokenType enumeration.
  int token_;

  // Text for last read token.
  string token_text_;

  // Last error message.
  string error_message_;
};

}  // namespace semview

#endif  // SEMVIEW_UTIL_JSON_SCANNER_H_
