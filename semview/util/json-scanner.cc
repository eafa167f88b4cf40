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

#include "semview/util/json-scanner.h"

#include <string>

namespace semview {

namespace {

bool IsDigit(int ch) { return ch >= '0' && ch <= '9'; }

bool IsSpace(int ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool IsAlpha(int ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

}  // namespace

int JsonScanner::HexToDigit(int ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  return -1;
}

JsonScanner::JsonScanner(const char *data, size_t size)
    : current_input_(data), end_input_(data + size) {
  current_ = 0;
  line_ = 1;
  column_ = 0;
  token_ = END;
  NextChar();
  NextToken();
}

void JsonScanner::NextChar() {
  if (current_ != -1 && current_input_ < end_input_) {
    current_ = static_cast<unsigned char>(*current_input_++);
  } else {
    current_ = -1;
  }
  if (current_ == '\n') {
    line_++;
    column_ = 0;
  } else {
    column_++;
  }
}

int JsonScanner::NextToken() {
  // Errors are sticky.
  if (token_ == ERROR) return ERROR;

  // Clear token text buffer.
  token_text_.clear();

  // Skip whitespace.
  while (current_ != -1 && IsSpace(current_)) NextChar();

  switch (current_) {
    case -1:  // end of input
      return Token(END);

    case '"':  // string
      return ParseString();

    case '-':
    case '0': case '1': case '2': case '3': case '4':
    case '5': case '6': case '7': case '8': case '9':  // number
      return ParseNumber();

    case '{': case '}':  // object delimiter
    case '[': case ']':  // array delimiter
    case ':': case ',':  // separators
      return Select(current_);

    default:
      if (IsAlpha(current_)) return ParseKeyword();
      return Error("Unexpected character in input");
  }
}

int JsonScanner::ParseDigits() {
  int digits = 0;
  while (current_ != -1 && IsDigit(current_)) {
    Append(current_);
    NextChar();
    digits++;
  }
  return digits;
}

bool JsonScanner::ParseUnicode(int digits) {
  // Parse Unicode code point.
  uint32 code = 0;
  for (int i = 0; i < digits; ++i) {
    int digit = HexToDigit(current_);
    if (digit < 0) return false;
    code = (code << 4) + digit;
    if (code > 0x10ffff) return false;
    NextChar();
  }

  // Convert code point to UTF-8.
  if (code <= 0x7f) {
    // One character sequence.
    Append(code);
  } else if (code <= 0x7ff) {
    // Two character sequence.
    Append(0xc0 | (code >> 6));
    Append(0x80 | (code & 0x3f));
  } else if (code <= 0xffff) {
    // Three character sequence.
    Append(0xe0 | (code >> 12));
    Append(0x80 | ((code >> 6) & 0x3f));
    Append(0x80 | (code & 0x3f));
  } else {
    // Four character sequence.
    Append(0xf0 | (code >> 18));
    Append(0x80 | ((code >> 12) & 0x3f));
    Append(0x80 | ((code >> 6) & 0x3f));
    Append(0x80 | (code & 0x3f));
  }

  return true;
}

int JsonScanner::ParseString() {
  // Skip start quote character.
  NextChar();

  // Read until end of string.
  while (current_ != '"') {
    if (current_ == -1 || current_ == '\n') {
      return Error("Unterminated string");
    } else if (current_ == '\\') {
      // Handle escape characters.
      NextChar();
      switch (current_) {
        case 'b': Append('\b'); NextChar(); break;
        case 'f': Append('\f'); NextChar(); break;
        case 'n': Append('\n'); NextChar(); break;
        case 'r': Append('\r'); NextChar(); break;
        case 't': Append('\t'); NextChar(); break;
        case '"': case '\\': case '/':
          Append(current_);
          NextChar();
          break;
        case 'u':
          // Parse unicode hex escape (\u0000).
          NextChar();
          if (!ParseUnicode(4)) {
            return Error("Invalid Unicode escape in string");
          }
          break;
        default:
          return Error("Invalid escape character in string");
      }
    } else {
      Append(current_);
      NextChar();
    }
  }

  // Skip end quote character.
  NextChar();
  return Token(STRING_TOKEN);
}

int JsonScanner::ParseNumber() {
  // Add sign for negative numbers.
  if (current_ == '-') {
    Append('-');
    NextChar();
  }

  // Parse integral part.
  if (ParseDigits() == 0) return Error("Invalid number");

  // Parse optional fraction and exponent.
  bool fractional = false;
  if (current_ == '.') {
    fractional = true;
    Append('.');
    NextChar();
    if (ParseDigits() == 0) return Error("Invalid floating-point number");
  }
  if (current_ == 'e' || current_ == 'E') {
    fractional = true;
    Append('e');
    NextChar();
    if (current_ == '-' || current_ == '+') {
      Append(current_);
      NextChar();
    }
    if (ParseDigits() == 0) return Error("Missing exponent in number");
  }

  return Token(fractional ? FLOAT_TOKEN : INTEGER_TOKEN);
}

int JsonScanner::ParseKeyword() {
  while (current_ != -1 && IsAlpha(current_)) {
    Append(current_);
    NextChar();
  }
  if (token_text_ == "true") return Token(TRUE_TOKEN);
  if (token_text_ == "false") return Token(FALSE_TOKEN);
  if (token_text_ == "null") return Token(NULL_TOKEN);
  return Error("Unknown keyword '" + token_text_ + "'");
}

void JsonScanner::SetError(const string &error_message) {
  if (error_message_.empty()) error_message_ = error_message;
  token_ = ERROR;
}

int JsonScanner::Error(const string &error_message) {
  SetError(error_message);
  return ERROR;
}

string JsonScanner::GetErrorMessage() const {
  return "line " + std::to_string(line_) + ", column " +
         std::to_string(column_) + ": " + error_message_;
}

string JsonScanner::TokenName(int token) {
  switch (token) {
    case ERROR: return "error";
    case END: return "end of input";
    case STRING_TOKEN: return "string";
    case INTEGER_TOKEN: return "integer";
    case FLOAT_TOKEN: return "number";
    case TRUE_TOKEN: case FALSE_TOKEN: return "boolean";
    case NULL_TOKEN: return "null";
  }
  if (token >= 0 && token < 256) return string("'") + char(token) + "'";
  return "token " + std::to_string(token);
}

}  // namespace semview
