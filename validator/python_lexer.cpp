#include "validator/python_lexer.hpp"

#include <ctype.h>
#include <string.h>

#include <algorithm>
#include <utility>

namespace {

// Longest operators first, so that the first match is the right one.
const char* const kOperators[] = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "!=", "==", "<=", ">=",
    "**",  "//",  "<<",  ">>",  "+=",  "-=", "*=", "/=", "%=", "&=", "|=",
    "^=",  "@=",  "+",   "-",   "*",   "/",  "%",  "@",  "&",  "|",  "^",
    "~",   "<",   ">",   "(",   ")",   "[",  "]",  "{",  "}",  ",",  ":",
    ".",   ";",   "="};

bool IsIdentStart(char c) {
  auto u = static_cast<unsigned char>(c);
  // Bytes >= 0x80 belong to UTF-8 encoded identifiers.
  return isalpha(u) || c == '_' || u >= 0x80;
}

bool IsIdentChar(char c) {
  return IsIdentStart(c) || isdigit(static_cast<unsigned char>(c));
}

bool IsQuote(char c) { return c == '\'' || c == '"'; }

std::string Lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(tolower(c));
  });
  return s;
}

bool IsStringPrefix(const std::string& word) {
  static const char* const kPrefixes[] = {"r",  "u",  "b",  "f",  "t",  "br",
                                          "rb", "fr", "rf", "tr", "rt"};
  std::string lowered = Lowercase(word);
  for (const char* prefix : kPrefixes) {
    if (lowered == prefix) return true;
  }
  return false;
}

bool IsFormatPrefix(const std::string& word) {
  std::string lowered = Lowercase(word);
  return lowered.find('f') != std::string::npos ||
         lowered.find('t') != std::string::npos;
}

// Returns the encoding named by a coding declaration (a comment matching
// `^[ \t\f]*#.*?coding[:=][ \t]*([-\w.]+)`) on the line, or an empty string.
std::string CodingDeclaration(const std::string& line) {
  size_t pos = line.find_first_not_of(" \t\f");
  if (pos == std::string::npos || line[pos] != '#') return "";
  while ((pos = line.find("coding", pos)) != std::string::npos) {
    pos += 6;
    if (pos >= line.size() || (line[pos] != ':' && line[pos] != '=')) continue;
    size_t start = line.find_first_not_of(" \t", pos + 1);
    if (start == std::string::npos) return "";
    size_t end = start;
    while (end < line.size() &&
           (IsIdentChar(line[end]) || line[end] == '-' || line[end] == '.')) {
      end++;
    }
    if (end > start) return line.substr(start, end - start);
  }
  return "";
}

bool IsUtf8Encoding(const std::string& name) {
  std::string normal = Lowercase(name);
  std::replace(normal.begin(), normal.end(), '_', '-');
  return normal == "utf-8" || normal == "utf8" ||
         normal.compare(0, 6, "utf-8-") == 0;
}

bool IsBlankOrComment(const std::string& line) {
  size_t pos = line.find_first_not_of(" \t\f");
  return pos == std::string::npos || line[pos] == '#';
}

char MatchingBracket(char c) {
  switch (c) {
    case ')':
      return '(';
    case ']':
      return '[';
    case '}':
      return '{';
    default:
      return '\0';
  }
}

class Lexer {
 public:
  Lexer(const std::string& source, std::vector<validator::Token>* tokens)
      : src_(source), tokens_(tokens) {}

  bool Run(std::string* error_msg);

  Lexer(const Lexer&) = delete;
  Lexer& operator=(const Lexer&) = delete;

 private:
  bool Fail(const std::string& msg, int line) {
    error_ = "line " + std::to_string(line) + ": " + msg;
    return false;
  }
  bool Fail(const std::string& msg) { return Fail(msg, line_); }

  char Peek(size_t offset = 0) const {
    return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
  }
  bool AtNewline() const { return Peek() == '\n' || Peek() == '\r'; }

  void ConsumeNewline() {
    if (Peek() == '\r' && Peek(1) == '\n') pos_++;
    pos_++;
    line_++;
  }

  void Emit(validator::Token::Type type, std::string text, int line) {
    tokens_->push_back(validator::Token{type, std::move(text), line});
    if (type != validator::Token::NEWLINE &&
        type != validator::Token::INDENT && type != validator::Token::DEDENT)
      line_has_tokens_ = true;
  }

  bool CheckEncoding();
  bool HandleIndentation();
  bool ScanString(size_t start, const std::string& prefix);
  bool ScanStringBody(char quote, bool triple, bool format, int start_line);
  bool ScanReplacementField(char quote, bool triple, int start_line);
  bool ScanFormatSpec(char quote, bool triple, int start_line);
  void ScanNumber();
  bool ScanOperator();

  const std::string& src_;
  std::vector<validator::Token>* tokens_;
  size_t pos_ = 0;
  int line_ = 1;
  std::vector<int> indents_{0};
  std::vector<std::pair<char, int>> brackets_;
  bool line_has_tokens_ = false;
  std::string error_;
};

// The code is only ever read as UTF-8, so any other declared source encoding
// is refused: the interpreter would decode the file differently.
bool Lexer::CheckEncoding() {
  size_t begin = pos_;
  for (int line = 1; line <= 2 && begin < src_.size(); line++) {
    size_t end = src_.find_first_of("\r\n", begin);
    if (end == std::string::npos) end = src_.size();
    std::string text = src_.substr(begin, end - begin);
    std::string encoding = CodingDeclaration(text);
    if (!encoding.empty()) {
      if (IsUtf8Encoding(encoding)) return true;
      return Fail("encoding problem: " + encoding, line);
    }
    // The second line is only looked at after a blank or comment line.
    if (!IsBlankOrComment(text)) return true;
    begin = end;
    if (begin < src_.size() && src_[begin] == '\r') begin++;
    if (begin < src_.size() && src_[begin] == '\n') begin++;
  }
  return true;
}

// Called at the beginning of every physical line that starts a logical line.
// Returns false on inconsistent dedent.
bool Lexer::HandleIndentation() {
  int column = 0;
  while (pos_ < src_.size()) {
    char c = src_[pos_];
    if (c == ' ') {
      column++;
    } else if (c == '\t') {
      column = (column / 8 + 1) * 8;
    } else if (c == '\f') {
      column = 0;
    } else {
      break;
    }
    pos_++;
  }
  // Blank lines and lines with only a comment do not change the indentation.
  if (pos_ >= src_.size() || AtNewline() || Peek() == '#') return true;
  if (column > indents_.back()) {
    indents_.push_back(column);
    Emit(validator::Token::INDENT, "", line_);
    return true;
  }
  while (column < indents_.back()) {
    indents_.pop_back();
    Emit(validator::Token::DEDENT, "", line_);
  }
  if (column != indents_.back()) {
    return Fail("unindent does not match any outer indentation level");
  }
  return true;
}

bool Lexer::ScanString(size_t start, const std::string& prefix) {
  int start_line = line_;
  char quote = Peek();
  bool triple = Peek(1) == quote && Peek(2) == quote;
  pos_ += triple ? 3 : 1;
  if (!ScanStringBody(quote, triple, IsFormatPrefix(prefix), start_line)) {
    return false;
  }
  Emit(validator::Token::STRING, src_.substr(start, pos_ - start), start_line);
  return true;
}

bool Lexer::ScanStringBody(char quote, bool triple, bool format,
                           int start_line) {
  while (true) {
    if (pos_ >= src_.size()) {
      return Fail(triple ? "unterminated triple-quoted string literal"
                         : "unterminated string literal",
                  start_line);
    }
    char c = src_[pos_];
    if (c == '\\') {
      // Escapes, raw or not, never terminate the literal.
      pos_++;
      if (AtNewline()) {
        ConsumeNewline();
      } else if (pos_ < src_.size()) {
        pos_++;
      }
      continue;
    }
    if (c == '\n' || c == '\r') {
      if (!triple) return Fail("unterminated string literal", start_line);
      ConsumeNewline();
      continue;
    }
    if (c == quote) {
      if (!triple) {
        pos_++;
        return true;
      }
      if (Peek(1) == quote && Peek(2) == quote) {
        pos_ += 3;
        return true;
      }
      pos_++;
      continue;
    }
    if (format && c == '{') {
      if (Peek(1) == '{') {
        pos_ += 2;
        continue;
      }
      pos_++;
      if (!ScanReplacementField(quote, triple, start_line)) return false;
      continue;
    }
    pos_++;
  }
}

// Skips an f-string replacement field, up to and including the closing brace.
// Nested strings may reuse the enclosing quote character.
bool Lexer::ScanReplacementField(char quote, bool triple, int start_line) {
  int depth = 1;
  while (true) {
    if (pos_ >= src_.size()) {
      return Fail("f-string: expecting '}'", start_line);
    }
    char c = src_[pos_];
    if (IsIdentStart(c)) {
      size_t word_start = pos_;
      while (pos_ < src_.size() && IsIdentChar(src_[pos_])) pos_++;
      std::string word = src_.substr(word_start, pos_ - word_start);
      if (IsQuote(Peek()) && IsStringPrefix(word)) {
        if (!ScanString(word_start, word)) return false;
        tokens_->pop_back();
      }
      continue;
    }
    if (IsQuote(c)) {
      if (!ScanString(pos_, "")) return false;
      tokens_->pop_back();
      continue;
    }
    if (c == '\n' || c == '\r') {
      ConsumeNewline();
      continue;
    }
    if (c == ':' && depth == 1) {
      pos_++;
      return ScanFormatSpec(quote, triple, start_line);
    }
    if (c == '{' || c == '(' || c == '[') {
      depth++;
    } else if (c == '}' || c == ')' || c == ']') {
      depth--;
      if (depth == 0) {
        if (c != '}') {
          return Fail("f-string: unmatched '" + std::string(1, c) + "'");
        }
        pos_++;
        return true;
      }
    }
    pos_++;
  }
}

// Skips the format specification of a replacement field, up to and including
// the closing brace. Quotes are plain text here, but nested replacement
// fields are allowed.
bool Lexer::ScanFormatSpec(char quote, bool triple, int start_line) {
  while (true) {
    if (pos_ >= src_.size()) {
      return Fail("f-string: expecting '}'", start_line);
    }
    char c = src_[pos_];
    if (c == '}') {
      pos_++;
      return true;
    }
    if (c == '{') {
      pos_++;
      if (!ScanReplacementField(quote, triple, start_line)) return false;
      continue;
    }
    if (c == quote && (!triple || (Peek(1) == quote && Peek(2) == quote))) {
      return Fail("f-string: expecting '}'", start_line);
    }
    if (c == '\n' || c == '\r') {
      if (!triple) return Fail("unterminated string literal", start_line);
      ConsumeNewline();
      continue;
    }
    pos_++;
  }
}

void Lexer::ScanNumber() {
  size_t start = pos_;
  bool hex = Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X');
  while (pos_ < src_.size()) {
    char c = src_[pos_];
    if (isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
      pos_++;
      continue;
    }
    // Signed exponent, as in 1e-5.
    if ((c == '+' || c == '-') && !hex && pos_ > start &&
        (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E')) {
      pos_++;
      continue;
    }
    break;
  }
  Emit(validator::Token::NUMBER, src_.substr(start, pos_ - start), line_);
}

bool Lexer::ScanOperator() {
  for (const char* op : kOperators) {
    size_t len = strlen(op);
    if (src_.compare(pos_, len, op) != 0) continue;
    if (len == 1 && (op[0] == '(' || op[0] == '[' || op[0] == '{')) {
      brackets_.emplace_back(op[0], line_);
    } else if (len == 1 && MatchingBracket(op[0]) != '\0') {
      if (brackets_.empty()) {
        return Fail("unmatched '" + std::string(op) + "'");
      }
      if (brackets_.back().first != MatchingBracket(op[0])) {
        return Fail("closing parenthesis '" + std::string(op) +
                    "' does not match opening parenthesis '" +
                    std::string(1, brackets_.back().first) + "'");
      }
      brackets_.pop_back();
    }
    Emit(validator::Token::OP, op, line_);
    pos_ += len;
    return true;
  }
  return Fail("invalid character '" + std::string(1, Peek()) + "'");
}

bool Lexer::Run(std::string* error_msg) {
  if (src_.compare(0, 3, "\xEF\xBB\xBF") == 0) pos_ = 3;
  bool line_start = true;
  bool ok = CheckEncoding();
  while (ok && pos_ < src_.size()) {
    if (line_start) {
      line_start = false;
      ok = HandleIndentation();
      continue;
    }
    char c = src_[pos_];
    if (c == ' ' || c == '\t' || c == '\f') {
      pos_++;
    } else if (c == '#') {
      while (pos_ < src_.size() && !AtNewline()) pos_++;
    } else if (c == '\n' || c == '\r') {
      ConsumeNewline();
      if (brackets_.empty()) {
        if (line_has_tokens_) {
          Emit(validator::Token::NEWLINE, "", line_ - 1);
          line_has_tokens_ = false;
        }
        line_start = true;
      }
    } else if (c == '\\') {
      pos_++;
      if (pos_ >= src_.size()) {
        ok = Fail("unexpected EOF after line continuation character");
      } else if (!AtNewline()) {
        ok = Fail("unexpected character after line continuation character");
      } else {
        ConsumeNewline();
      }
    } else if (IsIdentStart(c)) {
      size_t start = pos_;
      while (pos_ < src_.size() && IsIdentChar(src_[pos_])) pos_++;
      std::string word = src_.substr(start, pos_ - start);
      if (IsQuote(Peek()) && IsStringPrefix(word)) {
        ok = ScanString(start, word);
      } else {
        Emit(validator::Token::NAME, std::move(word), line_);
      }
    } else if (IsQuote(c)) {
      ok = ScanString(pos_, "");
    } else if (isdigit(static_cast<unsigned char>(c)) ||
               (c == '.' && isdigit(static_cast<unsigned char>(Peek(1))))) {
      ScanNumber();
    } else {
      ok = ScanOperator();
    }
  }
  if (ok && !brackets_.empty()) {
    ok = Fail("'" + std::string(1, brackets_.back().first) +
                  "' was never closed",
              brackets_.back().second);
  }
  if (!ok) {
    *error_msg = error_;
    return false;
  }
  if (line_has_tokens_) Emit(validator::Token::NEWLINE, "", line_);
  while (indents_.size() > 1) {
    indents_.pop_back();
    Emit(validator::Token::DEDENT, "", line_);
  }
  Emit(validator::Token::END, "", line_);
  return true;
}

}  // namespace

namespace validator {

bool Tokenize(const std::string& source, std::vector<Token>* tokens,
              std::string* error_msg) {
  tokens->clear();
  Lexer lexer(source, tokens);
  return lexer.Run(error_msg);
}

}  // namespace validator
