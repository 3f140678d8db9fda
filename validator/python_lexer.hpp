#ifndef VALIDATOR_PYTHON_LEXER_HPP
#define VALIDATOR_PYTHON_LEXER_HPP

#include <string>
#include <vector>

namespace validator {

struct Token {
  enum Type { NAME, NUMBER, STRING, OP, NEWLINE, INDENT, DEDENT, END };
  Type type;
  std::string text;
  int line;
};

// Splits Python source code into tokens, following the rules of the Python
// tokenizer: comments are dropped, physical lines are joined inside brackets
// and after a backslash, and changes of indentation at the start of a
// logical line produce INDENT and DEDENT tokens. String literals (with any
// prefix, including f-strings with nested replacement fields) become a
// single STRING token. The last token is always END.
// Returns false and sets error_msg (prefixed by the line number) if the code
// is not lexically valid.
bool Tokenize(const std::string& source, std::vector<Token>* tokens,
              std::string* error_msg);

}  // namespace validator

#endif
