#include "validator/import_validator.hpp"

#include <algorithm>

#include "validator/python_lexer.hpp"

namespace {

using validator::Token;

bool IsKeyword(const std::string& word) {
  static const std::unordered_set<std::string> keywords = {
      "False", "None",   "True",    "and",      "as",       "assert",
      "async", "await",  "break",   "class",    "continue", "def",
      "del",   "elif",   "else",    "except",   "finally",  "for",
      "from",  "global", "if",      "import",   "in",       "is",
      "lambda", "nonlocal", "not",  "or",       "pass",     "raise",
      "return", "try",   "while",   "with",     "yield"};
  return keywords.count(word) != 0;
}

// Walks the token stream of a module looking for import statements. Besides
// the import statements themselves it checks the block structure: a line
// ending with a colon must be followed by an indented block, and indentation
// may only increase after such a line.
class ImportParser {
 public:
  ImportParser(const std::vector<Token>& tokens,
               std::vector<std::string>* modules)
      : tokens_(tokens), modules_(modules) {}

  bool Run(std::string* error_msg);

  ImportParser(const ImportParser&) = delete;
  ImportParser& operator=(const ImportParser&) = delete;

 private:
  const Token& Cur() const { return tokens_[pos_]; }
  bool IsOp(const char* op) const {
    return Cur().type == Token::OP && Cur().text == op;
  }
  bool IsName(const char* name) const {
    return Cur().type == Token::NAME && Cur().text == name;
  }
  bool AtStatementEnd() const {
    return Cur().type == Token::NEWLINE || Cur().type == Token::END ||
           IsOp(";");
  }
  bool Fail(const std::string& msg) {
    error_ = "line " + std::to_string(Cur().line) + ": " + msg;
    return false;
  }

  bool ParseIdentifier();
  bool ParseDottedName(std::string* root);
  bool ParseImport();
  bool ParseFromImport();

  const std::vector<Token>& tokens_;
  std::vector<std::string>* modules_;
  size_t pos_ = 0;
  std::string error_;
};

bool ImportParser::ParseIdentifier() {
  if (Cur().type != Token::NAME || IsKeyword(Cur().text)) {
    return Fail("invalid syntax in import statement");
  }
  pos_++;
  return true;
}

bool ImportParser::ParseDottedName(std::string* root) {
  if (Cur().type != Token::NAME || IsKeyword(Cur().text)) {
    return Fail("expected a module name");
  }
  *root = Cur().text;
  pos_++;
  while (IsOp(".")) {
    pos_++;
    if (Cur().type != Token::NAME || IsKeyword(Cur().text)) {
      return Fail("expected a module name");
    }
    pos_++;
  }
  return true;
}

// import a.b as c, d
bool ImportParser::ParseImport() {
  while (true) {
    std::string root;
    if (!ParseDottedName(&root)) return false;
    modules_->push_back(root);
    if (IsName("as")) {
      pos_++;
      if (!ParseIdentifier()) return false;
    }
    if (!IsOp(",")) break;
    pos_++;
  }
  if (!AtStatementEnd()) return Fail("invalid syntax in import statement");
  return true;
}

// from ..a.b import (c as d, e)
bool ImportParser::ParseFromImport() {
  bool relative = false;
  while (IsOp(".") || IsOp("...")) {
    relative = true;
    pos_++;
  }
  if (Cur().type == Token::NAME && !IsName("import")) {
    std::string root;
    if (!ParseDottedName(&root)) return false;
    modules_->push_back(root);
  } else if (!relative) {
    return Fail("expected a module name");
  }
  if (!IsName("import")) return Fail("expected 'import'");
  pos_++;
  if (IsOp("*")) {
    pos_++;
  } else {
    bool parenthesized = IsOp("(");
    if (parenthesized) pos_++;
    while (true) {
      if (!ParseIdentifier()) return false;
      if (IsName("as")) {
        pos_++;
        if (!ParseIdentifier()) return false;
      }
      if (!IsOp(",")) break;
      pos_++;
      // A trailing comma is only allowed inside parentheses.
      if (parenthesized && IsOp(")")) break;
    }
    if (parenthesized) {
      if (!IsOp(")")) return Fail("expected ')'");
      pos_++;
    }
  }
  if (!AtStatementEnd()) return Fail("invalid syntax in import statement");
  return true;
}

bool ImportParser::Run(std::string* error_msg) {
  bool statement_start = true;
  bool ends_with_colon = false;
  int depth = 0;
  bool ok = true;
  while (ok && Cur().type != Token::END) {
    const Token& tok = Cur();
    if (tok.type == Token::NEWLINE) {
      pos_++;
      if (ends_with_colon && Cur().type != Token::INDENT) {
        ok = Fail("expected an indented block");
      }
      statement_start = true;
      ends_with_colon = false;
      continue;
    }
    if (tok.type == Token::INDENT) {
      // Only reachable when the previous line did not open a block.
      if (pos_ == 0 || tokens_[pos_ - 1].type != Token::NEWLINE ||
          pos_ < 2 || tokens_[pos_ - 2].type != Token::OP ||
          tokens_[pos_ - 2].text != ":") {
        ok = Fail("unexpected indent");
      }
      pos_++;
      statement_start = true;
      continue;
    }
    if (tok.type == Token::DEDENT) {
      pos_++;
      statement_start = true;
      continue;
    }
    ends_with_colon = false;
    if (tok.type == Token::NAME && tok.text == "import") {
      if (!statement_start) {
        ok = Fail("invalid syntax");
        continue;
      }
      pos_++;
      ok = ParseImport();
      statement_start = false;
      continue;
    }
    if (statement_start && tok.type == Token::NAME && tok.text == "from") {
      pos_++;
      ok = ParseFromImport();
      statement_start = false;
      continue;
    }
    statement_start = false;
    if (tok.type == Token::OP) {
      if (tok.text == "(" || tok.text == "[" || tok.text == "{") {
        depth++;
      } else if (tok.text == ")" || tok.text == "]" || tok.text == "}") {
        depth--;
      } else if (depth == 0 && (tok.text == ";" || tok.text == ":")) {
        // Both start a new simple statement on the same line, as in
        // "if x: import y" or "a = 1; import b".
        statement_start = true;
        ends_with_colon = tok.text == ":";
      }
    }
    pos_++;
  }
  if (!ok) {
    *error_msg = error_;
    return false;
  }
  return true;
}

}  // namespace

namespace validator {

ImportValidator::ImportValidator(
    const std::vector<std::string>& allowed_modules)
    : allowed_(allowed_modules.begin(), allowed_modules.end()) {}

bool ImportValidator::ExtractImports(const std::string& code,
                                     std::vector<std::string>* modules,
                                     std::string* error_msg) {
  std::vector<Token> tokens;
  if (!Tokenize(code, &tokens, error_msg)) return false;
  ImportParser parser(tokens, modules);
  return parser.Run(error_msg);
}

bool ImportValidator::Validate(const std::string& code,
                               std::string* reason) const {
  std::vector<std::string> modules;
  std::string error_msg;
  if (!ExtractImports(code, &modules, &error_msg)) {
    *reason = "syntax error: " + error_msg;
    return false;
  }
  for (const std::string& module : modules) {
    if (allowed_.count(module) == 0) {
      *reason = "disallowed import: " + module;
      return false;
    }
  }
  return true;
}

std::vector<std::string> ImportValidator::AllowedModules() const {
  std::vector<std::string> modules(allowed_.begin(), allowed_.end());
  std::sort(modules.begin(), modules.end());
  return modules;
}

}  // namespace validator
