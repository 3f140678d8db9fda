#ifndef VALIDATOR_IMPORT_VALIDATOR_HPP
#define VALIDATOR_IMPORT_VALIDATOR_HPP

#include <string>
#include <unordered_set>
#include <vector>

namespace validator {

// Statically checks that Python code only imports modules from an
// allow-list. The code is never executed.
class ImportValidator {
 public:
  explicit ImportValidator(const std::vector<std::string>& allowed_modules);

  // Returns true if every import in the code refers to an allowed module.
  // Otherwise returns false and sets reason. Code that cannot be parsed is
  // rejected.
  bool Validate(const std::string& code, std::string* reason) const;

  // Returns the allowed modules, sorted.
  std::vector<std::string> AllowedModules() const;

  // Collects the top-level package of every module imported anywhere in the
  // code, in order of appearance. `from . import x` contributes nothing,
  // `from .a.b import x` contributes "a". Returns false and sets error_msg if
  // the code is not syntactically valid.
  static bool ExtractImports(const std::string& code,
                             std::vector<std::string>* modules,
                             std::string* error_msg);

 private:
  std::unordered_set<std::string> allowed_;
};

}  // namespace validator

#endif
