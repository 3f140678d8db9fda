#ifndef UTIL_SUBPROCESS_HPP
#define UTIL_SUBPROCESS_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace util {

// Termination status and captured output of a helper program.
struct CommandResult {
  int32_t status_code = 0;
  int32_t signal = 0;
  std::string output;
  std::string error_output;

  bool Success() const { return status_code == 0 && signal == 0; }
};

// Signature of a function that runs a command line and waits for it, with the
// same meaning of the arguments as Subprocess::Run. Returns false and sets
// error_msg if the program could not be started at all.
using CommandRunner = std::function<bool(
    const std::vector<std::string>& args, CommandResult* result,
    std::string* error_msg, bool merge_stderr)>;

class Subprocess {
 public:
  // Runs args[0], looked up in PATH, with the remaining arguments. The child
  // inherits the environment, reads from /dev/null, and its standard output
  // and error are captured separately, unless merge_stderr is true, in which
  // case both end up in result->output in the order they were written.
  // This function is thread safe.
  static bool Run(const std::vector<std::string>& args, CommandResult* result,
                  std::string* error_msg, bool merge_stderr = false);
};

}  // namespace util

#endif
