#ifndef RUNTIME_DOCKER_RUNTIME_HPP
#define RUNTIME_DOCKER_RUNTIME_HPP

#include <string>
#include <vector>

#include "runtime/isolation_runtime.hpp"
#include "util/subprocess.hpp"

namespace runtime {

struct DockerOptions {
  // Client used to reach the daemon, looked up in PATH.
  std::string docker_binary = "docker";
  // Image providing the interpreter and the allowed libraries.
  std::string image = "codebox-python:latest";

  static DockerOptions FromFlags();
};

// Runs units as Docker containers, through the docker command line client.
// Every call spawns its own client process, so the runtime keeps no state
// about the units.
class DockerRuntime : public IsolationRuntime {
 public:
  // Where the workspace is mounted inside the container.
  static const constexpr char* kMountPoint = "/workspace";
  static const constexpr int64_t kCpuPeriod = 100000;

  explicit DockerRuntime(DockerOptions options,
                         util::CommandRunner runner = &util::Subprocess::Run)
      : options_(std::move(options)), runner_(std::move(runner)) {}

  std::unique_ptr<IsolatedUnit> Start(const std::string& workspace_path,
                                      const ResourceLimits& limits,
                                      std::string* error_msg) override;

  bool FetchLogs(IsolatedUnit* unit, std::string* logs,
                 std::string* error_msg) override;

  // Arguments passed to `docker create` for a unit.
  std::vector<std::string> CreateArgs(const std::string& workspace_path,
                                      const ResourceLimits& limits) const;

 protected:
  bool Wait(IsolatedUnit* unit, int32_t* exit_code,
            std::string* error_msg) override;
  bool Kill(IsolatedUnit* unit, std::string* error_msg) override;
  bool Remove(IsolatedUnit* unit, std::string* error_msg) override;

 private:
  // Runs the client with the given arguments. Returns false and sets
  // error_msg if it could not be run or did not succeed.
  bool RunDocker(const std::vector<std::string>& args, bool merge_stderr,
                 util::CommandResult* result, std::string* error_msg);

  DockerOptions options_;
  util::CommandRunner runner_;
};

}  // namespace runtime

#endif
