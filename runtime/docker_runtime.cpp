#include "runtime/docker_runtime.hpp"

#include "absl/memory/memory.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "util/flags.hpp"
#include "workspace/workspace_manager.hpp"

namespace runtime {

constexpr const char* DockerRuntime::kMountPoint;
constexpr int64_t DockerRuntime::kCpuPeriod;

DockerOptions DockerOptions::FromFlags() {
  DockerOptions options;
  options.docker_binary = FLAGS_docker_binary;
  options.image = FLAGS_image;
  return options;
}

std::vector<std::string> DockerRuntime::CreateArgs(
    const std::string& workspace_path, const ResourceLimits& limits) const {
  int64_t cpu_quota = static_cast<int64_t>(limits.cpus * kCpuPeriod);
  return {"create",
          "--network",
          "none",
          "--memory",
          limits.memory,
          "--memory-swap",
          limits.memory,
          "--cpu-period",
          absl::StrCat(kCpuPeriod),
          "--cpu-quota",
          absl::StrCat(cpu_quota),
          "--pids-limit",
          absl::StrCat(limits.pids),
          "--security-opt",
          "no-new-privileges",
          "--cap-drop",
          "ALL",
          "--user",
          limits.user,
          "--volume",
          absl::StrCat(workspace_path, ":", kMountPoint, ":rw"),
          "--workdir",
          kMountPoint,
          "--env",
          "OPENBLAS_NUM_THREADS=1",
          "--label",
          "codebox.unit=1",
          options_.image,
          "python",
          absl::StrCat(kMountPoint, "/", workspace::kCodeFileName)};
}

bool DockerRuntime::RunDocker(const std::vector<std::string>& args,
                              bool merge_stderr, util::CommandResult* result,
                              std::string* error_msg) {
  std::vector<std::string> command{options_.docker_binary};
  command.insert(command.end(), args.begin(), args.end());
  VLOG(1) << absl::StrJoin(command, " ");
  std::string run_error;
  if (!runner_(command, result, &run_error, merge_stderr)) {
    *error_msg = "docker " + args[0] + ": " + run_error;
    return false;
  }
  if (result->Success()) return true;
  std::string details(absl::StripAsciiWhitespace(
      merge_stderr ? result->output : result->error_output));
  *error_msg = "docker " + args[0] + " failed";
  if (result->signal != 0) {
    *error_msg += absl::StrCat(" with signal ", result->signal);
  } else {
    *error_msg += absl::StrCat(" with status ", result->status_code);
  }
  if (!details.empty()) *error_msg += ": " + details;
  return false;
}

std::unique_ptr<IsolatedUnit> DockerRuntime::Start(
    const std::string& workspace_path, const ResourceLimits& limits,
    std::string* error_msg) {
  util::CommandResult result;
  if (!RunDocker(CreateArgs(workspace_path, limits), false, &result,
                 error_msg)) {
    return nullptr;
  }
  std::string id(absl::StripAsciiWhitespace(result.output));
  if (id.empty()) {
    *error_msg = "docker create did not return a container id";
    return nullptr;
  }
  std::unique_ptr<IsolatedUnit> unit =
      absl::make_unique<IsolatedUnit>(id, workspace_path, limits);
  if (!RunDocker({"start", id}, false, &result, error_msg)) {
    Destroy(unit.get());
    return nullptr;
  }
  unit->SetState(IsolatedUnit::State::RUNNING);
  return unit;
}

bool DockerRuntime::Wait(IsolatedUnit* unit, int32_t* exit_code,
                         std::string* error_msg) {
  util::CommandResult result;
  if (!RunDocker({"wait", unit->Id()}, false, &result, error_msg)) {
    return false;
  }
  // Only the last line holds the status; older clients may print more.
  absl::string_view output = absl::StripAsciiWhitespace(result.output);
  size_t last_line = output.find_last_of('\n');
  if (last_line != absl::string_view::npos) {
    output.remove_prefix(last_line + 1);
  }
  if (!absl::SimpleAtoi(output, exit_code)) {
    *error_msg = "docker wait returned an invalid status: " +
                 std::string(output);
    return false;
  }
  return true;
}

bool DockerRuntime::Kill(IsolatedUnit* unit, std::string* error_msg) {
  util::CommandResult result;
  return RunDocker({"kill", unit->Id()}, false, &result, error_msg);
}

bool DockerRuntime::Remove(IsolatedUnit* unit, std::string* error_msg) {
  util::CommandResult result;
  if (RunDocker({"rm", "--force", unit->Id()}, false, &result, error_msg)) {
    return true;
  }
  if (absl::StrContains(result.error_output, "No such container")) {
    LOG(INFO) << "Container " << unit->Id() << " was already removed";
    error_msg->clear();
    return true;
  }
  return false;
}

bool DockerRuntime::FetchLogs(IsolatedUnit* unit, std::string* logs,
                              std::string* error_msg) {
  util::CommandResult result;
  if (!RunDocker({"logs", unit->Id()}, true, &result, error_msg)) {
    return false;
  }
  *logs = std::move(result.output);
  return true;
}

}  // namespace runtime
