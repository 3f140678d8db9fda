#include "util/subprocess.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>

#include "glog/logging.h"

extern char** environ;

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kStrErrorBufSize = 2048;

void SetError(const char* prefix, int err, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  *error_msg = prefix;
  *error_msg += ": ";
  *error_msg += mystrerror(err, buf, kStrErrorBufSize);
}

// Closes the file descriptors it owns when going out of scope.
class FdCloser {
 public:
  FdCloser() = default;
  ~FdCloser() {
    for (int fd : fds_) {
      if (fd != -1) close(fd);
    }
  }
  void Add(int fd) { fds_.push_back(fd); }
  void Close(int fd) {
    for (int& owned : fds_) {
      if (owned == fd) {
        close(owned);
        owned = -1;
      }
    }
  }
  FdCloser(const FdCloser&) = delete;
  FdCloser& operator=(const FdCloser&) = delete;

 private:
  std::vector<int> fds_;
};

class FileActions {
 public:
  FileActions() { ret_ = posix_spawn_file_actions_init(&actions_); }
  ~FileActions() {
    if (ret_ == 0) posix_spawn_file_actions_destroy(&actions_);
  }
  int InitResult() const { return ret_; }
  posix_spawn_file_actions_t* Get() { return &actions_; }
  FileActions(const FileActions&) = delete;
  FileActions& operator=(const FileActions&) = delete;

 private:
  posix_spawn_file_actions_t actions_;
  int ret_;
};

// Reads from all the given descriptors until every one of them reaches EOF.
// Returns errno, or 0 on success.
int DrainPipes(int out_fd, std::string* out, int err_fd, std::string* err) {
  struct pollfd fds[2] = {};
  fds[0].fd = out_fd;
  fds[0].events = POLLIN;
  fds[1].fd = err_fd;
  fds[1].events = POLLIN;
  std::string* dest[2] = {out, err};
  int open_fds = err_fd == -1 ? 1 : 2;
  if (err_fd == -1) fds[1].fd = -1;
  char buf[4096];
  while (open_fds > 0) {
    int ret = poll(fds, 2, -1);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) return errno;
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd == -1 || fds[i].revents == 0) continue;
      ssize_t amount = read(fds[i].fd, buf, sizeof(buf));
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) return errno;
      if (amount == 0) {
        fds[i].fd = -1;
        open_fds--;
        continue;
      }
      dest[i]->append(buf, amount);
    }
  }
  return 0;
}
}  // namespace

namespace util {

bool Subprocess::Run(const std::vector<std::string>& args,
                     CommandResult* result, std::string* error_msg,
                     bool merge_stderr) {
  if (args.empty()) {
    *error_msg = "Empty command line";
    return false;
  }
  *result = CommandResult();

  FdCloser closer;
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    SetError("pipe2", errno, error_msg);
    return false;
  }
  closer.Add(out_pipe[0]);
  closer.Add(out_pipe[1]);
  if (!merge_stderr) {
    if (pipe2(err_pipe, O_CLOEXEC) == -1) {
      SetError("pipe2", errno, error_msg);
      return false;
    }
    closer.Add(err_pipe[0]);
    closer.Add(err_pipe[1]);
  }

  FileActions actions;
  int ret = actions.InitResult();
  if (ret != 0) {
    SetError("posix_spawn_file_actions_init", ret, error_msg);
    return false;
  }
  ret = posix_spawn_file_actions_addopen(actions.Get(), STDIN_FILENO,
                                         "/dev/null", O_RDONLY, 0);
  if (ret == 0) {
    ret = posix_spawn_file_actions_adddup2(actions.Get(), out_pipe[1],
                                           STDOUT_FILENO);
  }
  if (ret == 0) {
    ret = posix_spawn_file_actions_adddup2(
        actions.Get(), merge_stderr ? out_pipe[1] : err_pipe[1],
        STDERR_FILENO);
  }
  if (ret != 0) {
    SetError("posix_spawn_file_actions", ret, error_msg);
    return false;
  }

  std::vector<std::vector<char>> arg_storage;
  for (const std::string& s : args) {
    std::vector<char> arg(s.size() + 1);
    std::copy(s.begin(), s.end(), arg.begin());
    arg.back() = '\0';
    arg_storage.push_back(std::move(arg));
  }
  std::vector<char*> args_list(arg_storage.size() + 1);
  for (size_t i = 0; i < arg_storage.size(); i++) {
    args_list[i] = arg_storage[i].data();
  }
  args_list.back() = nullptr;

  pid_t child_pid = 0;
  ret = posix_spawnp(&child_pid, args_list[0], actions.Get(), nullptr,
                     args_list.data(), environ);
  if (ret != 0) {
    SetError(("exec " + args[0]).c_str(), ret, error_msg);
    return false;
  }
  closer.Close(out_pipe[1]);
  if (!merge_stderr) closer.Close(err_pipe[1]);

  int drain_error =
      DrainPipes(out_pipe[0], &result->output,
                 merge_stderr ? -1 : err_pipe[0], &result->error_output);
  if (drain_error != 0) {
    char buf[kStrErrorBufSize] = {};
    LOG(WARNING) << "Reading output of " << args[0] << " failed: "
                 << mystrerror(drain_error, buf, kStrErrorBufSize);
    // Make further writes of the child fail instead of blocking forever.
    closer.Close(out_pipe[0]);
    if (!merge_stderr) closer.Close(err_pipe[0]);
  }

  int child_status = 0;
  while (waitpid(child_pid, &child_status, 0) == -1) {
    if (errno == EINTR) continue;
    SetError("waitpid", errno, error_msg);
    return false;
  }
  result->status_code =
      WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  result->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  return true;
}

}  // namespace util
