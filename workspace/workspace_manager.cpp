#include "workspace/workspace_manager.hpp"

#include <stdio.h>

#include <cstdint>
#include <random>
#include <stdexcept>

#include "glog/logging.h"
#include "util/file.hpp"

namespace workspace {

Workspace& Workspace::operator=(Workspace&& other) noexcept {
  if (this == &other) return *this;
  if (!released_ && manager_ != nullptr) manager_->Release(this);
  manager_ = other.manager_;
  id_ = std::move(other.id_);
  path_ = std::move(other.path_);
  released_ = other.released_;
  other.released_ = true;
  return *this;
}

Workspace::~Workspace() {
  if (!released_ && manager_ != nullptr) manager_->Release(this);
}

WorkspaceManager::WorkspaceManager(std::string root, bool keep)
    : root_(std::move(root)), keep_(keep) {}

std::string WorkspaceManager::NewId() {
  std::random_device rd;
  uint32_t words[4];
  for (uint32_t& word : words) word = rd();
  // Version 4, variant 1.
  words[1] = (words[1] & 0xffff0fffu) | 0x00004000u;
  words[2] = (words[2] & 0x3fffffffu) | 0x80000000u;
  char buf[37];
  snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%04x%08x", words[0],
           words[1] >> 16, words[1] & 0xffffu, words[2] >> 16,
           words[2] & 0xffffu, words[3]);
  return buf;
}

bool WorkspaceManager::IsPlainFileName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  for (char c : name) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
    if (!ok) return false;
  }
  return true;
}

Workspace WorkspaceManager::Acquire(const std::string& id) const {
  if (!IsPlainFileName(id)) {
    throw std::invalid_argument("Invalid workspace id: " + id);
  }
  util::File::MakeDirs(root_);
  std::string path = util::File::JoinPath(root_, id);
  util::File::MakeDir(path);
  Workspace workspace(this, id, path);
  workspace.released_ = false;
  // The sandboxed code runs as an unprivileged user and writes its outputs
  // here.
  util::File::MakeWritableByAll(path);
  return workspace;
}

void WorkspaceManager::Populate(
    const Workspace& workspace, const std::string& code,
    const google::protobuf::RepeatedPtrField<proto::InputFile>& input_files)
    const {
  util::File::Write(util::File::JoinPath(workspace.Path(), kCodeFileName),
                    code);
  for (const proto::InputFile& file : input_files) {
    if (!IsPlainFileName(file.name()) || file.name() == kCodeFileName) {
      throw std::invalid_argument("Invalid input file name: " + file.name());
    }
    util::File::Write(util::File::JoinPath(workspace.Path(), file.name()),
                      file.contents());
  }
}

std::vector<std::string> WorkspaceManager::Harvest(
    const Workspace& workspace) const {
  std::vector<std::string> files;
  for (std::string& name : util::File::ListDir(workspace.Path())) {
    if (name == kCodeFileName) continue;
    files.push_back(std::move(name));
  }
  return files;
}

void WorkspaceManager::Release(Workspace* workspace) const {
  if (workspace->released_) return;
  workspace->released_ = true;
  if (keep_) {
    LOG(INFO) << "Keeping workspace " << workspace->Path();
    return;
  }
  try {
    if (!util::File::Exists(workspace->Path())) return;
    util::File::RemoveTree(workspace->Path());
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Failed to remove workspace " << workspace->Path() << ": "
                 << exc.what();
  }
}

}  // namespace workspace
