#ifndef WORKSPACE_WORKSPACE_MANAGER_HPP
#define WORKSPACE_WORKSPACE_MANAGER_HPP

#include <string>
#include <utility>
#include <vector>

#include "google/protobuf/repeated_field.h"
#include "proto/execution.pb.h"

namespace workspace {

// Name under which the submitted code is stored in the workspace. It is
// never reported as an output file.
static const constexpr char* kCodeFileName = "user_code.py";

class WorkspaceManager;

// Scratch directory owned by a single execution. The directory is released
// through its manager when the object goes out of scope.
class Workspace {
 public:
  const std::string& Id() const { return id_; }
  const std::string& Path() const { return path_; }

  ~Workspace();
  Workspace(Workspace&& other) noexcept { *this = std::move(other); }
  Workspace& operator=(Workspace&& other) noexcept;
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

 private:
  friend class WorkspaceManager;
  Workspace(const WorkspaceManager* manager, std::string id, std::string path)
      : manager_(manager), id_(std::move(id)), path_(std::move(path)) {}

  const WorkspaceManager* manager_ = nullptr;
  std::string id_;
  std::string path_;
  bool released_ = true;
};

// Creates, fills, inspects and removes workspaces below a root directory.
// All the methods are thread safe: workspaces never share a directory.
class WorkspaceManager {
 public:
  // If keep is true, released workspaces are left on disk.
  explicit WorkspaceManager(std::string root, bool keep = false);

  // Returns a fresh random identifier, in UUID text form.
  static std::string NewId();

  // Returns true if name can be used as the name of a file in the root of a
  // workspace.
  static bool IsPlainFileName(const std::string& name);

  // Creates the directory of the workspace with the given id. Throws
  // util::file_exists if it is already there.
  Workspace Acquire(const std::string& id) const;

  // Writes the code and the input files to the workspace root.
  void Populate(
      const Workspace& workspace, const std::string& code,
      const google::protobuf::RepeatedPtrField<proto::InputFile>& input_files)
      const;

  // Lists the files the execution left in the workspace root, without the
  // code file, sorted by name.
  std::vector<std::string> Harvest(const Workspace& workspace) const;

  // Removes the workspace from disk. Calling it more than once, or on a
  // workspace whose directory is already gone, does nothing. Never throws:
  // failures are logged.
  void Release(Workspace* workspace) const;

  const std::string& Root() const { return root_; }

  WorkspaceManager(const WorkspaceManager&) = delete;
  WorkspaceManager& operator=(const WorkspaceManager&) = delete;

 private:
  std::string root_;
  bool keep_;
};

}  // namespace workspace

#endif
