#include <future>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_split.h"
#include "core/core.hpp"
#include "executor/execution_engine.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "proto/execution.pb.h"
#include "runtime/docker_runtime.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_double(timeout, 0,
              "Timeout in seconds of every request. If unset, "
              "--default_timeout is used");  // NOLINT
DEFINE_string(input_files, "",
              "Comma-separated list of files made available to the code, "
              "under their base name");  // NOLINT
DEFINE_bool(list_modules, false,
            "Print the modules the code may import and exit");  // NOLINT

namespace {

std::string ReadCode(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::Read(path);
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  CHECK(status.ok()) << status.ToString();
  return json;
}

bool Executed(const proto::ExecutionResult& result) {
  switch (result.outcome()) {
    case proto::Outcome::SUCCESS:
    case proto::Outcome::NONZERO:
    case proto::Outcome::TIMEOUT:
      return true;
    default:
      return false;
  }
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("codebox [flags] <code.py>...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  CHECK_GT(FLAGS_max_timeout, 0) << "--max_timeout must be positive";
  CHECK_GT(FLAGS_default_timeout, 0) << "--default_timeout must be positive";
  CHECK_LE(FLAGS_default_timeout, FLAGS_max_timeout)
      << "--default_timeout cannot exceed --max_timeout";
  CHECK_GT(FLAGS_cpu_limit, 0) << "--cpu_limit must be positive";
  CHECK_GT(FLAGS_pids_limit, 0) << "--pids_limit must be positive";
  CHECK_NE(FLAGS_image, "") << "You need to specify an image!";
  CHECK_GE(FLAGS_max_concurrent_units, 0);
  CHECK_GE(FLAGS_num_cores, 0);

  executor::EngineConfig config = executor::EngineConfig::FromFlags();

  if (FLAGS_list_modules) {
    validator::ImportValidator validator(config.allowed_modules);
    proto::AllowedModules modules;
    for (const std::string& module : validator.AllowedModules()) {
      modules.add_allowed_libraries(module);
    }
    std::cout << ToJson(modules) << std::endl;
    return 0;
  }

  if (argc < 2) {
    std::cerr << gflags::ProgramUsage() << std::endl;
    return 1;
  }

  std::vector<std::string> codes;
  google::protobuf::RepeatedPtrField<proto::InputFile> input_files;
  try {
    for (int i = 1; i < argc; i++) codes.push_back(ReadCode(argv[i]));
    for (absl::string_view path :
         absl::StrSplit(FLAGS_input_files, ',', absl::SkipEmpty())) {
      proto::InputFile* file = input_files.Add();
      file->set_name(util::File::BaseName(std::string(path)));
      file->set_contents(util::File::Read(std::string(path)));
    }
  } catch (const std::system_error& exc) {
    LOG(ERROR) << exc.what();
    return 1;
  }

  runtime::DockerRuntime runtime(runtime::DockerOptions::FromFlags());
  executor::ExecutionEngine engine(config, &runtime);
  core::Core core(&engine, FLAGS_num_cores);

  std::vector<std::future<proto::ExecutionResult>> results;
  for (std::string& code : codes) {
    proto::ExecutionRequest request;
    request.set_code(std::move(code));
    request.set_timeout(FLAGS_timeout);
    *request.mutable_input_file() = input_files;
    results.push_back(core.Enqueue(std::move(request)));
  }

  bool all_executed = true;
  for (std::future<proto::ExecutionResult>& future : results) {
    proto::ExecutionResult result = future.get();
    if (!Executed(result)) all_executed = false;
    std::cout << ToJson(result) << std::endl;
  }
  return all_executed ? 0 : 1;
}
