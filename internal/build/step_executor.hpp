#pragma once

#include <sys/types.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "internal/layer/rootfs.hpp"
#include "internal/model/fs_delta.hpp"

namespace dockyard::build {

struct RunRequest {
  std::string                        command;
  std::string                        workdir = "/";
  std::map<std::string, std::string> env;
  const layer::RootFs*               rootfs = nullptr;
};

struct RunResult {
  int            exit_status = 0;
  model::FsDelta delta;
  std::string    output;
};

/*
  Executes run steps against a filesystem snapshot. A step in flight is
  only stopped by Kill(); build cancellation waits for it.
*/
class StepExecutor {
 public:
  virtual ~StepExecutor() = default;

  virtual RunResult Run(const RunRequest& request) = 0;

  // Forcibly terminates every run in flight.
  virtual void Kill() = 0;
};

/*
  Materializes the snapshot into a scratch directory, runs the command with
  `<shell> -c` in <scratch>/<workdir> (exported as DOCKYARD_ROOTFS) and
  diffs the directory afterwards. Each run gets its own session so Kill()
  reaches the whole process group.

  There is no filesystem isolation: the command runs on the host with only
  its working directory inside the scratch rootfs. Relative paths stay in
  the snapshot, absolute paths ("rm -rf /app") reach the real host
  filesystem, and only changes under the scratch directory are captured.
*/
class ShellStepExecutor final : public StepExecutor {
 public:
  explicit ShellStepExecutor(std::string shell = "/bin/sh", std::filesystem::path scratch_root = {});

  RunResult Run(const RunRequest& request) override;
  void      Kill() override;

 private:
  std::string           shell_;
  std::filesystem::path scratch_root_;

  std::mutex      mutex_;
  std::set<pid_t> running_;
};

} // namespace dockyard::build
