#include "internal/build/step_executor.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace dockyard::build {

namespace fs = std::filesystem;

using dockyard::observability::IntField;
using dockyard::observability::StringField;

namespace {

constexpr std::size_t kMaxOutputBytes = 64 * 1024;
constexpr const char* kDefaultPath    = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

class ScratchDir {
 public:
  explicit ScratchDir(fs::path path) : path_(std::move(path)) {
    fs::create_directories(path_);
  }

  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) DOCKYARD_LOG_WARN("failed to remove scratch directory", {StringField("path", path_.string()), StringField("error", ec.message())});
  }

  ScratchDir(const ScratchDir&)            = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const fs::path& path() const {
    return path_;
  }

 private:
  fs::path path_;
};

fs::path HostPath(const fs::path& root, const std::string& container_path) {
  return container_path == "/" ? root : root / container_path.substr(1);
}

void Materialize(const fs::path& root, const layer::RootFs& rootfs) {
  for (const auto& [path, content] : rootfs.files()) {
    const auto target = HostPath(root, path);
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to materialize " + path);
    out << content;
  }
}

layer::RootFs Capture(const fs::path& root) {
  layer::RootFs rootfs;
  for (const auto& entry : fs::recursive_directory_iterator(root)) {
    if (!entry.is_regular_file() || entry.is_symlink()) continue;
    std::ifstream      in(entry.path(), std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    rootfs.Write("/" + fs::relative(entry.path(), root).generic_string(), content.str());
  }
  return rootfs;
}

std::vector<std::string> BuildEnvironment(const RunRequest& request, const fs::path& root) {
  std::vector<std::string> env;
  bool                     has_path = false;
  for (const auto& [key, value] : request.env) {
    if (key == "PATH") has_path = true;
    env.push_back(key + "=" + value);
  }
  if (!has_path) env.push_back(std::string("PATH=") + kDefaultPath);
  env.push_back("DOCKYARD_ROOTFS=" + root.string());
  return env;
}

} // namespace

ShellStepExecutor::ShellStepExecutor(std::string shell, fs::path scratch_root)
    : shell_(std::move(shell)), scratch_root_(scratch_root.empty() ? fs::temp_directory_path() : std::move(scratch_root)) {
}

RunResult ShellStepExecutor::Run(const RunRequest& request) {
  static const layer::RootFs kEmpty;
  const auto&                input = request.rootfs ? *request.rootfs : kEmpty;

  ScratchDir scratch(scratch_root_ / ("dockyard-run-" + util::GenerateHexId().substr(0, 16)));
  Materialize(scratch.path(), input);

  const auto cwd = HostPath(scratch.path(), request.workdir);
  fs::create_directories(cwd);

  // prepared before fork: the child only calls async-signal-safe functions
  const auto          env_strings = BuildEnvironment(request, scratch.path());
  std::vector<char*>  envp;
  for (const auto& entry : env_strings) envp.push_back(const_cast<char*>(entry.c_str()));
  envp.push_back(nullptr);
  const std::string  dash_c = "-c";
  std::vector<char*> argv   = {const_cast<char*>(shell_.c_str()), const_cast<char*>(dash_c.c_str()), const_cast<char*>(request.command.c_str()), nullptr};
  const std::string  cwd_string = cwd.string();

  int pipes[2];
  // close-on-exec: runs forked by other threads must not inherit either end
  if (::pipe2(pipes, O_CLOEXEC) == -1) throw std::system_error(errno, std::generic_category(), "pipe2");

  const pid_t pid = ::fork();
  if (pid == -1) {
    const int error = errno;
    ::close(pipes[0]);
    ::close(pipes[1]);
    throw std::system_error(error, std::generic_category(), "fork");
  }

  if (pid == 0) {
    ::setsid();
    ::close(pipes[0]);
    ::dup2(pipes[1], STDOUT_FILENO);
    ::dup2(pipes[1], STDERR_FILENO);
    ::close(pipes[1]);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    if (::chdir(cwd_string.c_str()) != 0) ::_exit(126);
    ::execve(shell_.c_str(), argv.data(), envp.data());
    ::_exit(127);
  }

  ::close(pipes[1]);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.insert(pid);
  }
  DOCKYARD_LOG_DEBUG("run step started", {IntField("pid", pid), StringField("command", request.command)});

  RunResult result;
  char      buffer[4096];
  for (;;) {
    const auto n = ::read(pipes[0], buffer, sizeof(buffer));
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    result.output.append(buffer, static_cast<std::size_t>(n));
    if (result.output.size() > kMaxOutputBytes) result.output.erase(0, result.output.size() - kMaxOutputBytes);
  }
  ::close(pipes[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      const int error = errno;
      std::lock_guard<std::mutex> lock(mutex_);
      running_.erase(pid);
      throw std::system_error(error, std::generic_category(), "waitpid");
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(pid);
  }

  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_status = 128 + WTERMSIG(status);
  } else {
    result.exit_status = -1;
  }

  if (result.exit_status == 0) {
    result.delta = layer::RootFs::Diff(input, Capture(scratch.path()));
  }

  DOCKYARD_LOG_DEBUG("run step finished", {IntField("pid", pid), IntField("status", result.exit_status)});
  return result;
}

void ShellStepExecutor::Kill() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto pid : running_) {
    // negative pid: the child's whole session/process group
    if (::kill(-pid, SIGKILL) == -1 && errno != ESRCH) {
      DOCKYARD_LOG_WARN("failed to kill run step", {IntField("pid", pid), StringField("error", std::strerror(errno))});
    }
  }
}

} // namespace dockyard::build
