/**
 * @file Process.cpp
 * @brief Child supervision, command capture, port probing and scoped run resources.
 */

#include "src/gate/inc/Process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sched.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"

extern char** environ;

namespace quorum {
namespace gate {

namespace {

volatile std::sig_atomic_t gInterrupted = 0;

extern "C" void onInterruptSignal(int /*sig*/) { gInterrupted = 1; }

constexpr std::chrono::milliseconds SLEEP_SLICE{50};

/** @brief argv/envp storage that outlives the fork (no allocation in the child). */
struct ExecImage {
  std::vector<std::string> argStore;
  std::vector<std::string> envStore;
  std::vector<char*> argv;
  std::vector<char*> envp;

  ExecImage(const std::vector<std::string>& args,
            const std::vector<std::pair<std::string, std::string>>& overrides)
      : argStore(args) {
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
      const std::string_view ENTRY(*e);
      const std::string_view KEY = ENTRY.substr(0, ENTRY.find('='));
      bool overridden = false;
      for (const auto& kv : overrides) {
        overridden = overridden || (kv.first == KEY);
      }
      if (!overridden) {
        envStore.emplace_back(ENTRY);
      }
    }
    for (const auto& kv : overrides) {
      envStore.push_back(kv.first + "=" + kv.second);
    }
    for (auto& s : argStore) {
      argv.push_back(s.data());
    }
    argv.push_back(nullptr);
    for (auto& s : envStore) {
      envp.push_back(s.data());
    }
    envp.push_back(nullptr);
  }
};

/** @brief Child-side setup shared by spawn() and runCommand(); never returns. */
[[noreturn]] void execChild(const ExecImage& img, int outFd, int errFd, std::optional<int> core) {
  ::setpgid(0, 0);
  if (outFd >= 0) {
    ::dup2(outFd, STDOUT_FILENO);
  }
  if (errFd >= 0) {
    ::dup2(errFd, STDERR_FILENO);
  }
  const int DEV_NULL = ::open("/dev/null", O_RDONLY);
  if (DEV_NULL >= 0) {
    ::dup2(DEV_NULL, STDIN_FILENO);
  }
  if (core) {
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(*core, &set);
    if (::sched_setaffinity(0, sizeof(set), &set) != 0) {
      std::fprintf(stderr, "[ERROR] sched_setaffinity(core %d): %s\n", *core,
                   std::strerror(errno));
      ::_exit(126);
    }
  }
  std::signal(SIGPIPE, SIG_DFL);
  ::execvpe(img.argv[0], img.argv.data(), img.envp.data());
  std::fprintf(stderr, "[ERROR] exec %s: %s\n", img.argv[0], std::strerror(errno));
  ::_exit(127);
}

int decodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

std::string joinArgv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += a;
  }
  return out;
}

} // namespace

/* ----------------------------- Interruption ----------------------------- */

void installInterruptHandlers() {
  struct sigaction sa {};
  sa.sa_handler = onInterruptSignal;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

bool interruptRequested() noexcept { return gInterrupted != 0; }

void throwIfInterrupted() {
  if (interruptRequested()) {
    throw GateError(ErrorKind::Round, "interrupted by signal");
  }
}

void sleepInterruptible(std::chrono::milliseconds duration) {
  const auto DEADLINE = std::chrono::steady_clock::now() + duration;
  while (true) {
    throwIfInterrupted();
    const auto NOW = std::chrono::steady_clock::now();
    if (NOW >= DEADLINE) {
      return;
    }
    const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - NOW);
    std::this_thread::sleep_for(std::min(LEFT, SLEEP_SLICE));
  }
}

/* ---------------------------- Executables ---------------------------- */

std::optional<std::string> findExecutable(const std::string& program) {
  if (program.empty()) {
    return std::nullopt;
  }
  if (program.find('/') != std::string::npos) {
    if (::access(program.c_str(), X_OK) == 0 && !std::filesystem::is_directory(program)) {
      return program;
    }
    return std::nullopt;
  }
  const char* path = std::getenv("PATH");
  const std::string SEARCH = (path != nullptr) ? path : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= SEARCH.size()) {
    std::size_t end = SEARCH.find(':', start);
    if (end == std::string::npos) {
      end = SEARCH.size();
    }
    const std::string DIR = SEARCH.substr(start, end - start);
    const std::string CANDIDATE = (DIR.empty() ? "." : DIR) + "/" + program;
    if (::access(CANDIDATE.c_str(), X_OK) == 0 && !std::filesystem::is_directory(CANDIDATE)) {
      return CANDIDATE;
    }
    start = end + 1;
  }
  return std::nullopt;
}

void requireExecutable(const std::string& program, const std::string& role) {
  if (!findExecutable(program)) {
    throw GateError(ErrorKind::Setup, role + " not found or not executable: " + program);
  }
}

/* ----------------------------- ChildProcess ----------------------------- */

ChildProcess::~ChildProcess() { terminate(); }

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), exitCode_(other.exitCode_) {
  other.pid_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    terminate();
    pid_ = other.pid_;
    exitCode_ = other.exitCode_;
    other.pid_ = -1;
  }
  return *this;
}

ChildProcess ChildProcess::spawn(const SpawnOptions& opts) {
  if (opts.argv.empty()) {
    throw GateError(ErrorKind::Setup, "spawn: empty command");
  }
  const ExecImage IMG(opts.argv, opts.env);
  const std::string LOG = opts.logPath.empty() ? "/dev/null" : opts.logPath;
  const int LOG_FD = ::open(LOG.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (LOG_FD < 0) {
    throw GateError(ErrorKind::Setup, "cannot open log " + LOG + ": " + std::strerror(errno));
  }

  const pid_t PID = ::fork();
  if (PID < 0) {
    const int ERR = errno;
    ::close(LOG_FD);
    throw GateError(ErrorKind::Setup,
                    "fork failed for " + joinArgv(opts.argv) + ": " + std::strerror(ERR));
  }
  if (PID == 0) {
    execChild(IMG, LOG_FD, LOG_FD, opts.cpuCore);
  }
  ::setpgid(PID, PID);
  ::close(LOG_FD);

  ChildProcess child;
  child.pid_ = PID;
  return child;
}

bool ChildProcess::reap(bool block) noexcept {
  if (pid_ <= 0) {
    return true;
  }
  int status = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (r < 0 && errno == EINTR);
  if (r == pid_) {
    exitCode_ = decodeStatus(status);
    pid_ = -1;
    return true;
  }
  if (r < 0) {
    pid_ = -1;
    return true;
  }
  return false;
}

bool ChildProcess::running() { return !reap(false); }

std::optional<int> ChildProcess::waitFor(std::chrono::milliseconds timeout) {
  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  while (!reap(false)) {
    if (std::chrono::steady_clock::now() >= DEADLINE) {
      return std::nullopt;
    }
    throwIfInterrupted();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return exitCode_;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) noexcept {
  if (pid_ <= 0) {
    return;
  }
  const pid_t GROUP = pid_;
  ::kill(-GROUP, SIGTERM);
  ::kill(GROUP, SIGTERM);
  const auto DEADLINE = std::chrono::steady_clock::now() + grace;
  while (!reap(false)) {
    if (std::chrono::steady_clock::now() >= DEADLINE) {
      std::fprintf(stderr, "[WARN] pid %d ignored SIGTERM, sending SIGKILL\n",
                   static_cast<int>(GROUP));
      ::kill(-GROUP, SIGKILL);
      ::kill(GROUP, SIGKILL);
      reap(true);
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  // Leader reaped; stragglers may remain in its group.
  ::kill(-GROUP, SIGKILL);
}

/* ------------------------------ runCommand ------------------------------ */

CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         std::optional<int> cpuCore, bool captureStderr) {
  if (argv.empty()) {
    throw GateError(ErrorKind::Setup, "runCommand: empty command");
  }
  const ExecImage IMG(argv, {});
  std::array<int, 2> fds{-1, -1};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    throw GateError(ErrorKind::Setup, std::string("pipe failed: ") + std::strerror(errno));
  }
  const int DEV_NULL = ::open("/dev/null", O_WRONLY | O_CLOEXEC);

  const pid_t PID = ::fork();
  if (PID < 0) {
    const int ERR = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    if (DEV_NULL >= 0) {
      ::close(DEV_NULL);
    }
    throw GateError(ErrorKind::Setup,
                    "fork failed for " + joinArgv(argv) + ": " + std::strerror(ERR));
  }
  if (PID == 0) {
    execChild(IMG, fds[1], captureStderr ? fds[1] : DEV_NULL, cpuCore);
  }
  ::setpgid(PID, PID);
  ::close(fds[1]);
  if (DEV_NULL >= 0) {
    ::close(DEV_NULL);
  }

  CommandResult result;
  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  std::array<char, 4096> buf{};
  bool interrupted = false;
  while (true) {
    if (interruptRequested()) {
      interrupted = true;
      break;
    }
    const auto NOW = std::chrono::steady_clock::now();
    if (NOW >= DEADLINE) {
      result.timedOut = true;
      break;
    }
    const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - NOW);
    pollfd pfd{fds[0], POLLIN, 0};
    const int READY = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(LEFT.count(), 100)));
    if (READY < 0 && errno != EINTR) {
      break;
    }
    if (READY <= 0) {
      continue;
    }
    const ssize_t N = ::read(fds[0], buf.data(), buf.size());
    if (N > 0) {
      result.output.append(buf.data(), static_cast<std::size_t>(N));
    } else if (N == 0 || errno != EINTR) {
      break;
    }
  }
  ::close(fds[0]);

  if (result.timedOut || interrupted) {
    ::kill(-PID, SIGKILL);
    ::kill(PID, SIGKILL);
  }
  int status = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(PID, &status, 0);
  } while (r < 0 && errno == EINTR);
  result.exitCode = (r == PID) ? decodeStatus(status) : -1;

  if (interrupted) {
    throwIfInterrupted();
  }
  return result;
}

/* ------------------------------ waitForPort ------------------------------ */

bool waitForPort(const std::string& host, int port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<std::uint16_t>(port));
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    throw GateError(ErrorKind::Setup, "invalid IPv4 host: " + host);
  }

  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  while (true) {
    throwIfInterrupted();
    const int FD = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (FD >= 0) {
      const int RC = ::connect(FD, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
      ::close(FD);
      if (RC == 0) {
        return true;
      }
    }
    if (std::chrono::steady_clock::now() >= DEADLINE) {
      return false;
    }
    std::this_thread::sleep_for(SLEEP_SLICE);
  }
}

/* ------------------------------ TempDir ------------------------------ */

TempDir::TempDir(const std::string& prefix) {
  std::error_code ec;
  const std::filesystem::path BASE = std::filesystem::temp_directory_path(ec);
  std::string tmpl = ((ec ? std::filesystem::path("/tmp") : BASE) / (prefix + ".XXXXXX")).string();
  if (::mkdtemp(tmpl.data()) == nullptr) {
    throw GateError(ErrorKind::Setup,
                    "cannot create temp directory " + tmpl + ": " + std::strerror(errno));
  }
  path_ = tmpl;
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

/* --------------------------- ConfigFileGuard --------------------------- */

ConfigFileGuard::ConfigFileGuard(std::filesystem::path target,
                                 const std::filesystem::path& backupDir)
    : target_(std::move(target)), backup_(backupDir / "subject_config.backup") {
  std::error_code ec;
  if (std::filesystem::exists(target_, ec)) {
    std::filesystem::copy_file(target_, backup_,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      throw GateError(ErrorKind::Setup,
                      "cannot back up " + target_.string() + ": " + ec.message());
    }
    hadOriginal_ = true;
  }
}

ConfigFileGuard::~ConfigFileGuard() {
  std::error_code ec;
  if (hadOriginal_) {
    std::filesystem::copy_file(backup_, target_,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      std::fprintf(stderr, "[WARN] failed to restore %s from %s: %s\n", target_.c_str(),
                   backup_.c_str(), ec.message().c_str());
    }
  } else {
    std::filesystem::remove(target_, ec);
  }
}

void ConfigFileGuard::write(const std::string& content) {
  if (!writeFile(target_, content)) {
    throw GateError(ErrorKind::Setup, "cannot write " + target_.string());
  }
}

/* ------------------------------- RunLock ------------------------------- */

RunLock::RunLock(const std::string& path) {
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw GateError(ErrorKind::Setup,
                    "cannot open lock file " + path + ": " + std::strerror(errno));
  }
  if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    const int ERR = errno;
    ::close(fd_);
    fd_ = -1;
    if (ERR == EWOULDBLOCK) {
      throw GateError(ErrorKind::Setup, "another gate invocation is running (lock: " + path + ")");
    }
    throw GateError(ErrorKind::Setup, "cannot lock " + path + ": " + std::strerror(ERR));
  }
}

RunLock::~RunLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

} // namespace gate
} // namespace quorum
