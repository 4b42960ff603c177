#ifndef QUORUM_PROCESS_HPP
#define QUORUM_PROCESS_HPP
/**
 * @file Process.hpp
 * @brief Scoped ownership of spawned processes and the shared resources of a gate run.
 *
 * Every resource acquired by a run is released by a destructor, so stack unwinding after a
 * GateError (including one raised by an interruption signal) terminates children, restores
 * the subject configuration, removes temp state and releases the run lock.
 *
 * @note NOT RT-safe (fork/exec, file I/O, sleeps).
 */

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace quorum {
namespace gate {

/* ----------------------------- Interruption ----------------------------- */

/** @brief Route SIGINT/SIGTERM to an interruption flag; ignore SIGPIPE. */
void installInterruptHandlers();

/** @brief True once SIGINT or SIGTERM was received. */
bool interruptRequested() noexcept;

/** @throws GateError(Round) if an interruption was requested. */
void throwIfInterrupted();

/** @brief Sleep in small slices, raising on interruption. */
void sleepInterruptible(std::chrono::milliseconds duration);

/* ---------------------------- Executables ---------------------------- */

/** @brief Resolve a program name or path to an executable file. */
std::optional<std::string> findExecutable(const std::string& program);

/** @throws GateError(Setup) naming @p role if @p program cannot be executed. */
void requireExecutable(const std::string& program, const std::string& role);

/* ----------------------------- ChildProcess ----------------------------- */

/** @brief Launch parameters for a supervised child. */
struct SpawnOptions {
  std::vector<std::string> argv;
  std::vector<std::pair<std::string, std::string>> env{}; ///< Overrides on top of environ
  std::string logPath{};        ///< stdout+stderr destination; /dev/null when empty
  std::optional<int> cpuCore{}; ///< Affinity applied in the child before exec
};

/**
 * @brief Move-only owner of one spawned process group.
 *
 * The child leads its own process group so wrappers and their descendants are signalled
 * together. Destruction terminates the group (SIGTERM, then SIGKILL after a grace period).
 */
class ChildProcess {
public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  /**
   * @brief Fork and exec @p opts.argv.
   * @throws GateError(Setup) if the process cannot be created.
   */
  static ChildProcess spawn(const SpawnOptions& opts);

  [[nodiscard]] pid_t pid() const noexcept { return pid_; }

  /** @brief True while the child has not been reaped. */
  bool running();

  /**
   * @brief Wait for exit up to @p timeout.
   * @return Exit code (128+signal when killed), or nullopt on timeout.
   */
  std::optional<int> waitFor(std::chrono::milliseconds timeout);

  /** @brief SIGTERM the group, SIGKILL after @p grace, then reap. Idempotent. */
  void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000)) noexcept;

private:
  bool reap(bool block) noexcept;

  pid_t pid_ = -1;
  int exitCode_ = -1;
};

/* ------------------------------ runCommand ------------------------------ */

/** @brief Result of a short-lived command. */
struct CommandResult {
  int exitCode = -1;
  std::string output; ///< Captured stdout (and stderr when requested)
  bool timedOut = false;
};

/**
 * @brief Run a command to completion, capturing its output.
 *
 * The command is killed when @p timeout elapses (timedOut is set) or when an interruption
 * arrives (GateError(Round) is raised after the child is reaped).
 */
CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         std::optional<int> cpuCore = std::nullopt, bool captureStderr = false);

/* ------------------------------ waitForPort ------------------------------ */

/** @brief Poll a TCP connect every 50 ms until it succeeds or @p timeout elapses. */
bool waitForPort(const std::string& host, int port, std::chrono::milliseconds timeout);

/* ------------------------------ Scoped state ------------------------------ */

/** @brief Private temp directory, removed recursively on destruction. */
class TempDir {
public:
  /** @throws GateError(Setup) if the directory cannot be created. */
  explicit TempDir(const std::string& prefix = "quorum_gate");
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/**
 * @brief Backs up a shared configuration file and restores it on destruction.
 *
 * If the file did not exist before, it is removed on destruction instead.
 */
class ConfigFileGuard {
public:
  /** @throws GateError(Setup) if an existing file cannot be backed up. */
  ConfigFileGuard(std::filesystem::path target, const std::filesystem::path& backupDir);
  ~ConfigFileGuard();

  ConfigFileGuard(const ConfigFileGuard&) = delete;
  ConfigFileGuard& operator=(const ConfigFileGuard&) = delete;

  /** @throws GateError(Setup) if the file cannot be written. */
  void write(const std::string& content);

  [[nodiscard]] const std::filesystem::path& target() const noexcept { return target_; }
  [[nodiscard]] bool hadOriginal() const noexcept { return hadOriginal_; }

private:
  std::filesystem::path target_;
  std::filesystem::path backup_;
  bool hadOriginal_ = false;
};

/**
 * @brief Exclusive, non-blocking advisory lock held for the lifetime of a run.
 */
class RunLock {
public:
  /** @throws GateError(Setup) if the lock is held by another invocation. */
  explicit RunLock(const std::string& path);
  ~RunLock();

  RunLock(const RunLock&) = delete;
  RunLock& operator=(const RunLock&) = delete;

private:
  int fd_ = -1;
};

} // namespace gate
} // namespace quorum

#endif // QUORUM_PROCESS_HPP
