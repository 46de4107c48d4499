#pragma once
/**
 * @file singleton_lock.hpp
 * @brief Cross-process "only one server runs" admission lock backed by a PID-stamped file.
 *
 * A SingletonLock names a lock file. `acquire()` creates the file exclusively and
 * stamps it with `{"pid": <our pid>, "acquiredAt": "<ISO-8601 UTC>"}`. A second
 * process calling `acquire()` on the same path sees a live owner and gets `false`.
 *
 * **Stale locks.** A lock file is stale when:
 *   - no live process has the recorded pid, or
 *   - a signature was given and the recorded process's command line / executable
 *     does not contain it (the pid was recycled by an unrelated program), or
 *   - the content cannot be parsed, or
 *   - it carries our own pid while no SingletonLock of this process holds the path
 *     (an earlier process with the same pid died without cleaning up).
 * Within one process a path can be held by one SingletonLock at a time; another
 * instance on the same path gets `false` from `acquire()`.
 * A stale file is reclaimed by the next `acquire()`. Reclaiming is serialized across
 * processes with an advisory `flock` on the sibling file `<lock path>.reclaim`, so
 * two reclaimers can never delete each other's fresh lock.
 *
 * **Atomic publication.** The record is written to a private temporary file and
 * hard-linked to the lock path. `link()` fails if the path exists (like `O_EXCL`),
 * and readers never observe a half-written record.
 *
 * **Process exit.** Held locks are tracked in a process-wide registry. They are
 * removed on normal exit (`std::atexit`), on `std::terminate`, and on SIGINT,
 * SIGTERM and SIGHUP when no other handler is installed for that signal. The signal
 * handler unlinks the files, restores the default disposition and re-raises.
 *
 * **Lifecycle.** Constructing a SingletonLock before `GetLifecycleModule()` has been
 * started is a programmer error and panics. The static helpers do not need it.
 *
 * @code
 *  SingletonLock lock(SingletonLock::default_lock_path(), "mcp-server");
 *  if (!lock.acquire())
 *  {
 *      auto holder = read_lock_record(lock.path());
 *      ...
 *  }
 * @endcode
 */
#include "utils/module_def.hpp"

#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mcpguard::utils
{

/// @brief Content of a lock file.
struct LockRecord
{
    uint64_t pid{0};
    std::string acquired_at; ///< ISO-8601 UTC, e.g. "2026-10-17T08:15:30.123Z"
};

/**
 * @brief Reads and parses the record stored at `path`.
 * @return std::nullopt if the file does not exist, cannot be read, or does not hold
 *         a valid record.
 */
MCPGUARD_UTILS_EXPORT std::optional<LockRecord>
read_lock_record(const std::filesystem::path &path) noexcept;

class MCPGUARD_UTILS_EXPORT SingletonLock
{
  public:
    /**
     * @param lock_path Lock file location. Its parent directory is created on acquire.
     * @param signature If non-empty, a live pid only counts as the owner when its
     *                  command line or executable path contains this string.
     */
    explicit SingletonLock(std::filesystem::path lock_path, std::string signature = {});

    /// Releases the lock if still held.
    ~SingletonLock();

    SingletonLock(const SingletonLock &) = delete;
    SingletonLock &operator=(const SingletonLock &) = delete;
    SingletonLock(SingletonLock &&) = delete;
    SingletonLock &operator=(SingletonLock &&) = delete;

    /**
     * @brief Tries to become the owner. Idempotent while held.
     * @return true if this instance holds the lock; false if a live owner holds it or
     *         a filesystem error occurred (logged).
     * @throws std::system_error if the lock directory cannot be created.
     */
    bool acquire();

    /**
     * @brief Removes the lock file if its recorded pid is ours. A no-op when the lock
     *        is not held. Errors are logged.
     */
    void release() noexcept;

    /**
     * @brief Same contract as release(), run on a background task. The future becomes
     *        ready once the lock file has been removed.
     */
    std::future<void> release_async();

    bool is_acquired() const noexcept;

    const std::filesystem::path &path() const noexcept;

    /**
     * @brief Deletes the lock file at `lock_path` regardless of its owner.
     * @warning Unsafe: a running owner is not notified and a second instance may start.
     * @return true if a file was removed.
     */
    static bool force_release(const std::filesystem::path &lock_path) noexcept;

    /**
     * @brief `$XDG_RUNTIME_DIR/mcpguard/mcpguard.lock`, falling back to
     *        `$HOME/.local/state/mcpguard/mcpguard.lock` and then
     *        `<temp dir>/mcpguard/mcpguard.lock`.
     */
    static std::filesystem::path default_lock_path();

    /**
     * @brief Lifecycle module. Startup installs the exit and signal handlers; shutdown
     *        releases any lock still held by this process. Depends on the Logger.
     */
    static ModuleDef GetLifecycleModule();

    static bool lifecycle_initialized() noexcept;

  private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpguard::utils
