// singleton_lock.cpp
#include "mcg_base.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/singleton_lock.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iterator>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

// Module-level flag to indicate if the SingletonLock module has been initialized.
static std::atomic<bool> g_singleton_lock_initialized{false};

namespace
{
namespace fs = std::filesystem;

constexpr int kLockFileMode = 0644;
constexpr std::chrono::milliseconds kSingletonLockShutdownTimeoutMs{2000};
constexpr std::size_t kMaxTrackedLocks = 16;
constexpr int kHandledSignals[] = {SIGINT, SIGTERM, SIGHUP};

// Process-wide registry of held locks. Fixed storage so that the signal handler can
// walk it without allocating or locking.
enum SlotState : int
{
    kSlotFree = 0,
    kSlotClaimed = 1,
    kSlotHeld = 2
};

struct LockSlot
{
    std::atomic<int> state{kSlotFree};
    std::atomic<pid_t> owner_pid{0};
    char path[PATH_MAX]{};
};

LockSlot g_slots[kMaxTrackedLocks];

// Lock paths claimed by a SingletonLock of this process, from the start of acquire()
// until release(). A record that carries our pid for a path outside this set was
// left by an earlier process that had the same pid.
std::mutex g_claims_mu;
std::set<std::string> g_claims;

bool claim_path(const std::string &key)
{
    std::lock_guard lk(g_claims_mu);
    return g_claims.insert(key).second;
}

void drop_claim(const std::string &key) noexcept
{
    std::lock_guard lk(g_claims_mu);
    g_claims.erase(key);
}

std::once_flag g_handlers_once;
std::terminate_handler g_previous_terminate = nullptr;

int register_slot(const fs::path &lock_path) noexcept
{
    const auto &native = lock_path.native();
    if (native.size() >= PATH_MAX)
    {
        return -1;
    }
    for (std::size_t i = 0; i < kMaxTrackedLocks; ++i)
    {
        int expected = kSlotFree;
        if (g_slots[i].state.compare_exchange_strong(expected, kSlotClaimed,
                                                     std::memory_order_acq_rel))
        {
            std::memcpy(g_slots[i].path, native.c_str(), native.size() + 1);
            g_slots[i].owner_pid.store(::getpid(), std::memory_order_relaxed);
            g_slots[i].state.store(kSlotHeld, std::memory_order_release);
            return static_cast<int>(i);
        }
    }
    return -1;
}

void unregister_slot(int index, const fs::path &lock_path) noexcept
{
    if (index < 0 || static_cast<std::size_t>(index) >= kMaxTrackedLocks)
    {
        return;
    }
    auto &slot = g_slots[index];
    // The slot may already have been released (and reused) by the exit path.
    if (slot.state.load(std::memory_order_acquire) == kSlotHeld &&
        std::strcmp(slot.path, lock_path.c_str()) == 0)
    {
        int expected = kSlotHeld;
        slot.state.compare_exchange_strong(expected, kSlotFree, std::memory_order_acq_rel);
    }
}

enum class RecordRead
{
    Missing,
    Invalid,
    Valid
};

RecordRead read_record_file(const fs::path &path, mcpguard::utils::LockRecord &out) noexcept
{
    try
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            std::error_code ec;
            return fs::exists(path, ec) ? RecordRead::Invalid : RecordRead::Missing;
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const auto j = nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object() || !j.contains("pid") ||
            !j.at("pid").is_number_unsigned())
        {
            return RecordRead::Invalid;
        }
        out.pid = j.at("pid").get<uint64_t>();
        if (j.contains("acquiredAt") && j.at("acquiredAt").is_string())
        {
            out.acquired_at = j.at("acquiredAt").get<std::string>();
        }
        return out.pid != 0 ? RecordRead::Valid : RecordRead::Invalid;
    }
    catch (const std::exception &)
    {
        return RecordRead::Invalid;
    }
}

// Used from atexit, std::terminate and module shutdown: unlink each registered lock
// whose file still names this process.
void release_owned_locks() noexcept
{
    const pid_t self = ::getpid();
    for (auto &slot : g_slots)
    {
        if (slot.state.load(std::memory_order_acquire) != kSlotHeld ||
            slot.owner_pid.load(std::memory_order_relaxed) != self)
        {
            continue;
        }
        mcpguard::utils::LockRecord rec;
        if (read_record_file(slot.path, rec) == RecordRead::Valid &&
            rec.pid == static_cast<uint64_t>(self))
        {
            ::unlink(slot.path);
        }
        int expected = kSlotHeld;
        slot.state.compare_exchange_strong(expected, kSlotFree, std::memory_order_acq_rel);
    }
}

// Async-signal-safe: no allocation, no stdio, no locks.
void cleanup_signal_handler(int sig)
{
    const pid_t self = ::getpid();
    for (auto &slot : g_slots)
    {
        if (slot.state.load(std::memory_order_acquire) == kSlotHeld &&
            slot.owner_pid.load(std::memory_order_relaxed) == self)
        {
            ::unlink(slot.path);
        }
    }
    struct sigaction dfl{};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    ::sigaction(sig, &dfl, nullptr);
    ::raise(sig);
}

void atexit_release()
{
    release_owned_locks();
}

[[noreturn]] void terminate_release()
{
    release_owned_locks();
    if (g_previous_terminate != nullptr)
    {
        g_previous_terminate();
    }
    std::abort();
}

// Signals that already have a handler (e.g. the application's own shutdown flag)
// are left alone; the application then releases its locks itself.
void install_exit_handlers() noexcept
{
    std::call_once(g_handlers_once,
                   []()
                   {
                       if (std::atexit(&atexit_release) != 0)
                       {
                           MCG_DEBUG("SingletonLock: atexit registration failed");
                       }
                       g_previous_terminate = std::set_terminate(&terminate_release);
                       for (int sig : kHandledSignals)
                       {
                           struct sigaction current{};
                           if (::sigaction(sig, nullptr, &current) != 0)
                           {
                               continue;
                           }
                           if ((current.sa_flags & SA_SIGINFO) != 0 ||
                               current.sa_handler != SIG_DFL)
                           {
                               continue;
                           }
                           struct sigaction sa{};
                           sa.sa_handler = &cleanup_signal_handler;
                           sigemptyset(&sa.sa_mask);
                           sa.sa_flags = 0;
                           ::sigaction(sig, &sa, nullptr);
                       }
                   });
}

bool contains(const std::optional<std::string> &haystack, const std::string &needle)
{
    return haystack && haystack->find(needle) != std::string::npos;
}

} // namespace

namespace mcpguard::utils
{

std::optional<LockRecord> read_lock_record(const fs::path &path) noexcept
{
    LockRecord rec;
    if (read_record_file(path, rec) == RecordRead::Valid)
    {
        return rec;
    }
    return std::nullopt;
}

struct SingletonLock::Impl
{
    fs::path path;
    std::string signature;
    std::mutex mu;
    bool acquired = false;
    int slot = -1;
    std::string claim; // Key in g_claims while acquired.

    // Only called while this instance holds the claim on the path, so a record with
    // our own pid cannot belong to a live lock of this process.
    bool is_live_owner(const LockRecord &rec) const
    {
        if (rec.pid == platform::get_pid())
        {
            return false;
        }
        if (!platform::is_process_alive(rec.pid))
        {
            return false;
        }
        if (signature.empty())
        {
            return true;
        }
        const auto cmdline = platform::process_cmdline(rec.pid);
        const auto exe = platform::process_executable(rec.pid);
        if (!cmdline && !exe)
        {
            // Alive but not inspectable (e.g. another user's process); assume it is the owner.
            return true;
        }
        return contains(cmdline, signature) || contains(exe, signature);
    }

    void ensure_lock_directory() const
    {
        const auto parent = path.parent_path();
        if (parent.empty())
        {
            return;
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            throw std::system_error(
                ec, fmt::format("SingletonLock: cannot create lock directory '{}'", parent.string()));
        }
    }

    // Writes the record to a private file and links it into place. Fails with
    // errc::file_exists when the lock path is taken.
    std::error_code publish_record() const
    {
        const auto self = platform::get_pid();
        const fs::path tmp = fmt::format("{}.{}.{}.tmp", path.string(), self,
                                         platform::get_native_thread_id());
        // The name is ours alone; a file under it was left by a crashed process that
        // ran with the same pid and tid.
        if (::unlink(tmp.c_str()) == 0)
        {
            LOGGER_DEBUG("SingletonLock: removed leftover temp file '{}'", tmp.string());
        }

        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW,
                        kLockFileMode);
        if (fd == -1)
        {
            return {errno, std::generic_category()};
        }
        auto remove_tmp = basics::make_scope_guard([&]() noexcept { ::unlink(tmp.c_str()); });
        auto close_fd = basics::make_scope_guard(
            [&]() noexcept
            {
                if (fd != -1)
                    ::close(fd);
            });

        const std::string content =
            nlohmann::json{{"pid", self},
                           {"acquiredAt",
                            format_tools::formatted_time_iso8601(std::chrono::system_clock::now())}}
                .dump();

        const char *data = content.data();
        size_t remaining = content.size();
        while (remaining > 0)
        {
            ssize_t n = ::write(fd, data, remaining);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return {errno, std::generic_category()};
            }
            data += n;
            remaining -= static_cast<size_t>(n);
        }
        int rc = ::close(fd);
        fd = -1;
        if (rc != 0)
        {
            return {errno, std::generic_category()};
        }

        if (::link(tmp.c_str(), path.c_str()) != 0)
        {
            return {errno, std::generic_category()};
        }
        return {};
    }

    // Opens and flocks `<path>.reclaim`. Returns -1 (with errno set) on failure.
    int lock_reclaim_guard() const
    {
        const std::string guard_path = path.string() + ".reclaim";
        int fd = ::open(guard_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW,
                        kLockFileMode);
        if (fd == -1)
        {
            return -1;
        }
        while (::flock(fd, LOCK_EX) != 0)
        {
            if (errno != EINTR)
            {
                int err = errno;
                ::close(fd);
                errno = err;
                return -1;
            }
        }
        return fd;
    }

    bool acquire()
    {
        std::lock_guard lk(mu);
        if (acquired)
        {
            return true;
        }

        ensure_lock_directory();

        std::error_code canon_ec;
        fs::path canonical = fs::weakly_canonical(path, canon_ec);
        const std::string key = canon_ec ? path.lexically_normal().string() : canonical.string();
        if (!claim_path(key))
        {
            LOGGER_WARN("SingletonLock: '{}' is already held within this process",
                        path.string());
            return false;
        }
        auto unclaim = basics::make_scope_guard([&key]() noexcept { drop_claim(key); });

        std::error_code ec = publish_record();
        if (ec == std::errc::file_exists)
        {
            int guard_fd = lock_reclaim_guard();
            if (guard_fd == -1)
            {
                LOGGER_ERROR("SingletonLock: cannot lock reclaim guard for '{}': {}",
                             path.string(), std::strerror(errno));
                return false;
            }
            auto unlock_guard = basics::make_scope_guard(
                [guard_fd]() noexcept
                {
                    ::flock(guard_fd, LOCK_UN);
                    ::close(guard_fd);
                });

            LockRecord holder;
            switch (read_record_file(path, holder))
            {
            case RecordRead::Valid:
                if (is_live_owner(holder))
                {
                    LOGGER_DEBUG("SingletonLock: '{}' is held by live pid {}", path.string(),
                                 holder.pid);
                    return false;
                }
                LOGGER_INFO("SingletonLock: reclaiming stale lock '{}' (pid {} since {} is gone "
                            "or does not match '{}')",
                            path.string(), holder.pid, holder.acquired_at, signature);
                break;
            case RecordRead::Invalid:
                LOGGER_INFO("SingletonLock: reclaiming unreadable lock file '{}'", path.string());
                break;
            case RecordRead::Missing:
                break;
            }

            std::error_code rm_ec;
            fs::remove(path, rm_ec);
            if (rm_ec)
            {
                LOGGER_ERROR("SingletonLock: cannot remove stale lock '{}': {}", path.string(),
                             rm_ec.message());
                return false;
            }
            ec = publish_record();
        }

        if (ec)
        {
            if (ec == std::errc::file_exists)
            {
                LOGGER_DEBUG("SingletonLock: lost the race for '{}'", path.string());
            }
            else
            {
                LOGGER_ERROR("SingletonLock: cannot create lock '{}': {}", path.string(),
                             ec.message());
            }
            return false;
        }

        slot = register_slot(path);
        if (slot < 0)
        {
            LOGGER_WARN("SingletonLock: '{}' will not be removed automatically on exit "
                        "(registry full or path too long)",
                        path.string());
        }
        install_exit_handlers();
        unclaim.dismiss();
        claim = key;
        acquired = true;
        LOGGER_INFO("SingletonLock: acquired '{}' (pid {})", path.string(), platform::get_pid());
        return true;
    }

    void release() noexcept
    {
        std::lock_guard lk(mu);
        if (!acquired)
        {
            return;
        }
        acquired = false;
        unregister_slot(slot, path);
        slot = -1;
        // Dropped only after the file is handled, so that a new claimant cannot mistake
        // our still-present record for a leftover.
        auto unclaim = basics::make_scope_guard(
            [key = std::move(claim)]() noexcept { drop_claim(key); });
        claim.clear();

        LockRecord rec;
        switch (read_record_file(path, rec))
        {
        case RecordRead::Missing:
            LOGGER_DEBUG("SingletonLock: '{}' already removed", path.string());
            return;
        case RecordRead::Invalid:
            LOGGER_WARN("SingletonLock: '{}' no longer holds our record; left in place",
                        path.string());
            return;
        case RecordRead::Valid:
            break;
        }
        if (rec.pid != platform::get_pid())
        {
            LOGGER_WARN("SingletonLock: '{}' now belongs to pid {}; left in place", path.string(),
                        rec.pid);
            return;
        }
        if (::unlink(path.c_str()) != 0 && errno != ENOENT)
        {
            LOGGER_ERROR("SingletonLock: cannot remove '{}': {}", path.string(),
                         std::strerror(errno));
            return;
        }
        LOGGER_INFO("SingletonLock: released '{}'", path.string());
    }
};

SingletonLock::SingletonLock(fs::path lock_path, std::string signature)
    : pImpl(std::make_shared<Impl>())
{
    if (!lifecycle_initialized())
    {
        MCG_PANIC("FATAL: SingletonLock created before its module was initialized via "
                  "LifecycleManager. Aborting.");
    }
    pImpl->path = std::move(lock_path);
    pImpl->signature = std::move(signature);
}

SingletonLock::~SingletonLock()
{
    pImpl->release();
}

bool SingletonLock::acquire()
{
    return pImpl->acquire();
}

void SingletonLock::release() noexcept
{
    pImpl->release();
}

std::future<void> SingletonLock::release_async()
{
    // The task owns a reference to the state so the future stays valid after *this is gone.
    return std::async(std::launch::async, [impl = pImpl]() { impl->release(); });
}

bool SingletonLock::is_acquired() const noexcept
{
    std::lock_guard lk(pImpl->mu);
    return pImpl->acquired;
}

const fs::path &SingletonLock::path() const noexcept
{
    return pImpl->path;
}

bool SingletonLock::force_release(const fs::path &lock_path) noexcept
{
    std::error_code ec;
    const bool removed = fs::remove(lock_path, ec);
    if (ec)
    {
        LOGGER_ERROR("SingletonLock: force release of '{}' failed: {}", lock_path.string(),
                     ec.message());
        return false;
    }
    if (removed)
    {
        LOGGER_WARN("SingletonLock: force-released '{}'", lock_path.string());
    }
    return removed;
}

fs::path SingletonLock::default_lock_path()
{
    const fs::path tail = fs::path("mcpguard") / "mcpguard.lock";
    if (const char *xdg = std::getenv("XDG_RUNTIME_DIR"); xdg != nullptr && *xdg != '\0')
    {
        return fs::path(xdg) / tail;
    }
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0')
    {
        return fs::path(home) / ".local" / "state" / tail;
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec)
    {
        tmp = "/tmp";
    }
    return tmp / tail;
}

bool SingletonLock::lifecycle_initialized() noexcept
{
    return g_singleton_lock_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_singleton_lock_startup(const char * /*arg*/)
{
    install_exit_handlers();
    g_singleton_lock_initialized.store(true, std::memory_order_release);
}

void do_singleton_lock_shutdown(const char * /*arg*/)
{
    g_singleton_lock_initialized.store(false, std::memory_order_release);
    release_owned_locks();
}
} // namespace

ModuleDef SingletonLock::GetLifecycleModule()
{
    ModuleDef module("mcpguard::utils::SingletonLock");
    module.add_dependency("mcpguard::utils::Logger");
    module.set_startup(&do_singleton_lock_startup);
    module.set_shutdown(&do_singleton_lock_shutdown, kSingletonLockShutdownTimeoutMs);
    return module;
}

} // namespace mcpguard::utils
