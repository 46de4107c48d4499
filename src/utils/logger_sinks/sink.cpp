#include "utils/logger_sinks/sink.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace mcpguard::utils
{

namespace
{
// Indexed by Logger::Level.
constexpr std::array<std::string_view, 6> kLevelNames = {"TRACE", "DEBUG", "INFO",
                                                         "WARN",  "ERROR", "SYSTEM"};

std::string_view level_name(int lvl)
{
    if (lvl < 0 || static_cast<size_t>(lvl) >= kLevelNames.size())
        return "UNK";
    return kLevelNames[static_cast<size_t>(lvl)];
}
} // namespace

std::string Sink::render(const LogMessage &msg)
{
    return fmt::format("[LOGGER] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", level_name(msg.level),
                       format_tools::formatted_time(msg.timestamp), msg.process_id,
                       msg.thread_id, std::string_view(msg.body.data(), msg.body.size()));
}

void ConsoleSink::write(const LogMessage &msg)
{
    fmt::print(stderr, "{}", render(msg));
}

void ConsoleSink::flush()
{
    std::fflush(stderr);
}

FileSink::FileSink(const std::filesystem::path &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path.string(), ec.message()));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
        ::close(m_fd);
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = render(msg);
    // A failed flock degrades to an unserialised append.
    const bool locked = m_use_flock && ::flock(m_fd, LOCK_EX) == 0;
    const ssize_t n = ::write(m_fd, line.data(), line.size());
    const int saved_errno = errno;
    if (locked)
        ::flock(m_fd, LOCK_UN);

    if (n < 0)
        throw std::system_error(saved_errno, std::generic_category(), "log file write");
    if (static_cast<size_t>(n) != line.size())
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                fmt::format("short write to log file ({} of {} bytes)", n,
                                            line.size()));
}

void FileSink::flush()
{
    // EINVAL: the path names a special file such as /dev/null.
    if (::fsync(m_fd) != 0 && errno != EINVAL)
        throw std::system_error(errno, std::generic_category(), "log file fsync");
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace mcpguard::utils
