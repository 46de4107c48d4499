#pragma once
/**
 * @file sink.hpp
 * @brief Log destinations driven by the Logger worker thread.
 *
 * Every line has the form
 * `[LOGGER] [LEVEL ] [YYYY-MM-DD HH:MM:SS.us] [PID:nnnnn TID:nnnnn] body`.
 */
#include "mcg_base.hpp"

#include <filesystem>
#include <string>

namespace mcpguard::utils
{

// A single log event, formatted on the producer thread.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Logger::Level as int, so sinks do not depend on logger.hpp.
    fmt::memory_buffer body;
};

// Abstract destination for log messages. Only the logger worker calls into a sink.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    /// Renders one complete line, newline included.
    static std::string render(const LogMessage &msg);
};

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override { return "Console"; }
};

/**
 * @brief Appends to a file, creating it with mode 0644.
 *
 * With `use_flock` each line is written under an exclusive advisory `flock`, so
 * processes sharing the file never interleave partial lines. flush() calls fsync.
 */
class FileSink : public Sink
{
  public:
    /** @throws std::runtime_error if the file cannot be opened. */
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /** @throws std::system_error if the line could not be written completely. */
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    bool m_use_flock;
    int m_fd = -1;
};

} // namespace mcpguard::utils
