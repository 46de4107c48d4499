/*******************************************************************************
 * @file logger.cpp
 * @brief Asynchronous logger: producer-side queueing and the single I/O worker.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "mcg_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/sink.hpp"

using namespace mcpguard::format_tools;

namespace mcpguard::utils
{

namespace
{

enum class Phase
{
    NotStarted,
    Running,
    Stopping,
    Stopped
};

std::atomic<Phase> g_phase{Phase::NotStarted};

// Configuration calls before startup are a programming error; after shutdown they
// are refused quietly so that late destructors can still call into the Logger.
bool accepting_calls(const char *function_name)
{
    const Phase phase = g_phase.load(std::memory_order_acquire);
    if (phase == Phase::NotStarted)
    {
        MCG_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleManager. Aborting.",
                  function_name);
    }
    return phase == Phase::Running;
}

using Reply = std::shared_ptr<std::promise<bool>>;

struct SwapSink
{
    std::unique_ptr<Sink> sink;
    Reply reply;
};
struct ReportFailure
{
    std::string text;
    Reply reply;
};
struct Barrier
{
    Reply reply;
};
struct SwapCallback
{
    std::function<void(const std::string &)> callback;
    Reply reply;
};

using QueueItem = std::variant<LogMessage, SwapSink, ReportFailure, Barrier, SwapCallback>;

void answer(const Reply &reply, bool ok) noexcept
{
    if (!reply)
        return;
    try
    {
        reply->set_value(ok);
    }
    catch (const std::future_error &)
    {
        // Already answered.
    }
}

Reply reply_of(const QueueItem &item)
{
    return std::visit(
        [](const auto &cmd) -> Reply
        {
            if constexpr (std::is_same_v<std::decay_t<decltype(cmd)>, LogMessage>)
                return nullptr;
            else
                return cmd.reply;
        },
        item);
}

LogMessage stamp(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = mcpguard::platform::get_pid(),
                      .thread_id = mcpguard::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

struct Logger::Impl
{
    ~Impl();

    bool push(QueueItem &&item);
    bool call(QueueItem &&item, std::future<bool> reply);
    void run();
    void handle(QueueItem &item);
    void install_sink(SwapSink &cmd);
    void write_internal(Logger::Level lvl, fmt::memory_buffer &&body);
    void notify_error(const std::string &text);
    void stop_and_join();

    // Producer side, guarded by mu.
    std::mutex mu;
    std::condition_variable wake;
    std::vector<QueueItem> pending;
    size_t soft_limit{10000};
    size_t dropped_in_burst{0};
    std::chrono::steady_clock::time_point burst_start;

    // Worker side. sink is never null.
    std::mutex sink_mu;
    std::unique_ptr<Sink> sink{std::make_unique<ConsoleSink>()};
    std::function<void(const std::string &)> on_error;
    std::thread worker;

    std::atomic<Logger::Level> threshold{Logger::Level::L_INFO};
    std::atomic<bool> announce_switches{true};
    std::atomic<bool> stop_requested{false};
    std::atomic<size_t> dropped_since_switch{0};
};

Logger::Impl::~Impl()
{
    if (worker.joinable())
    {
        MCG_DEBUG("Logger destroyed while its worker is running; the Logger module was "
                  "never shut down.");
        worker.detach();
    }
}

bool Logger::Impl::push(QueueItem &&item)
{
    std::unique_lock<std::mutex> lk(mu);
    if (stop_requested.load(std::memory_order_acquire))
    {
        lk.unlock();
        answer(reply_of(item), false);
        return false;
    }

    // Only log messages are subject to the queue limits; control commands always queue.
    if (const auto *msg = std::get_if<LogMessage>(&item))
    {
        const size_t depth = pending.size();
        const bool over_hard = depth >= soft_limit * 2;
        const bool over_soft =
            depth >= soft_limit && msg->level < static_cast<int>(Logger::Level::L_WARNING);
        if (over_hard || over_soft)
        {
            if (dropped_in_burst++ == 0)
                burst_start = std::chrono::steady_clock::now();
            dropped_since_switch.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    }

    pending.push_back(std::move(item));
    lk.unlock();
    wake.notify_one();
    return true;
}

bool Logger::Impl::call(QueueItem &&item, std::future<bool> reply)
{
    push(std::move(item));
    return reply.get();
}

void Logger::Impl::run()
{
    std::vector<QueueItem> batch;
    for (;;)
    {
        size_t burst = 0;
        std::chrono::duration<double> burst_length{0};
        bool last_batch = false;
        {
            std::unique_lock<std::mutex> lk(mu);
            wake.wait(lk, [this] { return !pending.empty() || stop_requested.load(); });
            batch.swap(pending);
            std::swap(burst, dropped_in_burst);
            if (burst > 0)
                burst_length = std::chrono::steady_clock::now() - burst_start;
            // push() refuses new items once stop_requested is set under mu.
            last_batch = stop_requested.load(std::memory_order_acquire);
        }

        for (auto &item : batch)
            handle(item);
        batch.clear();

        if (burst > 0)
        {
            write_internal(Logger::Level::L_WARNING,
                           make_buffer("Logger dropped {} messages over {:.2f}s due to a full "
                                       "queue.",
                                       burst, burst_length.count()));
        }

        if (last_batch)
            break;
    }

    write_internal(Logger::Level::L_SYSTEM, make_buffer("Logger is shutting down."));
    g_phase.store(Phase::Stopped, std::memory_order_release);
}

void Logger::Impl::handle(QueueItem &item)
{
    try
    {
        if (auto *msg = std::get_if<LogMessage>(&item))
        {
            if (msg->level >= static_cast<int>(threshold.load(std::memory_order_relaxed)))
            {
                std::lock_guard<std::mutex> lk(sink_mu);
                sink->write(*msg);
            }
        }
        else if (auto *swap = std::get_if<SwapSink>(&item))
        {
            install_sink(*swap);
        }
        else if (auto *barrier = std::get_if<Barrier>(&item))
        {
            {
                std::lock_guard<std::mutex> lk(sink_mu);
                sink->flush();
            }
            answer(barrier->reply, true);
        }
        else if (auto *failure = std::get_if<ReportFailure>(&item))
        {
            notify_error(failure->text);
            answer(failure->reply, false);
        }
        else if (auto *cb = std::get_if<SwapCallback>(&item))
        {
            on_error = std::move(cb->callback);
            answer(cb->reply, true);
        }
    }
    catch (const std::exception &e)
    {
        answer(reply_of(item), false);
        notify_error(fmt::format("Logger worker error: {}", e.what()));
    }
}

void Logger::Impl::install_sink(SwapSink &cmd)
{
    const bool announce = announce_switches.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(sink_mu);
    const std::string previous = sink->description();
    if (announce)
    {
        sink->write(stamp(Logger::Level::L_SYSTEM,
                          make_buffer("Switching log sink to: {}", cmd.sink->description())));
    }
    sink->flush();

    sink = std::move(cmd.sink);
    dropped_since_switch.store(0, std::memory_order_relaxed);
    if (announce)
    {
        sink->write(stamp(Logger::Level::L_SYSTEM,
                          make_buffer("Log sink switched from: {}", previous)));
    }
    answer(cmd.reply, true);
}

void Logger::Impl::write_internal(Logger::Level lvl, fmt::memory_buffer &&body)
{
    std::lock_guard<std::mutex> lk(sink_mu);
    try
    {
        sink->write(stamp(lvl, std::move(body)));
        sink->flush();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] internal write failed: {}\n", e.what());
    }
}

void Logger::Impl::notify_error(const std::string &text)
{
    if (!on_error)
    {
        MCG_DEBUG("Logger error with no error callback installed: {}", text);
        return;
    }
    try
    {
        on_error(text);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] write error callback threw: {}\n", e.what());
    }
}

void Logger::Impl::stop_and_join()
{
    {
        std::lock_guard<std::mutex> lk(mu);
        if (stop_requested.exchange(true, std::memory_order_acq_rel))
            return;
    }
    wake.notify_one();
    if (worker.joinable())
        worker.join();
}

// --- Public API ---

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_phase.load(std::memory_order_acquire) != Phase::NotStarted;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    static constexpr std::pair<std::string_view, Level> kNames[] = {
        {"trace", Level::L_TRACE}, {"debug", Level::L_DEBUG},   {"info", Level::L_INFO},
        {"warn", Level::L_WARNING}, {"warning", Level::L_WARNING}, {"error", Level::L_ERROR},
        {"system", Level::L_SYSTEM},
    };
    const auto same = [](char a, char b)
    {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    };
    for (const auto &[text, lvl] : kNames)
    {
        if (std::equal(text.begin(), text.end(), name.begin(), name.end(), same))
            return lvl;
    }
    return std::nullopt;
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    return set_logfile(utf8_path, true);
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!accepting_calls("Logger::set_logfile"))
        return false;

    auto reply = std::make_shared<std::promise<bool>>();
    std::unique_ptr<Sink> file;
    try
    {
        file = std::make_unique<FileSink>(utf8_path, use_flock);
    }
    catch (const std::exception &e)
    {
        // Routed through the worker so the error callback sees it in queue order.
        pImpl->call(ReportFailure{fmt::format("Failed to create FileSink: {}", e.what()), reply},
                    reply->get_future());
        return false;
    }
    return pImpl->call(SwapSink{std::move(file), reply}, reply->get_future());
}

void Logger::shutdown()
{
    if (lifecycle_initialized() && pImpl)
        pImpl->stop_and_join();
}

void Logger::flush()
{
    if (!accepting_calls("Logger::flush"))
        return;
    auto reply = std::make_shared<std::promise<bool>>();
    (void)pImpl->call(Barrier{reply}, reply->get_future());
}

void Logger::set_level(Level lvl)
{
    if (accepting_calls("Logger::set_level"))
        pImpl->threshold.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->threshold.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!accepting_calls("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lk(pImpl->mu);
    pImpl->soft_limit = std::max<size_t>(max_size, 1);
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    return pImpl->dropped_since_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!accepting_calls("Logger::set_write_error_callback"))
        return;
    auto reply = std::make_shared<std::promise<bool>>();
    (void)pImpl->call(SwapCallback{std::move(cb), reply}, reply->get_future());
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (accepting_calls("Logger::set_log_sink_messages_enabled"))
        pImpl->announce_switches.store(enabled, std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return g_phase.load(std::memory_order_acquire) == Phase::Running &&
           static_cast<int>(lvl) >= static_cast<int>(level());
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_phase.load(std::memory_order_acquire) != Phase::Running)
        return false;
    try
    {
        return pImpl->push(stamp(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        fmt::memory_buffer mb;
        mb.append(body.data(), body.data() + body.size());
        return enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &)
    {
        return false;
    }
}

// --- Lifecycle callbacks ---

void do_logger_startup(const char * /*arg*/)
{
    auto &impl = *Logger::instance().pImpl;
    if (!impl.worker.joinable())
        impl.worker = std::thread(&Logger::Impl::run, &impl);
    g_phase.store(Phase::Running, std::memory_order_release);
}

namespace
{
void do_logger_shutdown(const char * /*arg*/)
{
    Phase expected = Phase::Running;
    if (!g_phase.compare_exchange_strong(expected, Phase::Stopping, std::memory_order_acq_rel))
        return;
    Logger::instance().shutdown();
    // The worker marks Stopped itself; this covers a worker that never started.
    g_phase.store(Phase::Stopped, std::memory_order_release);
}
} // namespace

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("mcpguard::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace mcpguard::utils
