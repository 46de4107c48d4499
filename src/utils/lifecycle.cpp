/**
 * @file lifecycle.cpp
 * @brief ModuleDef and the LifecycleManager.
 *
 * initialize() freezes the registered modules, orders them so that each module
 * follows its dependencies (Kahn's algorithm, ties broken by name) and starts them.
 * finalize() stops the started ones in reverse. A stop callback runs on a detached
 * thread and is waited for up to its declared timeout.
 */
#include "mcg_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fmt/ranges.h>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>

namespace mcpguard::utils
{

namespace
{

void check_name(std::string_view name, const char *what)
{
    if (name.empty())
        throw std::invalid_argument(fmt::format("Lifecycle: {} must not be empty.", what));
    if (name.size() > ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("Lifecycle: {} exceeds maximum of {} characters.",
                                            what, ModuleDef::MAX_MODULE_NAME_LEN));
    }
}

// Wraps a C callback, copying the optional argument into the closure.
std::function<void()> bind_callback(LifecycleCallback fn, const std::string_view *arg,
                                    const char *which)
{
    if (arg == nullptr)
        return [fn]() { fn(nullptr); };
    if (arg->size() > ModuleDef::MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error(
            fmt::format("Lifecycle: {} argument exceeds MAX_CALLBACK_PARAM_STRLEN.", which));
    }
    return [fn, owned = std::string(*arg)]() { fn(owned.c_str()); };
}

enum class StopResult
{
    Done,
    Threw,
    TimedOut
};

/**
 * Runs @p stop on its own detached thread and waits for it. A zero timeout waits
 * indefinitely. On Threw, @p error receives the exception text.
 */
StopResult run_stop(const std::function<void()> &stop, std::chrono::milliseconds timeout,
                    std::string &error)
{
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    std::thread(
        [stop, done]()
        {
            try
            {
                stop();
                done->set_value();
            }
            catch (...)
            {
                done->set_exception(std::current_exception());
            }
        })
        .detach();

    if (timeout.count() > 0 && finished.wait_for(timeout) == std::future_status::timeout)
        return StopResult::TimedOut;

    try
    {
        finished.get();
        return StopResult::Done;
    }
    catch (const std::exception &e)
    {
        error = e.what();
    }
    catch (...)
    {
        error = "unknown exception";
    }
    return StopResult::Threw;
}

} // namespace

struct ModuleSpec
{
    std::string name;
    std::vector<std::string> depends_on;
    std::function<void()> start;
    std::function<void()> stop;
    std::chrono::milliseconds stop_timeout{0};
};

class ModuleDefImpl
{
  public:
    ModuleSpec spec;
};

// ============================================================================
// ModuleDef
// ============================================================================

ModuleDef::ModuleDef(std::string_view name)
{
    check_name(name, "module name");
    pImpl = std::make_unique<ModuleDefImpl>();
    pImpl->spec.name.assign(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (!pImpl || dependency_name.empty())
        return;
    check_name(dependency_name, "dependency name");
    pImpl->spec.depends_on.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl && startup_func)
        pImpl->spec.start = bind_callback(startup_func, nullptr, "startup");
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl && startup_func)
        pImpl->spec.start = bind_callback(startup_func, &arg, "startup");
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (!pImpl || !shutdown_func)
        return;
    pImpl->spec.stop = bind_callback(shutdown_func, nullptr, "shutdown");
    pImpl->spec.stop_timeout = timeout;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (!pImpl || !shutdown_func)
        return;
    pImpl->spec.stop = bind_callback(shutdown_func, &arg, "shutdown");
    pImpl->spec.stop_timeout = timeout;
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

class LifecycleManagerImpl
{
  public:
    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Initializing,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout
    };

    void add(ModuleSpec spec);
    void initialize(const std::source_location &loc);
    void finalize(const std::source_location &loc);

    std::atomic<bool> initialized{false};
    std::atomic<bool> finalized{false};

  private:
    struct Module
    {
        ModuleSpec spec;
        ModuleStatus status{ModuleStatus::Registered};
    };

    std::vector<size_t> start_order();
    void stop_one(Module &mod, std::string &trace);
    [[noreturn]] void fatal(const std::string &what, const std::string &culprit = {});
    std::string banner(const char *phase, const std::source_location &loc) const;

    static const char *to_string(ModuleStatus status);

    std::mutex m_mutex;
    std::vector<Module> m_modules; // Sorted by name once initialize() starts.
    std::vector<size_t> m_order;
};

void LifecycleManagerImpl::add(ModuleSpec spec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (initialized.load(std::memory_order_acquire))
    {
        MCG_PANIC("[MCG_LifeCycle] EXEC[{}]:PID[{}] FATAL: register_module('{}') called after "
                  "initialization.",
                  mcpguard::platform::get_executable_name(), mcpguard::platform::get_pid(),
                  spec.name);
    }
    m_modules.push_back(Module{std::move(spec)});
}

std::string LifecycleManagerImpl::banner(const char *phase, const std::source_location &loc) const
{
    return fmt::format("[MCG_LifeCycle] [{}]:PID[{}]\n     **** {}() triggered from {} ({}:{})\n",
                       mcpguard::platform::get_executable_name(), mcpguard::platform::get_pid(),
                       phase, loc.function_name(),
                       mcpguard::format_tools::filename_only(loc.file_name()), loc.line());
}

/**
 * @brief Dependency-respecting start order, as indices into m_modules.
 * @throws std::runtime_error on a duplicate name, an undefined dependency or a cycle.
 */
std::vector<size_t> LifecycleManagerImpl::start_order()
{
    std::sort(m_modules.begin(), m_modules.end(),
              [](const Module &a, const Module &b) { return a.spec.name < b.spec.name; });

    std::map<std::string_view, size_t> index;
    for (size_t i = 0; i < m_modules.size(); ++i)
    {
        if (!index.emplace(m_modules[i].spec.name, i).second)
            throw std::runtime_error("Duplicate module name: " + m_modules[i].spec.name);
    }

    std::vector<std::vector<size_t>> dependents(m_modules.size());
    std::vector<size_t> waiting_on(m_modules.size(), 0);
    for (size_t i = 0; i < m_modules.size(); ++i)
    {
        for (const auto &dep : m_modules[i].spec.depends_on)
        {
            auto it = index.find(dep);
            if (it == index.end())
            {
                throw std::runtime_error(fmt::format("Undefined dependency '{}' required by '{}'",
                                                     dep, m_modules[i].spec.name));
            }
            dependents[it->second].push_back(i);
            ++waiting_on[i];
        }
    }

    // Modules are name-sorted, so the smallest ready index is the smallest ready name.
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready;
    for (size_t i = 0; i < m_modules.size(); ++i)
    {
        if (waiting_on[i] == 0)
            ready.push(i);
    }

    std::vector<size_t> order;
    order.reserve(m_modules.size());
    while (!ready.empty())
    {
        const size_t next = ready.top();
        ready.pop();
        order.push_back(next);
        for (size_t d : dependents[next])
        {
            if (--waiting_on[d] == 0)
                ready.push(d);
        }
    }

    if (order.size() != m_modules.size())
    {
        std::vector<std::string_view> stuck;
        for (size_t i = 0; i < m_modules.size(); ++i)
        {
            if (waiting_on[i] > 0)
                stuck.push_back(m_modules[i].spec.name);
        }
        throw std::runtime_error(
            fmt::format("Circular dependency detected involving: {}", fmt::join(stuck, ", ")));
    }
    return order;
}

void LifecycleManagerImpl::initialize(const std::source_location &loc)
{
    if (initialized.exchange(true, std::memory_order_acq_rel))
        return;

    std::string trace = banner("initialize", loc);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        try
        {
            m_order = start_order();
        }
        catch (const std::runtime_error &e)
        {
            fatal(e.what());
        }
    }

    for (size_t i : m_order)
    {
        Module &mod = m_modules[i];
        trace += fmt::format("     -> Starting module: '{}'...", mod.spec.name);
        mod.status = ModuleStatus::Initializing;
        if (mod.spec.start)
        {
            try
            {
                mod.spec.start();
            }
            catch (const std::exception &e)
            {
                mod.status = ModuleStatus::Failed;
                MCG_DEBUG("{}", trace);
                fatal(fmt::format("Exception during startup: {}", e.what()), mod.spec.name);
            }
        }
        mod.status = ModuleStatus::Started;
        trace += "done.\n";
    }
    MCG_DEBUG("{}     -> Application initialization complete.\n", trace);
}

void LifecycleManagerImpl::finalize(const std::source_location &loc)
{
    if (!initialized.load(std::memory_order_acquire) ||
        finalized.exchange(true, std::memory_order_acq_rel))
        return;

    std::string trace = banner("finalize", loc);
    for (auto it = m_order.rbegin(); it != m_order.rend(); ++it)
    {
        Module &mod = m_modules[*it];
        if (mod.status != ModuleStatus::Started)
        {
            trace += fmt::format("     <- Module '{}' not started ({}), skipped.\n", mod.spec.name,
                                 to_string(mod.status));
            continue;
        }
        stop_one(mod, trace);
    }
    MCG_DEBUG("{}     <- Application finalization complete.\n", trace);
}

void LifecycleManagerImpl::stop_one(Module &mod, std::string &trace)
{
    trace += fmt::format("     <- Shutting down module: '{}'...", mod.spec.name);
    if (!mod.spec.stop)
    {
        mod.status = ModuleStatus::Shutdown;
        trace += "done.\n";
        return;
    }

    std::string error;
    switch (run_stop(mod.spec.stop, mod.spec.stop_timeout, error))
    {
    case StopResult::Done:
        mod.status = ModuleStatus::Shutdown;
        trace += "done.\n";
        break;
    case StopResult::TimedOut:
        mod.status = ModuleStatus::ShutdownTimeout;
        trace += "TIMEOUT, thread detached.\n";
        fmt::print(stderr, "[MCG_LifeCycle] WARNING: module '{}' did not shut down within {}ms.\n",
                   mod.spec.name, mod.spec.stop_timeout.count());
        break;
    case StopResult::Threw:
        mod.status = ModuleStatus::FailedShutdown;
        trace += "FAILED.\n";
        fmt::print(stderr, "[MCG_LifeCycle] ERROR: module '{}' threw on shutdown: {}\n",
                   mod.spec.name, error);
        break;
    }
}

const char *LifecycleManagerImpl::to_string(ModuleStatus status)
{
    switch (status)
    {
    case ModuleStatus::Registered:
        return "Registered";
    case ModuleStatus::Initializing:
        return "Initializing";
    case ModuleStatus::Started:
        return "Started";
    case ModuleStatus::Failed:
        return "Failed";
    case ModuleStatus::Shutdown:
        return "Shutdown";
    case ModuleStatus::FailedShutdown:
        return "FailedShutdown";
    case ModuleStatus::ShutdownTimeout:
        return "ShutdownTimeout";
    }
    return "Unknown";
}

void LifecycleManagerImpl::fatal(const std::string &what, const std::string &culprit)
{
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "\n\n[MCG_LifeCycle] FATAL: {}. Aborting.\n", what);
    if (!culprit.empty())
        fmt::format_to(std::back_inserter(out), "[MCG_LifeCycle] Module '{}' was point of failure.\n",
                       culprit);
    fmt::format_to(std::back_inserter(out), "\n--- Module Status ---\n");
    for (const auto &mod : m_modules)
        fmt::format_to(std::back_inserter(out), "  - '{}' [{}]\n", mod.spec.name,
                       to_string(mod.status));
    fmt::format_to(std::back_inserter(out), "---------------------\n\n");
    fmt::print(stderr, "{}", fmt::to_string(out));

    mcpguard::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// LifecycleManager
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl)
        pImpl->add(std::move(def.pImpl->spec));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->finalized.load(std::memory_order_acquire);
}

} // namespace mcpguard::utils
