/**
 * @file supervisor_config.cpp
 * @brief SupervisorConfig singleton lifecycle module implementation.
 *
 * Config loading strategy (priority low -> high):
 *  1. Built-in C++ defaults (Impl struct fields)
 *  2. mcpguard.default.json, merged with mcpguard.user.json
 *  3. set_config_path() / MCPGUARD_CONFIG_FILE replaces both file sources
 *  4. MCPGUARD_* environment overrides (and their SNOW_* aliases)
 */
#include "mcg_service.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcpguard::utils
{

namespace fs = std::filesystem;

static std::atomic<bool> g_supervisor_config_initialized{false};

static std::mutex g_config_path_mu;
static fs::path g_config_path_override; ///< Set by set_config_path() before startup.

namespace
{

/// Returns the config directory discovered from the binary location.
fs::path discover_config_dir() noexcept
{
    try
    {
        const fs::path exe(platform::get_executable_name(true));
        if (!exe.is_absolute())
            return {};
        const fs::path bin = exe.parent_path();

        // Staged layout: <root>/bin/ + <root>/config/
        fs::path candidate = bin / ".." / "config";
        if (fs::is_directory(candidate))
            return fs::weakly_canonical(candidate);

        // Flat layout: config/ next to binary
        candidate = bin / "config";
        if (fs::is_directory(candidate))
            return fs::weakly_canonical(candidate);
    }
    catch (const std::exception &e)
    {
        MCG_DEBUG("SupervisorConfig: config directory discovery failed: {}", e.what());
    }
    return {};
}

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

/// Reads a JSON file. Returns a null value if the file is missing or malformed.
nlohmann::json read_json_file(const fs::path &path) noexcept
{
    try
    {
        std::ifstream f(path);
        if (!f.is_open())
            return nlohmann::json{};
        nlohmann::json j;
        f >> j;
        if (!j.is_object())
        {
            LOGGER_WARN("SupervisorConfig: '{}' does not contain a JSON object; ignored",
                        path.string());
            return nlohmann::json{};
        }
        return j;
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("SupervisorConfig: cannot parse '{}': {}; ignored", path.string(), e.what());
    }
    return nlohmann::json{};
}

std::optional<uint64_t> parse_unsigned(std::string_view text) noexcept
{
    const auto trimmed = format_tools::trim_whitespace(text);
    uint64_t value = 0;
    const auto *first = trimmed.data();
    const auto *last = trimmed.data() + trimmed.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || trimmed.empty())
        return std::nullopt;
    return value;
}

std::optional<bool> parse_bool(std::string_view text) noexcept
{
    const auto t = format_tools::trim_whitespace(text);
    if (t == "1" || t == "true" || t == "TRUE" || t == "yes" || t == "on")
        return true;
    if (t == "0" || t == "false" || t == "FALSE" || t == "no" || t == "off")
        return false;
    return std::nullopt;
}

/// Returns the first environment variable of the pair that is set.
const char *getenv_with_alias(const char *primary, const char *alias, const char **used) noexcept
{
    if (const char *v = std::getenv(primary))
    {
        *used = primary;
        return v;
    }
    if (const char *v = std::getenv(alias))
    {
        *used = alias;
        return v;
    }
    return nullptr;
}

} // namespace

struct SupervisorConfig::Impl
{
    mutable std::mutex mu;

    SupervisorLimits limits;
    fs::path lock_path;
    std::string log_level{"info"};
    fs::path log_file;
    fs::path config_dir;

    // Each setter rejects out-of-range values, keeping the previous one.
    bool set_max_servers(uint64_t v, std::string_view source)
    {
        if (v == 0 || v > UINT32_MAX)
        {
            LOGGER_WARN("SupervisorConfig: invalid max_servers {} from {}; keeping {}", v, source,
                        limits.max_servers);
            return false;
        }
        limits.max_servers = static_cast<uint32_t>(v);
        return true;
    }

    bool set_max_memory_mb(uint64_t v, std::string_view source)
    {
        if (v == 0)
        {
            LOGGER_WARN("SupervisorConfig: invalid max_memory_mb 0 from {}; keeping {}", source,
                        limits.max_memory_mb);
            return false;
        }
        limits.max_memory_mb = v;
        return true;
    }

    bool set_cleanup_interval(std::chrono::milliseconds v, std::string_view source)
    {
        if (v.count() <= 0)
        {
            LOGGER_WARN("SupervisorConfig: invalid cleanup_interval_ms {} from {}; keeping {}",
                        v.count(), source, limits.cleanup_interval.count());
            return false;
        }
        limits.cleanup_interval = v;
        return true;
    }

    bool set_graceful_timeout(std::chrono::milliseconds v, std::string_view source)
    {
        if (v.count() < 0)
        {
            LOGGER_WARN("SupervisorConfig: invalid graceful_timeout_ms {} from {}; keeping {}",
                        v.count(), source, limits.graceful_timeout.count());
            return false;
        }
        limits.graceful_timeout = v;
        return true;
    }

    bool set_launch_signature(const std::string &v, std::string_view source)
    {
        if (format_tools::trim_whitespace(v).empty())
        {
            LOGGER_WARN("SupervisorConfig: empty launch_signature from {}; keeping '{}'", source,
                        limits.launch_signature);
            return false;
        }
        limits.launch_signature = v;
        return true;
    }

    // Non-negative integer under `key`; negative and fractional numbers are rejected
    // here, anything that is not a number throws type_error from get().
    static std::optional<uint64_t> unsigned_field(const nlohmann::json &s, const char *key,
                                                  std::string_view source)
    {
        const auto &v = s.at(key);
        if (v.is_number() && !v.is_number_unsigned())
        {
            LOGGER_WARN("SupervisorConfig: invalid {} {} from {}; expected a non-negative integer",
                        key, v.dump(), source);
            return std::nullopt;
        }
        return v.get<uint64_t>();
    }

    void apply_json(const nlohmann::json &j, std::string_view source)
    {
        try
        {
            if (j.contains("supervisor"))
            {
                const auto &s = j.at("supervisor");
                if (s.contains("max_servers"))
                    if (auto n = unsigned_field(s, "max_servers", source))
                        set_max_servers(*n, source);
                if (s.contains("max_memory_mb"))
                    if (auto n = unsigned_field(s, "max_memory_mb", source))
                        set_max_memory_mb(*n, source);
                if (s.contains("cleanup_enabled"))
                    limits.cleanup_enabled = s.at("cleanup_enabled").get<bool>();
                if (s.contains("cleanup_interval_ms"))
                    set_cleanup_interval(
                        std::chrono::milliseconds(s.at("cleanup_interval_ms").get<int64_t>()),
                        source);
                if (s.contains("graceful_timeout_ms"))
                    set_graceful_timeout(
                        std::chrono::milliseconds(s.at("graceful_timeout_ms").get<int64_t>()),
                        source);
                if (s.contains("launch_signature"))
                    set_launch_signature(s.at("launch_signature").get<std::string>(), source);
            }
            if (j.contains("lock"))
            {
                const auto &l = j.at("lock");
                if (l.contains("path") && l.at("path").is_string())
                    lock_path = l.at("path").get<std::string>();
            }
            if (j.contains("logging"))
            {
                const auto &g = j.at("logging");
                if (g.contains("level"))
                {
                    auto lvl = g.at("level").get<std::string>();
                    if (Logger::level_from_string(lvl))
                        log_level = lvl;
                    else
                        LOGGER_WARN("SupervisorConfig: unknown log level '{}' from {}; keeping "
                                    "'{}'",
                                    lvl, source, log_level);
                }
                if (g.contains("file") && g.at("file").is_string())
                    log_file = g.at("file").get<std::string>();
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_WARN("SupervisorConfig: type error in {}: {}; remaining keys ignored", source,
                        e.what());
        }
    }

    void load_file(const fs::path &path, std::string_view what)
    {
        nlohmann::json j = read_json_file(path);
        if (!j.is_null())
        {
            LOGGER_INFO("SupervisorConfig: loading {} '{}'", what, path.string());
            config_dir = path.parent_path();
            apply_json(j, path.string());
        }
        else
        {
            LOGGER_WARN("SupervisorConfig: {} '{}' not readable; using defaults", what,
                        path.string());
        }
    }

    void apply_env()
    {
        const char *used = nullptr;
        if (const char *v = getenv_with_alias("MCPGUARD_MAX_SERVERS", "SNOW_MAX_MCP_SERVERS", &used))
        {
            if (auto n = parse_unsigned(v))
                set_max_servers(*n, used);
            else
                LOGGER_WARN("SupervisorConfig: {}='{}' is not a number; ignored", used, v);
        }
        if (const char *v =
                getenv_with_alias("MCPGUARD_MEMORY_LIMIT_MB", "SNOW_MCP_MEMORY_LIMIT", &used))
        {
            if (auto n = parse_unsigned(v))
                set_max_memory_mb(*n, used);
            else
                LOGGER_WARN("SupervisorConfig: {}='{}' is not a number; ignored", used, v);
        }
        if (const char *v = std::getenv("MCPGUARD_CLEANUP_ENABLED"))
        {
            if (auto b = parse_bool(v))
                limits.cleanup_enabled = *b;
            else
                LOGGER_WARN("SupervisorConfig: MCPGUARD_CLEANUP_ENABLED='{}' is not a boolean; "
                            "ignored",
                            v);
        }
        if (const char *v = std::getenv("MCPGUARD_LOCK_PATH"))
        {
            lock_path = v;
        }
    }

    void load(const fs::path &override_path)
    {
        std::lock_guard lock(mu);
        if (!override_path.empty())
        {
            load_file(override_path, "override file");
        }
        else if (const char *env = std::getenv("MCPGUARD_CONFIG_FILE"))
        {
            load_file(fs::path(env), "MCPGUARD_CONFIG_FILE");
        }
        else
        {
            fs::path cfg_dir = discover_config_dir();
            if (!cfg_dir.empty())
            {
                config_dir = cfg_dir;
                nlohmann::json merged = nlohmann::json::object();

                fs::path def_file = cfg_dir / "mcpguard.default.json";
                if (fs::exists(def_file))
                {
                    nlohmann::json jdef = read_json_file(def_file);
                    if (!jdef.is_null())
                    {
                        LOGGER_INFO("SupervisorConfig: loading defaults from '{}'",
                                    def_file.string());
                        json_merge(merged, jdef);
                    }
                }
                else
                {
                    LOGGER_INFO("SupervisorConfig: mcpguard.default.json not found; using "
                                "built-in defaults");
                }

                fs::path user_file = cfg_dir / "mcpguard.user.json";
                if (fs::exists(user_file))
                {
                    nlohmann::json juser = read_json_file(user_file);
                    if (!juser.is_null())
                    {
                        LOGGER_INFO("SupervisorConfig: merging user overrides from '{}'",
                                    user_file.string());
                        json_merge(merged, juser);
                    }
                }

                if (!merged.empty())
                    apply_json(merged, cfg_dir.string());
            }
            else
            {
                LOGGER_INFO("SupervisorConfig: no config directory found; using built-in "
                            "defaults");
            }
        }

        apply_env();

        LOGGER_INFO("SupervisorConfig: max_servers         = {}", limits.max_servers);
        LOGGER_INFO("SupervisorConfig: max_memory_mb       = {}", limits.max_memory_mb);
        LOGGER_INFO("SupervisorConfig: cleanup_enabled     = {}", limits.cleanup_enabled);
        LOGGER_INFO("SupervisorConfig: cleanup_interval_ms = {}", limits.cleanup_interval.count());
        LOGGER_INFO("SupervisorConfig: graceful_timeout_ms = {}", limits.graceful_timeout.count());
        LOGGER_INFO("SupervisorConfig: launch_signature    = {}", limits.launch_signature);
        LOGGER_INFO("SupervisorConfig: lock_path           = {}",
                    lock_path.empty() ? std::string("<default>") : lock_path.string());
        LOGGER_INFO("SupervisorConfig: log_level           = {}", log_level);
    }
};

SupervisorConfig::SupervisorConfig() : pImpl(std::make_unique<Impl>()) {}
SupervisorConfig::~SupervisorConfig() = default;

// static
void SupervisorConfig::set_config_path(const fs::path &path)
{
    std::lock_guard lock(g_config_path_mu);
    g_config_path_override = path;
}

// static
bool SupervisorConfig::lifecycle_initialized() noexcept
{
    return g_supervisor_config_initialized.load(std::memory_order_acquire);
}

// static
SupervisorConfig &SupervisorConfig::get_instance()
{
    if (!lifecycle_initialized())
    {
        MCG_PANIC("SupervisorConfig used before its module was initialized via LifecycleManager. "
                  "Aborting.");
    }
    static SupervisorConfig instance;
    return instance;
}

void SupervisorConfig::load_(const fs::path &override_path)
{
    pImpl->load(override_path);
}

SupervisorLimits SupervisorConfig::limits() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->limits;
}

uint32_t SupervisorConfig::max_servers() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->limits.max_servers;
}

uint64_t SupervisorConfig::max_memory_mb() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->limits.max_memory_mb;
}

bool SupervisorConfig::cleanup_enabled() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->limits.cleanup_enabled;
}

std::chrono::milliseconds SupervisorConfig::cleanup_interval() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->limits.cleanup_interval;
}

std::chrono::milliseconds SupervisorConfig::graceful_timeout() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->limits.graceful_timeout;
}

std::string SupervisorConfig::launch_signature() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->limits.launch_signature;
}

fs::path SupervisorConfig::lock_path() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->lock_path;
}

std::string SupervisorConfig::log_level() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->log_level;
}

fs::path SupervisorConfig::log_file() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->log_file;
}

fs::path SupervisorConfig::config_dir() const
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->config_dir;
}

bool SupervisorConfig::set_max_servers(uint32_t value)
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->set_max_servers(value, "override");
}

bool SupervisorConfig::set_max_memory_mb(uint64_t value)
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->set_max_memory_mb(value, "override");
}

bool SupervisorConfig::set_cleanup_interval(std::chrono::milliseconds value)
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->set_cleanup_interval(value, "override");
}

void SupervisorConfig::set_cleanup_enabled(bool value)
{
    std::lock_guard lock(pImpl->mu);
    pImpl->limits.cleanup_enabled = value;
}

bool SupervisorConfig::set_launch_signature(const std::string &value)
{
    std::lock_guard lock(pImpl->mu);
    return pImpl->set_launch_signature(value, "override");
}

void SupervisorConfig::set_lock_path(const fs::path &value)
{
    std::lock_guard lock(pImpl->mu);
    pImpl->lock_path = value;
}

namespace
{
void do_supervisor_config_startup(const char * /*arg*/)
{
    fs::path override_path;
    {
        std::lock_guard lock(g_config_path_mu);
        override_path = g_config_path_override;
    }
    // The flag is raised first so that get_instance() is usable from load_().
    g_supervisor_config_initialized.store(true, std::memory_order_release);
    SupervisorConfig::get_instance().load_(override_path);
}

void do_supervisor_config_shutdown(const char * /*arg*/)
{
    g_supervisor_config_initialized.store(false, std::memory_order_release);
}
} // namespace

// static
ModuleDef SupervisorConfig::GetLifecycleModule()
{
    ModuleDef module("mcpguard::utils::SupervisorConfig");
    module.add_dependency("mcpguard::utils::Logger");
    module.set_startup(&do_supervisor_config_startup);
    module.set_shutdown(&do_supervisor_config_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace mcpguard::utils
