#pragma once
/**
 * @file module_def.hpp
 * @brief Declaration of a lifecycle module: name, dependencies and hooks.
 */
#include "mcpguard_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace mcpguard::utils
{

class ModuleDefImpl;
class LifecycleManager;

/// Startup/shutdown hook. A C function pointer so the signature is stable across the
/// shared-library boundary; @p arg is the string given at registration or nullptr.
using LifecycleCallback = void (*)(const char *arg);

/**
 * @brief Describes one lifecycle module before it is handed to the LifecycleManager.
 *
 * Move-only; registering it transfers ownership. A module that lists a dependency is
 * started after it and shut down before it.
 *
 * @code
 *   ModuleDef def("SingletonLock");
 *   def.add_dependency("Logger");
 *   def.set_startup(&start_locks);
 *   def.set_shutdown(&release_all, std::chrono::milliseconds(2000));
 * @endcode
 */
class MCPGUARD_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /// @throws std::invalid_argument for an empty name, std::length_error above MAX_MODULE_NAME_LEN.
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    // A shutdown that outlives @p timeout is left running on a detached thread and
    // reported; zero waits forever.
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace mcpguard::utils
