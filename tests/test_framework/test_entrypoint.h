// tests/test_framework/test_entrypoint.h
#pragma once
/**
 * @file test_entrypoint.h
 * @brief Worker scenario table of the mcpguard_tests executable.
 *
 * `mcpguard_tests <module>.<scenario> [args...]` runs a single scenario instead of
 * the gtest suite. Worker files add their scenarios from a static initializer:
 *
 *   [[maybe_unused]] const bool registered = register_worker_scenarios(
 *       "logger", {{"test_basic_logging", 1, [](const WorkerArgs &a) { ... }}});
 */
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// Path of this executable as given in argv[0]; workers are spawned from it.
extern std::string g_self_exe_path;

namespace mcpguard::tests
{

/// Command-line arguments following the scenario name.
using WorkerArgs = std::vector<std::string>;

struct WorkerScenario
{
    std::string name;
    size_t min_args = 0;
    std::function<int(const WorkerArgs &)> run;
};

/// Scenario with no arguments.
inline WorkerScenario scenario(std::string name, int (*fn)())
{
    return {std::move(name), 0, [fn](const WorkerArgs &) { return fn(); }};
}

/// Scenario taking a single path argument.
inline WorkerScenario scenario(std::string name, int (*fn)(const std::string &))
{
    return {std::move(name), 1, [fn](const WorkerArgs &a) { return fn(a[0]); }};
}

/**
 * @brief Adds scenarios run as `<module>.<name>`. Registering a module twice panics.
 * @return Always true, so that the call can initialize a namespace-scope constant.
 */
bool register_worker_scenarios(const std::string &module, std::vector<WorkerScenario> scenarios);

} // namespace mcpguard::tests
