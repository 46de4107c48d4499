/**
 * @file debug_info.cpp
 * @brief Stack traces via backtrace(3), dladdr(3) and the Itanium demangler.
 */
#include "mcg_base.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

namespace mcpguard::debug
{

namespace
{

constexpr int kMaxFrames = 128;

// Each line goes out with one fwrite so concurrent traces do not interleave mid-line.
void emit(const std::string &line) noexcept
{
    std::fwrite(line.data(), 1, line.size(), stderr);
}

std::string demangle(const char *symbol)
{
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> out(
        abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &std::free);
    return (status == 0 && out) ? std::string(out.get()) : std::string(symbol);
}

std::string describe_frame(void *frame, const char *fallback_symbol)
{
    const auto addr = reinterpret_cast<uintptr_t>(frame);
    Dl_info info{};
    if (::dladdr(frame, &info) != 0 && info.dli_sname != nullptr)
    {
        return fmt::format("{} + {:#x}", demangle(info.dli_sname),
                           addr - reinterpret_cast<uintptr_t>(info.dli_saddr));
    }
    if (fallback_symbol != nullptr)
        return fallback_symbol;
    if (info.dli_fname != nullptr)
    {
        return fmt::format("({}) + {:#x}", info.dli_fname,
                           addr - reinterpret_cast<uintptr_t>(info.dli_fbase));
    }
    return "[unknown]";
}

} // namespace

void print_stack_trace() noexcept
{
    try
    {
        std::array<void *, kMaxFrames> frames{};
        const int depth = ::backtrace(frames.data(), kMaxFrames);
        if (depth <= 0)
        {
            emit("  [No stack frames available]\n");
            return;
        }

        std::unique_ptr<char *, decltype(&std::free)> symbols(
            ::backtrace_symbols(frames.data(), depth), &std::free);

        emit("Stack Trace (most recent call first):\n");
        for (int i = 0; i < depth; ++i)
        {
            const char *fallback = symbols ? symbols.get()[i] : nullptr;
            emit(fmt::format("  #{:02}  {:#018x}  {}\n", i,
                             reinterpret_cast<uintptr_t>(frames[static_cast<size_t>(i)]),
                             describe_frame(frames[static_cast<size_t>(i)], fallback)));
        }
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("Stack trace unavailable: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace mcpguard::debug
