// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <fmt/format.h>

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <tt-logger/tt-logger.hpp>

namespace beacon::assert {

namespace detail {

// Demangle a single symbol. Accepts either a raw mangled name ("_ZN6beacon...")
// or a backtrace_symbols() line ("binary(_ZN6beacon...+0x1c) [0x...]").
inline std::string demangle(const char* str) {
    std::string symbol(str);
    std::string mangled = symbol;
    auto open = symbol.find('(');
    if (open != std::string::npos) {
        auto plus = symbol.find('+', open);
        if (plus != std::string::npos && plus > open + 1) {
            mangled = symbol.substr(open + 1, plus - open - 1);
        }
    }

    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
    if (demangled == nullptr) {
        return symbol;
    }
    std::string result(demangled);
    std::free(demangled);  // NOLINT(cppcoreguidelines-no-malloc)
    return result;
}

}  // namespace detail

/**
 * @brief Get the current call stack
 * @param[in] size Maximum number of return layers
 * @param[in] skip Skip the number of layers at the top of the stack
 */
inline std::vector<std::string> backtrace(int size = 64, int skip = 1) {
    std::vector<std::string> bt;
    std::vector<void*> frames(size);
    int s = ::backtrace(frames.data(), size);
    char** strings = backtrace_symbols(frames.data(), s);
    if (strings == nullptr) {
        return bt;
    }
    for (int i = skip; i < s; ++i) {
        bt.push_back(detail::demangle(strings[i]));
    }
    std::free(strings);  // NOLINT(cppcoreguidelines-no-malloc)
    return bt;
}

inline std::string backtrace_to_string(int size = 64, int skip = 2, const std::string& prefix = "") {
    std::stringstream ss;
    for (const auto& line : backtrace(size, skip)) {
        ss << prefix << line << '\n';
    }
    return ss.str();
}

namespace detail {

template <typename... Args>
[[noreturn]] void throw_impl(
    const char* file, int line, const char* assert_type, const char* condition_str, const Args&... args) {
    std::stringstream message_ss;
    message_ss << assert_type << " @ " << file << ":" << line << ": " << condition_str << std::endl;
    if constexpr (sizeof...(args) > 0) {
        std::string info = fmt::format(args...);
        message_ss << "info:" << std::endl << info << std::endl;
        log_debug(tt::LogAlways, "{}: {}", assert_type, info);
    }
    static const bool disable_backtrace = std::getenv("BEACON_DISABLE_BACKTRACE") != nullptr;
    if (!disable_backtrace) {
        message_ss << "backtrace:\n" << backtrace_to_string(32, 3, " --- ");
    }
    throw std::runtime_error(message_ss.str());
}

[[noreturn]] inline void throw_error(const char* file, int line, const char* assert_type, const char* condition_str) {
    throw_impl(file, line, assert_type, condition_str);
}

template <typename... Args>
[[noreturn]] void throw_error(
    const char* file,
    int line,
    const char* assert_type,
    const char* condition_str,
    fmt::format_string<const Args&...> fmt,
    const Args&... args) {
    throw_impl(file, line, assert_type, condition_str, fmt, args...);
}

}  // namespace detail
}  // namespace beacon::assert

#ifndef BEACON_THROW
#define BEACON_THROW(...) \
    beacon::assert::detail::throw_error(__FILE__, __LINE__, "BEACON_THROW", "beacon::exception", ##__VA_ARGS__)
#endif

#ifndef BEACON_FATAL
#define BEACON_FATAL(condition, message, ...)                                                                   \
    do {                                                                                                        \
        if (not(condition)) [[unlikely]] {                                                                      \
            beacon::assert::detail::throw_error(__FILE__, __LINE__, "BEACON_FATAL", #condition, message, ##__VA_ARGS__); \
        }                                                                                                       \
    } while (0)  // NOLINT(cppcoreguidelines-macro-usage)
#endif
