// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <exception>
#include <string>

namespace beacon {

// HRESULT reported for exceptions that carry no error code of their own (COR_E_EXCEPTION).
inline constexpr std::int32_t kGenericExceptionHResult = static_cast<std::int32_t>(0x80131500);

// Caller-facing description of a failure to be reported as an exception event.
struct ExceptionInfo {
    std::string type_name;
    std::string message;
    std::int32_t hresult = kGenericExceptionHResult;
    std::string stack;

    // Demangled dynamic type, what(), and std::system_error::code() when available.
    static ExceptionInfo from_exception(const std::exception& e);

    // Same as above for a captured exception. Non-std exceptions are described generically.
    static ExceptionInfo from_exception_ptr(const std::exception_ptr& eptr);
};

// "0x80131500"
std::string format_hresult(std::int32_t hresult);

}  // namespace beacon
