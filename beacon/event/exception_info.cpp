// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/event/exception_info.hpp>

#include <system_error>
#include <typeinfo>

#include <fmt/format.h>

#include <beacon/common/assert.hpp>

namespace beacon {

ExceptionInfo ExceptionInfo::from_exception(const std::exception& e) {
    ExceptionInfo info;
    info.type_name = beacon::assert::detail::demangle(typeid(e).name());
    info.message = e.what();
    if (const auto* system_error = dynamic_cast<const std::system_error*>(&e)) {
        info.hresult = system_error->code().value();
    }
    return info;
}

ExceptionInfo ExceptionInfo::from_exception_ptr(const std::exception_ptr& eptr) {
    if (!eptr) {
        return ExceptionInfo{.type_name = "<none>", .message = "No exception"};
    }
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return from_exception(e);
    } catch (...) {
        // Non-std exception; nothing more can be extracted from it
        return ExceptionInfo{.type_name = "<unknown>", .message = "Unknown exception"};
    }
}

std::string format_hresult(std::int32_t hresult) {
    return fmt::format("0x{:08X}", static_cast<std::uint32_t>(hresult));
}

}  // namespace beacon
