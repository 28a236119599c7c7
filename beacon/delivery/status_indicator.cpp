// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/delivery/status_indicator.hpp>

#include <unistd.h>

#include <array>
#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace beacon {

namespace {
constexpr std::array<char, 4> kSpinnerFrames = {'|', '/', '-', '\\'};
}  // namespace

StatusIndicator::StatusIndicator(std::string description, Sink sink, std::chrono::milliseconds interval) :
    description_(std::move(description)), sink_(std::move(sink)), interval_(interval) {}

void StatusIndicator::tick() {
    char frame = kSpinnerFrames[frames_rendered_ % kSpinnerFrames.size()];
    frames_rendered_++;
    if (sink_) {
        sink_(fmt::format("{} {}", frame, description_));
    }
}

void StatusIndicator::clear() {
    if (sink_ && frames_rendered_ > 0) {
        sink_("");
    }
}

StatusIndicator::Sink StatusIndicator::stderr_sink() {
    return [](std::string_view line) {
        static const bool is_terminal = isatty(STDERR_FILENO) == 1;
        if (!is_terminal) {
            return;
        }
        if (line.empty()) {
            // Erase the spinner line
            fmt::print(stderr, "\r\033[K");
        } else {
            fmt::print(stderr, "\r{}", line);
        }
        std::fflush(stderr);
    };
}

}  // namespace beacon
