// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <string_view>

namespace beacon {

// Spinner rendered while the caller waits on a background task.
class StatusIndicator {
public:
    // Receives each rendered line; an empty line means "clear".
    using Sink = std::function<void(std::string_view line)>;

    explicit StatusIndicator(
        std::string description,
        Sink sink = stderr_sink(),
        std::chrono::milliseconds interval = std::chrono::milliseconds(100));

    void tick();
    void clear();

    std::chrono::milliseconds interval() const { return interval_; }
    size_t frames_rendered() const { return frames_rendered_; }

    // Writes carriage-return-prefixed frames to stderr when stderr is a terminal, else nothing.
    static Sink stderr_sink();

private:
    std::string description_;
    Sink sink_;
    std::chrono::milliseconds interval_;
    size_t frames_rendered_ = 0;
};

// Blocks until `future` is ready, animating `indicator` while waiting. Does not retrieve the
// result.
template <typename T>
void wait_with_animation(const std::future<T>& future, StatusIndicator& indicator) {
    while (future.wait_for(indicator.interval()) != std::future_status::ready) {
        indicator.tick();
    }
    indicator.clear();
}

}  // namespace beacon
