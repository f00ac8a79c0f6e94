// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file frame_source.hpp
/// @brief Abstract pull interface for raw transport frames
///
/// The collector reads one frame at a time. receive() blocks until a frame
/// arrives; it only returns nullopt once the source has been stopped.

#include "logagg/record.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace logagg {

/// Statistics for frame sources
struct FrameSourceStats {
    uint64_t frames_received = 0;
    uint64_t bytes_received = 0;
    uint64_t receive_errors = 0;
};

/// Abstract source of raw frames
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /// Block until the next frame arrives
    /// @return The frame, or nullopt if the source was stopped
    virtual std::optional<Frame> receive() = 0;

    /// Ask a blocked or future receive() to return nullopt.
    /// Safe to call from a signal handler.
    virtual void request_stop() = 0;

    /// Get statistics
    virtual FrameSourceStats stats() const = 0;

    /// Get source name for logging
    virtual std::string name() const = 0;
};

}  // namespace logagg
