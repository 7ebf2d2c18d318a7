// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Status Reporter - single current status line

#pragma once

#include "core/logging.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace app {

/// Holds the one status string shown to the user. Every report overwrites
/// the previous one; there is no history. UI thread only.
class StatusReporter {
public:
    using Callback = std::function<void(const std::string& message, bool is_error)>;

    void report(const std::string& message, bool is_error = false) {
        message_ = message;
        is_error_ = is_error;
        if (is_error) core::log_error(message);
        else core::log_info("status: " + message);
        for (const auto& cb : callbacks_) {
            cb(message_, is_error_);
        }
    }

    const std::string& current() const { return message_; }
    bool is_error() const { return is_error_; }

    void subscribe(Callback cb) { callbacks_.push_back(std::move(cb)); }

private:
    std::string message_;
    bool is_error_ = false;
    std::vector<Callback> callbacks_;
};

} // namespace app
