/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <sitepack/error.hpp>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sitepack {

enum class log_level {
    debug,
    info,
    warning,
    error
};

[[nodiscard]] std::string_view to_string(log_level level) noexcept;

// One structured log record. Debug-only events carry diagnostics that a
// console sink normally hides.
struct log_event {
    log_level level = log_level::info;
    std::string message;
    bool debug_only = false;
};

// Receiver for log events, injected into the extraction session
class log_sink {
public:
    virtual ~log_sink() = default;

    virtual void write(const log_event& event) = 0;

    void info(std::string message) {
        write(log_event{log_level::info, std::move(message), false});
    }

    void warning(std::string message) {
        write(log_event{log_level::warning, std::move(message), false});
    }

    void error(std::string message) {
        write(log_event{log_level::error, std::move(message), false});
    }

    void debug(std::string message) {
        write(log_event{log_level::debug, std::move(message), true});
    }
};

class null_log_sink : public log_sink {
public:
    void write(const log_event&) override {}
};

// Keeps every event in memory
class memory_log_sink : public log_sink {
private:
    std::vector<log_event> events_;

public:
    void write(const log_event& event) override { events_.push_back(event); }

    [[nodiscard]] const std::vector<log_event>& events() const noexcept { return events_; }

    // True if any event message contains the given text
    [[nodiscard]] bool contains(std::string_view text) const;

    void clear() noexcept { events_.clear(); }
};

// Prints messages to a C stream; debug-only events are dropped unless
// show_debug is set
class stream_log_sink : public log_sink {
private:
    std::FILE* out_;
    bool show_debug_;

public:
    explicit stream_log_sink(std::FILE* out = stdout, bool show_debug = false)
        : out_(out), show_debug_(show_debug) {}

    void write(const log_event& event) override;
};

// Appends "[YYYY-MM-DD HH:MM:SS] message" lines to a log file. Records
// every event, debug-only ones included.
class file_log_sink : public log_sink {
private:
    struct file_deleter {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, file_deleter> file_;

    explicit file_log_sink(std::FILE* file) : file_(file) {}

public:
    [[nodiscard]] static std::expected<file_log_sink, sitepack::error> open(const std::filesystem::path& path);

    void write(const log_event& event) override;
};

// Forwards each event to two sinks
class tee_log_sink : public log_sink {
private:
    log_sink* first_;
    log_sink* second_;

public:
    tee_log_sink(log_sink& first, log_sink& second) : first_(&first), second_(&second) {}

    void write(const log_event& event) override {
        first_->write(event);
        second_->write(event);
    }
};

} // namespace sitepack
