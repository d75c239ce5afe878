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

#include <sitepack/log.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <print>

namespace sitepack {

std::string_view to_string(const log_level level) noexcept {
    switch (level) {
        case log_level::debug:   return "debug";
        case log_level::info:    return "info";
        case log_level::warning: return "warning";
        case log_level::error:   return "error";
    }
    return "unknown";
}

bool memory_log_sink::contains(std::string_view text) const {
    return std::ranges::any_of(events_, [text](const log_event& event) {
        return event.message.find(text) != std::string::npos;
    });
}

void stream_log_sink::write(const log_event &event) {
    if (event.debug_only && !show_debug_) {
        return;
    }

    if (event.level == log_level::error) {
        std::println(out_, "ERROR: {}", event.message);
    } else {
        std::println(out_, "{}", event.message);
    }
}

auto file_log_sink::open(const std::filesystem::path &path) -> std::expected<file_log_sink, sitepack::error> {
    std::FILE* file = std::fopen(path.c_str(), "ab");
    if (!file) {
        return std::unexpected(sitepack::error{error_code::io_error,
            "Failed to open log file: " + std::string{std::strerror(errno)}});
    }
    return file_log_sink{file};
}

void file_log_sink::write(const log_event &event) {
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    const std::string_view prefix = event.level == log_level::error ? "ERROR: " : "";

    std::println(file_.get(), "[{:%Y-%m-%d %H:%M:%S}] {}{}", now, prefix, event.message);
    std::fflush(file_.get());
}

} // namespace sitepack
