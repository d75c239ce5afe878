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
#include <sitepack/header_codec.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

namespace sitepack {

// Largest payload a record may declare (exclusive)
constexpr uint64_t MAX_ENTRY_SIZE = 1024ULL * 1024 * 1024;

// 2000-01-01T00:00:00Z
constexpr int64_t MIN_MTIME = 946684800;

// How far past "now" a timestamp may lie
constexpr std::chrono::hours MTIME_FUTURE_TOLERANCE{24 * 30};

[[nodiscard]] constexpr bool size_in_range(const uint64_t size) noexcept {
    return size < MAX_ENTRY_SIZE;
}

[[nodiscard]] bool mtime_in_range(uint32_t mtime, std::chrono::system_clock::time_point now) noexcept;

// A header whose fields passed validation: name and path are decoded
class archive_entry {
private:
    std::string name_;
    std::string path_;
    uint32_t size_ = 0;
    uint32_t mtime_ = 0;

public:
    archive_entry(std::string name, std::string path, const uint32_t size, const uint32_t mtime)
        : name_(std::move(name)), path_(std::move(path)), size_(size), mtime_(mtime) {}

    // Validate a decoded header record against the container invariants
    [[nodiscard]] static std::expected<archive_entry, error> from_header(
        const archive_header& header,
        std::chrono::system_clock::time_point now);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] uint32_t size() const noexcept { return size_; }
    [[nodiscard]] uint32_t mtime() const noexcept { return mtime_; }

    [[nodiscard]] std::chrono::system_clock::time_point modification_time() const noexcept {
        return std::chrono::system_clock::time_point{std::chrono::seconds{mtime_}};
    }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
};

} // namespace sitepack
