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

#include <sitepack/stream.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace sitepack {

enum class archive_format {
    binary,
    text
};

[[nodiscard]] constexpr std::string_view to_string(const archive_format format) noexcept {
    return format == archive_format::binary ? "binary" : "text";
}

// Result of every individual check applied to the first header record
struct header_inspection {
    size_t available = 0;
    bool complete_record = false;
    bool decoded = false;

    std::string name;
    std::string path;
    uint32_t size = 0;
    uint32_t mtime = 0;

    bool name_present = false;
    bool name_length_ok = false;
    bool size_ok = false;
    bool mtime_ok = false;
    bool path_length_ok = false;
    bool no_control_chars = false;
    bool name_pattern_ok = false;

    [[nodiscard]] bool looks_binary() const noexcept {
        return complete_record && decoded && name_present && name_length_ok && size_ok &&
               mtime_ok && path_length_ok && no_control_chars && name_pattern_ok;
    }
};

// Letters, digits, "._- ()[]&@%+" and any byte >= 0x80
[[nodiscard]] bool is_plausible_file_name(std::string_view name) noexcept;

// No byte below 0x20 and no DEL
[[nodiscard]] bool is_free_of_control_chars(std::string_view text) noexcept;

// Run all binary-format checks against the leading bytes of a stream
[[nodiscard]] header_inspection inspect_header(
    std::span<const std::byte> prefix,
    std::chrono::system_clock::time_point now);

// Classify the leading bytes of a stream. Never fails: anything that is
// not a plausible binary header record is text.
[[nodiscard]] archive_format detect_format(
    std::span<const std::byte> prefix,
    std::chrono::system_clock::time_point now);

// Classify a seekable stream; its position is restored afterwards. Only
// stream I/O failures are reported as errors.
[[nodiscard]] std::expected<archive_format, error> detect_format(random_access_stream& stream);

} // namespace sitepack
