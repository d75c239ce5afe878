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

#include <sitepack/format_detector.hpp>
#include <sitepack/archive_entry.hpp>
#include <sitepack/header_codec.hpp>
#include <sitepack/path_codec.hpp>
#include <algorithm>

namespace sitepack {

bool is_plausible_file_name(std::string_view name) noexcept {
    return std::ranges::all_of(name, [](const char c) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80) {
            return true;
        }
        if ((byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') || (byte >= '0' && byte <= '9')) {
            return true;
        }
        switch (byte) {
            case '.': case '_': case '-': case ' ':
            case '(': case ')': case '[': case ']':
            case '&': case '@': case '%': case '+':
                return true;
            default:
                return false;
        }
    });
}

bool is_free_of_control_chars(std::string_view text) noexcept {
    return std::ranges::none_of(text, [](const char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte < 0x20 || byte == 0x7F;
    });
}

header_inspection inspect_header(std::span<const std::byte> prefix, const std::chrono::system_clock::time_point now) {
    header_inspection result;
    result.available = prefix.size();

    if (prefix.size() < HEADER_SIZE) {
        return result;
    }
    result.complete_record = true;

    auto header = decode_header(prefix.first(HEADER_SIZE));
    if (!header) {
        return result;
    }

    // A field that fails to decode (embedded %00) is reported as a
    // control-character violation; keep the raw text for diagnostics.
    auto name = decode_field(header->name);
    auto path = decode_field(header->path);
    result.decoded = true;
    result.name = name ? *name : header->name;
    result.path = path ? *path : header->path;
    result.size = header->size;
    result.mtime = header->mtime;

    result.name_present = !result.name.empty();
    result.name_length_ok = result.name_present && result.name.size() <= NAME_FIELD_SIZE;
    result.size_ok = size_in_range(header->size);
    result.mtime_ok = mtime_in_range(header->mtime, now);
    result.path_length_ok = result.path.size() <= PATH_FIELD_SIZE;
    result.no_control_chars = name && path &&
        is_free_of_control_chars(result.name) && is_free_of_control_chars(result.path);
    result.name_pattern_ok = is_plausible_file_name(result.name);

    return result;
}

archive_format detect_format(std::span<const std::byte> prefix, const std::chrono::system_clock::time_point now) {
    return inspect_header(prefix, now).looks_binary() ? archive_format::binary : archive_format::text;
}

auto detect_format(random_access_stream &stream) -> std::expected<archive_format, error> {
    const size_t start = stream.position();

    header_block block{};
    auto read = read_fully(stream, block);
    if (!read) {
        return std::unexpected(read.error());
    }

    if (auto restored = stream.seek(start); !restored) {
        return std::unexpected(restored.error());
    }

    return detect_format(std::span{block}.first(*read), std::chrono::system_clock::now());
}

} // namespace sitepack
