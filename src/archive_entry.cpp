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

#include <sitepack/archive_entry.hpp>
#include <sitepack/path_codec.hpp>
#include <format>

namespace sitepack {

bool mtime_in_range(const uint32_t mtime, const std::chrono::system_clock::time_point now) noexcept {
    const auto latest = std::chrono::duration_cast<std::chrono::seconds>(
        (now + MTIME_FUTURE_TOLERANCE).time_since_epoch()).count();
    const auto value = static_cast<int64_t>(mtime);
    return value >= MIN_MTIME && value <= latest;
}

auto archive_entry::from_header(const archive_header &header, const std::chrono::system_clock::time_point now)
    -> std::expected<archive_entry, error> {
    auto name = decode_field(header.name);
    if (!name) {
        return std::unexpected(error{name.error().code(), "Invalid file name: " + name.error().message()});
    }
    if (name->empty()) {
        return std::unexpected(error{error_code::invalid_header, "Empty file name"});
    }
    if (name->size() > NAME_FIELD_SIZE) {
        return std::unexpected(error{error_code::invalid_header, "File name exceeds field width"});
    }

    auto path = decode_field(header.path);
    if (!path) {
        return std::unexpected(error{path.error().code(), "Invalid file path: " + path.error().message()});
    }
    if (path->size() > PATH_FIELD_SIZE) {
        return std::unexpected(error{error_code::invalid_header, "File path exceeds field width"});
    }

    if (!size_in_range(header.size)) {
        return std::unexpected(error{error_code::invalid_header,
            std::format("Declared size {} is not below {}", header.size, MAX_ENTRY_SIZE)});
    }

    if (!mtime_in_range(header.mtime, now)) {
        return std::unexpected(error{error_code::invalid_header,
            std::format("Modification time {} outside accepted window", header.mtime)});
    }

    return archive_entry{std::move(*name), std::move(*path), header.size, header.mtime};
}

} // namespace sitepack
