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

#include <sitepack/header_codec.hpp>
#include <algorithm>
#include <format>

namespace sitepack {

namespace detail {

std::string_view extract_field(std::span<const std::byte> field) {
    size_t length = field.size();
    while (length > 0 && field[length - 1] == std::byte{0}) {
        --length;
    }
    return std::string_view{reinterpret_cast<const char*>(field.data()), length};
}

} // namespace detail

auto decode_header(std::span<const std::byte> block) -> std::expected<archive_header, error> {
    if (block.size() != HEADER_SIZE) {
        return std::unexpected(error{error_code::invalid_header,
            std::format("Header record must be {} bytes, got {}", HEADER_SIZE, block.size())});
    }

    archive_header header;
    header.name = std::string{detail::extract_field(block.subspan(NAME_FIELD_OFFSET, NAME_FIELD_SIZE))};
    header.size = detail::load_le32(block.subspan<SIZE_FIELD_OFFSET, SIZE_FIELD_SIZE>());
    header.mtime = detail::load_le32(block.subspan<MTIME_FIELD_OFFSET, MTIME_FIELD_SIZE>());
    header.path = std::string{detail::extract_field(block.subspan(PATH_FIELD_OFFSET, PATH_FIELD_SIZE))};

    return header;
}

auto encode_header(const archive_header &header) -> std::expected<header_block, error> {
    if (header.name.size() > NAME_FIELD_SIZE) {
        return std::unexpected(error{error_code::invalid_header,
            std::format("Name field too long: {} bytes (max {})", header.name.size(), NAME_FIELD_SIZE)});
    }
    if (header.path.size() > PATH_FIELD_SIZE) {
        return std::unexpected(error{error_code::invalid_header,
            std::format("Path field too long: {} bytes (max {})", header.path.size(), PATH_FIELD_SIZE)});
    }

    header_block block{};
    const std::span<std::byte, HEADER_SIZE> out{block};

    std::ranges::transform(header.name, out.begin() + NAME_FIELD_OFFSET,
                           [](char c) { return static_cast<std::byte>(c); });
    detail::store_le32(out.subspan<SIZE_FIELD_OFFSET, SIZE_FIELD_SIZE>(), header.size);
    detail::store_le32(out.subspan<MTIME_FIELD_OFFSET, MTIME_FIELD_SIZE>(), header.mtime);
    std::ranges::transform(header.path, out.begin() + PATH_FIELD_OFFSET,
                           [](char c) { return static_cast<std::byte>(c); });

    return block;
}

} // namespace sitepack
