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
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace sitepack {

// Binary record layout: name(255) size(4, LE) mtime(4, LE) path(4112)
constexpr size_t NAME_FIELD_SIZE = 255;
constexpr size_t SIZE_FIELD_SIZE = 4;
constexpr size_t MTIME_FIELD_SIZE = 4;
constexpr size_t PATH_FIELD_SIZE = 4112;

constexpr size_t NAME_FIELD_OFFSET = 0;
constexpr size_t SIZE_FIELD_OFFSET = NAME_FIELD_OFFSET + NAME_FIELD_SIZE;
constexpr size_t MTIME_FIELD_OFFSET = SIZE_FIELD_OFFSET + SIZE_FIELD_SIZE;
constexpr size_t PATH_FIELD_OFFSET = MTIME_FIELD_OFFSET + MTIME_FIELD_SIZE;

constexpr size_t HEADER_SIZE = PATH_FIELD_OFFSET + PATH_FIELD_SIZE;
static_assert(HEADER_SIZE == 4375);

using header_block = std::array<std::byte, HEADER_SIZE>;

// One header record as stored. The string fields hold the raw, still
// percent-encoded bytes with trailing NUL padding removed.
struct archive_header {
    std::string name;
    uint32_t size = 0;
    uint32_t mtime = 0;
    std::string path;
};

// Decode a header record. Any buffer of exactly HEADER_SIZE bytes decodes.
[[nodiscard]] std::expected<archive_header, error> decode_header(std::span<const std::byte> block);

// Exact inverse of decode_header
[[nodiscard]] std::expected<header_block, error> encode_header(const archive_header& header);

namespace detail {

[[nodiscard]] constexpr uint32_t load_le32(std::span<const std::byte, 4> bytes) noexcept {
    return static_cast<uint32_t>(bytes[0])
         | (static_cast<uint32_t>(bytes[1]) << 8)
         | (static_cast<uint32_t>(bytes[2]) << 16)
         | (static_cast<uint32_t>(bytes[3]) << 24);
}

constexpr void store_le32(std::span<std::byte, 4> bytes, const uint32_t value) noexcept {
    bytes[0] = static_cast<std::byte>(value & 0xFF);
    bytes[1] = static_cast<std::byte>((value >> 8) & 0xFF);
    bytes[2] = static_cast<std::byte>((value >> 16) & 0xFF);
    bytes[3] = static_cast<std::byte>((value >> 24) & 0xFF);
}

// Field contents up to the last non-NUL byte
[[nodiscard]] std::string_view extract_field(std::span<const std::byte> field);

} // namespace detail

} // namespace sitepack
