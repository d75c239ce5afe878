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
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace sitepack {

// Trim NUL padding, drop stray NUL bytes, percent-decode. Fails with
// malformed_path if the decoded text contains a NUL (an encoded %00).
[[nodiscard]] std::expected<std::string, error> decode_field(std::string_view raw);

// Decode %XX escapes. Malformed escapes are kept as-is; '+' is literal.
[[nodiscard]] std::string percent_decode(std::string_view encoded);

// Escape every byte outside [A-Za-z0-9-_.~] as %XX
[[nodiscard]] std::string percent_encode(std::string_view text);

// Join a stored directory and file name below root. Leading separators
// are dropped; any ".." component is rejected with unsafe_path.
[[nodiscard]] std::expected<std::filesystem::path, error> resolve(
    const std::filesystem::path& root,
    std::string_view relative_path,
    std::string_view name);

// Relative form of resolve(): the sanitized "dir/name" below the root
[[nodiscard]] std::expected<std::string, error> sanitize_relative(
    std::string_view relative_path,
    std::string_view name);

} // namespace sitepack
