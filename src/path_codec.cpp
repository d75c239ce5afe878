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

#include <sitepack/path_codec.hpp>
#include <algorithm>
#include <ranges>

namespace sitepack {

namespace {

constexpr char separator = '/';

[[nodiscard]] constexpr int hex_value(const char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[nodiscard]] constexpr bool is_unreserved(const unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

std::string percent_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());

    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            const int high = hex_value(encoded[i + 1]);
            const int low = hex_value(encoded[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(encoded[i]);
    }

    return decoded;
}

std::string percent_encode(std::string_view text) {
    static constexpr char digits[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(text.size());

    for (const char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (is_unreserved(byte)) {
            encoded.push_back(c);
        } else {
            encoded.push_back('%');
            encoded.push_back(digits[byte >> 4]);
            encoded.push_back(digits[byte & 0x0F]);
        }
    }

    return encoded;
}

auto decode_field(std::string_view raw) -> std::expected<std::string, error> {
    // NUL padding may sit on either side of the stored text
    const auto first = raw.find_first_not_of('\0');
    if (first == std::string_view::npos) {
        return std::string{};
    }
    raw = raw.substr(first, raw.find_last_not_of('\0') - first + 1);

    std::string stored{raw};
    std::erase(stored, '\0');

    std::string decoded = percent_decode(stored);
    if (decoded.find('\0') != std::string::npos) {
        return std::unexpected(error{error_code::malformed_path,
            "Decoded field contains an embedded NUL byte"});
    }

    return decoded;
}

auto sanitize_relative(std::string_view relative_path, std::string_view name) -> std::expected<std::string, error> {
    std::string joined;
    joined.reserve(relative_path.size() + name.size() + 1);
    joined.append(relative_path);
    joined.push_back(separator);
    joined.append(name);

    std::string sanitized;
    sanitized.reserve(joined.size());

    for (const auto component : joined | std::views::split(separator)) {
        const std::string_view part{component.begin(), component.end()};
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            return std::unexpected(error{error_code::unsafe_path,
                "Path escapes the destination root: " + joined});
        }
        if (!sanitized.empty()) {
            sanitized.push_back(separator);
        }
        sanitized.append(part);
    }

    if (sanitized.empty()) {
        return std::unexpected(error{error_code::unsafe_path, "Entry resolves to an empty path"});
    }

    return sanitized;
}

auto resolve(const std::filesystem::path &root, std::string_view relative_path, std::string_view name)
    -> std::expected<std::filesystem::path, error> {
    auto relative = sanitize_relative(relative_path, name);
    if (!relative) {
        return std::unexpected(relative.error());
    }

    return root / std::filesystem::path{*relative};
}

} // namespace sitepack
