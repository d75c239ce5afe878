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

/**
 * inspect_header - Shows how the first header record of an archive is
 * classified, check by check.
 *
 * Usage: ./inspect_header <archive>
 */

#include <sitepack/sitepack.hpp>
#include <array>
#include <chrono>
#include <print>

namespace {

const char* mark(bool ok) {
    return ok ? "ok" : "FAILED";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::println(stderr, "Usage: {} <archive>", argv[0]);
        return 1;
    }

    auto stream = sitepack::file_stream::open(argv[1]);
    if (!stream) {
        std::println(stderr, "Failed to open archive: {}", stream.error().message());
        return 1;
    }

    sitepack::header_block block{};
    auto read = sitepack::read_fully(*stream, block);
    if (!read) {
        std::println(stderr, "Failed to read archive: {}", read.error().message());
        return 1;
    }

    const auto inspection = sitepack::inspect_header(std::span{block}.first(*read),
                                                     std::chrono::system_clock::now());

    std::println("Bytes available: {} (record is {})", inspection.available, sitepack::HEADER_SIZE);
    if (inspection.decoded) {
        std::println("Name:  '{}'", inspection.name);
        std::println("Path:  '{}'", inspection.path);
        std::println("Size:  {}", inspection.size);
        std::println("Mtime: {}", inspection.mtime);
        std::println("");
        std::println("  name present        {}", mark(inspection.name_present));
        std::println("  name length         {}", mark(inspection.name_length_ok));
        std::println("  size below 1 GiB    {}", mark(inspection.size_ok));
        std::println("  timestamp window    {}", mark(inspection.mtime_ok));
        std::println("  path length         {}", mark(inspection.path_length_ok));
        std::println("  no control chars    {}", mark(inspection.no_control_chars));
        std::println("  filename characters {}", mark(inspection.name_pattern_ok));
        std::println("");
    }

    const auto format = inspection.looks_binary() ? sitepack::archive_format::binary
                                                  : sitepack::archive_format::text;
    std::println("Format: {}", sitepack::to_string(format));
    return 0;
}
