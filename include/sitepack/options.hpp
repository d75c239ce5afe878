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

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace sitepack {

// Marker lines of the text container. Matching is done on the line with
// surrounding whitespace removed.
struct text_sentinels {
    std::string comment_prefix = "#";
    std::string file_start = "FILE-START:";
    std::vector<std::string> metadata_prefixes = {"SIZE:", "MD5:"};
    std::string file_end = "FILE-END";
    std::string archive_end = "ARCHIVE-END";

    // Vocabulary written by older exporters
    [[nodiscard]] static text_sentinels legacy() {
        return text_sentinels{
            .comment_prefix = "#",
            .file_start = "__file__:",
            .metadata_prefixes = {"__size__:", "__md5__:"},
            .file_end = "__endfile__",
            .archive_end = "__done__",
        };
    }
};

struct extraction_options {
    // Payload copy size and longest line fragment held in memory
    size_t chunk_size = 512 * 1024;

    // Emit "Extracted N files..." every this many files (0 disables)
    size_t progress_interval = 100;

    // Rate reporting, only when verbose
    bool verbose = false;
    size_t verbose_interval = 50;

    // Emit debug-only diagnostics (header dumps, validation details)
    bool debug = false;

    // Pause between entries to throttle host I/O
    std::chrono::milliseconds entry_delay{0};

    text_sentinels sentinels;

    // extract_archive() maps the archive instead of reading it (Linux only)
    bool use_mmap = false;
};

} // namespace sitepack
