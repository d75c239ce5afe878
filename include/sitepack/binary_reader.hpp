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

#include <sitepack/archive_entry.hpp>
#include <sitepack/error.hpp>
#include <sitepack/header_codec.hpp>
#include <sitepack/log.hpp>
#include <sitepack/options.hpp>
#include <sitepack/outcome.hpp>
#include <sitepack/progress.hpp>
#include <sitepack/stream.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <vector>

namespace sitepack {

// Sequential extractor for the binary container:
// [4375-byte header][payload] records until a clean end of stream.
//
// Structural problems (invalid fields, a torn header record, truncated
// payload, a skip that cannot advance) end extraction as corrupted.
// Filesystem problems skip the single affected entry and keep the
// stream aligned.
class binary_container_reader {
private:
    input_stream* stream_;
    std::filesystem::path destination_;
    log_sink* log_;
    const extraction_options* options_;
    std::chrono::system_clock::time_point now_;
    progress_reporter progress_;
    extraction_stats stats_;
    std::vector<std::byte> chunk_;

    // Read one header record; nullopt at a clean end of stream, corrupt_archive
    // when the stream ends inside a record
    [[nodiscard]] std::expected<std::optional<header_block>, error> read_header();

    // Write one validated entry; errors returned here end extraction
    [[nodiscard]] std::expected<void, error> extract_entry(const archive_entry& entry);

    // Copy the payload to target in fixed-size chunks
    [[nodiscard]] std::expected<void, error> stream_payload(
        const archive_entry& entry,
        const std::filesystem::path& target,
        const std::string& relative);

    // Advance past bytes of payload without reading them
    [[nodiscard]] std::expected<void, error> skip_payload(size_t bytes);

    void apply_timestamp(const std::filesystem::path& target, const archive_entry& entry);

    void dump_header(const header_block& block);

public:
    binary_container_reader(input_stream& stream,
                            std::filesystem::path destination,
                            log_sink& log,
                            const extraction_options& options,
                            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Extract until the archive ends or a terminal error occurs
    [[nodiscard]] reader_report run();

    [[nodiscard]] const extraction_stats& stats() const noexcept { return stats_; }
};

} // namespace sitepack
