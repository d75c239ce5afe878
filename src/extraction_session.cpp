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

#include <sitepack/extraction_session.hpp>
#include <sitepack/binary_reader.hpp>
#include <sitepack/header_codec.hpp>
#include <sitepack/text_reader.hpp>
#include <chrono>
#include <format>
#include <vector>

namespace sitepack {

namespace {

[[nodiscard]] constexpr std::string_view yes_no(const bool value) noexcept {
    return value ? "YES" : "NO";
}

} // namespace

extraction_session::extraction_session(std::filesystem::path destination, log_sink &log, extraction_options options)
    : destination_(std::move(destination)), log_(&log), options_(std::move(options)) {}

void extraction_session::log_inspection(const header_inspection &inspection) {
    if (!options_.debug) {
        return;
    }

    if (!inspection.complete_record) {
        log_->debug(std::format("Archive too small for binary format: {} bytes (need {})",
                                inspection.available, HEADER_SIZE));
        return;
    }

    log_->debug(std::format("Binary detection - File: '{}', Size: {}, Date: {}, Path: '{}'",
                            inspection.name, inspection.size, inspection.mtime, inspection.path));
    log_->debug(std::format("Binary format validation result: {}",
                            inspection.looks_binary() ? "PASSED" : "FAILED"));

    if (!inspection.looks_binary()) {
        log_->debug("Validation details:");
        log_->debug(std::format("- Filename not empty: {}", yes_no(inspection.name_present)));
        log_->debug(std::format("- Filename length OK: {}", yes_no(inspection.name_length_ok)));
        log_->debug(std::format("- File size valid: {}", yes_no(inspection.size_ok)));
        log_->debug(std::format("- Date valid: {}", yes_no(inspection.mtime_ok)));
        log_->debug(std::format("- Path length OK: {}", yes_no(inspection.path_length_ok)));
        log_->debug(std::format("- No control characters: {}", yes_no(inspection.no_control_chars)));
        log_->debug(std::format("- Filename pattern OK: {}", yes_no(inspection.name_pattern_ok)));
    }
}

void extraction_session::log_outcome(const extraction_outcome &outcome) {
    if (outcome.succeeded()) {
        log_->info(outcome.describe());
    } else if (outcome.is<empty_archive>()) {
        log_->error("No files were extracted; the archive is empty, truncated or in an unexpected format");
    } else if (outcome.is<corrupted_archive>()) {
        log_->error(outcome.describe());
        log_->error(std::format("Destination {} holds a partial extraction", destination_.string()));
    } else {
        log_->error(outcome.describe());
    }

    if (outcome.stats().entries_skipped > 0) {
        log_->warning(std::format("{} entries were skipped", outcome.stats().entries_skipped));
    }
}

extraction_outcome extraction_session::run(input_stream &stream) {
    const auto started = std::chrono::steady_clock::now();

    log_->info("=== Site Migration Extraction Started ===");
    log_->info("Destination: " + destination_.string());

    std::error_code ec;
    std::filesystem::create_directories(destination_, ec);
    if (ec) {
        auto outcome = extraction_outcome::input_failure(error{error_code::io_error,
            std::format("Cannot create destination {}: {}", destination_.string(), ec.message())});
        log_outcome(outcome);
        return outcome;
    }

    std::vector<std::byte> prefix(HEADER_SIZE);
    auto read = read_fully(stream, prefix);
    if (!read) {
        auto outcome = extraction_outcome::input_failure(read.error());
        log_outcome(outcome);
        return outcome;
    }
    prefix.resize(*read);

    const auto now = std::chrono::system_clock::now();
    const auto inspection = inspect_header(prefix, now);
    log_inspection(inspection);

    const auto format = inspection.looks_binary() ? archive_format::binary : archive_format::text;
    if (format == archive_format::binary) {
        log_->info("Detected binary archive format (4375-byte headers)");
    } else {
        log_->info("Detected text archive format, using fallback method");
    }

    replay_stream replay{std::move(prefix), stream};

    const auto report = format == archive_format::binary
        ? binary_container_reader{replay, destination_, *log_, options_, now}.run()
        : text_container_reader{replay, destination_, *log_, options_}.run();

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    auto outcome = extraction_outcome::from_report(report, format, elapsed);

    log_outcome(outcome);
    log_->info("=== Site Migration Extraction Finished ===");

    return outcome;
}

} // namespace sitepack
