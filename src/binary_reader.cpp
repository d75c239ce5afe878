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

#include <sitepack/binary_reader.hpp>
#include <sitepack/path_codec.hpp>
#include <algorithm>
#include <format>
#include <fstream>

namespace sitepack {

namespace {

constexpr size_t HEADER_DUMP_BYTES = 32;

[[nodiscard]] reader_report make_failure(const extraction_stats& stats, error cause) {
    const auto termination = cause.code() == error_code::io_error
        ? reader_termination::io_failure
        : reader_termination::corrupted;
    return reader_report{termination, stats, std::move(cause)};
}

} // namespace

binary_container_reader::binary_container_reader(input_stream &stream,
                                                 std::filesystem::path destination,
                                                 log_sink &log,
                                                 const extraction_options &options,
                                                 const std::chrono::system_clock::time_point now)
    : stream_(&stream)
    , destination_(std::move(destination))
    , log_(&log)
    , options_(&options)
    , now_(now)
    , progress_(log, options)
    , chunk_(std::max<size_t>(options.chunk_size, 1)) {}

auto binary_container_reader::read_header() -> std::expected<std::optional<header_block>, error> {
    header_block block{};
    auto result = read_fully(*stream_, block);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (*result == 0) {
        return std::nullopt;
    }

    // Only a clean end of stream may fall on a record boundary
    if (*result != HEADER_SIZE) {
        log_->error(std::format("Incomplete block at end of file ({} of {} bytes), stopping extraction",
                                *result, HEADER_SIZE));
        return std::unexpected(error{error_code::corrupt_archive,
            std::format("Incomplete block at end of file: {} of {} bytes", *result, HEADER_SIZE)});
    }

    return block;
}

auto binary_container_reader::skip_payload(const size_t bytes) -> std::expected<void, error> {
    if (bytes == 0) {
        return {};
    }

    // Once a skip comes up short the next header boundary is unknown
    if (auto result = stream_->skip(bytes); !result) {
        return std::unexpected(error{error_code::corrupt_archive,
            std::format("Cannot skip {} bytes of payload: {}", bytes, result.error().message())});
    }
    return {};
}

void binary_container_reader::apply_timestamp(const std::filesystem::path &target, const archive_entry &entry) {
    const auto file_time = std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::chrono::file_clock::from_sys(entry.modification_time()));

    std::error_code ec;
    std::filesystem::last_write_time(target, file_time, ec);
    if (ec) {
        log_->warning(std::format("Cannot set modification time of {}: {}", target.string(), ec.message()));
    }
}

void binary_container_reader::dump_header(const header_block &block) {
    if (!options_->debug) {
        return;
    }

    std::string hex;
    hex.reserve(HEADER_DUMP_BYTES * 2);
    for (const auto byte : std::span{block}.first<HEADER_DUMP_BYTES>()) {
        hex += std::format("{:02x}", static_cast<unsigned>(byte));
    }
    log_->debug("Block hex data: " + hex);
}

auto binary_container_reader::stream_payload(const archive_entry &entry,
                                             const std::filesystem::path &target,
                                             const std::string &relative) -> std::expected<void, error> {
    size_t remaining = entry.size();
    uint64_t written = 0;
    std::error_code ec;

    std::ofstream file{target, std::ios::binary | std::ios::trunc};
    if (!file) {
        log_->error("Cannot create file: " + target.string());
        ++stats_.entries_skipped;
        return skip_payload(remaining);
    }

    while (remaining > 0) {
        const size_t wanted = std::min(chunk_.size(), remaining);
        auto result = stream_->read(std::span{chunk_.data(), wanted});
        if (!result) {
            return std::unexpected(result.error());
        }

        if (*result == 0) {
            log_->error("Unexpected end of archive while reading: " + relative);
            return std::unexpected(error{error_code::corrupt_archive,
                std::format("Payload of {} truncated: {} of {} bytes", relative, written, entry.size())});
        }
        remaining -= *result;

        file.write(reinterpret_cast<const char*>(chunk_.data()), static_cast<std::streamsize>(*result));
        if (!file) {
            log_->error("Error writing file content for: " + relative);
            file.close();
            std::filesystem::remove(target, ec);
            ++stats_.entries_skipped;
            return skip_payload(remaining);
        }
        written += *result;
    }

    file.close();
    if (file.fail()) {
        log_->error("Error writing file content for: " + relative);
        std::filesystem::remove(target, ec);
        ++stats_.entries_skipped;
        return {};
    }

    stats_.bytes_written += written;
    ++stats_.files_extracted;
    return {};
}

auto binary_container_reader::extract_entry(const archive_entry &entry) -> std::expected<void, error> {
    auto relative = sanitize_relative(entry.path(), entry.name());
    if (!relative) {
        log_->error("Skipping entry: " + relative.error().message());
        ++stats_.entries_skipped;
        return skip_payload(entry.size());
    }

    const auto target = destination_ / std::filesystem::path{*relative};

    if (options_->debug) {
        log_->debug(std::format("Processing: {} (Size: {} bytes)", *relative, entry.size()));
    }

    std::error_code ec;
    const auto parent = target.parent_path();
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        log_->error(std::format("Failed to create directory: {} ({})", parent.string(), ec.message()));
        ++stats_.entries_skipped;
        return skip_payload(entry.size());
    }

    const size_t files_before = stats_.files_extracted;

    if (entry.empty()) {
        std::ofstream file{target, std::ios::binary | std::ios::trunc};
        if (!file) {
            log_->error("Cannot create file: " + target.string());
            ++stats_.entries_skipped;
            return {};
        }
        file.close();
        ++stats_.files_extracted;
    } else if (auto result = stream_payload(entry, target, *relative); !result) {
        return std::unexpected(result.error());
    }

    if (stats_.files_extracted == files_before) {
        return {};
    }

    apply_timestamp(target, entry);
    progress_.file_extracted(stats_.files_extracted);
    return {};
}

reader_report binary_container_reader::run() {
    log_->info("Starting binary archive extraction...");

    while (true) {
        auto block = read_header();
        if (!block) {
            return make_failure(stats_, block.error());
        }

        if (!*block) {
            break;
        }

        auto header = decode_header(**block);
        if (!header) {
            log_->error("Failed to unpack binary block, stopping extraction");
            dump_header(**block);
            return make_failure(stats_, error{error_code::corrupt_archive, header.error().message()});
        }

        auto entry = archive_entry::from_header(*header, now_);
        if (!entry) {
            log_->error("Invalid file data detected, stopping extraction: " + entry.error().message());
            if (options_->debug) {
                log_->debug(std::format("File: '{}', Size: {}, Date: {}, Path: '{}'",
                                        header->name, header->size, header->mtime, header->path));
            }
            dump_header(**block);
            return make_failure(stats_, error{error_code::corrupt_archive, entry.error().message()});
        }

        if (auto result = extract_entry(*entry); !result) {
            return make_failure(stats_, result.error());
        }

        progress_.throttle();
    }

    log_->info(std::format("Binary extraction complete. Extracted {} files in {:.2f} seconds",
                           stats_.files_extracted, progress_.elapsed().count()));

    return reader_report{reader_termination::end_of_archive, stats_, std::nullopt};
}

} // namespace sitepack
