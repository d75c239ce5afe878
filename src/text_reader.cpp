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

#include <sitepack/text_reader.hpp>
#include <sitepack/path_codec.hpp>
#include <algorithm>
#include <format>

namespace sitepack {

// line_reader implementation
line_reader::line_reader(input_stream &stream, const size_t max_fragment)
    : stream_(&stream)
    , buffer_(READ_BUFFER_SIZE)
    , max_fragment_(std::max<size_t>(max_fragment, 1)) {}

auto line_reader::fill() -> std::expected<void, error> {
    begin_ = 0;
    end_ = 0;

    auto result = stream_->read(buffer_);
    if (!result) {
        return std::unexpected(result.error());
    }

    end_ = *result;
    if (*result == 0) {
        eof_ = true;
    }
    return {};
}

auto line_reader::next() -> std::expected<std::optional<line_fragment>, error> {
    if (eof_ && begin_ == end_) {
        return std::nullopt;
    }

    line_fragment fragment;
    fragment.starts_line = at_line_start_;
    fragment.ends_line = false;

    while (fragment.data.size() < max_fragment_) {
        if (begin_ == end_) {
            if (eof_) {
                break;
            }
            if (auto result = fill(); !result) {
                return std::unexpected(result.error());
            }
            if (begin_ == end_) {
                break;
            }
        }

        const size_t room = max_fragment_ - fragment.data.size();
        const size_t available = std::min(end_ - begin_, room);
        const std::string_view window{reinterpret_cast<const char*>(buffer_.data() + begin_), available};

        if (const auto newline = window.find('\n'); newline != std::string_view::npos) {
            fragment.data.append(window.substr(0, newline + 1));
            begin_ += newline + 1;
            fragment.ends_line = true;
            break;
        }

        fragment.data.append(window);
        begin_ += available;
    }

    if (fragment.data.empty()) {
        return std::nullopt;
    }

    // An unterminated final line is still a complete line
    if (!fragment.ends_line && eof_ && begin_ == end_) {
        fragment.ends_line = true;
    }

    at_line_start_ = fragment.ends_line;
    return fragment;
}

std::string_view trim_line(std::string_view line) noexcept {
    constexpr std::string_view whitespace{" \t\n\r\v\0", 6};

    const auto first = line.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = line.find_last_not_of(whitespace);
    return line.substr(first, last - first + 1);
}

// text_container_reader implementation
text_container_reader::text_container_reader(input_stream &stream,
                                             std::filesystem::path destination,
                                             log_sink &log,
                                             const extraction_options &options)
    : lines_(stream, options.chunk_size)
    , destination_(std::move(destination))
    , log_(&log)
    , options_(&options)
    , progress_(log, options) {}

void text_container_reader::begin_file(std::string_view stored_path) {
    if (output_open_) {
        if (options_->debug) {
            log_->debug("Missing end marker for " + current_relative_ + ", closing it");
        }
    }
    close_output();

    const auto path_text = trim_line(stored_path);
    auto relative = sanitize_relative({}, path_text);
    if (!relative) {
        log_->error("Skipping entry: " + relative.error().message());
        ++stats_.entries_skipped;
        state_ = state::idle;
        return;
    }

    auto target = destination_ / std::filesystem::path{*relative};

    std::error_code ec;
    const auto parent = target.parent_path();
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        log_->error(std::format("Failed to create directory: {} ({})", parent.string(), ec.message()));
        ++stats_.entries_skipped;
        state_ = state::idle;
        return;
    }

    current_target_ = std::move(target);
    current_relative_ = std::move(*relative);
    state_ = state::header_phase;
}

void text_container_reader::open_output() {
    state_ = state::content_phase;
    content_started_ = false;

    if (!current_target_) {
        return;
    }

    output_.open(*current_target_, std::ios::binary | std::ios::trunc);
    if (!output_) {
        log_->error("Cannot create file " + current_target_->string());
        ++stats_.entries_skipped;
        output_.clear();
        current_target_.reset();
        return;
    }

    output_open_ = true;
    output_bytes_ = 0;

    if (options_->debug) {
        log_->debug("Processing: " + current_relative_);
    }
}

void text_container_reader::write_content(std::string_view data) {
    content_started_ = true;

    output_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!output_) {
        log_->error("Error writing file content for: " + current_relative_);
        ++stats_.entries_skipped;
        abandon_output();
        return;
    }
    output_bytes_ += data.size();
}

void text_container_reader::close_output() {
    if (!output_open_) {
        current_target_.reset();
        return;
    }

    output_.close();
    output_open_ = false;

    if (output_.fail()) {
        log_->error("Error writing file content for: " + current_relative_);
        ++stats_.entries_skipped;
        output_.clear();
        std::error_code ec;
        std::filesystem::remove(*current_target_, ec);
    } else {
        ++stats_.files_extracted;
        stats_.bytes_written += output_bytes_;
        progress_.file_extracted(stats_.files_extracted);
        progress_.throttle();
    }

    current_target_.reset();
}

void text_container_reader::abandon_output() {
    if (output_open_) {
        output_.close();
        output_.clear();
        output_open_ = false;

        std::error_code ec;
        std::filesystem::remove(*current_target_, ec);
    }
    current_target_.reset();
}

bool text_container_reader::handle_sentinel(std::string_view line, bool &archive_end) {
    const auto& sentinels = options_->sentinels;

    const auto is_metadata = std::ranges::any_of(sentinels.metadata_prefixes,
        [line](const std::string& prefix) { return !prefix.empty() && line.starts_with(prefix); });

    if (!sentinels.file_start.empty() && line.starts_with(sentinels.file_start)) {
        begin_file(line.substr(sentinels.file_start.size()));
        return true;
    }

    if (is_metadata && state_ == state::header_phase) {
        open_output();
        return true;
    }

    // Producers may write several metadata lines (size, then hash) before
    // the first content line
    if (is_metadata && state_ == state::content_phase && !content_started_) {
        return true;
    }

    if (line == sentinels.file_end) {
        close_output();
        state_ = state::idle;
        return true;
    }

    if (line == sentinels.archive_end) {
        close_output();
        state_ = state::idle;
        archive_end = true;
        return true;
    }

    return false;
}

reader_report text_container_reader::run() {
    log_->info("Using fallback text extraction method...");

    const auto& comment_prefix = options_->sentinels.comment_prefix;
    bool archive_end = false;

    while (!archive_end) {
        auto next = lines_.next();
        if (!next) {
            abandon_output();
            return reader_report{reader_termination::io_failure, stats_, next.error()};
        }

        if (!*next) {
            break;
        }
        const auto& fragment = **next;

        if (discarding_comment_) {
            discarding_comment_ = !fragment.ends_line;
            continue;
        }

        if (state_ == state::skip_preamble) {
            const auto trimmed = trim_line(fragment.data);
            if (fragment.starts_line && !comment_prefix.empty() && trimmed.starts_with(comment_prefix)) {
                if (options_->debug) {
                    log_->debug("Skipping header: " + std::string{trimmed});
                }
                discarding_comment_ = !fragment.ends_line;
                continue;
            }
            state_ = state::idle;
        }

        if (fragment.whole_line() && handle_sentinel(trim_line(fragment.data), archive_end)) {
            continue;
        }

        if (state_ == state::content_phase && output_open_) {
            write_content(fragment.data);
        }
    }

    // Whatever was open when the input ran out stands as extracted
    close_output();

    if (!archive_end) {
        log_->warning("Archive ended without an end marker");
    }

    log_->info(std::format("Fallback extraction complete. Extracted {} files in {:.2f} seconds",
                           stats_.files_extracted, progress_.elapsed().count()));

    return reader_report{
        archive_end ? reader_termination::archive_end_marker : reader_termination::end_of_stream,
        stats_,
        std::nullopt};
}

} // namespace sitepack
