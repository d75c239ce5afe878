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
#include <sitepack/log.hpp>
#include <sitepack/options.hpp>
#include <sitepack/outcome.hpp>
#include <sitepack/progress.hpp>
#include <sitepack/stream.hpp>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sitepack {

// Piece of a line, terminator included when present. Lines longer than
// the fragment limit arrive as several fragments.
struct line_fragment {
    std::string data;
    bool starts_line = true;
    bool ends_line = true;

    [[nodiscard]] bool whole_line() const noexcept { return starts_line && ends_line; }
};

// Splits a byte stream into '\n'-terminated lines without holding more
// than max_fragment bytes of any one line
class line_reader {
private:
    static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

    input_stream* stream_;
    std::vector<std::byte> buffer_;
    size_t begin_ = 0;
    size_t end_ = 0;
    size_t max_fragment_;
    bool eof_ = false;
    bool at_line_start_ = true;

    [[nodiscard]] std::expected<void, error> fill();

public:
    line_reader(input_stream& stream, size_t max_fragment);

    // Next fragment, or nullopt once the stream is exhausted
    [[nodiscard]] std::expected<std::optional<line_fragment>, error> next();
};

// Remove leading and trailing whitespace (and NUL) the way the sentinel
// matcher sees a line
[[nodiscard]] std::string_view trim_line(std::string_view line) noexcept;

// Line-oriented extractor for the sentinel-delimited text container.
//
// Sentinels are recognized on whole lines only. Content lines are copied
// byte for byte, terminators included. A content line that equals the
// file-start, file-end or archive-end marker still ends the entry; the
// format has no escaping.
class text_container_reader {
public:
    enum class state {
        skip_preamble,
        idle,
        header_phase,
        content_phase
    };

private:
    line_reader lines_;
    std::filesystem::path destination_;
    log_sink* log_;
    const extraction_options* options_;
    progress_reporter progress_;
    extraction_stats stats_;
    state state_ = state::skip_preamble;
    bool discarding_comment_ = false;

    std::optional<std::filesystem::path> current_target_;
    std::string current_relative_;
    std::ofstream output_;
    bool output_open_ = false;
    bool content_started_ = false;
    uint64_t output_bytes_ = 0;

    void begin_file(std::string_view stored_path);
    void open_output();
    void write_content(std::string_view data);
    void close_output();
    void abandon_output();

    // True if the line was a sentinel and has been handled
    [[nodiscard]] bool handle_sentinel(std::string_view line, bool& archive_end);

public:
    text_container_reader(input_stream& stream,
                          std::filesystem::path destination,
                          log_sink& log,
                          const extraction_options& options);

    // Extract until the archive-end sentinel or the end of the stream
    [[nodiscard]] reader_report run();

    [[nodiscard]] state current_state() const noexcept { return state_; }
    [[nodiscard]] const extraction_stats& stats() const noexcept { return stats_; }
};

} // namespace sitepack
