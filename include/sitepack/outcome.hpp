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
#include <sitepack/format_detector.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sitepack {

struct extraction_stats {
    size_t files_extracted = 0;
    uint64_t bytes_written = 0;
    size_t entries_skipped = 0;
};

// How a container reader stopped
enum class reader_termination {
    end_of_archive,      // binary: clean end of stream at a record boundary
    archive_end_marker,  // text: archive-end sentinel reached
    end_of_stream,       // text: input ran out without the archive-end sentinel
    corrupted,           // structural violation, extraction aborted
    io_failure           // the input stream itself failed
};

struct reader_report {
    reader_termination termination = reader_termination::end_of_archive;
    extraction_stats stats;
    std::optional<error> cause;

    [[nodiscard]] bool clean() const noexcept {
        return termination != reader_termination::corrupted &&
               termination != reader_termination::io_failure;
    }
};

struct extraction_success {
    size_t files = 0;
    uint64_t bytes = 0;
    std::chrono::duration<double> elapsed{};
};

// Reader finished cleanly without producing a single file
struct empty_archive {};

// Extraction stopped on a structural violation; files_written entries are
// on disk and the destination is incomplete
struct corrupted_archive {
    size_t files_written = 0;
    error cause;
};

struct fatal_io {
    error cause;
};

class extraction_outcome {
public:
    using value_type = std::variant<extraction_success, empty_archive, corrupted_archive, fatal_io>;

private:
    value_type value_;
    std::optional<archive_format> format_;
    extraction_stats stats_;
    std::chrono::duration<double> elapsed_{};

public:
    extraction_outcome(value_type value,
                       std::optional<archive_format> format,
                       extraction_stats stats,
                       std::chrono::duration<double> elapsed)
        : value_(std::move(value)), format_(format), stats_(stats), elapsed_(elapsed) {}

    // Map a reader's terminal state to the session outcome
    [[nodiscard]] static extraction_outcome from_report(
        const reader_report& report,
        archive_format format,
        std::chrono::duration<double> elapsed);

    [[nodiscard]] static extraction_outcome input_failure(error cause) {
        return extraction_outcome{fatal_io{std::move(cause)}, std::nullopt, {}, {}};
    }

    [[nodiscard]] const value_type& value() const noexcept { return value_; }

    template<typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(value_); }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&value_); }

    [[nodiscard]] bool succeeded() const noexcept { return is<extraction_success>(); }

    // Format chosen by detection; empty when the archive never opened
    [[nodiscard]] const std::optional<archive_format>& format() const noexcept { return format_; }
    [[nodiscard]] const extraction_stats& stats() const noexcept { return stats_; }
    [[nodiscard]] std::chrono::duration<double> elapsed() const noexcept { return elapsed_; }

    // One-line human-readable summary
    [[nodiscard]] std::string describe() const;
};

} // namespace sitepack
