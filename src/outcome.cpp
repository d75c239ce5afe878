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

#include <sitepack/outcome.hpp>
#include <format>

namespace sitepack {

auto extraction_outcome::from_report(const reader_report &report, const archive_format format,
                                     const std::chrono::duration<double> elapsed) -> extraction_outcome {
    const auto& stats = report.stats;

    switch (report.termination) {
        case reader_termination::end_of_archive:
        case reader_termination::archive_end_marker:
        case reader_termination::end_of_stream:
            if (stats.files_extracted == 0) {
                return extraction_outcome{empty_archive{}, format, stats, elapsed};
            }
            return extraction_outcome{
                extraction_success{stats.files_extracted, stats.bytes_written, elapsed},
                format, stats, elapsed};

        case reader_termination::corrupted:
            return extraction_outcome{
                corrupted_archive{stats.files_extracted,
                    report.cause.value_or(error{error_code::corrupt_archive, "Archive is corrupted"})},
                format, stats, elapsed};

        case reader_termination::io_failure:
            break;
    }

    return extraction_outcome{
        fatal_io{report.cause.value_or(error{error_code::io_error, "Archive read failed"})},
        format, stats, elapsed};
}

std::string extraction_outcome::describe() const {
    return std::visit([this](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, extraction_success>) {
            return std::format("Extracted {} files ({} bytes) in {:.2f} seconds",
                               value.files, value.bytes, value.elapsed.count());
        } else if constexpr (std::is_same_v<T, empty_archive>) {
            return std::format("No files extracted from {} archive",
                               format_ ? to_string(*format_) : "unknown");
        } else if constexpr (std::is_same_v<T, corrupted_archive>) {
            return std::format("Archive corrupted after {} files: {}",
                               value.files_written, value.cause.message());
        } else {
            return std::format("Archive could not be read: {}", value.cause.message());
        }
    }, value_);
}

} // namespace sitepack
