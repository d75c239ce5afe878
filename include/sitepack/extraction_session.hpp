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

#include <sitepack/format_detector.hpp>
#include <sitepack/log.hpp>
#include <sitepack/options.hpp>
#include <sitepack/outcome.hpp>
#include <sitepack/stream.hpp>
#include <filesystem>

namespace sitepack {

// One extraction run: detect the container format from the first header
// record, drive the matching reader to the end and classify the result.
//
// The only fallback is at the whole-archive level (binary, else text);
// nothing is retried.
class extraction_session {
private:
    std::filesystem::path destination_;
    log_sink* log_;
    extraction_options options_;

    void log_inspection(const header_inspection& inspection);
    void log_outcome(const extraction_outcome& outcome);

public:
    extraction_session(std::filesystem::path destination, log_sink& log, extraction_options options = {});

    // Consume the stream from its current position
    [[nodiscard]] extraction_outcome run(input_stream& stream);

    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }
    [[nodiscard]] const extraction_options& options() const noexcept { return options_; }
};

} // namespace sitepack
