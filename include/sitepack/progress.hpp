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

#include <sitepack/log.hpp>
#include <sitepack/options.hpp>
#include <chrono>

namespace sitepack {

// Periodic progress events and the optional inter-entry throttle
class progress_reporter {
private:
    log_sink* log_;
    const extraction_options* options_;
    std::chrono::steady_clock::time_point start_;

public:
    progress_reporter(log_sink& log, const extraction_options& options)
        : log_(&log), options_(&options), start_(std::chrono::steady_clock::now()) {}

    // Called once per extracted file with the running total
    void file_extracted(size_t files_extracted);

    // Sleep for the configured entry delay, if any
    void throttle() const;

    [[nodiscard]] std::chrono::duration<double> elapsed() const {
        return std::chrono::steady_clock::now() - start_;
    }
};

} // namespace sitepack
