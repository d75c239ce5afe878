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

#include <sitepack/progress.hpp>
#include <algorithm>
#include <format>
#include <thread>

namespace sitepack {

void progress_reporter::file_extracted(const size_t files_extracted) {
    if (options_->progress_interval > 0 && files_extracted % options_->progress_interval == 0) {
        log_->info(std::format("Extracted {} files...", files_extracted));
    }

    if (options_->verbose && options_->verbose_interval > 0 &&
        files_extracted % options_->verbose_interval == 0) {
        const double seconds = std::max(elapsed().count(), 1.0);
        log_->info(std::format("Progress: {} files extracted ({:.2f} files/sec)",
                               files_extracted, static_cast<double>(files_extracted) / seconds));
    }
}

void progress_reporter::throttle() const {
    if (options_->entry_delay.count() > 0) {
        std::this_thread::sleep_for(options_->entry_delay);
    }
}

} // namespace sitepack
