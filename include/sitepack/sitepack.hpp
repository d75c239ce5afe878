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
#include <sitepack/stream.hpp>
#include <sitepack/log.hpp>
#include <sitepack/options.hpp>
#include <sitepack/header_codec.hpp>
#include <sitepack/path_codec.hpp>
#include <sitepack/archive_entry.hpp>
#include <sitepack/format_detector.hpp>
#include <sitepack/outcome.hpp>
#include <sitepack/extraction_session.hpp>

namespace sitepack {

// Main convenience API
[[nodiscard]] std::expected<archive_format, error> detect_format(const std::filesystem::path& archive);

[[nodiscard]] extraction_outcome extract(input_stream& stream,
                                         const std::filesystem::path& destination,
                                         log_sink& log,
                                         const extraction_options& options = {});

// Open the archive and extract it; an archive that cannot be opened is
// reported as fatal_io before any decoding
[[nodiscard]] extraction_outcome extract_archive(const std::filesystem::path& archive,
                                                 const std::filesystem::path& destination,
                                                 log_sink& log,
                                                 const extraction_options& options = {});

} // namespace sitepack
