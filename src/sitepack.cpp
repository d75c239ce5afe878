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

#include <sitepack/sitepack.hpp>

namespace sitepack {

namespace {

[[nodiscard]] std::expected<std::unique_ptr<random_access_stream>, error> open_stream(
    const std::filesystem::path &path, [[maybe_unused]] const bool use_mmap) {
#ifdef __linux__
    if (use_mmap) {
        auto mapped = mmap_stream::create(path);
        if (!mapped) {
            return std::unexpected(mapped.error());
        }
        return std::make_unique<mmap_stream>(std::move(*mapped));
    }
#endif

    auto file = file_stream::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    return std::make_unique<file_stream>(std::move(*file));
}

} // namespace

auto detect_format(const std::filesystem::path &archive) -> std::expected<archive_format, error> {
    auto stream = file_stream::open(archive);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    return detect_format(*stream);
}

auto extract(input_stream &stream, const std::filesystem::path &destination, log_sink &log,
             const extraction_options &options) -> extraction_outcome {
    extraction_session session{destination, log, options};
    return session.run(stream);
}

auto extract_archive(const std::filesystem::path &archive, const std::filesystem::path &destination,
                     log_sink &log, const extraction_options &options) -> extraction_outcome {
    log.info("Archive File: " + archive.string());

    auto stream = open_stream(archive, options.use_mmap);
    if (!stream) {
        log.error("Cannot open archive: " + stream.error().message());
        return extraction_outcome::input_failure(stream.error());
    }

    return extract(**stream, destination, log, options);
}

} // namespace sitepack
