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

/**
 * extract_site - Extracts a site-migration archive into a destination directory.
 *
 * Usage: ./extract_site [options] <archive> <destination>
 *
 *   --verbose          periodic rate lines
 *   --debug            validation details and header dumps
 *   --legacy           older text sentinel vocabulary
 *   --mmap             map the archive instead of reading it
 *   --delay-ms <n>     pause between entries
 *   --log <file>       also append timestamped lines to a log file
 *
 * Exit status: 0 success, 1 usage, 2 empty archive, 3 corrupted archive,
 * 4 unreadable archive or destination.
 */

#include <sitepack/sitepack.hpp>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <optional>
#include <print>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::println(stderr, "Usage: {} [--verbose] [--debug] [--legacy] [--mmap] "
                         "[--delay-ms <n>] [--log <file>] <archive> <destination>", program);
}

} // namespace

int main(int argc, char* argv[]) {
    sitepack::extraction_options options;
    std::optional<std::filesystem::path> log_path;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--legacy") {
            options.sentinels = sitepack::text_sentinels::legacy();
        } else if (arg == "--mmap") {
            options.use_mmap = true;
        } else if (arg == "--delay-ms" && i + 1 < argc) {
            const std::string_view value = argv[++i];
            long long delay = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), delay);
            if (ec != std::errc{} || ptr != value.data() + value.size() || delay < 0) {
                std::println(stderr, "Invalid delay: {}", value);
                return 1;
            }
            options.entry_delay = std::chrono::milliseconds{delay};
        } else if (arg == "--log" && i + 1 < argc) {
            log_path = argv[++i];
        } else if (arg.starts_with("--")) {
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path archive{positional[0]};
    const std::filesystem::path destination{positional[1]};

    sitepack::stream_log_sink console{stdout, options.debug};

    std::optional<sitepack::file_log_sink> file_log;
    if (log_path) {
        auto opened = sitepack::file_log_sink::open(*log_path);
        if (!opened) {
            std::println(stderr, "{}", opened.error().message());
            return 1;
        }
        file_log.emplace(std::move(*opened));
    }

    std::optional<sitepack::tee_log_sink> tee;
    sitepack::log_sink* log = &console;
    if (file_log) {
        tee.emplace(console, *file_log);
        log = &*tee;
    }

    const auto outcome = sitepack::extract_archive(archive, destination, *log, options);

    if (outcome.succeeded()) {
        return 0;
    }
    if (outcome.is<sitepack::empty_archive>()) {
        return 2;
    }
    if (outcome.is<sitepack::corrupted_archive>()) {
        return 3;
    }
    return 4;
}
