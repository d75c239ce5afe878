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

#include <catch2/catch_test_macros.hpp>
#include <sitepack/text_reader.hpp>
#include <test_support.hpp>
#include <string>
#include <string_view>

using namespace sitepack;
using namespace sitepack::testing;
using namespace std::string_view_literals;

namespace {

reader_report run_reader(std::string_view text,
                         const fs::path& destination,
                         log_sink& log,
                         const extraction_options& options = {}) {
    const auto data = to_bytes(text);
    memory_mapped_stream stream{data};
    text_container_reader reader{stream, destination, log, options};
    return reader.run();
}

} // namespace

TEST_CASE("Line reader", "[text_reader]") {
    const auto data = to_bytes("ab\ncdefgh\n\nxyz");
    memory_mapped_stream stream{data};
    line_reader lines{stream, 4};

    auto expect = [&lines](std::string_view text, bool starts, bool ends) {
        auto next = lines.next();
        REQUIRE(next.has_value());
        REQUIRE(next->has_value());
        CHECK((*next)->data == text);
        CHECK((*next)->starts_line == starts);
        CHECK((*next)->ends_line == ends);
    };

    expect("ab\n", true, true);
    expect("cdef", true, false);
    expect("gh\n", false, true);
    expect("\n", true, true);
    expect("xyz", true, true);

    auto done = lines.next();
    REQUIRE(done.has_value());
    CHECK_FALSE(done->has_value());
}

TEST_CASE("Line reader propagates stream errors", "[text_reader]") {
    failing_stream stream;
    line_reader lines{stream, 64};

    auto next = lines.next();
    REQUIRE_FALSE(next.has_value());
    CHECK(next.error().code() == error_code::io_error);
}

TEST_CASE("Line trimming", "[text_reader]") {
    CHECK(trim_line("  FILE-END\r\n") == "FILE-END");
    CHECK(trim_line("\tSIZE:12 \n") == "SIZE:12");
    CHECK(trim_line("\0\0ARCHIVE-END\0"sv) == "ARCHIVE-END");
    CHECK(trim_line(" \r\n").empty());
    CHECK(trim_line("").empty());
}

TEST_CASE("Text archive extraction", "[text_reader]") {
    TempDirectory temp;
    memory_log_sink log;
    extraction_options options;
    options.debug = true;

    constexpr std::string_view archive =
        "# Site export v2\n"
        "# generated 2024-03-01\n"
        "FILE-START:index.php\n"
        "SIZE:6\n"
        "hello\n"
        "FILE-END\n"
        "FILE-START:wp-content/notes/a.txt\n"
        "SIZE:18\n"
        "MD5:0123456789abcdef0123456789abcdef\n"
        "line one\n"
        "line two\n"
        "FILE-END\n"
        "FILE-START:empty.txt\n"
        "SIZE:0\n"
        "FILE-END\n"
        "ARCHIVE-END\n"
        "FILE-START:after-end.txt\n"
        "SIZE:1\n"
        "x\n"
        "FILE-END\n";

    auto report = run_reader(archive, temp.path(), log, options);

    CHECK(report.termination == reader_termination::archive_end_marker);
    CHECK(report.clean());
    CHECK(report.stats.files_extracted == 3);
    CHECK(report.stats.bytes_written == 6 + 18);
    CHECK(report.stats.entries_skipped == 0);

    CHECK(read_file(temp.path() / "index.php") == "hello\n");
    CHECK(read_file(temp.path() / "wp-content/notes/a.txt") == "line one\nline two\n");
    CHECK(fs::exists(temp.path() / "empty.txt"));
    CHECK(fs::file_size(temp.path() / "empty.txt") == 0);
    CHECK_FALSE(fs::exists(temp.path() / "after-end.txt"));

    CHECK(log.contains("Skipping header: # Site export v2"));
    CHECK(log.contains("Fallback extraction complete. Extracted 3 files"));
    CHECK_FALSE(log.contains("without an end marker"));
}

TEST_CASE("Legacy sentinel vocabulary", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;
    extraction_options options;
    options.sentinels = text_sentinels::legacy();

    constexpr std::string_view archive =
        "# exported by an older plugin\n"
        "__file__:wp-config.php\n"
        "__size__:11\n"
        "__md5__:d41d8cd98f00b204e9800998ecf8427e\n"
        "define(1);\n"
        "__endfile__\n"
        "__done__\n";

    auto report = run_reader(archive, temp.path(), log, options);

    CHECK(report.termination == reader_termination::archive_end_marker);
    CHECK(report.stats.files_extracted == 1);
    CHECK(read_file(temp.path() / "wp-config.php") == "define(1);\n");
}

TEST_CASE("Missing archive end marker", "[text_reader]") {
    TempDirectory temp;
    memory_log_sink log;

    SECTION("Open file is kept") {
        auto report = run_reader("FILE-START:a.txt\nSIZE:4\nabc\n", temp.path(), log);

        CHECK(report.termination == reader_termination::end_of_stream);
        CHECK(report.clean());
        CHECK(report.stats.files_extracted == 1);
        CHECK(read_file(temp.path() / "a.txt") == "abc\n");
        CHECK(log.contains("Archive ended without an end marker"));
    }

    SECTION("Unterminated final line") {
        auto report = run_reader("FILE-START:a.txt\nSIZE:3\nabc", temp.path(), log);

        CHECK(report.termination == reader_termination::end_of_stream);
        CHECK(read_file(temp.path() / "a.txt") == "abc");
    }

    SECTION("Empty input") {
        auto report = run_reader("", temp.path(), log);

        CHECK(report.termination == reader_termination::end_of_stream);
        CHECK(report.stats.files_extracted == 0);
    }
}

TEST_CASE("Lines outside an entry are discarded", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;

    constexpr std::string_view archive =
        "stray line before any entry\n"
        "FILE-START:a.txt\n"
        "header noise before the size line\n"
        "SIZE:4\n"
        "abc\n"
        "FILE-END\n"
        "between entries\n"
        "ARCHIVE-END\n";

    auto report = run_reader(archive, temp.path(), log);

    CHECK(report.stats.files_extracted == 1);
    CHECK(read_file(temp.path() / "a.txt") == "abc\n");
}

TEST_CASE("Content lines are copied verbatim", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;

    SECTION("Metadata-looking lines after content began") {
        auto report = run_reader(
            "FILE-START:a.txt\nSIZE:10\nfirst\nSIZE: not metadata\n# not a comment\nFILE-END\n",
            temp.path(), log);

        CHECK(report.stats.files_extracted == 1);
        CHECK(read_file(temp.path() / "a.txt") == "first\nSIZE: not metadata\n# not a comment\n");
    }

    SECTION("Metadata-looking lines before the first content line are consumed") {
        // The format has no escaping: a file that starts with SIZE: or MD5:
        // lines loses them
        auto report = run_reader(
            "FILE-START:notes.txt\nSIZE:42\nMD5:0cc175b9c0f1b6a831c399e269772661\nSIZE: 3 apples\nbody\nFILE-END\n",
            temp.path(), log);

        CHECK(report.stats.files_extracted == 1);
        CHECK(read_file(temp.path() / "notes.txt") == "body\n");
    }

    SECTION("A blank first line ends the metadata block") {
        auto report = run_reader("FILE-START:b.txt\nSIZE:9\n\nMD5: kept\nFILE-END\n", temp.path(), log);

        CHECK(report.stats.files_extracted == 1);
        CHECK(read_file(temp.path() / "b.txt") == "\nMD5: kept\n");
    }

    SECTION("CRLF terminators are kept") {
        auto report = run_reader("FILE-START:win.txt\r\nSIZE:5\r\nabc\r\nFILE-END\r\n", temp.path(), log);

        CHECK(report.stats.files_extracted == 1);
        CHECK(read_file(temp.path() / "win.txt") == "abc\r\n");
    }

    SECTION("Blank lines and indentation") {
        auto report = run_reader("FILE-START:a.py\nSIZE:0\n\n    pass\n\nFILE-END\n", temp.path(), log);

        CHECK(read_file(temp.path() / "a.py") == "\n    pass\n\n");
    }
}

TEST_CASE("A content line equal to a sentinel ends the entry", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;

    auto report = run_reader("FILE-START:a.txt\nSIZE:5\nbefore\nFILE-END\nafter\nFILE-END\n", temp.path(), log);

    CHECK(report.stats.files_extracted == 1);
    CHECK(read_file(temp.path() / "a.txt") == "before\n");
}

TEST_CASE("Missing file end marker", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;

    constexpr std::string_view archive =
        "FILE-START:a.txt\nSIZE:4\naaa\n"
        "FILE-START:b.txt\nSIZE:4\nbbb\nFILE-END\n"
        "ARCHIVE-END\n";

    auto report = run_reader(archive, temp.path(), log);

    CHECK(report.stats.files_extracted == 2);
    CHECK(read_file(temp.path() / "a.txt") == "aaa\n");
    CHECK(read_file(temp.path() / "b.txt") == "bbb\n");
}

TEST_CASE("Unsafe text entries are skipped", "[text_reader]") {
    TempDirectory temp;
    const auto site = temp.path() / "www" / "site";
    memory_log_sink log;

    constexpr std::string_view archive =
        "FILE-START:../../escape.txt\nSIZE:5\nevil\nFILE-END\n"
        "FILE-START:ok.txt\nSIZE:3\nok\nFILE-END\n"
        "ARCHIVE-END\n";

    auto report = run_reader(archive, site, log);

    CHECK(report.termination == reader_termination::archive_end_marker);
    CHECK(report.stats.files_extracted == 1);
    CHECK(report.stats.entries_skipped == 1);
    CHECK(read_file(site / "ok.txt") == "ok\n");
    CHECK_FALSE(fs::exists(temp.path() / "escape.txt"));
    CHECK(log.contains("Skipping entry"));
}

TEST_CASE("Output that cannot be created is skipped", "[text_reader]") {
    TempDirectory temp;
    memory_log_sink log;
    fs::create_directories(temp.path() / "uploads");

    constexpr std::string_view archive =
        "FILE-START:uploads\nSIZE:5\nlost\nFILE-END\n"
        "FILE-START:kept.txt\nSIZE:5\nkept\nFILE-END\n"
        "ARCHIVE-END\n";

    auto report = run_reader(archive, temp.path(), log);

    CHECK(report.stats.files_extracted == 1);
    CHECK(report.stats.entries_skipped == 1);
    CHECK(fs::is_directory(temp.path() / "uploads"));
    CHECK(read_file(temp.path() / "kept.txt") == "kept\n");
    CHECK(log.contains("Cannot create file"));
}

TEST_CASE("Long lines arrive in fragments", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;
    extraction_options options;
    options.chunk_size = 32;

    SECTION("Content longer than the chunk size") {
        const std::string long_line = std::string(100, 'q') + "\n";
        const std::string archive = "FILE-START:long.txt\nSIZE:101\n" + long_line + "FILE-END\nARCHIVE-END\n";

        auto report = run_reader(archive, temp.path(), log, options);

        CHECK(report.termination == reader_termination::archive_end_marker);
        CHECK(read_file(temp.path() / "long.txt") == long_line);
    }

    SECTION("Only whole lines are sentinels") {
        const std::string padded = std::string(40, ' ') + "FILE-END\n";
        const std::string archive = "FILE-START:pad.txt\nSIZE:49\n" + padded + "FILE-END\nARCHIVE-END\n";

        auto report = run_reader(archive, temp.path(), log, options);

        CHECK(report.stats.files_extracted == 1);
        CHECK(read_file(temp.path() / "pad.txt") == padded);
    }

    SECTION("Long preamble comments are skipped whole") {
        const std::string archive = "# " + std::string(60, 'c') + "\nFILE-START:a.txt\nSIZE:2\nz\nFILE-END\n";

        auto report = run_reader(archive, temp.path(), log, options);

        CHECK(report.stats.files_extracted == 1);
        CHECK(read_file(temp.path() / "a.txt") == "z\n");
    }
}

TEST_CASE("Reader state", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;
    extraction_options options;

    const auto data = to_bytes("FILE-START:a.txt\nSIZE:1\n");
    memory_mapped_stream stream{data};
    text_container_reader reader{stream, temp.path(), log, options};

    CHECK(reader.current_state() == text_container_reader::state::skip_preamble);
    auto report = reader.run();
    CHECK(report.termination == reader_termination::end_of_stream);
    CHECK(reader.current_state() == text_container_reader::state::content_phase);
    CHECK(reader.stats().files_extracted == 1);
}

TEST_CASE("Text stream failure", "[text_reader]") {
    TempDirectory temp;
    null_log_sink log;
    failing_stream stream;
    extraction_options options;

    text_container_reader reader{stream, temp.path(), log, options};
    auto report = reader.run();

    CHECK(report.termination == reader_termination::io_failure);
    REQUIRE(report.cause.has_value());
    CHECK(report.cause->code() == error_code::io_error);
}
