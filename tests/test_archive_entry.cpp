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
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sitepack/archive_entry.hpp>
#include <chrono>

using namespace sitepack;

namespace {

const auto now = std::chrono::system_clock::now();

archive_header valid_header() {
    archive_header header;
    header.name = "my%20photo.jpg";
    header.path = "wp-content/uploads/2023";
    header.size = 2048;
    header.mtime = 1700000000;
    return header;
}

} // namespace

TEST_CASE("Valid header becomes an entry", "[archive_entry]") {
    auto entry = archive_entry::from_header(valid_header(), now);
    REQUIRE(entry.has_value());

    CHECK(entry->name() == "my photo.jpg");
    CHECK(entry->path() == "wp-content/uploads/2023");
    CHECK(entry->size() == 2048);
    CHECK(entry->mtime() == 1700000000u);
    CHECK_FALSE(entry->empty());
    CHECK(entry->modification_time() ==
          std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}});
}

TEST_CASE("Invalid headers are rejected", "[archive_entry]") {
    auto header = valid_header();

    SECTION("Empty name") {
        header.name.clear();
        auto entry = archive_entry::from_header(header, now);
        REQUIRE_FALSE(entry.has_value());
        CHECK(entry.error().code() == error_code::invalid_header);
    }

    SECTION("Maximum unsigned size") {
        header.size = 4294967295u;
        auto entry = archive_entry::from_header(header, now);
        REQUIRE_FALSE(entry.has_value());
        CHECK(entry.error().code() == error_code::invalid_header);
        CHECK_THAT(entry.error().message(), Catch::Matchers::ContainsSubstring("4294967295"));
    }

    SECTION("Exactly one GiB") {
        header.size = 1024u * 1024u * 1024u;
        CHECK_FALSE(archive_entry::from_header(header, now).has_value());
    }

    SECTION("Timestamp before 2000") {
        header.mtime = 946684799;
        CHECK_FALSE(archive_entry::from_header(header, now).has_value());
    }

    SECTION("Timestamp too far ahead") {
        const auto far = now + std::chrono::hours{24 * 45};
        header.mtime = static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::seconds>(far.time_since_epoch()).count());
        CHECK_FALSE(archive_entry::from_header(header, now).has_value());
    }

    SECTION("Encoded NUL in the name") {
        header.name = "shell%00.php";
        auto entry = archive_entry::from_header(header, now);
        REQUIRE_FALSE(entry.has_value());
        CHECK(entry.error().code() == error_code::malformed_path);
    }

    SECTION("Encoded NUL in the path") {
        header.path = "wp-content%00/x";
        auto entry = archive_entry::from_header(header, now);
        REQUIRE_FALSE(entry.has_value());
        CHECK(entry.error().code() == error_code::malformed_path);
    }
}

TEST_CASE("Zero-size entries are valid", "[archive_entry]") {
    auto header = valid_header();
    header.size = 0;
    auto entry = archive_entry::from_header(header, now);
    REQUIRE(entry.has_value());
    CHECK(entry->empty());
}

TEST_CASE("Timestamp window helpers", "[archive_entry]") {
    CHECK(mtime_in_range(946684800u, now));
    CHECK_FALSE(mtime_in_range(946684799u, now));
    CHECK(size_in_range(0));
    CHECK(size_in_range(MAX_ENTRY_SIZE - 1));
    CHECK_FALSE(size_in_range(MAX_ENTRY_SIZE));
}
