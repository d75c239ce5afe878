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
#include <sitepack/path_codec.hpp>
#include <string>
#include <vector>

using namespace sitepack;
using namespace std::string_literals;

TEST_CASE("Percent decoding", "[path_codec]") {
    SECTION("Plain text passes through") {
        CHECK(percent_decode("wp-content/uploads") == "wp-content/uploads");
    }

    SECTION("Escapes decode in either case") {
        CHECK(percent_decode("my%20file.txt") == "my file.txt");
        CHECK(percent_decode("%c3%a9t%C3%A9") == "\xC3\xA9t\xC3\xA9");
    }

    SECTION("Plus is literal") {
        CHECK(percent_decode("a+b") == "a+b");
    }

    SECTION("Malformed escapes are kept") {
        CHECK(percent_decode("100%") == "100%");
        CHECK(percent_decode("%4") == "%4");
        CHECK(percent_decode("%zz.txt") == "%zz.txt");
    }
}

TEST_CASE("Percent encoding", "[path_codec]") {
    CHECK(percent_encode("index.php") == "index.php");
    CHECK(percent_encode("a b") == "a%20b");
    CHECK(percent_encode("50%") == "50%25");
    CHECK(percent_encode("~_-.") == "~_-.");
    CHECK(percent_encode("\xC3\xA9") == "%C3%A9");
}

TEST_CASE("Decode of encode returns the input text", "[path_codec]") {
    const std::vector<std::string> samples = {
        "plain.txt",
        "with space.txt",
        "100% done.md",
        "%41 is not A",
        "caf\xC3\xA9/\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E.txt",
        "emoji \xF0\x9F\x98\x80.png",
        "symbols ()[]&@+=#?.txt",
        "tab\tand\nnewline",
        "",
    };

    for (const auto& sample : samples) {
        auto decoded = decode_field(percent_encode(sample));
        REQUIRE(decoded.has_value());
        CHECK(*decoded == sample);
    }
}

TEST_CASE("Field decoding trims padding", "[path_codec]") {
    SECTION("Trailing and leading NUL padding") {
        auto decoded = decode_field("\0\0name.txt\0\0\0"s);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == "name.txt");
    }

    SECTION("All padding decodes to empty") {
        auto decoded = decode_field(std::string(16, '\0'));
        REQUIRE(decoded.has_value());
        CHECK(decoded->empty());
    }

    SECTION("Stray stored NUL bytes are dropped") {
        auto decoded = decode_field("na\0me.txt"s);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == "name.txt");
    }

    SECTION("Encoded NUL is rejected") {
        auto decoded = decode_field("evil%00.php");
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code() == error_code::malformed_path);
    }
}

TEST_CASE("Relative path sanitizing", "[path_codec]") {
    SECTION("Directory and name are joined with one separator") {
        auto joined = sanitize_relative("wp-content/uploads", "photo.jpg");
        REQUIRE(joined.has_value());
        CHECK(*joined == "wp-content/uploads/photo.jpg");
    }

    SECTION("Leading and doubled separators are dropped") {
        auto joined = sanitize_relative("/wp-content//uploads/", "photo.jpg");
        REQUIRE(joined.has_value());
        CHECK(*joined == "wp-content/uploads/photo.jpg");
    }

    SECTION("Empty directory means the root") {
        auto joined = sanitize_relative("", "index.php");
        REQUIRE(joined.has_value());
        CHECK(*joined == "index.php");
    }

    SECTION("Current-directory components are dropped") {
        auto joined = sanitize_relative("./wp-content/.", "a.txt");
        REQUIRE(joined.has_value());
        CHECK(*joined == "wp-content/a.txt");
    }

    SECTION("Dots inside names are not traversal") {
        auto joined = sanitize_relative("backups", "..hidden..txt");
        REQUIRE(joined.has_value());
        CHECK(*joined == "backups/..hidden..txt");
    }

    SECTION("Parent references are rejected") {
        auto in_path = sanitize_relative("wp-content/../../etc", "passwd");
        REQUIRE_FALSE(in_path.has_value());
        CHECK(in_path.error().code() == error_code::unsafe_path);
        CHECK_THAT(in_path.error().message(), Catch::Matchers::ContainsSubstring(".."));

        auto in_name = sanitize_relative("", "../outside.txt");
        REQUIRE_FALSE(in_name.has_value());
        CHECK(in_name.error().code() == error_code::unsafe_path);

        auto bare = sanitize_relative("..", "x");
        CHECK_FALSE(bare.has_value());
    }

    SECTION("Nothing left after sanitizing") {
        auto empty = sanitize_relative("/", "");
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code() == error_code::unsafe_path);
    }
}

TEST_CASE("Resolve below a root", "[path_codec]") {
    const std::filesystem::path root = "/srv/site";

    auto resolved = resolve(root, "/wp-content/themes", "style.css");
    REQUIRE(resolved.has_value());
    CHECK(*resolved == std::filesystem::path{"/srv/site/wp-content/themes/style.css"});

    auto escaped = resolve(root, "../../tmp", "x.php");
    REQUIRE_FALSE(escaped.has_value());
    CHECK(escaped.error().code() == error_code::unsafe_path);
}
