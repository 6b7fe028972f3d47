#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using namespace cordbridge;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t\n hello \r\n") == "hello");
}

TEST_CASE("trim: empty string returns empty", "[util]") {
    REQUIRE(trim("").empty());
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

// ── strip_invisible ──────────────────────────────────────────────

TEST_CASE("strip_invisible: removes zero-width spaces anywhere", "[util]") {
    REQUIRE(strip_invisible("\xE2\x80\x8Bhi\xE2\x80\x8B there\xE2\x80\x8B") == "hi there");
}

TEST_CASE("strip_invisible: only invisible characters become empty", "[util]") {
    REQUIRE(strip_invisible(" \xE2\x80\x8B\xE2\x80\x8B \n").empty());
}

TEST_CASE("strip_invisible: other multibyte text untouched", "[util]") {
    REQUIRE(strip_invisible("  h\xC3\xA9llo ") == "h\xC3\xA9llo");
}

// ── case-insensitive helpers ─────────────────────────────────────

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("General-Chat") == "general-chat");
}

TEST_CASE("iequals: matches regardless of case", "[util]") {
    REQUIRE(iequals("General", "gENERAL"));
    REQUIRE_FALSE(iequals("general", "general2"));
    REQUIRE(iequals("", ""));
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: sixteen hex digits, unique", "[util]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        std::string id = generate_id();
        REQUIRE(id.size() == 16);
        REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/state.json");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
}

TEST_CASE("expand_home: empty string unchanged", "[util]") {
    REQUIRE(expand_home("").empty());
}

// ── atomic_write_file ────────────────────────────────────────────

static std::string read_all(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    auto dir = std::filesystem::temp_directory_path() / ("cordbridge_util_" + generate_id());
    std::string path = (dir / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "{}"));
    REQUIRE(read_all(path) == "{}");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("atomic_write_file: replaces existing content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() / ("cordbridge_util_" + generate_id());
    std::string path = (dir / "file.json").string();

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));
    REQUIRE(read_all(path) == "second");

    std::filesystem::remove_all(dir);
}

TEST_CASE("atomic_write_file: failure leaves previous file intact", "[util]") {
    auto dir = std::filesystem::temp_directory_path() / ("cordbridge_util_" + generate_id());
    std::filesystem::create_directories(dir);
    std::string path = (dir / "file.json").string();
    REQUIRE(atomic_write_file(path, "kept"));

    // A directory where the temp file should go makes the write fail.
    std::filesystem::create_directories(path + ".tmp");
    REQUIRE_FALSE(atomic_write_file(path, "lost"));
    REQUIRE(read_all(path) == "kept");

    std::filesystem::remove_all(dir);
}
