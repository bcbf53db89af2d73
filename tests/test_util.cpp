#include <catch2/catch.hpp>
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>

using namespace streamgate;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t\n hello \r\n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t ").empty());
    REQUIRE(trim("").empty());
}

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: ascii letters lowered", "[util]") {
    REQUIRE(to_lower("MAX_TOKENS") == "max_tokens");
    REQUIRE(to_lower("already") == "already");
}

// ── generate_uuid ────────────────────────────────────────────────

TEST_CASE("generate_uuid: v4 layout", "[util]") {
    std::string id = generate_uuid();
    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[13] == '-');
    REQUIRE(id[14] == '4');
    REQUIRE(id[18] == '-');
    REQUIRE(id[23] == '-');
    char variant = id[19];
    REQUIRE((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
}

TEST_CASE("generate_uuid: values are distinct", "[util]") {
    std::set<std::string> ids;
    for (int i = 0; i < 200; i++) ids.insert(generate_uuid());
    REQUIRE(ids.size() == 200);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/tmp/x") == "/tmp/x");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/.streamgate") == std::string(home) + "/.streamgate");
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent dirs and replaces content", "[util]") {
    auto base = std::filesystem::temp_directory_path() / "streamgate_util_XXXXXX";
    std::string tmpl = base.string();
    char* dir = mkdtemp(tmpl.data());
    REQUIRE(dir != nullptr);

    std::string path = std::string(dir) + "/nested/file.txt";
    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

// ── time helpers ─────────────────────────────────────────────────

TEST_CASE("epoch_millis: consistent with epoch_seconds", "[util]") {
    uint64_t s = epoch_seconds();
    uint64_t ms = epoch_millis();
    REQUIRE(ms / 1000 >= s - 1);
    REQUIRE(ms / 1000 <= s + 1);
}
