#include <doctest/doctest.h>
#include "jpi/zip.hpp"

using namespace jpi;

namespace {

ZipEntry file(const std::string& path, const std::string& content) {
    ZipEntry e;
    e.path = path;
    e.data.assign(content.begin(), content.end());
    return e;
}

std::vector<std::string> paths(const std::vector<ZipEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) {
        out.push_back(e.type == ZipEntryType::Directory ? e.path + "/" : e.path);
    }
    return out;
}

} // namespace

TEST_CASE("create_deterministic_zip orders the manifest first") {
    std::vector<ZipEntry> entries = {
        file("WEB-INF/lib/junit-4.12.jar", "junit"),
        file("index.jelly", "<div/>"),
        file("META-INF/MANIFEST.MF", "Manifest-Version: 1.0\r\n\r\n"),
    };

    auto zip = create_deterministic_zip(entries);
    REQUIRE(zip.ok);

    auto read = read_zip(zip.archive_data);
    REQUIRE(read.ok);
    CHECK(paths(read.entries) == std::vector<std::string>{
                                     "META-INF/",
                                     "META-INF/MANIFEST.MF",
                                     "WEB-INF/",
                                     "WEB-INF/lib/",
                                     "WEB-INF/lib/junit-4.12.jar",
                                     "index.jelly",
                                 });
}

TEST_CASE("create_deterministic_zip output depends only on the entries") {
    std::vector<ZipEntry> a = {file("b.txt", "two"), file("a.txt", "one")};
    std::vector<ZipEntry> b = {file("a.txt", "one"), file("b.txt", "two")};

    auto za = create_deterministic_zip(a);
    auto zb = create_deterministic_zip(b);
    REQUIRE(za.ok);
    REQUIRE(zb.ok);
    CHECK(za.archive_data == zb.archive_data);
}

TEST_CASE("entries round-trip with compression") {
    std::string big(10000, 'a');
    std::vector<ZipEntry> entries = {file("big.txt", big), file("small.txt", "x"),
                                     file("empty.txt", "")};

    auto zip = create_deterministic_zip(entries);
    REQUIRE(zip.ok);
    CHECK(zip.archive_data.size() < big.size());

    auto read = read_zip(zip.archive_data);
    REQUIRE(read.ok);
    auto* e = find_zip_entry(read.entries, "big.txt");
    REQUIRE(e != nullptr);
    CHECK(e->data.size() == big.size());
    CHECK(find_zip_entry(read.entries, "small.txt")->data.size() == 1);
    CHECK(find_zip_entry(read.entries, "empty.txt")->data.empty());
    CHECK(find_zip_entry(read.entries, "missing.txt") == nullptr);
}

TEST_CASE("explicit directory entries are kept") {
    ZipEntry dir;
    dir.path = "WEB-INF/classes";
    dir.type = ZipEntryType::Directory;

    auto zip = create_deterministic_zip({dir});
    REQUIRE(zip.ok);
    auto read = read_zip(zip.archive_data);
    REQUIRE(read.ok);
    CHECK(paths(read.entries) == std::vector<std::string>{"WEB-INF/", "WEB-INF/classes/"});
}

TEST_CASE("create_deterministic_zip rejects unsafe paths") {
    CHECK_FALSE(create_deterministic_zip({file("", "x")}).ok);
    CHECK_FALSE(create_deterministic_zip({file("/etc/passwd", "x")}).ok);
    CHECK_FALSE(create_deterministic_zip({file("a/../b", "x")}).ok);
    CHECK_FALSE(create_deterministic_zip({file("a//b", "x")}).ok);
    CHECK_FALSE(create_deterministic_zip({file("a\\b", "x")}).ok);
}

TEST_CASE("create_deterministic_zip rejects duplicates and file/directory clashes") {
    auto dup = create_deterministic_zip({file("a.txt", "1"), file("a.txt", "2")});
    CHECK_FALSE(dup.ok);
    CHECK(dup.error.find("duplicate") != std::string::npos);

    auto clash = create_deterministic_zip({file("a", "1"), file("a/b", "2")});
    CHECK_FALSE(clash.ok);
}

TEST_CASE("read_zip detects corruption") {
    auto zip = create_deterministic_zip({file("a.txt", "hello")});
    REQUIRE(zip.ok);

    SUBCASE("truncated") {
        std::vector<uint8_t> data(zip.archive_data.begin(), zip.archive_data.begin() + 10);
        CHECK_FALSE(read_zip(data).ok);
    }
    SUBCASE("flipped payload byte") {
        auto data = zip.archive_data;
        // local header is 30 bytes + "a.txt"; "hello" is stored
        data[30 + 5] ^= 0xFF;
        auto r = read_zip(data);
        CHECK_FALSE(r.ok);
    }
}
