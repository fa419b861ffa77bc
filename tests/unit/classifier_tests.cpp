#include <doctest/doctest.h>
#include <binpack/classifier.hpp>
#include <binpack/platform.hpp>

#include "../test_helpers.hpp"

#include <algorithm>

using namespace binpack;
using namespace binpack::testing;

namespace {

// Probe with a fixed answer per file name
class ListProbe : public ExecutableProbe {
public:
    explicit ListProbe(std::vector<std::string> names) : names_(std::move(names)) {}

    bool is_executable(const std::string& path) const override {
        auto name = get_filename(path);
        return std::find(names_.begin(), names_.end(), name) != names_.end();
    }
    const char* name() const override { return "list"; }

private:
    std::vector<std::string> names_;
};

const ClassifiedEntry* find_entry(const ClassifyResult& r, const std::string& name) {
    for (const auto& e : r.entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

} // namespace

TEST_CASE("classify moves executables to bin and the rest to extras") {
    TempDir prefix;
    write_bytes(prefix.path() + "/tool", elf_executable(), 0644);
    write_text(prefix.path() + "/helper.sh", "#!/bin/sh\n", 0644);
    write_text(prefix.path() + "/LICENSE", "MIT");
    write_text(prefix.path() + "/docs/guide.md", "guide");

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);

    CHECK(list_directory(prefix.path()) == std::vector<std::string>{"bin", "extras"});
    CHECK(list_directory(prefix.path() + "/bin") == std::vector<std::string>{"helper.sh", "tool"});
    CHECK(list_directory(prefix.path() + "/extras") == std::vector<std::string>{"LICENSE", "docs"});
    CHECK(read_text(prefix.path() + "/extras/docs/guide.md") == "guide");

    // Detected executables get their execute bits
    CHECK(has_execute_permission(prefix.path() + "/bin/tool"));
    CHECK(has_execute_permission(prefix.path() + "/bin/helper.sh"));

    REQUIRE(find_entry(r, "docs"));
    CHECK(find_entry(r, "docs")->kind == EntryKind::Directory);
    CHECK(find_entry(r, "docs")->destination == EntryDestination::Auxiliary);
    CHECK(find_entry(r, "tool")->destination == EntryDestination::Executables);
}

TEST_CASE("classify leaves reserved directories byte for byte") {
    TempDir prefix;
    write_text(prefix.path() + "/share/man/man1/tool.1", ".TH TOOL 1");
    write_text(prefix.path() + "/lib/libtool.so.1", "elf-ish", 0755);
    write_text(prefix.path() + "/etc/tool.conf", "key=value");
    write_text(prefix.path() + "/tool", "exe", 0755);

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);

    CHECK(list_directory(prefix.path()) == std::vector<std::string>{"bin", "etc", "extras", "lib", "share"});
    CHECK(read_text(prefix.path() + "/share/man/man1/tool.1") == ".TH TOOL 1");
    CHECK(read_text(prefix.path() + "/etc/tool.conf") == "key=value");
    CHECK(is_regular_file(prefix.path() + "/lib/libtool.so.1"));
    CHECK(find_entry(r, "lib")->destination == EntryDestination::Reserved);
    CHECK(list_directory(prefix.path() + "/extras").empty());
}

TEST_CASE("classify keeps an existing bin directory and adds to it") {
    TempDir prefix;
    write_text(prefix.path() + "/bin/tool", "exe", 0755);
    write_text(prefix.path() + "/tool-completion", "#!/bin/bash\n", 0644);

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);
    CHECK(list_directory(prefix.path() + "/bin") ==
          std::vector<std::string>{"tool", "tool-completion"});
}

TEST_CASE("classify uses only the probe's decision") {
    TempDir prefix;
    write_text(prefix.path() + "/a", "data", 0755);
    write_text(prefix.path() + "/b", "data", 0644);

    ListProbe probe({"b"});
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);
    CHECK(is_regular_file(prefix.path() + "/bin/b"));
    CHECK(is_regular_file(prefix.path() + "/extras/a"));
}

TEST_CASE("classify on windows targets goes by suffix") {
    TempDir prefix;
    write_text(prefix.path() + "/tool.exe", "MZ", 0644);
    write_text(prefix.path() + "/tool.dll", "MZ", 0644);
    write_text(prefix.path() + "/README.txt", "r", 0755);

    WindowsExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);
    CHECK(list_directory(prefix.path() + "/bin") == std::vector<std::string>{"tool.exe"});
    CHECK(list_directory(prefix.path() + "/extras") == std::vector<std::string>{"README.txt", "tool.dll"});
}

TEST_CASE("classify sends dangling symlinks to extras") {
    TempDir prefix;
    fs::create_symlink("does-not-exist", prefix.path() + "/broken");

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);
    CHECK(is_symlink(prefix.path() + "/extras/broken"));
    CHECK(find_entry(r, "broken")->kind == EntryKind::Other);
}

TEST_CASE("classify treats a symlink named like a reserved directory as an entry") {
    TempDir prefix;
    TempDir elsewhere;
    write_text(elsewhere.path() + "/libz.so", "z");
    fs::create_directory_symlink(elsewhere.path(), prefix.path() + "/lib");

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);
    CHECK(is_symlink(prefix.path() + "/extras/lib"));
    CHECK_FALSE(path_exists(prefix.path() + "/lib"));
}

TEST_CASE("classify leaves targets outside the prefix untouched") {
    TempDir outer;
    std::string prefix = outer.sub("prefix");
    write_text(outer.path() + "/victim", "#!/bin/sh\necho outside\n", 0644);
    fs::create_directory(prefix + "/d");
    fs::create_directory_symlink("..", prefix + "/d/l1");
    fs::create_symlink("d/l1/../victim", prefix + "/a");

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix, probe);
    REQUIRE(r.ok);
    CHECK(find_entry(r, "a")->kind == EntryKind::Other);
    CHECK(find_entry(r, "a")->destination == EntryDestination::Auxiliary);
    CHECK(is_symlink(prefix + "/extras/a"));
    CHECK_FALSE(has_execute_permission(outer.path() + "/victim"));
    CHECK(list_directory(prefix + "/bin").empty());
}

TEST_CASE("classify fails on a collision in bin") {
    TempDir prefix;
    write_text(prefix.path() + "/bin/tool", "shipped in bin", 0755);
    write_text(prefix.path() + "/tool", "#!/bin/sh\n", 0755);

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::LayoutConflict);
    CHECK(read_text(prefix.path() + "/bin/tool") == "shipped in bin");
    CHECK(is_regular_file(prefix.path() + "/tool"));
}

TEST_CASE("classify refuses a file named bin") {
    TempDir prefix;
    write_text(prefix.path() + "/bin", "not a directory", 0755);

    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::LayoutConflict);
}

TEST_CASE("classify on an empty prefix creates both directories") {
    TempDir prefix;
    UnixExecutableProbe probe;
    auto r = classify_entries(prefix.path(), probe);
    REQUIRE(r.ok);
    CHECK(list_directory(prefix.path()) == std::vector<std::string>{"bin", "extras"});
}
