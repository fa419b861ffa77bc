#include <doctest/doctest.h>
#include <binpack/normalizer.hpp>
#include <binpack/platform.hpp>

#include "../test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <thread>

using namespace binpack;
using namespace binpack::testing;

namespace {

// Work directory and prefix side by side, as a packaging run lays them out
struct Workspace {
    TempDir root;
    std::string work;
    std::string prefix;

    Workspace() : work(root.sub("work")), prefix(root.sub("prefix")) {}

    NormalizeOptions options(const std::string& name, const std::string& version,
                             const std::string& platform = "linux-64") const {
        NormalizeOptions o;
        o.package = {name, version, platform};
        o.work_dir = work;
        o.prefix = prefix;
        o.rename.mode = RenameMode::BeforeVersion;
        return o;
    }
};

// Typical upstream release tree wrapped in a versioned directory
std::vector<FixtureEntry> release_tree(const std::string& top) {
    return {
        FixtureEntry::dir(top + "/"),
        FixtureEntry::binary(top + "/mytool-1.2.3-linux64", elf_executable(), 0755),
        FixtureEntry::file(top + "/helper.sh", "#!/bin/sh\nexec mytool \"$@\"\n", 0644),
        FixtureEntry::file(top + "/LICENSE", "MIT License\n"),
        FixtureEntry::file(top + "/README.md", "# mytool\n"),
        FixtureEntry::file(top + "/doc/manual.html", "<html></html>"),
        FixtureEntry::file(top + "/completions/mytool.bash", "complete -F _mytool mytool\n"),
        FixtureEntry::file(top + "/share/man/man1/mytool.1", ".TH MYTOOL 1\n"),
    };
}

void check_release_layout(const std::string& prefix) {
    CHECK(list_directory(prefix) == std::vector<std::string>{"bin", "extras", "share"});
    CHECK(list_directory(prefix + "/bin") == std::vector<std::string>{"helper.sh", "mytool"});
    CHECK(list_directory(prefix + "/extras") == std::vector<std::string>{"LICENSE", "README.md", "completions", "doc"});
    CHECK(has_execute_permission(prefix + "/bin/mytool"));
    CHECK(has_execute_permission(prefix + "/bin/helper.sh"));
    CHECK(read_text(prefix + "/share/man/man1/mytool.1") == ".TH MYTOOL 1\n");
}

} // namespace

TEST_CASE("normalize every archive format end to end") {
    struct Case {
        FixtureFormat fixture;
        const char* suffix;
        ArchiveFormat format;
    };
    for (const auto& c : {Case{FixtureFormat::Zip, ".zip", ArchiveFormat::Zip},
                          Case{FixtureFormat::TarGzip, ".tar.gz", ArchiveFormat::TarGzip},
                          Case{FixtureFormat::TarXz, ".tar.xz", ArchiveFormat::TarXz},
                          Case{FixtureFormat::TarZstd, ".tar.zst", ArchiveFormat::TarZstd}}) {
        CAPTURE(c.suffix);
        Workspace ws;
        std::string artifact = ws.work + "/mytool-1.2.3-linux-64" + c.suffix;
        write_archive(artifact, c.fixture, release_tree("mytool-1.2.3"));

        auto report = normalize_prefix(ws.options("mytool", "1.2.3"));
        REQUIRE_MESSAGE(report.ok, report.error);
        CHECK(report.artifact.format == c.format);
        CHECK(report.artifact.size == fs::file_size(artifact));
        CHECK(report.artifact.sha256.size() == 64);
        CHECK(report.flatten_iterations == 1);
        REQUIRE(report.renames.size() == 1);
        CHECK(report.renames[0].from == "mytool-1.2.3-linux64");
        CHECK(report.renames[0].to == "mytool");
        check_release_layout(ws.prefix);

        // The artifact is read, never consumed
        CHECK(is_regular_file(artifact));
    }
}

TEST_CASE("normalize single-file payloads end to end") {
    struct Case {
        StreamFormat stream;
        const char* suffix;
    };
    for (const auto& c : {Case{StreamFormat::Gzip, ".gz"}, Case{StreamFormat::Xz, ".xz"},
                          Case{StreamFormat::Zstd, ".zst"}}) {
        CAPTURE(c.suffix);
        Workspace ws;
        auto elf = elf_executable();
        write_compressed_stream(ws.work + "/kubectl-1.30.0-linux-64" + c.suffix, c.stream,
                                std::string(elf.begin(), elf.end()));

        auto report = normalize_prefix(ws.options("kubectl", "1.30.0"));
        REQUIRE_MESSAGE(report.ok, report.error);
        CHECK(list_directory(ws.prefix) == std::vector<std::string>{"bin", "extras"});
        CHECK(list_directory(ws.prefix + "/bin") == std::vector<std::string>{"kubectl"});
        CHECK(report.renames.empty());
    }
}

TEST_CASE("normalize a bare binary") {
    Workspace ws;
    write_text(ws.work + "/jq-1.7.1-linux-64", "#!/bin/sh\necho jq\n", 0644);

    auto report = normalize_prefix(ws.options("jq", "1.7.1"));
    REQUIRE(report.ok);
    CHECK(report.artifact.format == ArchiveFormat::Bare);
    CHECK(list_directory(ws.prefix + "/bin") == std::vector<std::string>{"jq"});
    CHECK(has_execute_permission(ws.prefix + "/bin/jq"));
}

TEST_CASE("normalize an archive that already has bin") {
    Workspace ws;
    write_archive(ws.work + "/node-20.0.0-linux-64.tar.xz", FixtureFormat::TarXz, {
        FixtureEntry::binary("node-v20.0.0-linux-x64/bin/node", elf_executable(), 0755),
        FixtureEntry::file("node-v20.0.0-linux-x64/include/node/node.h", "// header"),
        FixtureEntry::file("node-v20.0.0-linux-x64/CHANGELOG.md", "changes"),
    });

    auto report = normalize_prefix(ws.options("node", "20.0.0"));
    REQUIRE(report.ok);
    CHECK(report.flatten_iterations == 1);
    CHECK(list_directory(ws.prefix) == std::vector<std::string>{"bin", "extras", "include"});
    CHECK(list_directory(ws.prefix + "/bin") == std::vector<std::string>{"node"});
    CHECK(list_directory(ws.prefix + "/extras") == std::vector<std::string>{"CHANGELOG.md"});
}

TEST_CASE("normalize a windows release") {
    Workspace ws;
    write_archive(ws.work + "/tool-0.9.0-win-64.zip", FixtureFormat::Zip, {
        FixtureEntry::binary("tool-0.9.0-windows.exe", pe_image(false), 0644),
        FixtureEntry::binary("tool.dll", pe_image(true), 0644),
        FixtureEntry::file("README.txt", "readme"),
    });

    auto options = ws.options("tool", "0.9.0", "win-64");
    options.rename.preserved_suffixes = {".exe", ".bat", ".com"};
    auto report = normalize_prefix(options);
    REQUIRE(report.ok);
    CHECK(report.probe == "windows");
    CHECK(list_directory(ws.prefix + "/bin") == std::vector<std::string>{"tool.exe"});
    CHECK(list_directory(ws.prefix + "/extras") == std::vector<std::string>{"README.txt", "tool.dll"});
}

TEST_CASE("normalize reports a missing input with the directory listing") {
    Workspace ws;
    write_text(ws.work + "/mytool-1.2.2-linux-64.zip", "older release");

    auto report = normalize_prefix(ws.options("mytool", "1.2.3"));
    CHECK_FALSE(report.ok);
    CHECK(report.code == ErrorCode::MissingInputArtifact);
    CHECK(exit_code_for(report.code) == 1);
    CHECK(report.error.find("mytool-1.2.2-linux-64.zip") != std::string::npos);
    CHECK(list_directory(ws.prefix).empty());
}

TEST_CASE("normalize refuses to run twice on one prefix") {
    Workspace ws;
    write_archive(ws.work + "/mytool-1.2.3-linux-64.tar.gz", FixtureFormat::TarGzip, release_tree("mytool-1.2.3"));

    auto first = normalize_prefix(ws.options("mytool", "1.2.3"));
    REQUIRE(first.ok);

    auto second = normalize_prefix(ws.options("mytool", "1.2.3"));
    CHECK_FALSE(second.ok);
    CHECK(second.code == ErrorCode::AlreadyNormalized);
    CHECK_FALSE(second.artifact_found);
    check_release_layout(ws.prefix);
}

TEST_CASE("normalize refuses a missing prefix") {
    Workspace ws;
    auto options = ws.options("mytool", "1.2.3");
    options.prefix = ws.root.path() + "/missing";

    auto report = normalize_prefix(options);
    CHECK(report.code == ErrorCode::PrefixAccessFailure);
    CHECK(exit_code_for(report.code) == 3);
}

TEST_CASE("normalize refuses a work directory inside the prefix") {
    Workspace ws;
    auto options = ws.options("mytool", "1.2.3");
    options.work_dir = ws.prefix + "/src";
    fs::create_directories(options.work_dir);

    auto report = normalize_prefix(options);
    CHECK(report.code == ErrorCode::InvalidConfiguration);
}

TEST_CASE("normalize requires a rename policy before touching the prefix") {
    Workspace ws;
    write_archive(ws.work + "/mytool-1.2.3-linux-64.tar.gz", FixtureFormat::TarGzip, release_tree("mytool-1.2.3"));
    auto options = ws.options("mytool", "1.2.3");
    options.rename.mode = RenameMode::Unset;

    auto report = normalize_prefix(options);
    CHECK(report.code == ErrorCode::InvalidConfiguration);
    CHECK(list_directory(ws.prefix).empty());
}

TEST_CASE("normalize surfaces layout conflicts") {
    Workspace ws;
    write_archive(ws.work + "/dup-1.0-linux-64.tar.gz", FixtureFormat::TarGzip, {
        FixtureEntry::file("dup-1.0-gnu", "#!/bin/sh\n", 0755),
        FixtureEntry::file("dup-1.0-musl", "#!/bin/sh\n", 0755),
    });

    auto report = normalize_prefix(ws.options("dup", "1.0"));
    CHECK_FALSE(report.ok);
    CHECK(report.code == ErrorCode::LayoutConflict);
    CHECK(exit_code_for(report.code) == 2);
}

TEST_CASE("concurrent runs on disjoint prefixes do not interfere") {
    Workspace a;
    Workspace b;
    write_archive(a.work + "/alpha-1.0.0-linux-64.tar.gz", FixtureFormat::TarGzip, {
        FixtureEntry::file("alpha-1.0.0/alpha-1.0.0", "#!/bin/sh\necho alpha\n", 0755),
        FixtureEntry::file("alpha-1.0.0/NOTICE", "alpha"),
    });
    write_archive(b.work + "/beta-2.0.0-linux-64.zip", FixtureFormat::Zip, {
        FixtureEntry::file("beta/nested/beta-2.0.0-x64", "#!/bin/sh\necho beta\n", 0755),
        FixtureEntry::file("beta/nested/NOTICE", "beta"),
    });

    NormalizeReport report_a;
    NormalizeReport report_b;
    std::thread ta([&] { report_a = normalize_prefix(a.options("alpha", "1.0.0")); });
    std::thread tb([&] { report_b = normalize_prefix(b.options("beta", "2.0.0")); });
    ta.join();
    tb.join();

    REQUIRE(report_a.ok);
    REQUIRE(report_b.ok);
    CHECK(list_directory(a.prefix + "/bin") == std::vector<std::string>{"alpha"});
    CHECK(list_directory(b.prefix + "/bin") == std::vector<std::string>{"beta"});
    CHECK(read_text(a.prefix + "/extras/NOTICE") == "alpha");
    CHECK(read_text(b.prefix + "/extras/NOTICE") == "beta");
    CHECK(report_b.flatten_iterations == 2);
}

// ============================================================================
// Report
// ============================================================================

TEST_CASE("serialize_report describes a successful run") {
    Workspace ws;
    write_archive(ws.work + "/mytool-1.2.3-linux-64.tar.gz", FixtureFormat::TarGzip, release_tree("mytool-1.2.3"));

    auto report = normalize_prefix(ws.options("mytool", "1.2.3"));
    REQUIRE(report.ok);

    auto j = nlohmann::json::parse(serialize_report(report));
    CHECK(j["ok"] == true);
    CHECK_FALSE(j.contains("error"));
    CHECK(j["package"]["name"] == "mytool");
    CHECK(j["artifact"]["format"] == "tar.gz");
    CHECK(j["artifact"]["sha256"].get<std::string>() == report.artifact.sha256);
    CHECK(j["flatten_iterations"] == 1);
    CHECK(j["flattened"][0] == "mytool-1.2.3");
    CHECK(j["renames"][0]["from"] == "mytool-1.2.3-linux64");
    CHECK(j["renames"][0]["to"] == "mytool");
    CHECK(j["rename_policy"] == "before-version");

    bool saw_license = false;
    for (const auto& e : j["entries"]) {
        if (e["name"] == "LICENSE") {
            saw_license = true;
            CHECK(e["kind"] == "file");
            CHECK(e["destination"] == "extras");
        }
    }
    CHECK(saw_license);
}

TEST_CASE("serialize_report describes a failure") {
    Workspace ws;
    auto report = normalize_prefix(ws.options("ghost", "0.1"));
    REQUIRE_FALSE(report.ok);

    auto j = nlohmann::json::parse(serialize_report(report));
    CHECK(j["ok"] == false);
    CHECK(j["code"] == "missing_input_artifact");
    CHECK(j["exit_code"] == 1);
    CHECK(j["artifact"].is_null());
    CHECK(j["entries"].empty());
}
