#include <catch2/catch.hpp>
#include <mxpack/build/layout.hpp>
#include "test_support.hpp"

using namespace mxpack;
using testing::Sandbox;
using testing::TempDir;
using testing::read_file;
using testing::write_file;

TEST_CASE("ensure_layout creates every directory", "[layout]") {
    TempDir tmp;
    REQUIRE(ensure_layout(tmp.path).is_ok());
    for (const auto& rel : target_layout_dirs()) {
        INFO(rel);
        REQUIRE(fs::is_directory(tmp.path / rel));
    }
}

TEST_CASE("ensure_layout is idempotent and keeps contents", "[layout]") {
    TempDir tmp;
    REQUIRE(ensure_layout(tmp.path).is_ok());
    write_file(tmp.path / "data" / "files" / "upload.bin", "x");
    REQUIRE(ensure_layout(tmp.path).is_ok());
    REQUIRE(read_file(tmp.path / "data" / "files" / "upload.bin") == "x");
}

TEST_CASE("A file in the way is an assembly error", "[layout]") {
    TempDir tmp;
    write_file(tmp.path / "log", "not a directory");
    auto r = ensure_layout(tmp.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Assembly);
}

TEST_CASE("Static resources replace previous copies", "[layout]") {
    Sandbox sb;
    const fs::path& root = sb.paths.build_dir;
    write_file(root / ".local" / "etc" / "stale.conf", "old");
    write_file(root / "start", "old start");

    REQUIRE(copy_static_resources(sb.paths.buildpack_dir, root, false).is_ok());
    REQUIRE_FALSE(fs::exists(root / ".local" / "etc" / "stale.conf"));
    REQUIRE(read_file(root / ".local" / "etc" / "m2ee.yaml") == "m2ee: {}\n");
    REQUIRE(fs::exists(root / ".local" / "etc" / "nginx" / "conf" / "nginx.conf"));
    REQUIRE(read_file(root / "lib" / "helper.txt") == "helper\n");
    REQUIRE(read_file(root / "start") == "#!/bin/sh\n");
    REQUIRE_FALSE(fs::exists(root / "newrelic"));
}

TEST_CASE("Monitoring agent is copied on request", "[layout]") {
    Sandbox sb;
    REQUIRE(copy_static_resources(sb.paths.buildpack_dir, sb.paths.build_dir, true).is_ok());
    REQUIRE(fs::exists(sb.build("newrelic/newrelic.yml")));
}

TEST_CASE("Missing buildpack resource is an assembly error", "[layout]") {
    Sandbox sb;
    fs::remove_all(sb.paths.buildpack_dir / "lib");
    auto r = copy_static_resources(sb.paths.buildpack_dir, sb.paths.build_dir, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Assembly);
}

TEST_CASE("sweep_children keeps only the named entries", "[layout]") {
    TempDir tmp;
    write_file(tmp.path / ".local" / "mono" / "bin" / "mono", "");
    write_file(tmp.path / "App.mpr", "");
    write_file(tmp.path / "javasource" / "A.java", "");
    write_file(tmp.path / ".gitignore", "");

    auto removed = sweep_children(tmp.path, {".local"});
    REQUIRE(removed.is_ok());
    REQUIRE(removed.value() == std::vector<std::string>{".gitignore", "App.mpr", "javasource"});
    REQUIRE(testing::list_tree(tmp.path) ==
            std::vector<std::string>{".local", ".local/mono", ".local/mono/bin",
                                     ".local/mono/bin/mono"});
}

TEST_CASE("replace_symlink replaces links and files", "[layout]") {
    TempDir tmp;
    fs::path link = tmp.path / ".local" / "bin" / "java";

    REQUIRE(replace_symlink("/opt/jre-8/bin/java", link).is_ok());
    REQUIRE(fs::read_symlink(link) == "/opt/jre-8/bin/java");

    REQUIRE(replace_symlink("/opt/jre-11/bin/java", link).is_ok());
    REQUIRE(fs::read_symlink(link) == "/opt/jre-11/bin/java");

    fs::remove(link);
    write_file(link / "stray", "x");
    REQUIRE(replace_symlink("/opt/jre-11/bin/java", link).is_ok());
    REQUIRE(fs::is_symlink(link));
}
