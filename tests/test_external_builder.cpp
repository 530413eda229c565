#include <catch2/catch.hpp>
#include <mxpack/build/external_builder.hpp>
#include <mxpack/build/problems.hpp>
#include "test_support.hpp"

using namespace mxpack;
using testing::FakeRunner;
using testing::Sandbox;
using testing::has_arg_prefix;
using testing::make_context;
using testing::read_file;
using testing::write_file;
using testing::write_project_database;

static const char* TWO_PROBLEMS =
    R"({"problems":[{"severity":"Error","message":"Entity 'Order' not found","locationName":"Microflow 'ACT_Save'"},)"
    R"({"severity":"Error","message":"Page 'Home' has no layout"}]})";

static Version v(const std::string& s) { return Version::parse(s).value(); }

// Project checkout with a few files the compile should sweep away
static void write_source_push(Sandbox& sb, const std::string& version) {
    write_project_database(sb.build("App.mpr"), version);
    write_file(sb.build("javasource/myfirstmodule/Action.java"), "class Action {}");
    write_file(sb.build("theme/styles.css"), "body {}");
    write_file(sb.build(".local/keep-me"), "local tools");
}

struct BuilderFixture {
    Sandbox sb;
    FakeRunner runner;
    CommandFetcher fetcher{runner};
    BuildContext ctx;

    explicit BuilderFixture(const std::string& version, Settings settings = testing::valid_settings()) {
        write_source_push(sb, version);
        ctx = make_context(sb, version, std::move(settings));
    }
};

TEST_CASE("Structured errors are requested from 6.4.0 on", "[builder]") {
    REQUIRE_FALSE(ExternalBuilder::writes_build_errors(v("6.3.9"), false));
    REQUIRE(ExternalBuilder::writes_build_errors(v("6.4.0"), false));
    REQUIRE(ExternalBuilder::writes_build_errors(v("7.23.1.55882"), false));
    REQUIRE(ExternalBuilder::writes_build_errors(v("6.3.9"), true));
}

TEST_CASE("Compiler command line", "[builder]") {
    BuilderFixture f("7.23.1");
    f.ctx.settings.library_path = "/usr/lib/extra";
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    CompilerToolchain tc{"/t/mono", "/t/mxbuild", "/t/jdk"};
    auto cmd = builder.compiler_command(tc, f.sb.build("App.mpr"));

    std::vector<std::string> expected = {
        "/t/mono/bin/mono", "--config", "/t/mono/etc/mono/config",
        "/t/mxbuild/modeler/mxbuild.exe",
        "--target=package",
        "--output=" + f.ctx.model_package_path().string(),
        "--java-home=/t/jdk",
        "--java-exe-path=/t/jdk/bin/java",
        "--write-errors=" + f.ctx.build_errors_path().string(),
        f.sb.build("App.mpr").string(),
    };
    REQUIRE(cmd.args == expected);
    REQUIRE(cmd.env.at("LD_LIBRARY_PATH") == "/t/mono/lib:/usr/lib/extra");
    REQUIRE(cmd.working_dir == f.sb.paths.build_dir.string());
}

TEST_CASE("Old toolchains get no error file flag", "[builder]") {
    BuilderFixture f("6.3.9");
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto cmd = builder.compiler_command(CompilerToolchain{"/m", "/x", "/j"}, "/p/App.mpr");
    REQUIRE_FALSE(has_arg_prefix(cmd, "--write-errors="));
    REQUIRE(cmd.env.at("LD_LIBRARY_PATH") == "/m/lib");

    f.ctx.settings.force_write_build_errors = true;
    REQUIRE(has_arg_prefix(builder.compiler_command(CompilerToolchain{"/m", "/x", "/j"}, "/p/App.mpr"),
                           "--write-errors="));
}

TEST_CASE("Forced compiler URL loosens the version check", "[builder]") {
    auto settings = testing::valid_settings();
    settings.forced_compiler_url = "https://mirror.test/mxbuild-7.23.1.tar.gz";
    BuilderFixture f("7.23.1", settings);
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto cmd = builder.compiler_command(CompilerToolchain{"/m", "/x", "/j"}, "/p/App.mpr");
    REQUIRE(cmd.args.back() == "/p/App.mpr");
    REQUIRE(cmd.args[cmd.args.size() - 2] == "--loose-version-check");
}

TEST_CASE("Successful build replaces the build root with the package", "[builder]") {
    BuilderFixture f("7.23.1");
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto r = builder.build();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().project_file == f.sb.build("App.mpr"));
    REQUIRE(r.value().package == f.ctx.model_package_path());

    // Toolchain was unpacked under the local-tools subtree
    REQUIRE(fs::exists(f.sb.build(".local/mono/unpacked-from")));
    REQUIRE(fs::exists(f.sb.build(".local/mxbuild/unpacked-from")));
    REQUIRE(fs::exists(f.sb.build(".local/usr/lib/jvm/jdk-11.0.3/unpacked-from")));

    // Sources are gone, package contents and .local remain
    REQUIRE_FALSE(fs::exists(f.sb.build("App.mpr")));
    REQUIRE_FALSE(fs::exists(f.sb.build("javasource")));
    REQUIRE_FALSE(fs::exists(f.sb.build("theme")));
    REQUIRE(read_file(f.sb.build(".local/keep-me")) == "local tools");
    REQUIRE(read_file(f.sb.build("model/metadata.json")) == R"({"RuntimeVersion":"7.23.1"})");
    REQUIRE(fs::exists(f.sb.build("web/index.html")));
    REQUIRE_FALSE(fs::exists(f.sb.build(".local/package-staging")));
}

TEST_CASE("Package entries never overwrite the local-tools subtree", "[builder]") {
    BuilderFixture f("7.23.1");
    f.runner.package_files[".local/evil"] = "x";
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    REQUIRE(builder.build().is_ok());
    REQUIRE_FALSE(fs::exists(f.sb.build(".local/evil")));
    REQUIRE(fs::exists(f.sb.build(".local/keep-me")));
}

TEST_CASE("Compile failure carries the compiler's problems", "[builder]") {
    BuilderFixture f("7.23.1");
    f.runner.compiler_exit = 1;
    f.runner.compiler_errors = TWO_PROBLEMS;
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto r = builder.build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Compile);
    REQUIRE(r.error().problems.size() == 2);
    REQUIRE(r.error().problems[0].message == "Entity 'Order' not found");
    REQUIRE(r.error().problems[0].location == "Microflow 'ACT_Save'");
    REQUIRE(r.error().problems[1].message == "Page 'Home' has no layout");

    // Nothing was swept
    REQUIRE(fs::exists(f.sb.build("App.mpr")));
    REQUIRE(fs::exists(f.sb.build("javasource")));
}

TEST_CASE("Compile failure without an error file is generic", "[builder]") {
    BuilderFixture f("6.3.9");
    f.runner.compiler_exit = 1;
    f.runner.compiler_errors = TWO_PROBLEMS;  // not written: no --write-errors
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto r = builder.build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().problems == std::vector<BuildError>{generic_build_error()});
}

TEST_CASE("A stale error file is not reported", "[builder]") {
    BuilderFixture f("7.23.1");
    write_file(f.ctx.build_errors_path(), TWO_PROBLEMS);
    f.runner.compiler_exit = 2;
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto r = builder.build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().problems == std::vector<BuildError>{generic_build_error()});
    REQUIRE_FALSE(fs::exists(f.ctx.build_errors_path()));
}

TEST_CASE("Unreadable package leaves the build root untouched", "[builder]") {
    BuilderFixture f("7.23.1");
    f.runner.unzip_exit = 9;
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto r = builder.build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Assembly);
    REQUIRE(fs::exists(f.sb.build("App.mpr")));
    REQUIRE(fs::exists(f.sb.build("javasource/myfirstmodule/Action.java")));
    REQUIRE(fs::exists(f.sb.build("theme/styles.css")));
    REQUIRE_FALSE(fs::exists(f.sb.build(".local/package-staging")));
}

TEST_CASE("Success without a package is a compile failure", "[builder]") {
    BuilderFixture f("7.23.1");
    f.runner.compiler_writes_package = false;
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto r = builder.build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Compile);
    REQUIRE(r.error().problems.size() == 1);
    REQUIRE(fs::exists(f.sb.build("App.mpr")));
}

TEST_CASE("Build without a project file", "[builder]") {
    Sandbox sb;
    FakeRunner runner;
    CommandFetcher fetcher(runner);
    auto ctx = make_context(sb, "7.23.1");
    ArtifactCache cache(ctx, fetcher);
    ExternalBuilder builder(ctx, cache, fetcher, runner);

    auto r = builder.build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::NotFound);
    REQUIRE(runner.commands.empty());
}

TEST_CASE("Toolchain download failure stops before compiling", "[builder]") {
    BuilderFixture f("7.23.1");
    f.runner.failing_urls.insert("https://blob.test/buildpack/mxbuild-7.23.1.tar.gz");
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto r = builder.build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Artifact);
    REQUIRE(f.runner.find("mono") == nullptr);
}

TEST_CASE("Prebaked mono is used in place", "[builder]") {
    BuilderFixture f("7.23.1");
    write_file(f.sb.base("opt/mono-5.20.1/bin/mono"), "");
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);

    auto tc = builder.prepare_toolchain();
    REQUIRE(tc.is_ok());
    REQUIRE(tc.value().mono == f.sb.base("opt/mono-5.20.1"));
    REQUIRE(tc.value().mxbuild == f.sb.build(".local/mxbuild"));
    REQUIRE(tc.value().jdk == f.sb.build(".local/usr/lib/jvm/jdk-11.0.3"));
}

TEST_CASE("Releasing the toolchain keeps the rest of .local", "[builder]") {
    BuilderFixture f("7.23.1");
    ArtifactCache cache(f.ctx, f.fetcher);
    ExternalBuilder builder(f.ctx, cache, f.fetcher, f.runner);
    REQUIRE(builder.build().is_ok());

    REQUIRE(builder.release_toolchain().is_ok());
    REQUIRE_FALSE(fs::exists(f.sb.build(".local/mono")));
    REQUIRE_FALSE(fs::exists(f.sb.build(".local/mxbuild")));
    REQUIRE_FALSE(fs::exists(f.sb.build(".local/usr/lib/jvm/jdk-11.0.3")));
    REQUIRE(fs::exists(f.sb.build(".local/keep-me")));
}
