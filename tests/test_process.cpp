#include <catch2/catch.hpp>
#include <mxpack/process.hpp>
#include "test_support.hpp"

using namespace mxpack;
using testing::TempDir;

TEST_CASE("run_command captures stdout and exit code", "[process]") {
    Command cmd;
    cmd.args = {"sh", "-c", "echo hello; echo oops 1>&2; exit 3"};
    auto r = run_command(cmd);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stdout_str == "hello\n");
    REQUIRE(r.value().stderr_str == "oops\n");
}

TEST_CASE("run_command applies the environment overlay", "[process]") {
    Command cmd;
    cmd.args = {"sh", "-c", "printf '%s' \"$LD_LIBRARY_PATH\""};
    cmd.env["LD_LIBRARY_PATH"] = "/opt/mono/lib";
    auto r = run_command(cmd);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "/opt/mono/lib");
}

TEST_CASE("run_command runs in the working directory", "[process]") {
    TempDir tmp;
    Command cmd;
    cmd.args = {"sh", "-c", "touch marker"};
    cmd.working_dir = tmp.path.string();
    auto r = run_command(cmd);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(fs::exists(tmp.path / "marker"));
}

TEST_CASE("Unknown program exits 127", "[process]") {
    Command cmd;
    cmd.args = {"mxpack-no-such-program-xyz"};
    auto r = run_command(cmd);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("Empty command is an argument error", "[process]") {
    auto r = run_command(Command{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::InvalidArg);
}

TEST_CASE("Timed out command is killed", "[process]") {
    Command cmd;
    cmd.args = {"sleep", "5"};
    cmd.timeout_seconds = 1;
    auto r = run_command(cmd);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("Command to_string joins arguments", "[process]") {
    Command cmd;
    cmd.args = {"tar", "-xf", "a.tar.gz"};
    REQUIRE(cmd.to_string() == "tar -xf a.tar.gz");
}

TEST_CASE("capture_environment sees the process environment", "[process]") {
    setenv("MXPACK_TEST_CAPTURE", "42", 1);
    auto env = capture_environment();
    REQUIRE(env["MXPACK_TEST_CAPTURE"] == "42");
    unsetenv("MXPACK_TEST_CAPTURE");
}
