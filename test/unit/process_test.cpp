#include <benchgen/process.hpp>

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace benchgen;
using namespace benchgen_test;

#ifndef _WIN32

static process_request
shell(const std::string& script) {
  process_request request;
  request.program = "/bin/sh";
  request.args = {"-c", script};
  return request;
}

// ---------------------------------------------------------------------------
// run_process
// ---------------------------------------------------------------------------

TEST_CASE("run_process: zero exit status succeeds", "[process]") {
  auto result = run_process(shell("exit 0"));
  CHECK(result.launched);
  CHECK(result.exit_code == 0);
  CHECK_FALSE(result.timed_out);
  CHECK(result.succeeded());
}

TEST_CASE("run_process: non-zero exit status is reported", "[process]") {
  auto result = run_process(shell("exit 3"));
  CHECK(result.launched);
  CHECK(result.exit_code == 3);
  CHECK_FALSE(result.succeeded());
}

TEST_CASE("run_process: stdout and stderr are both captured", "[process]") {
  auto result = run_process(shell("echo out; echo err >&2"));
  REQUIRE(result.succeeded());
  CHECK(result.output.find("out\n") != std::string::npos);
  CHECK(result.output.find("err\n") != std::string::npos);
}

TEST_CASE("run_process: arguments are passed without a shell", "[process]") {
  process_request request;
  request.program = "/bin/echo";
  request.args = {"two words", "$HOME"};
  auto result = run_process(request);
  REQUIRE(result.succeeded());
  CHECK(result.output == "two words $HOME\n");
}

TEST_CASE("run_process: large output does not block the child",
          "[process]") {
  // Well past a pipe buffer
  auto result = run_process(
      shell("i=0; while [ $i -lt 20000 ]; do echo 0123456789; "
            "i=$((i+1)); done"));
  REQUIRE(result.succeeded());
  CHECK(result.output.size() == 20000u * 11u);
}

TEST_CASE("run_process: missing program is not launched", "[process]") {
  process_request request;
  request.program = "/nonexistent/benchgen/tool";
  auto result = run_process(request);
  CHECK_FALSE(result.launched);
  CHECK_FALSE(result.error.empty());
  CHECK_FALSE(result.succeeded());
}

TEST_CASE("run_process: timeout kills a hung child", "[process]") {
  auto request = shell("echo started; sleep 30");
  request.timeout = std::chrono::milliseconds(200);

  auto start = std::chrono::steady_clock::now();
  auto result = run_process(request);
  auto elapsed = std::chrono::steady_clock::now() - start;

  CHECK(result.launched);
  CHECK(result.timed_out);
  CHECK_FALSE(result.succeeded());
  CHECK(result.output.find("started") != std::string::npos);
  CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("run_process: a fast child finishes inside its timeout",
          "[process]") {
  auto request = shell("exit 0");
  request.timeout = std::chrono::milliseconds(10000);
  auto result = run_process(request);
  CHECK(result.succeeded());
  CHECK_FALSE(result.timed_out);
}

TEST_CASE("run_process: timeout beyond the maximum is clamped", "[process]") {
  auto request = shell("sleep 0.2; echo hi");
  request.timeout = std::chrono::milliseconds(10000000000000LL);
  auto result = run_process(request);
  CHECK(result.succeeded());
  CHECK_FALSE(result.timed_out);
  CHECK(result.output == "hi\n");
}

TEST_CASE("run_process: timeout applies after the child closes its output",
          "[process]") {
  auto request = shell("exec >/dev/null 2>&1; sleep 30");
  request.timeout = std::chrono::milliseconds(200);

  auto start = std::chrono::steady_clock::now();
  auto result = run_process(request);
  auto elapsed = std::chrono::steady_clock::now() - start;

  CHECK(result.timed_out);
  CHECK_FALSE(result.succeeded());
  CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("run_process: returns when the child exits while a background "
          "process holds the output open",
          "[process]") {
  auto start = std::chrono::steady_clock::now();
  auto result = run_process(shell("sleep 5 & echo started; exit 0"));
  auto elapsed = std::chrono::steady_clock::now() - start;

  CHECK(result.succeeded());
  CHECK(result.output == "started\n");
  CHECK(elapsed < std::chrono::seconds(4));
}

TEST_CASE("run_process: output written just before exit is kept",
          "[process]") {
  auto result = run_process(shell("printf 'last line'; exit 4"));
  CHECK(result.exit_code == 4);
  CHECK(result.output == "last line");
}

// ---------------------------------------------------------------------------
// find_executable
// ---------------------------------------------------------------------------

TEST_CASE("find_executable: explicit path to an executable", "[process]") {
  temp_dir dir("find_exec");
  auto tool = dir / "tool";
  write_script(tool, "#!/bin/sh\nexit 0\n");

  auto found = find_executable(tool);
  REQUIRE(found.has_value());
  CHECK(*found == tool);
}

TEST_CASE("find_executable: file without execute permission", "[process]") {
  temp_dir dir("find_noexec");
  auto tool = dir / "tool";
  write_file(tool, "#!/bin/sh\nexit 0\n");
  fs::permissions(tool, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace);

  CHECK_FALSE(find_executable(tool).has_value());
}

TEST_CASE("find_executable: directories are not executables", "[process]") {
  temp_dir dir("find_dir");
  CHECK_FALSE(find_executable(dir.path()).has_value());
}

TEST_CASE("find_executable: missing path", "[process]") {
  CHECK_FALSE(find_executable("/nonexistent/benchgen/tool").has_value());
  CHECK_FALSE(find_executable("").has_value());
}

TEST_CASE("find_executable: bare name is searched on PATH", "[process]") {
  auto found = find_executable("sh");
  REQUIRE(found.has_value());
  CHECK(found->filename() == "sh");
}

#endif

// ---------------------------------------------------------------------------
// format_command
// ---------------------------------------------------------------------------

TEST_CASE("format_command: plain arguments", "[process]") {
  process_request request;
  request.program = "protoc";
  request.args = {"-Ischemas", "--cpp_out=src/protos", "schemas/jazz.proto"};
  CHECK(format_command(request) ==
        "protoc -Ischemas --cpp_out=src/protos schemas/jazz.proto");
}

TEST_CASE("format_command: quotes arguments with spaces", "[process]") {
  process_request request;
  request.program = "bebopc";
  request.args = {"--files", "my schemas/a.bop", ""};
  CHECK(format_command(request) == "bebopc --files \"my schemas/a.bop\" \"\"");
}
