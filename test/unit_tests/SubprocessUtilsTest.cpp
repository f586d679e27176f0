#include "SubprocessUtils.hpp"

#include "FdUtils.hpp"
#include "TestHeaders.hpp"

using namespace pd;

TEST_CASE("SubprocessUtils run executes command", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.run("echo", {"hello", "world"});

  REQUIRE(result.exitCode == 0);
  REQUIRE(result.output == "hello world\n");
}

TEST_CASE("SubprocessUtils run with no args", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.run("pwd", {});

  // pwd should return a path (containing at least a forward slash)
  REQUIRE(result.output.find("/") != string::npos);
}

TEST_CASE("SubprocessUtils run captures stdout only", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result =
      utils.run("/bin/sh", {"-c", "printf test123; echo noise >&2; exit 4"});

  REQUIRE(result.output == "test123");
  REQUIRE(result.exitCode == 4);
}

TEST_CASE("SubprocessUtils run reports missing commands",
          "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.run("pd-command-that-does-not-exist", {});
  REQUIRE(result.exitCode == 127);
  REQUIRE(result.output.empty());
}

TEST_CASE("SubprocessUtils run reports signals", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.run("/bin/sh", {"-c", "kill -TERM $$"});
  REQUIRE(result.exitCode == 128 + SIGTERM);
}

TEST_CASE("SubprocessUtils run does not leak descriptors to the command",
          "[SubprocessUtils]") {
  int link[2];
  REQUIRE(::pipe(link) == 0);
  SubprocessUtils utils;
  // The background sleep outlives run(); it must not hold our pipe open
  auto result = utils.run(
      "/bin/sh", {"-c", "sleep 5 </dev/null >/dev/null 2>&1 & echo done"});
  REQUIRE(result.exitCode == 0);
  REQUIRE(result.output == "done\n");

  ::close(link[1]);
  REQUIRE(FdUtils::waitForReadable(link[0], 2000));
  char c;
  REQUIRE(::read(link[0], &c, 1) == 0);
  ::close(link[0]);
}
