#include "OutputRingBuffer.hpp"

#include "TestHeaders.hpp"

using namespace pd;

TEST_CASE("OutputRingBuffer basic operations", "[OutputRingBuffer]") {
  OutputRingBuffer buffer(3);

  SECTION("Empty buffer state") {
    REQUIRE(buffer.empty());
    REQUIRE(buffer.size() == 0);
    REQUIRE(buffer.byteLength() == 0);
    REQUIRE(buffer.joined() == "");
    REQUIRE(buffer.getCapacity() == 3);
  }

  SECTION("Joins chunks in arrival order") {
    buffer.push("ab");
    buffer.push("cd");
    REQUIRE(buffer.size() == 2);
    REQUIRE(buffer.byteLength() == 4);
    REQUIRE(buffer.joined() == "abcd");
  }

  SECTION("Evicts the oldest chunks beyond capacity") {
    buffer.push("1");
    buffer.push("22");
    buffer.push("333");
    buffer.push("4444");
    REQUIRE(buffer.size() == 3);
    REQUIRE(buffer.getChunks().front() == "22");
    REQUIRE(buffer.joined() == "223334444");
    REQUIRE(buffer.byteLength() == 9);
  }

  SECTION("Empty chunks are ignored") {
    buffer.push("");
    REQUIRE(buffer.empty());
  }

  SECTION("Clear buffer") {
    buffer.push("hello");
    buffer.clear();
    REQUIRE(buffer.empty());
    REQUIRE(buffer.byteLength() == 0);
  }
}

TEST_CASE("OutputRingBuffer keeps the newest chunks of a long stream",
          "[OutputRingBuffer]") {
  OutputRingBuffer buffer(200);
  string expected;
  for (int i = 0; i < 500; i++) {
    string chunk = "line " + to_string(i) + "\n";
    buffer.push(chunk);
    if (i >= 300) {
      expected += chunk;
    }
  }
  REQUIRE(buffer.size() == 200);
  REQUIRE(buffer.getChunks().front() == "line 300\n");
  REQUIRE(buffer.getChunks().back() == "line 499\n");
  REQUIRE(buffer.joined() == expected);
  REQUIRE(buffer.byteLength() == int64_t(expected.size()));
}
