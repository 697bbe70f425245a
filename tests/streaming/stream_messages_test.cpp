#include "streaming/stream_messages.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("Connected message carries the resolution", "[streaming][messages]") {
  REQUIRE(scopecam::streaming::BuildConnectedMessage(1280U, 1024U) ==
          R"({"type":"connected","resolution":{"width":1280,"height":1024}})");
}

TEST_CASE("Frame message embeds the base64 payload verbatim", "[streaming][messages]") {
  REQUIRE(scopecam::streaming::BuildFrameMessage("/9j/4A==", 12.5) ==
          R"({"type":"frame","data":"/9j/4A==","timestamp":12.5})");
}

TEST_CASE("Frame message keeps sub-second timestamp precision", "[streaming][messages]") {
  const std::string message = scopecam::streaming::BuildFrameMessage("", 1234.567);
  REQUIRE(message == R"({"type":"frame","data":"","timestamp":1234.57})");
}
