/**
 * @file test_stomp_frame.cpp
 * @brief Tests for stomp_frame.hpp
 */

#include "sbench/stomp_frame.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using sbench::Frame;
using sbench::FrameDecoder;
using sbench::FrameError;

namespace {

void Feed(FrameDecoder& d, const std::string& bytes) {
  d.Feed(bytes.data(), bytes.size());
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("Frame encodes command, headers and body", "[stomp_frame]") {
  Frame f(sbench::stomp::kSend);
  f.AddHeader("destination", "/queue/a").AddHeader("receipt", "r-1");
  f.body = "hello";
  REQUIRE(f.Encode() ==
          std::string("SEND\ndestination:/queue/a\nreceipt:r-1\n\nhello\0", 45));
}

TEST_CASE("Frame header lookup and replace", "[stomp_frame]") {
  Frame f(sbench::stomp::kConnect);
  f.AddHeader("login", "a").AddHeader("login", "b");
  REQUIRE(*f.FindHeader("login") == "a");
  REQUIRE(f.FindHeader("passcode") == nullptr);

  f.SetHeader("login", "c");
  REQUIRE(*f.FindHeader("login") == "c");
  REQUIRE(f.headers.size() == 2U);
  f.SetHeader("passcode", "p");
  REQUIRE(f.headers.size() == 3U);
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE("FrameDecoder decodes an encoded frame", "[stomp_frame]") {
  Frame in(sbench::stomp::kMessage);
  in.AddHeader("destination", "/topic/x").AddHeader("message-id", "7");
  in.body = "payload";

  FrameDecoder d;
  Feed(d, in.Encode());
  Frame out;
  auto r = d.Next(out);
  REQUIRE(r.has_value());
  REQUIRE(r.value());
  REQUIRE(out.command == "MESSAGE");
  REQUIRE(out.headers == in.headers);
  REQUIRE(out.body == "payload");
  REQUIRE(d.Buffered() == 0U);

  auto again = d.Next(out);
  REQUIRE(again.has_value());
  REQUIRE(!again.value());
}

TEST_CASE("FrameDecoder waits for split input", "[stomp_frame]") {
  const std::string wire("RECEIPT\nreceipt-id:r-9\n\n\0", 25);
  FrameDecoder d;
  Frame out;
  for (size_t i = 0; i + 1U < wire.size(); ++i) {
    d.Feed(&wire[i], 1U);
    auto r = d.Next(out);
    REQUIRE(r.has_value());
    REQUIRE(!r.value());
  }
  d.Feed(&wire[wire.size() - 1U], 1U);
  auto r = d.Next(out);
  REQUIRE(r.has_value());
  REQUIRE(r.value());
  REQUIRE(out.command == "RECEIPT");
  REQUIRE(*out.FindHeader("receipt-id") == "r-9");
  REQUIRE(out.body.empty());
}

TEST_CASE("FrameDecoder skips heart-beats and CRLF line endings", "[stomp_frame]") {
  FrameDecoder d;
  Feed(d, std::string("\n\r\n\nCONNECTED\r\nversion:1.2\r\n\r\n\0\n\n", 33));
  Frame out;
  auto r = d.Next(out);
  REQUIRE(r.has_value());
  REQUIRE(r.value());
  REQUIRE(out.command == "CONNECTED");
  REQUIRE(*out.FindHeader("version") == "1.2");

  r = d.Next(out);
  REQUIRE(r.has_value());
  REQUIRE(!r.value());
  REQUIRE(d.Buffered() == 0U);
}

TEST_CASE("FrameDecoder yields several frames from one feed", "[stomp_frame]") {
  Frame a(sbench::stomp::kReceipt);
  a.AddHeader("receipt-id", "1");
  Frame b(sbench::stomp::kMessage);
  b.AddHeader("message-id", "2");
  b.body = "x";

  FrameDecoder d;
  Feed(d, a.Encode() + b.Encode());
  Frame out;
  REQUIRE(d.Next(out).value());
  REQUIRE(out.command == "RECEIPT");
  REQUIRE(d.Next(out).value());
  REQUIRE(out.command == "MESSAGE");
  REQUIRE(out.body == "x");
  REQUIRE(!d.Next(out).value());
}

TEST_CASE("FrameDecoder honours content-length", "[stomp_frame]") {
  FrameDecoder d;
  const std::string body("a\0b", 3);
  Feed(d, "MESSAGE\ncontent-length:3\n\n");
  Frame out;
  REQUIRE(!d.Next(out).value());
  Feed(d, body);
  REQUIRE(!d.Next(out).value());
  Feed(d, std::string("\0", 1));
  auto r = d.Next(out);
  REQUIRE(r.has_value());
  REQUIRE(r.value());
  REQUIRE(out.body == body);
}

TEST_CASE("FrameDecoder reports malformed input", "[stomp_frame]") {
  FrameDecoder d;
  Frame out;

  SECTION("header without colon") {
    Feed(d, std::string("SEND\nbogus\n\n\0", 13));
    auto r = d.Next(out);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == FrameError::kMalformedHeader);
  }

  SECTION("empty header name") {
    Feed(d, std::string("SEND\n:v\n\n\0", 10));
    auto r = d.Next(out);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == FrameError::kMalformedHeader);
  }

  SECTION("non-numeric content-length") {
    Feed(d, std::string("SEND\ncontent-length:abc\n\nx\0", 27));
    auto r = d.Next(out);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == FrameError::kBadContentLength);
  }

  SECTION("content-length not followed by NUL") {
    Feed(d, std::string("SEND\ncontent-length:1\n\nxy\0", 26));
    auto r = d.Next(out);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == FrameError::kBadContentLength);
  }
}

TEST_CASE("FrameDecoder enforces the frame size limit", "[stomp_frame]") {
  FrameDecoder d(16U);
  Frame out;

  SECTION("oversized body") {
    Feed(d, "SEND\n\n" + std::string(64, 'z'));
    auto r = d.Next(out);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == FrameError::kFrameTooLarge);
  }

  SECTION("oversized content-length") {
    Feed(d, "SEND\ncontent-length:100\n\n");
    auto r = d.Next(out);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == FrameError::kFrameTooLarge);
  }
}

TEST_CASE("FrameErrorName", "[stomp_frame]") {
  REQUIRE(std::string(sbench::FrameErrorName(FrameError::kFrameTooLarge)) ==
          "frame too large");
}
