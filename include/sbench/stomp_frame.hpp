/**
 * @file stomp_frame.hpp
 * @brief STOMP 1.0/1.1 frame model, encoder and incremental decoder.
 *
 * Wire shape:
 *   COMMAND\n
 *   name:value\n ...
 *   \n
 *   body\0
 *
 * Header values are passed through verbatim (no 1.1/1.2 escaping).
 */

#ifndef SBENCH_STOMP_FRAME_HPP_
#define SBENCH_STOMP_FRAME_HPP_

#include "sbench/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace sbench {

// ============================================================================
// Commands
// ============================================================================

namespace stomp {

constexpr const char* kConnect = "CONNECT";
constexpr const char* kConnected = "CONNECTED";
constexpr const char* kSend = "SEND";
constexpr const char* kSubscribe = "SUBSCRIBE";
constexpr const char* kAck = "ACK";
constexpr const char* kDisconnect = "DISCONNECT";
constexpr const char* kMessage = "MESSAGE";
constexpr const char* kReceipt = "RECEIPT";
constexpr const char* kError = "ERROR";

}  // namespace stomp

// ============================================================================
// FrameError
// ============================================================================

enum class FrameError : uint8_t {
  kMalformedHeader = 0,
  kFrameTooLarge,
  kBadContentLength,
};

inline const char* FrameErrorName(FrameError e) noexcept {
  switch (e) {
    case FrameError::kMalformedHeader: return "malformed header";
    case FrameError::kFrameTooLarge: return "frame too large";
    case FrameError::kBadContentLength: return "bad content-length";
    default: return "unknown";
  }
}

// ============================================================================
// Frame
// ============================================================================

struct Frame {
  using Header = std::pair<std::string, std::string>;

  std::string command;
  std::vector<Header> headers;
  std::string body;

  Frame() = default;
  explicit Frame(std::string cmd) : command(std::move(cmd)) {}

  Frame& AddHeader(std::string name, std::string value) {
    headers.emplace_back(std::move(name), std::move(value));
    return *this;
  }

  /// Replace the first header named @p name, or append it.
  Frame& SetHeader(const std::string& name, std::string value) {
    for (auto& h : headers) {
      if (h.first == name) {
        h.second = std::move(value);
        return *this;
      }
    }
    headers.emplace_back(name, std::move(value));
    return *this;
  }

  /// First value for @p name (STOMP: the first occurrence wins).
  const std::string* FindHeader(const char* name) const noexcept {
    for (const auto& h : headers) {
      if (h.first == name) {
        return &h.second;
      }
    }
    return nullptr;
  }

  /// Append the wire encoding of this frame to @p out.
  void EncodeTo(std::string& out) const {
    out.reserve(out.size() + command.size() + body.size() + 64U);
    out.append(command);
    out.push_back('\n');
    for (const auto& h : headers) {
      out.append(h.first);
      out.push_back(':');
      out.append(h.second);
      out.push_back('\n');
    }
    out.push_back('\n');
    out.append(body);
    out.push_back('\0');
  }

  std::string Encode() const {
    std::string out;
    EncodeTo(out);
    return out;
  }
};

// ============================================================================
// FrameDecoder
// ============================================================================

static constexpr size_t kDefaultMaxFrameSize = 16U * 1024U * 1024U;

/**
 * @brief Incremental decoder. Feed() raw bytes, then call Next() until it
 *        yields false. Any error leaves the stream unusable.
 */
class FrameDecoder {
 public:
  explicit FrameDecoder(size_t max_frame_size = kDefaultMaxFrameSize)
      : max_frame_size_(max_frame_size) {}

  void Feed(const char* data, size_t len) { buf_.append(data, len); }

  /// Bytes received but not yet consumed by a complete frame.
  size_t Buffered() const noexcept { return buf_.size() - pos_; }

  /**
   * @brief Extract the next complete frame into @p out.
   * @return true when a frame was produced, false when more bytes are needed.
   */
  expected<bool, FrameError> Next(Frame& out) {
    // Heart-beats (bare EOLs) between frames.
    while (pos_ < buf_.size() && (buf_[pos_] == '\n' || buf_[pos_] == '\r')) {
      ++pos_;
    }
    Compact();
    if (pos_ >= buf_.size()) {
      return expected<bool, FrameError>::success(false);
    }

    const size_t head_end = FindHeaderEnd();
    if (head_end == std::string::npos) {
      if (Buffered() > max_frame_size_) {
        return expected<bool, FrameError>::error(FrameError::kFrameTooLarge);
      }
      return expected<bool, FrameError>::success(false);
    }

    Frame frame;
    size_t body_start = 0;
    auto parsed = ParseHead(head_end, frame, body_start);
    if (!parsed.has_value()) {
      return expected<bool, FrameError>::error(parsed.get_error());
    }

    size_t body_len = 0;
    const std::string* cl = frame.FindHeader("content-length");
    if (cl != nullptr) {
      char* end = nullptr;
      const unsigned long long v = std::strtoull(cl->c_str(), &end, 10);
      if (cl->empty() || end == nullptr || *end != '\0') {
        return expected<bool, FrameError>::error(FrameError::kBadContentLength);
      }
      if (v > max_frame_size_) {
        return expected<bool, FrameError>::error(FrameError::kFrameTooLarge);
      }
      body_len = static_cast<size_t>(v);
      if (buf_.size() < body_start + body_len + 1U) {
        return expected<bool, FrameError>::success(false);
      }
      if (buf_[body_start + body_len] != '\0') {
        return expected<bool, FrameError>::error(FrameError::kBadContentLength);
      }
    } else {
      const size_t nul = buf_.find('\0', body_start);
      if (nul == std::string::npos) {
        if (Buffered() > max_frame_size_) {
          return expected<bool, FrameError>::error(FrameError::kFrameTooLarge);
        }
        return expected<bool, FrameError>::success(false);
      }
      body_len = nul - body_start;
    }

    frame.body.assign(buf_, body_start, body_len);
    pos_ = body_start + body_len + 1U;
    out = std::move(frame);
    return expected<bool, FrameError>::success(true);
  }

 private:
  /// Offset of the blank line ending the header block, or npos.
  size_t FindHeaderEnd() const {
    size_t i = pos_;
    while (true) {
      const size_t nl = buf_.find('\n', i);
      if (nl == std::string::npos) {
        return std::string::npos;
      }
      size_t next = nl + 1U;
      if (next < buf_.size() && buf_[next] == '\r') {
        ++next;
      }
      if (next < buf_.size() && buf_[next] == '\n') {
        return nl;
      }
      if (next >= buf_.size()) {
        return std::string::npos;
      }
      i = nl + 1U;
    }
  }

  expected<void, FrameError> ParseHead(size_t head_end, Frame& frame,
                                       size_t& body_start) const {
    size_t line_start = pos_;
    bool first = true;
    while (line_start <= head_end) {
      size_t nl = buf_.find('\n', line_start);
      size_t line_end = nl;
      if (line_end > line_start && buf_[line_end - 1U] == '\r') {
        --line_end;
      }
      if (first) {
        frame.command.assign(buf_, line_start, line_end - line_start);
        if (frame.command.empty()) {
          return expected<void, FrameError>::error(
              FrameError::kMalformedHeader);
        }
        first = false;
      } else {
        const size_t colon = buf_.find(':', line_start);
        if (colon == std::string::npos || colon >= line_end ||
            colon == line_start) {
          return expected<void, FrameError>::error(
              FrameError::kMalformedHeader);
        }
        frame.headers.emplace_back(
            buf_.substr(line_start, colon - line_start),
            buf_.substr(colon + 1U, line_end - colon - 1U));
      }
      line_start = nl + 1U;
    }
    // Skip the blank line (\n or \r\n).
    if (line_start < buf_.size() && buf_[line_start] == '\r') {
      ++line_start;
    }
    body_start = line_start + 1U;
    return expected<void, FrameError>::success();
  }

  void Compact() {
    if (pos_ > 0U && (pos_ >= buf_.size() || pos_ > 64U * 1024U)) {
      buf_.erase(0, pos_);
      pos_ = 0;
    }
  }

  std::string buf_;
  size_t pos_ = 0;
  size_t max_frame_size_;
};

}  // namespace sbench

#endif  // SBENCH_STOMP_FRAME_HPP_
