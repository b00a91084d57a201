/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file socket.hpp
 * @brief POSIX TCP socket RAII wrappers for the broker transport.
 *
 * TcpSocket supports non-blocking connect (kInProgress until the poller
 * reports writability, then TakeError() yields the outcome). TcpListener is
 * used by the loopback test broker. All errors are returned via
 * sbench::expected<V,E>; the failing errno is left in errno for callers
 * that want to report it.
 */

#ifndef SBENCH_SOCKET_HPP_
#define SBENCH_SOCKET_HPP_

#include "sbench/platform.hpp"
#include "sbench/vocabulary.hpp"

#if SBENCH_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace sbench {

constexpr int32_t kDefaultBacklog = 128;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kResolveFailed,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kInProgress,     ///< Non-blocking connect started; wait for writability.
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kWouldBlock,     ///< EAGAIN/EWOULDBLOCK, transient.
};

inline const char* SocketErrorName(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd: return "invalid fd";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kResolveFailed: return "resolve failed";
    case SocketError::kBindFailed: return "bind failed";
    case SocketError::kListenFailed: return "listen failed";
    case SocketError::kConnectFailed: return "connect failed";
    case SocketError::kInProgress: return "connect in progress";
    case SocketError::kSendFailed: return "send failed";
    case SocketError::kRecvFailed: return "recv failed";
    case SocketError::kAcceptFailed: return "accept failed";
    case SocketError::kSetOptFailed: return "setsockopt failed";
    case SocketError::kWouldBlock: return "would block";
    default: return "unknown";
  }
}

// ============================================================================
// SocketAddress
// ============================================================================

/**
 * @brief IPv4 socket address (sockaddr_in).
 */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /**
   * @brief Build from a dotted-decimal string and a host-order port.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /// Copy of @p sin with the port replaced by @p port (host order).
  static SocketAddress FromSockaddr(const sockaddr_in& sin,
                                    uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_ = sin;
    sa.addr_.sin_port = htons(port);
    return sa;
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /// Dotted-decimal form of the address, written into @p buf.
  const char* ToString(char* buf, socklen_t len) const noexcept {
    if (::inet_ntop(AF_INET, &addr_.sin_addr, buf, len) == nullptr) {
      return "?";
    }
    return buf;
  }

 private:
  sockaddr_in addr_;
};

/**
 * @brief Resolve @p host (name or dotted-decimal) to its first IPv4 address.
 *
 * Blocking (getaddrinfo); call once at startup, never on a client queue.
 */
inline expected<SocketAddress, SocketError> ResolveIpv4(const char* host,
                                                        uint16_t port) noexcept {
  auto literal = SocketAddress::FromIpv4(host, port);
  if (literal.has_value()) {
    return literal;
  }
  if (host == nullptr) {
    return expected<SocketAddress, SocketError>::error(
        SocketError::kInvalidAddress);
  }
  struct addrinfo hints {};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  if (::getaddrinfo(host, nullptr, &hints, &res) != 0 || res == nullptr) {
    return expected<SocketAddress, SocketError>::error(
        SocketError::kResolveFailed);
  }
  SBENCH_SCOPE_EXIT(::freeaddrinfo(res));
  sockaddr_in sin {};
  std::memcpy(&sin, res->ai_addr, sizeof(sin));
  return expected<SocketAddress, SocketError>::success(
      SocketAddress::FromSockaddr(sin, port));
}

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief RAII TCP stream socket. Movable, not copyable.
 */
class TcpSocket {
 public:
  TcpSocket() noexcept : fd_(-1) {}

  ~TcpSocket() { Close(); }

  TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  TcpSocket& operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  static expected<TcpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  /**
   * @brief Start connecting.
   *
   * On a non-blocking socket returns kInProgress when the handshake is
   * pending; poll for writability and call TakeError().
   */
  expected<void, SocketError> Connect(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::connect(fd_, addr.Raw(), addr.Size()) < 0) {
      if (errno == EINPROGRESS) {
        return expected<void, SocketError>::error(SocketError::kInProgress);
      }
      return expected<void, SocketError>::error(SocketError::kConnectFailed);
    }
    return expected<void, SocketError>::success();
  }

  /// Fetch and clear SO_ERROR (0 when a pending connect succeeded).
  int32_t TakeError() noexcept {
    int32_t err = 0;
    socklen_t len = static_cast<socklen_t>(sizeof(err));
    if (fd_ < 0 || ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
      return (fd_ < 0) ? EBADF : errno;
    }
    return err;
  }

  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /// Returns 0 on orderly shutdown by the peer.
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::recv(fd_, buf, len, 0);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<void, SocketError> SetNonBlocking(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, flags) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetNoDelay(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = enable ? 1 : 0;
    if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Close the socket. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  friend class TcpListener;

  explicit TcpSocket(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief RAII TCP listener socket.
 */
class TcpListener {
 public:
  TcpListener() noexcept : fd_(-1) {}

  ~TcpListener() { Close(); }

  TcpListener(TcpListener&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
  }

  TcpListener& operator=(TcpListener&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  static expected<TcpListener, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = 1;
    (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt,
                       static_cast<socklen_t>(sizeof(opt)));
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
  }

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> Listen(
      int32_t backlog = kDefaultBacklog) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::listen(fd_, backlog) < 0) {
      return expected<void, SocketError>::error(SocketError::kListenFailed);
    }
    return expected<void, SocketError>::success();
  }

  /// Blocking accept.
  expected<TcpSocket, SocketError> Accept() noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t client_fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client_fd));
  }

  /// Port the listener is bound to (useful after binding port 0).
  expected<uint16_t, SocketError> LocalPort() const noexcept {
    SocketAddress sa;
    socklen_t len = sa.Size();
    if (fd_ < 0 || ::getsockname(fd_, sa.RawMut(), &len) < 0) {
      return expected<uint16_t, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<uint16_t, SocketError>::success(sa.Port());
  }

  /// Unblock a pending Accept() from another thread.
  void ShutdownRead() noexcept {
    if (fd_ >= 0) {
      (void)::shutdown(fd_, SHUT_RD);
    }
  }

  void Close() noexcept {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit TcpListener(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

}  // namespace sbench

#endif  // SBENCH_HAS_NETWORK

#endif  // SBENCH_SOCKET_HPP_
