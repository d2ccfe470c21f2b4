/* @file TcpChannel.cpp
 * @brief IO abstraction layer that wraps a TCP socket - handles fd, connect timeout, line framing and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// HVLoad headers
#include "io/TcpChannel.hpp"

using namespace hvload::io;

TcpChannel::~TcpChannel() { close(); }

TcpChannel::TcpChannel(TcpChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

TcpChannel& TcpChannel::operator=(TcpChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool TcpChannel::open(const std::string& host, std::uint16_t port,
                      std::chrono::milliseconds timeout) {
  close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res); rc != 0) {
    std::cerr << "[TcpChannel] getaddrinfo " << host << ": " << gai_strerror(rc) << "\n";
    return false;
  }

  for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0)
      continue;

    // non-blocking connect so the caller's deadline is honoured
    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      pollfd pfd{ fd, POLLOUT, 0 };
      int prc;
      do {
        prc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
      } while (prc == -1 && errno == EINTR);

      int soErr = 0;
      socklen_t len = sizeof(soErr);
      if (prc == 1 && ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len) == 0 && soErr == 0) {
        rc = 0;
      } else {
        if (prc == 0)
          std::cerr << "[TcpChannel] connect to " << host << ":" << port << " timed out\n";
        else
          std::cerr << "[TcpChannel] connect to " << host << ":" << port << ": "
                    << strerror(soErr != 0 ? soErr : errno) << "\n";
        rc = -1;
      }
    } else if (rc != 0) {
      std::cerr << "[TcpChannel] connect to " << host << ":" << port << ": " << strerror(errno)
                << "\n";
    }

    if (rc == 0) {
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)); // small request/reply lines
      fd_ = fd;
      break;
    }
    ::close(fd);
  }

  ::freeaddrinfo(res);
  rx_buffer_.clear();
  return fd_ >= 0;
}

bool TcpChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\n")) {
    out += "\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 1000) <= 0) {
        std::cerr << "[TcpChannel] send stalled\n";
        return false;
      }
    } else {
      std::cerr << "[TcpChannel] Error: " << errno << " from send: " << strerror(errno) << "\n";
      close();
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// TcpChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> TcpChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  auto takeLine = [this]() -> std::optional<std::string> {
    auto pos = rx_buffer_.find('\n');
    if (pos == std::string::npos)
      return std::nullopt;
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  };

  // a previous read may already hold the next line
  if (auto line = takeLine())
    return line;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "[TcpChannel] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = ::recv(fd_, temp, sizeof(temp), 0);
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // peer closed
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "[TcpChannel] recv: " << strerror(errno) << '\n';
        close();
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
      if (rx_buffer_.size() > kMaxLineBytes) {
        std::cerr << "[TcpChannel] no line end within " << kMaxLineBytes << " bytes\n";
        return std::exchange(rx_buffer_, std::string{});
      }
    }
  }
  return std::nullopt; // timeout/partial
}

void TcpChannel::discardInput() {
  rx_buffer_.clear();
  if (fd_ < 0)
    return;

  char temp[256];
  for (;;) {
    ssize_t n = ::recv(fd_, temp, sizeof(temp), MSG_DONTWAIT);
    if (n > 0)
      continue;
    if (n == 0)
      close();
    break; // EAGAIN (drained) or error
  }
}

void TcpChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
}
