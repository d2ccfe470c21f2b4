#pragma once
/** @file  TcpChannel.hpp
 *  @brief Non-blocking TCP line I/O wrapper (uses poll under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace hvload {
  namespace io {

    /**
 * @class TcpChannel
 * @brief RAII wrapper around a single connected TCP socket.
 *
 *  * Frames I/O as ASCII lines (`\n` out, `\n` or `\r\n` in).
 *  * *Non-copyable*, but move-constructible.
 *  * Virtual I/O so tests can substitute a scripted channel.
 */
    class TcpChannel {

    public:
      /// Input without a line end is cut off here and returned as one overlong line.
      static constexpr std::size_t kMaxLineBytes = 4096;

      //---ctr / dtr--------------------------------------------
      TcpChannel() = default;
      virtual ~TcpChannel(); // close the socket at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& host, std::uint16_t port,
                        std::chrono::milliseconds timeout);
      virtual bool writeLine(const std::string& line); // returns false on EPIPE/ECONNRESET
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual void discardInput(); ///< drop buffered and already-arrived bytes
      virtual bool isOpen() const { return fd_ >= 0; }
      virtual void close();

      //---non-copyable-----------------------------------------
      TcpChannel(const TcpChannel&) = delete;
      TcpChannel& operator=(const TcpChannel&) = delete;

      //---mv and mv assign-------------------------------------
      TcpChannel(TcpChannel&& other) noexcept;
      TcpChannel& operator=(TcpChannel&& other) noexcept;

    private:
      int fd_{ -1 };            ///< socket fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received past the last complete line
    };
  } // namespace io
} // namespace hvload
