#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for run logs on the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace hvload {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for run logs (10 kB – 10 MB).
 *  * Uses `std::fwrite` in 4 kB chunks.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunk = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one line (caller includes trailing '\n'); returns false once the file failed. */
      bool write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace hvload
