#pragma once
/** @file  DumpWriter.hpp
 *  @brief Buffered binary writer for the RX / TX / RX+TX dump files.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace uartdec {
  namespace io {

    /**
 * @class DumpWriter
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Buffers up to 4 kB, then pushes the chunk with `std::fwrite`.
 *  * Non-copyable, move-enabled (sole owner of the FILE*).
 */
    class DumpWriter {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      DumpWriter() = default;
      ~DumpWriter(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues raw bytes; returns false if a chunk flush failed. */
      bool write(const std::vector<std::uint8_t>& bytes);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      /** Flush + fclose; returns false if the final flush failed. */
      bool close();

      bool isOpen() const { return fp_ != nullptr; }
      std::size_t bytesWritten() const { return written_; }

      //---non-copyable, move-enabled---------------------------------------
      DumpWriter(const DumpWriter&) = delete;
      DumpWriter& operator=(const DumpWriter&) = delete;
      DumpWriter(DumpWriter&& other) noexcept;
      DumpWriter& operator=(DumpWriter&& other) noexcept;

    private:
      std::FILE* fp_{ nullptr };
      std::vector<std::uint8_t> buffer_;
      std::size_t written_{ 0 }; ///< bytes accepted by write()
    };

  } // namespace io
} // namespace uartdec
