#pragma once

#include "openmotion/byte_source.h"

#include <cstddef>
#include <cstdint>

/**
 * \file file_source.h
 * \brief File-backed \ref ByteSource and atomic stream-to-file output.
 */

namespace openmotion {

/// Status code for file operations.
enum class FileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    ReadFailed,
    WriteFailed,
    RenameFailed,
};

/**
 * \brief Read-only file exposed as a \ref ByteSource.
 *
 * Reads are positional (`pread`), so two FileSource instances over the same
 * path keep independent cursors.
 */
class FileSource final : public ByteSource {
public:
    FileSource() noexcept;
    ~FileSource() noexcept override;

    FileSource(const FileSource&)            = delete;
    FileSource& operator=(const FileSource&) = delete;

    FileSource(FileSource&& other) noexcept;
    FileSource& operator=(FileSource&& other) noexcept;

    /// Opens \p path read-only and records its size.
    FileStatus open(const char* path) noexcept;

    /// Closes the file (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;

    IoStatus read(std::span<std::byte> out,
                  uint64_t* read_bytes) noexcept override;
    IoStatus seek(int64_t offset, SeekWhence whence,
                  uint64_t* new_pos) noexcept override;
    uint64_t tell() const noexcept override;

private:
#if defined(_WIN32)
    void* file_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
    uint64_t size_ = 0;
    uint64_t pos_  = 0;
};

/// Result of \ref write_stream_to_file.
struct WriteFileResult final {
    FileStatus status = FileStatus::Ok;
    /// Status of the failing source read when `status == ReadFailed`.
    IoStatus io_status     = IoStatus::Ok;
    uint64_t bytes_written = 0;
};

/**
 * \brief Copies \p source from offset 0 to its end into \p path.
 *
 * Bytes are written to `path + ".tmp"` first and renamed over \p path only
 * after the whole stream has been written; on failure the temporary file is
 * removed and \p path is left untouched.
 */
WriteFileResult
write_stream_to_file(ByteSource& source, const char* path) noexcept;

}  // namespace openmotion
