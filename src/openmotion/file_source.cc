#include "openmotion/file_source.h"

#include <cstdio>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <cerrno>
#    include <fcntl.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace openmotion {

FileSource::FileSource() noexcept = default;


FileSource::~FileSource() noexcept
{
    close();
}


FileSource::FileSource(FileSource&& other) noexcept
{
    *this = std::move(other);
}


FileSource&
FileSource::operator=(FileSource&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

#if defined(_WIN32)
    file_handle_       = other.file_handle_;
    other.file_handle_ = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif

    size_       = other.size_;
    pos_        = other.pos_;
    other.size_ = 0;
    other.pos_  = 0;
    return *this;
}


FileStatus
FileSource::open(const char* path) noexcept
{
    close();

    if (!path || !*path) {
        return FileStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                             OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return FileStatus::OpenFailed;
    }

    LARGE_INTEGER sz;
    if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
        ::CloseHandle(h);
        return FileStatus::StatFailed;
    }

    file_handle_ = static_cast<void*>(h);
    size_        = static_cast<uint64_t>(sz.QuadPart);
    pos_         = 0;
    return FileStatus::Ok;
#else
    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return FileStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        ::close(fd);
        return FileStatus::StatFailed;
    }

    fd_   = fd;
    size_ = static_cast<uint64_t>(st.st_size);
    pos_  = 0;
    return FileStatus::Ok;
#endif
}


void
FileSource::close() noexcept
{
#if defined(_WIN32)
    if (file_handle_) {
        ::CloseHandle(static_cast<HANDLE>(file_handle_));
    }
    file_handle_ = nullptr;
#else
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif

    size_ = 0;
    pos_  = 0;
}


bool
FileSource::is_open() const noexcept
{
#if defined(_WIN32)
    return file_handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


uint64_t
FileSource::size() const noexcept
{
    return size_;
}


IoStatus
FileSource::read(std::span<std::byte> out, uint64_t* read_bytes) noexcept
{
    if (read_bytes) {
        *read_bytes = 0;
    }
    if (!is_open()) {
        return IoStatus::IoError;
    }
    if (pos_ >= size_ || out.empty()) {
        return IoStatus::Ok;
    }

    uint64_t want = size_ - pos_;
    if (want > out.size()) {
        want = out.size();
    }

    uint64_t total = 0;
    while (total < want) {
        const uint64_t chunk_u64 = want - total;
#if defined(_WIN32)
        const DWORD chunk = chunk_u64 > 0x40000000U
                                ? 0x40000000U
                                : static_cast<DWORD>(chunk_u64);
        OVERLAPPED ov {};
        const uint64_t at = pos_ + total;
        ov.Offset         = static_cast<DWORD>(at & 0xFFFFFFFFu);
        ov.OffsetHigh     = static_cast<DWORD>((at >> 32) & 0xFFFFFFFFu);
        DWORD got         = 0;
        if (!::ReadFile(static_cast<HANDLE>(file_handle_), out.data() + total,
                        chunk, &got, &ov)) {
            return IoStatus::IoError;
        }
        if (got == 0) {
            break;
        }
        total += got;
#else
        const size_t chunk = chunk_u64 > 0x40000000U
                                 ? size_t { 0x40000000U }
                                 : static_cast<size_t>(chunk_u64);
        const ssize_t got  = ::pread(fd_, out.data() + total, chunk,
                                     static_cast<off_t>(pos_ + total));
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return IoStatus::IoError;
        }
        if (got == 0) {
            break;
        }
        total += static_cast<uint64_t>(got);
#endif
    }

    pos_ += total;
    if (read_bytes) {
        *read_bytes = total;
    }
    return IoStatus::Ok;
}


IoStatus
FileSource::seek(int64_t offset, SeekWhence whence, uint64_t* new_pos) noexcept
{
    int64_t base = 0;
    switch (whence) {
    case SeekWhence::Set: base = 0; break;
    case SeekWhence::Cur: base = static_cast<int64_t>(pos_); break;
    case SeekWhence::End: base = static_cast<int64_t>(size_); break;
    default: return IoStatus::InvalidArgument;
    }
    if (base + offset < 0) {
        return IoStatus::InvalidArgument;
    }
    pos_ = static_cast<uint64_t>(base + offset);
    if (new_pos) {
        *new_pos = pos_;
    }
    return IoStatus::Ok;
}


uint64_t
FileSource::tell() const noexcept
{
    return pos_;
}

namespace {

    class OutputFile final {
    public:
        OutputFile() noexcept = default;
        ~OutputFile() noexcept { close(); }

        OutputFile(const OutputFile&)            = delete;
        OutputFile& operator=(const OutputFile&) = delete;

        bool open(const char* path) noexcept
        {
#if defined(_WIN32)
            HANDLE h = ::CreateFileA(path, GENERIC_WRITE, 0, nullptr,
                                     CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL,
                                     nullptr);
            if (h == INVALID_HANDLE_VALUE) {
                return false;
            }
            handle_ = static_cast<void*>(h);
#else
            fd_ = ::open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd_ < 0) {
                return false;
            }
#endif
            return true;
        }

        bool write_all(const std::byte* data, size_t size) noexcept
        {
            size_t done = 0;
            while (done < size) {
#if defined(_WIN32)
                const size_t left = size - done;
                const DWORD chunk = left > 0x40000000U
                                        ? 0x40000000U
                                        : static_cast<DWORD>(left);
                DWORD wrote       = 0;
                if (!::WriteFile(static_cast<HANDLE>(handle_), data + done,
                                 chunk, &wrote, nullptr)
                    || wrote == 0) {
                    return false;
                }
                done += wrote;
#else
                const ssize_t wrote = ::write(fd_, data + done, size - done);
                if (wrote < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                done += static_cast<size_t>(wrote);
#endif
            }
            return true;
        }

        bool close() noexcept
        {
            bool ok = true;
#if defined(_WIN32)
            if (handle_) {
                ok      = ::CloseHandle(static_cast<HANDLE>(handle_)) != 0;
                handle_ = nullptr;
            }
#else
            if (fd_ >= 0) {
                ok  = ::close(fd_) == 0;
                fd_ = -1;
            }
#endif
            return ok;
        }

    private:
#if defined(_WIN32)
        void* handle_ = nullptr;
#else
        int fd_ = -1;
#endif
    };


    static bool rename_over(const char* from, const char* to) noexcept
    {
#if defined(_WIN32)
        return ::MoveFileExA(from, to, MOVEFILE_REPLACE_EXISTING) != 0;
#else
        return std::rename(from, to) == 0;
#endif
    }

}  // namespace

WriteFileResult
write_stream_to_file(ByteSource& source, const char* path) noexcept
{
    WriteFileResult res;
    if (!path || !*path) {
        res.status = FileStatus::OpenFailed;
        return res;
    }

    std::string tmp_path(path);
    tmp_path.append(".tmp");

    const IoStatus rewind = source.seek(0, SeekWhence::Set, nullptr);
    if (rewind != IoStatus::Ok) {
        res.status    = FileStatus::ReadFailed;
        res.io_status = rewind;
        return res;
    }

    OutputFile out;
    if (!out.open(tmp_path.c_str())) {
        res.status = FileStatus::OpenFailed;
        return res;
    }

    std::vector<std::byte> buf(1024 * 1024);
    for (;;) {
        uint64_t n        = 0;
        const IoStatus st = source.read(std::span<std::byte>(buf), &n);
        if (st != IoStatus::Ok) {
            (void)out.close();
            (void)std::remove(tmp_path.c_str());
            res.status    = FileStatus::ReadFailed;
            res.io_status = st;
            return res;
        }
        if (n == 0) {
            break;
        }
        if (!out.write_all(buf.data(), static_cast<size_t>(n))) {
            (void)out.close();
            (void)std::remove(tmp_path.c_str());
            res.status = FileStatus::WriteFailed;
            return res;
        }
        res.bytes_written += n;
    }

    if (!out.close()) {
        (void)std::remove(tmp_path.c_str());
        res.status = FileStatus::WriteFailed;
        return res;
    }
    if (!rename_over(tmp_path.c_str(), path)) {
        (void)std::remove(tmp_path.c_str());
        res.status = FileStatus::RenameFailed;
        return res;
    }
    return res;
}

}  // namespace openmotion
