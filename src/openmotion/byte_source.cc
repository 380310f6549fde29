#include "openmotion/byte_source.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace openmotion {
namespace {

    static IoStatus resolve_seek(uint64_t pos, uint64_t size, int64_t offset,
                                 SeekWhence whence, uint64_t* out) noexcept
    {
        int64_t base = 0;
        switch (whence) {
        case SeekWhence::Set: base = 0; break;
        case SeekWhence::Cur: base = static_cast<int64_t>(pos); break;
        case SeekWhence::End: base = static_cast<int64_t>(size); break;
        default: return IoStatus::InvalidArgument;
        }
        const int64_t target = base + offset;
        if (target < 0) {
            return IoStatus::InvalidArgument;
        }
        *out = static_cast<uint64_t>(target);
        return IoStatus::Ok;
    }


    static uint64_t copy_from(std::span<const std::byte> bytes, uint64_t pos,
                              std::span<std::byte> out) noexcept
    {
        if (pos >= bytes.size() || out.empty()) {
            return 0;
        }
        const uint64_t avail = bytes.size() - pos;
        const uint64_t n     = std::min<uint64_t>(avail, out.size());
        std::memcpy(out.data(), bytes.data() + pos, static_cast<size_t>(n));
        return n;
    }

}  // namespace

IoStatus
read_fully(ByteSource& source, std::span<std::byte> out,
           uint64_t* read_bytes) noexcept
{
    uint64_t total = 0;
    while (total < out.size()) {
        uint64_t n          = 0;
        const IoStatus status = source.read(out.subspan(total), &n);
        if (status != IoStatus::Ok) {
            if (read_bytes) {
                *read_bytes = total;
            }
            return status;
        }
        if (n == 0) {
            break;
        }
        total += n;
    }
    if (read_bytes) {
        *read_bytes = total;
    }
    return IoStatus::Ok;
}


IoStatus
read_to_end(ByteSource& source, std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return IoStatus::InvalidArgument;
    }
    std::byte chunk[64 * 1024];
    for (;;) {
        uint64_t n            = 0;
        const IoStatus status = source.read(std::span<std::byte>(chunk), &n);
        if (status != IoStatus::Ok) {
            return status;
        }
        if (n == 0) {
            return IoStatus::Ok;
        }
        out->insert(out->end(), chunk, chunk + n);
    }
}


IoStatus
stream_size(ByteSource& source, uint64_t* out) noexcept
{
    if (!out) {
        return IoStatus::InvalidArgument;
    }
    const uint64_t pos = source.tell();
    uint64_t end       = 0;
    IoStatus status    = source.seek(0, SeekWhence::End, &end);
    if (status != IoStatus::Ok) {
        return status;
    }
    status = source.seek(static_cast<int64_t>(pos), SeekWhence::Set, nullptr);
    if (status != IoStatus::Ok) {
        return status;
    }
    *out = end;
    return IoStatus::Ok;
}


MemorySource::MemorySource(std::vector<std::byte> bytes) noexcept
    : bytes_(std::move(bytes))
{
}


IoStatus
MemorySource::read(std::span<std::byte> out, uint64_t* read_bytes) noexcept
{
    const uint64_t n = copy_from(bytes_, pos_, out);
    pos_ += n;
    if (read_bytes) {
        *read_bytes = n;
    }
    return IoStatus::Ok;
}


IoStatus
MemorySource::seek(int64_t offset, SeekWhence whence,
                   uint64_t* new_pos) noexcept
{
    uint64_t target       = 0;
    const IoStatus status = resolve_seek(pos_, bytes_.size(), offset, whence,
                                         &target);
    if (status != IoStatus::Ok) {
        return status;
    }
    pos_ = target;
    if (new_pos) {
        *new_pos = pos_;
    }
    return IoStatus::Ok;
}


uint64_t
MemorySource::tell() const noexcept
{
    return pos_;
}


std::span<const std::byte>
MemorySource::bytes() const noexcept
{
    return bytes_;
}


SpanSource::SpanSource(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


IoStatus
SpanSource::read(std::span<std::byte> out, uint64_t* read_bytes) noexcept
{
    const uint64_t n = copy_from(bytes_, pos_, out);
    pos_ += n;
    if (read_bytes) {
        *read_bytes = n;
    }
    return IoStatus::Ok;
}


IoStatus
SpanSource::seek(int64_t offset, SeekWhence whence, uint64_t* new_pos) noexcept
{
    uint64_t target       = 0;
    const IoStatus status = resolve_seek(pos_, bytes_.size(), offset, whence,
                                         &target);
    if (status != IoStatus::Ok) {
        return status;
    }
    pos_ = target;
    if (new_pos) {
        *new_pos = pos_;
    }
    return IoStatus::Ok;
}


uint64_t
SpanSource::tell() const noexcept
{
    return pos_;
}

}  // namespace openmotion
