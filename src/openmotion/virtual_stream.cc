#include "openmotion/virtual_stream.h"

#include <algorithm>
#include <utility>

namespace openmotion {

SlicedIO::SlicedIO(ByteSource* source, uint64_t offset, uint64_t size) noexcept
    : source_(source)
    , begin_offset_(offset)
    , size_(size)
{
}


IoStatus
SlicedIO::read(std::span<std::byte> out, uint64_t* read_bytes) noexcept
{
    if (read_bytes) {
        *read_bytes = 0;
    }
    if (!source_) {
        return IoStatus::InvalidArgument;
    }
    if (rel_offset_ >= size_ || out.empty()) {
        return IoStatus::Ok;
    }

    IoStatus status = source_->seek(static_cast<int64_t>(begin_offset_
                                                         + rel_offset_),
                                    SeekWhence::Set, nullptr);
    if (status != IoStatus::Ok) {
        return status;
    }

    const uint64_t remaining = size_ - rel_offset_;
    const uint64_t want      = std::min<uint64_t>(remaining, out.size());
    uint64_t n               = 0;
    status = read_fully(*source_, out.first(static_cast<size_t>(want)), &n);
    rel_offset_ += n;
    if (read_bytes) {
        *read_bytes = n;
    }
    return status;
}


IoStatus
SlicedIO::seek(int64_t offset, SeekWhence whence, uint64_t* new_pos) noexcept
{
    int64_t target = 0;
    switch (whence) {
    case SeekWhence::Set:
        if (offset < 0) {
            return IoStatus::InvalidArgument;
        }
        target = offset;
        break;
    case SeekWhence::Cur:
        target = std::max<int64_t>(0, static_cast<int64_t>(rel_offset_)
                                          + offset);
        break;
    case SeekWhence::End:
        target = std::max<int64_t>(0, static_cast<int64_t>(size_) + offset);
        break;
    default: return IoStatus::InvalidArgument;
    }
    rel_offset_ = static_cast<uint64_t>(target);
    if (new_pos) {
        *new_pos = rel_offset_;
    }
    return IoStatus::Ok;
}


uint64_t
SlicedIO::tell() const noexcept
{
    return rel_offset_;
}


ChainedIO::ChainedIO(std::vector<std::unique_ptr<ByteSource>> streams) noexcept
    : streams_(std::move(streams))
{
    for (const std::unique_ptr<ByteSource>& s : streams_) {
        const IoStatus st = s ? s->seek(0, SeekWhence::Set, nullptr)
                              : IoStatus::InvalidArgument;
        if (st != IoStatus::Ok && init_status_ == IoStatus::Ok) {
            init_status_ = st;
        }
    }
}


IoStatus
ChainedIO::seek_next_stream() noexcept
{
    if (idx_ >= streams_.size()) {
        return IoStatus::Ok;
    }
    uint64_t ssize  = 0;
    IoStatus status = streams_[idx_]->seek(0, SeekWhence::End, &ssize);
    if (status != IoStatus::Ok) {
        return status;
    }

    ++idx_;
    if (idx_ < streams_.size()) {
        status = streams_[idx_]->seek(0, SeekWhence::Set, nullptr);
        if (status != IoStatus::Ok) {
            return status;
        }
    }
    begin_offset_ += ssize;
    return IoStatus::Ok;
}


IoStatus
ChainedIO::read(std::span<std::byte> out, uint64_t* read_bytes) noexcept
{
    if (read_bytes) {
        *read_bytes = 0;
    }
    if (init_status_ != IoStatus::Ok) {
        return init_status_;
    }

    uint64_t total = 0;
    while (idx_ < streams_.size() && total < out.size()) {
        uint64_t n      = 0;
        IoStatus status = read_fully(*streams_[idx_], out.subspan(total), &n);
        total += n;
        if (status != IoStatus::Ok) {
            if (read_bytes) {
                *read_bytes = total;
            }
            return status;
        }
        if (total < out.size()) {
            status = seek_next_stream();
            if (status != IoStatus::Ok) {
                if (read_bytes) {
                    *read_bytes = total;
                }
                return status;
            }
        }
    }

    if (read_bytes) {
        *read_bytes = total;
    }
    return IoStatus::Ok;
}


IoStatus
ChainedIO::seek_forward(uint64_t offset) noexcept
{
    while (idx_ < streams_.size()) {
        ByteSource& s     = *streams_[idx_];
        const uint64_t co = s.tell();
        uint64_t eo       = 0;
        IoStatus status   = s.seek(0, SeekWhence::End, &eo);
        if (status != IoStatus::Ok) {
            return status;
        }
        const uint64_t avail = eo > co ? eo - co : 0;
        if (offset <= avail) {
            return s.seek(static_cast<int64_t>(co + offset), SeekWhence::Set,
                          nullptr);
        }
        status = seek_next_stream();
        if (status != IoStatus::Ok) {
            return status;
        }
        offset -= avail;
    }
    offset_after_seek_end_ += offset;
    return IoStatus::Ok;
}


IoStatus
ChainedIO::seek(int64_t offset, SeekWhence whence, uint64_t* new_pos) noexcept
{
    if (init_status_ != IoStatus::Ok) {
        return init_status_;
    }

    IoStatus status = IoStatus::Ok;
    switch (whence) {
    case SeekWhence::Cur:
        if (offset < 0) {
            return IoStatus::Unsupported;
        }
        status = seek_forward(static_cast<uint64_t>(offset));
        break;
    case SeekWhence::Set:
        if (offset < 0) {
            return IoStatus::InvalidArgument;
        }
        idx_                   = 0;
        begin_offset_          = 0;
        offset_after_seek_end_ = 0;
        if (!streams_.empty()) {
            status = streams_[0]->seek(0, SeekWhence::Set, nullptr);
        }
        if (status == IoStatus::Ok && offset > 0) {
            status = seek_forward(static_cast<uint64_t>(offset));
        }
        break;
    case SeekWhence::End:
        if (offset < 0) {
            return IoStatus::Unsupported;
        }
        idx_                   = 0;
        begin_offset_          = 0;
        offset_after_seek_end_ = 0;
        while (status == IoStatus::Ok && idx_ < streams_.size()) {
            status = seek_next_stream();
        }
        if (status == IoStatus::Ok && offset > 0) {
            status = seek_forward(static_cast<uint64_t>(offset));
        }
        break;
    default: return IoStatus::InvalidArgument;
    }

    if (status != IoStatus::Ok) {
        return status;
    }
    if (new_pos) {
        *new_pos = tell();
    }
    return IoStatus::Ok;
}


uint64_t
ChainedIO::tell() const noexcept
{
    const uint64_t rel = idx_ < streams_.size() ? streams_[idx_]->tell()
                                                : offset_after_seek_end_;
    return begin_offset_ + rel;
}

}  // namespace openmotion
