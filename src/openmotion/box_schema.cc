#include "openmotion/box_schema.h"

#include "byte_io_internal.h"

#include <limits>
#include <utility>

namespace openmotion {

Box
make_container_box(uint32_t type, std::vector<Box> children)
{
    Box b;
    b.type     = type;
    b.kind     = BoxKind::Container;
    b.children = std::move(children);
    return b;
}


Box
make_leaf_box(uint32_t type, LeafData leaf)
{
    Box b;
    b.type = type;
    b.kind = BoxKind::Leaf;
    b.leaf = std::move(leaf);
    return b;
}


Box
make_opaque_box(uint32_t type, std::vector<std::byte> data)
{
    Box b;
    b.type = type;
    b.kind = BoxKind::Opaque;
    b.data = std::move(data);
    return b;
}


const BoxSchemaEntry*
BoxSchema::find(uint32_t type) const noexcept
{
    for (const BoxSchemaEntry& e : entries) {
        if (e.type == type) {
            return &e;
        }
    }
    return nullptr;
}

namespace {

    constexpr BoxSchemaEntry leaf_entry(uint32_t type,
                                        LeafLayout layout) noexcept
    {
        return BoxSchemaEntry { type, BoxKind::Leaf, layout, nullptr };
    }


    constexpr BoxSchemaEntry container_entry(uint32_t type,
                                             const BoxSchema* children) noexcept
    {
        return BoxSchemaEntry { type, BoxKind::Container,
                                LeafLayout::MovieHeader, children };
    }

    static constexpr BoxSchema kEmptySchema {};

    static constexpr BoxSchemaEntry kStblEntries[] = {
        leaf_entry(fourcc('s', 't', 's', 'd'), LeafLayout::SampleDescription),
        leaf_entry(fourcc('s', 't', 't', 's'), LeafLayout::TimeToSample),
        leaf_entry(fourcc('c', 't', 't', 's'), LeafLayout::CompositionOffset),
        leaf_entry(fourcc('s', 't', 's', 'c'), LeafLayout::SampleToChunk),
        leaf_entry(fourcc('s', 't', 's', 'z'), LeafLayout::SampleSize),
        leaf_entry(fourcc('s', 't', 'c', 'o'), LeafLayout::ChunkOffset),
        leaf_entry(fourcc('c', 'o', '6', '4'), LeafLayout::ChunkLargeOffset),
        leaf_entry(fourcc('s', 't', 's', 's'), LeafLayout::SyncSample),
    };
    static constexpr BoxSchema kStblSchema { kStblEntries };

    static constexpr BoxSchemaEntry kDinfEntries[] = {
        leaf_entry(fourcc('d', 'r', 'e', 'f'), LeafLayout::DataReference),
    };
    static constexpr BoxSchema kDinfSchema { kDinfEntries };

    static constexpr BoxSchemaEntry kMinfEntries[] = {
        container_entry(fourcc('d', 'i', 'n', 'f'), &kDinfSchema),
        container_entry(fourcc('s', 't', 'b', 'l'), &kStblSchema),
    };
    static constexpr BoxSchema kMinfSchema { kMinfEntries };

    static constexpr BoxSchemaEntry kMinfNoStblEntries[] = {
        container_entry(fourcc('d', 'i', 'n', 'f'), &kDinfSchema),
    };
    static constexpr BoxSchema kMinfNoStblSchema { kMinfNoStblEntries };

    static constexpr BoxSchemaEntry kMdiaEntries[] = {
        leaf_entry(fourcc('m', 'd', 'h', 'd'), LeafLayout::MediaHeader),
        leaf_entry(fourcc('h', 'd', 'l', 'r'), LeafLayout::HandlerReference),
        container_entry(fourcc('m', 'i', 'n', 'f'), &kMinfSchema),
    };
    static constexpr BoxSchema kMdiaSchema { kMdiaEntries };

    static constexpr BoxSchemaEntry kMdiaNoStblEntries[] = {
        leaf_entry(fourcc('m', 'd', 'h', 'd'), LeafLayout::MediaHeader),
        leaf_entry(fourcc('h', 'd', 'l', 'r'), LeafLayout::HandlerReference),
        container_entry(fourcc('m', 'i', 'n', 'f'), &kMinfNoStblSchema),
    };
    static constexpr BoxSchema kMdiaNoStblSchema { kMdiaNoStblEntries };

    static constexpr BoxSchemaEntry kEdtsEntries[] = {
        leaf_entry(fourcc('e', 'l', 's', 't'), LeafLayout::EditList),
    };
    static constexpr BoxSchema kEdtsSchema { kEdtsEntries };

    static constexpr BoxSchemaEntry kTrakEntries[] = {
        leaf_entry(fourcc('t', 'k', 'h', 'd'), LeafLayout::TrackHeader),
        container_entry(fourcc('e', 'd', 't', 's'), &kEdtsSchema),
        container_entry(fourcc('m', 'd', 'i', 'a'), &kMdiaSchema),
    };
    static constexpr BoxSchema kTrakSchema { kTrakEntries };

    static constexpr BoxSchemaEntry kTrakNoStblEntries[] = {
        leaf_entry(fourcc('t', 'k', 'h', 'd'), LeafLayout::TrackHeader),
        container_entry(fourcc('e', 'd', 't', 's'), &kEdtsSchema),
        container_entry(fourcc('m', 'd', 'i', 'a'), &kMdiaNoStblSchema),
    };
    static constexpr BoxSchema kTrakNoStblSchema { kTrakNoStblEntries };

    // udta children are vendor specific and stay opaque.
    static constexpr BoxSchemaEntry kMoovEntries[] = {
        leaf_entry(fourcc('m', 'v', 'h', 'd'), LeafLayout::MovieHeader),
        container_entry(fourcc('u', 'd', 't', 'a'), &kEmptySchema),
        container_entry(fourcc('t', 'r', 'a', 'k'), &kTrakSchema),
    };
    static constexpr BoxSchema kMoovSchema { kMoovEntries };

    static constexpr BoxSchemaEntry kMoovNoStblEntries[] = {
        leaf_entry(fourcc('m', 'v', 'h', 'd'), LeafLayout::MovieHeader),
        container_entry(fourcc('u', 'd', 't', 'a'), &kEmptySchema),
        container_entry(fourcc('t', 'r', 'a', 'k'), &kTrakNoStblSchema),
    };
    static constexpr BoxSchema kMoovNoStblSchema { kMoovNoStblEntries };

    static constexpr BoxSchemaEntry kMp4Entries[] = {
        container_entry(fourcc('m', 'o', 'o', 'v'), &kMoovSchema),
    };
    static constexpr BoxSchema kMp4Schema { kMp4Entries };

    static constexpr BoxSchemaEntry kMp4NoStblEntries[] = {
        container_entry(fourcc('m', 'o', 'o', 'v'), &kMoovNoStblSchema),
    };
    static constexpr BoxSchema kMp4NoStblSchema { kMp4NoStblEntries };

}  // namespace

const BoxSchema&
mp4_schema() noexcept
{
    return kMp4Schema;
}


const BoxSchema&
mp4_without_stbl_schema() noexcept
{
    return kMp4NoStblSchema;
}


const BoxSchema&
moov_schema() noexcept
{
    return kMoovSchema;
}


const BoxSchema&
moov_without_stbl_schema() noexcept
{
    return kMoovNoStblSchema;
}


const BoxSchema&
stbl_schema() noexcept
{
    return kStblSchema;
}

namespace {

    // Sequential big-endian reader over a leaf payload.
    class PayloadReader final {
    public:
        explicit PayloadReader(std::span<const std::byte> bytes) noexcept
            : bytes_(bytes)
        {
        }

        bool u8(uint8_t* out) noexcept
        {
            return advance(read_u8(bytes_, pos_, out), 1);
        }

        bool u16(uint16_t* out) noexcept
        {
            return advance(read_u16be(bytes_, pos_, out), 2);
        }

        bool i16(int16_t* out) noexcept
        {
            uint16_t v = 0;
            if (!u16(&v)) {
                return false;
            }
            *out = static_cast<int16_t>(v);
            return true;
        }

        bool u24(uint32_t* out) noexcept
        {
            return advance(read_u24be(bytes_, pos_, out), 3);
        }

        bool u32(uint32_t* out) noexcept
        {
            return advance(read_u32be(bytes_, pos_, out), 4);
        }

        bool i32(int32_t* out) noexcept
        {
            uint32_t v = 0;
            if (!u32(&v)) {
                return false;
            }
            *out = static_cast<int32_t>(v);
            return true;
        }

        bool u64(uint64_t* out) noexcept
        {
            return advance(read_u64be(bytes_, pos_, out), 8);
        }

        bool i64(int64_t* out) noexcept
        {
            uint64_t v = 0;
            if (!u64(&v)) {
                return false;
            }
            *out = static_cast<int64_t>(v);
            return true;
        }

        // 32-bit for version 0, 64-bit for version 1.
        bool versioned_u(uint8_t version, uint64_t* out) noexcept
        {
            if (version == 1) {
                return u64(out);
            }
            uint32_t v = 0;
            if (!u32(&v)) {
                return false;
            }
            *out = v;
            return true;
        }

        bool versioned_i(uint8_t version, int64_t* out) noexcept
        {
            if (version == 1) {
                return i64(out);
            }
            int32_t v = 0;
            if (!i32(&v)) {
                return false;
            }
            *out = v;
            return true;
        }

        bool skip(uint64_t n) noexcept
        {
            if (remaining() < n) {
                return false;
            }
            pos_ += n;
            return true;
        }

        bool bytes(uint64_t n, std::span<const std::byte>* out) noexcept
        {
            if (remaining() < n) {
                return false;
            }
            *out = bytes_.subspan(static_cast<size_t>(pos_),
                                  static_cast<size_t>(n));
            pos_ += n;
            return true;
        }

        std::span<const std::byte> rest() noexcept
        {
            std::span<const std::byte> r = bytes_.subspan(
                static_cast<size_t>(pos_));
            pos_ = bytes_.size();
            return r;
        }

        // True if `count` entries of `entry_size` bytes can still be read.
        bool has_entries(uint32_t count, uint64_t entry_size) const noexcept
        {
            return static_cast<uint64_t>(count) * entry_size <= remaining();
        }

        uint64_t remaining() const noexcept { return bytes_.size() - pos_; }

    private:
        bool advance(bool ok, uint64_t n) noexcept
        {
            if (ok) {
                pos_ += n;
            }
            return ok;
        }

        std::span<const std::byte> bytes_;
        uint64_t pos_ = 0;
    };


    static bool read_full_box(PayloadReader* r, uint8_t* version,
                              uint32_t* flags) noexcept
    {
        return r->u8(version) && r->u24(flags);
    }


    static void append_full_box(std::vector<std::byte>* out, uint8_t version,
                                uint32_t flags)
    {
        append_u8(out, version);
        append_u24be(out, flags & 0x00FFFFFFU);
    }


    static bool append_versioned_u(std::vector<std::byte>* out,
                                   uint8_t version, uint64_t v)
    {
        if (version == 1) {
            append_u64be(out, v);
            return true;
        }
        if (v > 0xFFFFFFFFULL) {
            return false;
        }
        append_u32be(out, static_cast<uint32_t>(v));
        return true;
    }


    static bool append_versioned_i(std::vector<std::byte>* out,
                                   uint8_t version, int64_t v)
    {
        if (version == 1) {
            append_u64be(out, static_cast<uint64_t>(v));
            return true;
        }
        if (v < std::numeric_limits<int32_t>::min()
            || v > std::numeric_limits<int32_t>::max()) {
            return false;
        }
        append_u32be(out, static_cast<uint32_t>(static_cast<int32_t>(v)));
        return true;
    }


    static bool read_matrix(PayloadReader* r,
                            std::array<int32_t, 9>* matrix) noexcept
    {
        for (int32_t& m : *matrix) {
            if (!r->i32(&m)) {
                return false;
            }
        }
        return true;
    }


    static void append_matrix(std::vector<std::byte>* out,
                              const std::array<int32_t, 9>& matrix)
    {
        for (const int32_t m : matrix) {
            append_u32be(out, static_cast<uint32_t>(m));
        }
    }


    static bool append_count(std::vector<std::byte>* out, size_t count)
    {
        if (count > 0xFFFFFFFFULL) {
            return false;
        }
        append_u32be(out, static_cast<uint32_t>(count));
        return true;
    }

    // mvhd

    static bool decode_mvhd(PayloadReader* r, MovieHeader* m) noexcept
    {
        return read_full_box(r, &m->version, &m->flags)
               && r->versioned_u(m->version, &m->creation_time)
               && r->versioned_u(m->version, &m->modification_time)
               && r->u32(&m->timescale)
               && r->versioned_u(m->version, &m->duration) && r->i32(&m->rate)
               && r->i16(&m->volume) && r->skip(2 + 8)
               && read_matrix(r, &m->matrix) && r->skip(24)
               && r->u32(&m->next_track_id);
    }


    static bool encode_mvhd(const MovieHeader& m, std::vector<std::byte>* out)
    {
        append_full_box(out, m.version, m.flags);
        if (!append_versioned_u(out, m.version, m.creation_time)
            || !append_versioned_u(out, m.version, m.modification_time)) {
            return false;
        }
        append_u32be(out, m.timescale);
        if (!append_versioned_u(out, m.version, m.duration)) {
            return false;
        }
        append_u32be(out, static_cast<uint32_t>(m.rate));
        append_u16be(out, static_cast<uint16_t>(m.volume));
        append_zeros(out, 2 + 8);
        append_matrix(out, m.matrix);
        append_zeros(out, 24);
        append_u32be(out, m.next_track_id);
        return true;
    }

    // tkhd

    static bool decode_tkhd(PayloadReader* r, TrackHeader* t) noexcept
    {
        return read_full_box(r, &t->version, &t->flags)
               && r->versioned_u(t->version, &t->creation_time)
               && r->versioned_u(t->version, &t->modification_time)
               && r->u32(&t->track_id) && r->skip(4)
               && r->versioned_u(t->version, &t->duration) && r->skip(8)
               && r->i16(&t->layer) && r->i16(&t->alternate_group)
               && r->i16(&t->volume) && r->skip(2)
               && read_matrix(r, &t->matrix) && r->u32(&t->width)
               && r->u32(&t->height);
    }


    static bool encode_tkhd(const TrackHeader& t, std::vector<std::byte>* out)
    {
        append_full_box(out, t.version, t.flags);
        if (!append_versioned_u(out, t.version, t.creation_time)
            || !append_versioned_u(out, t.version, t.modification_time)) {
            return false;
        }
        append_u32be(out, t.track_id);
        append_zeros(out, 4);
        if (!append_versioned_u(out, t.version, t.duration)) {
            return false;
        }
        append_zeros(out, 8);
        append_u16be(out, static_cast<uint16_t>(t.layer));
        append_u16be(out, static_cast<uint16_t>(t.alternate_group));
        append_u16be(out, static_cast<uint16_t>(t.volume));
        append_zeros(out, 2);
        append_matrix(out, t.matrix);
        append_u32be(out, t.width);
        append_u32be(out, t.height);
        return true;
    }

    // elst

    static bool decode_elst(PayloadReader* r, EditList* e) noexcept
    {
        uint32_t count = 0;
        if (!read_full_box(r, &e->version, &e->flags) || !r->u32(&count)) {
            return false;
        }
        const uint64_t entry_size = e->version == 1 ? 20 : 12;
        if (!r->has_entries(count, entry_size)) {
            return false;
        }
        e->entries.resize(count);
        for (EditListEntry& entry : e->entries) {
            if (!r->versioned_i(e->version, &entry.segment_duration)
                || !r->versioned_i(e->version, &entry.media_time)
                || !r->i16(&entry.media_rate_integer)
                || !r->i16(&entry.media_rate_fraction)) {
                return false;
            }
        }
        return true;
    }


    static bool encode_elst(const EditList& e, std::vector<std::byte>* out)
    {
        append_full_box(out, e.version, e.flags);
        if (!append_count(out, e.entries.size())) {
            return false;
        }
        for (const EditListEntry& entry : e.entries) {
            if (!append_versioned_i(out, e.version, entry.segment_duration)
                || !append_versioned_i(out, e.version, entry.media_time)) {
                return false;
            }
            append_u16be(out, static_cast<uint16_t>(entry.media_rate_integer));
            append_u16be(out, static_cast<uint16_t>(entry.media_rate_fraction));
        }
        return true;
    }

    // mdhd

    static bool decode_mdhd(PayloadReader* r, MediaHeader* m) noexcept
    {
        return read_full_box(r, &m->version, &m->flags)
               && r->versioned_u(m->version, &m->creation_time)
               && r->versioned_u(m->version, &m->modification_time)
               && r->u32(&m->timescale)
               && r->versioned_u(m->version, &m->duration)
               && r->u16(&m->language) && r->skip(2);
    }


    static bool encode_mdhd(const MediaHeader& m, std::vector<std::byte>* out)
    {
        append_full_box(out, m.version, m.flags);
        if (!append_versioned_u(out, m.version, m.creation_time)
            || !append_versioned_u(out, m.version, m.modification_time)) {
            return false;
        }
        append_u32be(out, m.timescale);
        if (!append_versioned_u(out, m.version, m.duration)) {
            return false;
        }
        append_u16be(out, m.language);
        append_zeros(out, 2);
        return true;
    }

    // hdlr

    static bool decode_hdlr(PayloadReader* r, HandlerReference* h)
    {
        if (!read_full_box(r, &h->version, &h->flags) || !r->u32(&h->pre_defined)
            || !r->u32(&h->handler_type)) {
            return false;
        }
        for (uint32_t& v : h->reserved) {
            if (!r->u32(&v)) {
                return false;
            }
        }
        const std::span<const std::byte> name = r->rest();
        h->name.assign(reinterpret_cast<const char*>(name.data()), name.size());
        return true;
    }


    static void encode_hdlr(const HandlerReference& h,
                            std::vector<std::byte>* out)
    {
        append_full_box(out, h.version, h.flags);
        append_u32be(out, h.pre_defined);
        append_u32be(out, h.handler_type);
        for (const uint32_t v : h.reserved) {
            append_u32be(out, v);
        }
        const std::byte* p = reinterpret_cast<const std::byte*>(h.name.data());
        out->insert(out->end(), p, p + h.name.size());
    }

    // url / urn

    static bool decode_data_entry(PayloadReader* r, DataEntry* d)
    {
        if (!read_full_box(r, &d->version, &d->flags)) {
            return false;
        }
        const std::span<const std::byte> rest = r->rest();
        d->data.assign(rest.begin(), rest.end());
        return true;
    }


    static void encode_data_entry(const DataEntry& d,
                                  std::vector<std::byte>* out)
    {
        append_full_box(out, d.version, d.flags);
        out->insert(out->end(), d.data.begin(), d.data.end());
    }


    static bool is_data_entry_type(uint32_t type) noexcept
    {
        return type == fourcc('u', 'r', 'l', ' ')
               || type == fourcc('u', 'r', 'n', ' ');
    }

    // dref

    static bool decode_dref(PayloadReader* r, DataReference* d)
    {
        uint32_t count = 0;
        if (!read_full_box(r, &d->version, &d->flags) || !r->u32(&count)) {
            return false;
        }
        if (!r->has_entries(count, 8)) {
            return false;
        }
        d->entries.resize(count);
        for (DataReferenceEntry& entry : d->entries) {
            uint32_t size = 0;
            std::span<const std::byte> body;
            if (!r->u32(&size) || size < 8 || !r->u32(&entry.type)
                || !r->bytes(size - 8, &body)) {
                return false;
            }
            PayloadReader sub(body);
            if (is_data_entry_type(entry.type)) {
                if (!decode_data_entry(&sub, &entry.entry)) {
                    return false;
                }
            } else {
                entry.entry.data.assign(body.begin(), body.end());
            }
        }
        return true;
    }


    static bool encode_dref(const DataReference& d,
                            std::vector<std::byte>* out)
    {
        append_full_box(out, d.version, d.flags);
        if (!append_count(out, d.entries.size())) {
            return false;
        }
        for (const DataReferenceEntry& entry : d.entries) {
            const size_t start = out->size();
            append_u32be(out, 0);
            append_u32be(out, entry.type);
            if (is_data_entry_type(entry.type)) {
                encode_data_entry(entry.entry, out);
            } else {
                out->insert(out->end(), entry.entry.data.begin(),
                            entry.entry.data.end());
            }
            const size_t size = out->size() - start;
            if (size > 0xFFFFFFFFULL) {
                return false;
            }
            patch_u32be(out, start, static_cast<uint32_t>(size));
        }
        return true;
    }

    // stsd

    static bool decode_stsd(PayloadReader* r, SampleDescription* s)
    {
        uint32_t count = 0;
        if (!read_full_box(r, &s->version, &s->flags) || !r->u32(&count)) {
            return false;
        }
        if (!r->has_entries(count, 16)) {
            return false;
        }
        s->entries.resize(count);
        for (SampleEntry& entry : s->entries) {
            uint32_t size = 0;
            std::span<const std::byte> body;
            if (!r->u32(&size) || size < 16 || !r->bytes(size - 4, &body)) {
                return false;
            }
            PayloadReader sub(body);
            if (!sub.u32(&entry.format) || !sub.skip(6)
                || !sub.u16(&entry.data_reference_index)) {
                return false;
            }
            const std::span<const std::byte> rest = sub.rest();
            entry.data.assign(rest.begin(), rest.end());
        }
        return true;
    }


    static bool encode_stsd(const SampleDescription& s,
                            std::vector<std::byte>* out)
    {
        append_full_box(out, s.version, s.flags);
        if (!append_count(out, s.entries.size())) {
            return false;
        }
        for (const SampleEntry& entry : s.entries) {
            const size_t start = out->size();
            append_u32be(out, 0);
            append_u32be(out, entry.format);
            append_zeros(out, 6);
            append_u16be(out, entry.data_reference_index);
            out->insert(out->end(), entry.data.begin(), entry.data.end());
            const size_t size = out->size() - start;
            if (size > 0xFFFFFFFFULL) {
                return false;
            }
            patch_u32be(out, start, static_cast<uint32_t>(size));
        }
        return true;
    }

    // stsz

    static bool decode_stsz(PayloadReader* r, SampleSize* s)
    {
        if (!read_full_box(r, &s->version, &s->flags) || !r->u32(&s->sample_size)
            || !r->u32(&s->sample_count)) {
            return false;
        }
        if (s->sample_size != 0) {
            return true;
        }
        if (!r->has_entries(s->sample_count, 4)) {
            return false;
        }
        s->entries.resize(s->sample_count);
        for (uint32_t& v : s->entries) {
            if (!r->u32(&v)) {
                return false;
            }
        }
        return true;
    }


    static bool encode_stsz(const SampleSize& s, std::vector<std::byte>* out)
    {
        append_full_box(out, s.version, s.flags);
        append_u32be(out, s.sample_size);
        append_u32be(out, s.sample_count);
        if (s.sample_size != 0) {
            return true;
        }
        if (s.entries.size() != s.sample_count) {
            return false;
        }
        for (const uint32_t v : s.entries) {
            append_u32be(out, v);
        }
        return true;
    }

    // stco / co64

    static bool decode_chunk_offsets(PayloadReader* r, bool large,
                                     ChunkOffsets* c)
    {
        uint32_t count = 0;
        if (!read_full_box(r, &c->version, &c->flags) || !r->u32(&count)) {
            return false;
        }
        if (!r->has_entries(count, large ? 8 : 4)) {
            return false;
        }
        c->entries.resize(count);
        for (uint64_t& v : c->entries) {
            if (large) {
                if (!r->u64(&v)) {
                    return false;
                }
            } else {
                uint32_t v32 = 0;
                if (!r->u32(&v32)) {
                    return false;
                }
                v = v32;
            }
        }
        return true;
    }


    static bool encode_chunk_offsets(const ChunkOffsets& c, bool large,
                                     std::vector<std::byte>* out)
    {
        append_full_box(out, c.version, c.flags);
        if (!append_count(out, c.entries.size())) {
            return false;
        }
        for (const uint64_t v : c.entries) {
            if (large) {
                append_u64be(out, v);
            } else {
                if (v > 0xFFFFFFFFULL) {
                    return false;
                }
                append_u32be(out, static_cast<uint32_t>(v));
            }
        }
        return true;
    }

    // stts

    static bool decode_stts(PayloadReader* r, TimeToSample* t)
    {
        uint32_t count = 0;
        if (!read_full_box(r, &t->version, &t->flags) || !r->u32(&count)
            || !r->has_entries(count, 8)) {
            return false;
        }
        t->entries.resize(count);
        for (TimeToSampleEntry& e : t->entries) {
            if (!r->u32(&e.sample_count) || !r->u32(&e.sample_delta)) {
                return false;
            }
        }
        return true;
    }


    static bool encode_stts(const TimeToSample& t, std::vector<std::byte>* out)
    {
        append_full_box(out, t.version, t.flags);
        if (!append_count(out, t.entries.size())) {
            return false;
        }
        for (const TimeToSampleEntry& e : t.entries) {
            append_u32be(out, e.sample_count);
            append_u32be(out, e.sample_delta);
        }
        return true;
    }

    // ctts

    static bool decode_ctts(PayloadReader* r, CompositionOffset* c)
    {
        uint32_t count = 0;
        if (!read_full_box(r, &c->version, &c->flags) || !r->u32(&count)
            || !r->has_entries(count, 8)) {
            return false;
        }
        c->entries.resize(count);
        for (CompositionOffsetEntry& e : c->entries) {
            uint32_t raw = 0;
            if (!r->u32(&e.sample_count) || !r->u32(&raw)) {
                return false;
            }
            e.sample_offset = c->version == 1
                                  ? static_cast<int64_t>(
                                        static_cast<int32_t>(raw))
                                  : static_cast<int64_t>(raw);
        }
        return true;
    }


    static bool encode_ctts(const CompositionOffset& c,
                            std::vector<std::byte>* out)
    {
        append_full_box(out, c.version, c.flags);
        if (!append_count(out, c.entries.size())) {
            return false;
        }
        for (const CompositionOffsetEntry& e : c.entries) {
            append_u32be(out, e.sample_count);
            if (c.version == 1) {
                if (e.sample_offset < std::numeric_limits<int32_t>::min()
                    || e.sample_offset > std::numeric_limits<int32_t>::max()) {
                    return false;
                }
                append_u32be(out, static_cast<uint32_t>(
                                      static_cast<int32_t>(e.sample_offset)));
            } else {
                if (e.sample_offset < 0 || e.sample_offset > 0xFFFFFFFFLL) {
                    return false;
                }
                append_u32be(out, static_cast<uint32_t>(e.sample_offset));
            }
        }
        return true;
    }

    // stsc

    static bool decode_stsc(PayloadReader* r, SampleToChunk* s)
    {
        uint32_t count = 0;
        if (!read_full_box(r, &s->version, &s->flags) || !r->u32(&count)
            || !r->has_entries(count, 12)) {
            return false;
        }
        s->entries.resize(count);
        for (SampleToChunkEntry& e : s->entries) {
            if (!r->u32(&e.first_chunk) || !r->u32(&e.samples_per_chunk)
                || !r->u32(&e.sample_description_index)) {
                return false;
            }
        }
        return true;
    }


    static bool encode_stsc(const SampleToChunk& s,
                            std::vector<std::byte>* out)
    {
        append_full_box(out, s.version, s.flags);
        if (!append_count(out, s.entries.size())) {
            return false;
        }
        for (const SampleToChunkEntry& e : s.entries) {
            append_u32be(out, e.first_chunk);
            append_u32be(out, e.samples_per_chunk);
            append_u32be(out, e.sample_description_index);
        }
        return true;
    }

    // stss

    static bool decode_stss(PayloadReader* r, SyncSample* s)
    {
        uint32_t count = 0;
        if (!read_full_box(r, &s->version, &s->flags) || !r->u32(&count)
            || !r->has_entries(count, 4)) {
            return false;
        }
        s->entries.resize(count);
        for (uint32_t& v : s->entries) {
            if (!r->u32(&v)) {
                return false;
            }
        }
        return true;
    }


    static bool encode_stss(const SyncSample& s, std::vector<std::byte>* out)
    {
        append_full_box(out, s.version, s.flags);
        if (!append_count(out, s.entries.size())) {
            return false;
        }
        for (const uint32_t v : s.entries) {
            append_u32be(out, v);
        }
        return true;
    }


    template<typename T, typename Fn>
    static BoxStatus decode_as(std::span<const std::byte> payload,
                               LeafData* out, Fn fn)
    {
        T value;
        PayloadReader r(payload);
        if (!fn(&r, &value)) {
            return BoxStatus::Malformed;
        }
        *out = std::move(value);
        return BoxStatus::Ok;
    }


    template<typename T, typename Fn>
    static BoxStatus encode_as(const LeafData& leaf,
                               std::vector<std::byte>* out, Fn fn)
    {
        const T* value = std::get_if<T>(&leaf);
        if (!value) {
            return BoxStatus::Malformed;
        }
        const size_t start = out->size();
        if (!fn(*value, out)) {
            out->resize(start);
            return BoxStatus::Malformed;
        }
        return BoxStatus::Ok;
    }

}  // namespace

BoxStatus
decode_leaf_payload(LeafLayout layout, std::span<const std::byte> payload,
                    LeafData* out) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    switch (layout) {
    case LeafLayout::MovieHeader:
        return decode_as<MovieHeader>(payload, out, decode_mvhd);
    case LeafLayout::TrackHeader:
        return decode_as<TrackHeader>(payload, out, decode_tkhd);
    case LeafLayout::EditList:
        return decode_as<EditList>(payload, out, decode_elst);
    case LeafLayout::MediaHeader:
        return decode_as<MediaHeader>(payload, out, decode_mdhd);
    case LeafLayout::HandlerReference:
        return decode_as<HandlerReference>(payload, out, decode_hdlr);
    case LeafLayout::DataReference:
        return decode_as<DataReference>(payload, out, decode_dref);
    case LeafLayout::DataEntryUrl:
    case LeafLayout::DataEntryUrn:
        return decode_as<DataEntry>(payload, out, decode_data_entry);
    case LeafLayout::SampleDescription:
        return decode_as<SampleDescription>(payload, out, decode_stsd);
    case LeafLayout::SampleSize:
        return decode_as<SampleSize>(payload, out, decode_stsz);
    case LeafLayout::ChunkOffset:
        return decode_as<ChunkOffsets>(payload, out,
                                       [](PayloadReader* r, ChunkOffsets* c) {
                                           return decode_chunk_offsets(r, false,
                                                                       c);
                                       });
    case LeafLayout::ChunkLargeOffset:
        return decode_as<ChunkOffsets>(payload, out,
                                       [](PayloadReader* r, ChunkOffsets* c) {
                                           return decode_chunk_offsets(r, true,
                                                                       c);
                                       });
    case LeafLayout::TimeToSample:
        return decode_as<TimeToSample>(payload, out, decode_stts);
    case LeafLayout::CompositionOffset:
        return decode_as<CompositionOffset>(payload, out, decode_ctts);
    case LeafLayout::SampleToChunk:
        return decode_as<SampleToChunk>(payload, out, decode_stsc);
    case LeafLayout::SyncSample:
        return decode_as<SyncSample>(payload, out, decode_stss);
    }
    return BoxStatus::Malformed;
}


BoxStatus
encode_leaf_payload(LeafLayout layout, const LeafData& leaf,
                    std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    switch (layout) {
    case LeafLayout::MovieHeader:
        return encode_as<MovieHeader>(leaf, out, encode_mvhd);
    case LeafLayout::TrackHeader:
        return encode_as<TrackHeader>(leaf, out, encode_tkhd);
    case LeafLayout::EditList:
        return encode_as<EditList>(leaf, out, encode_elst);
    case LeafLayout::MediaHeader:
        return encode_as<MediaHeader>(leaf, out, encode_mdhd);
    case LeafLayout::HandlerReference:
        return encode_as<HandlerReference>(
            leaf, out,
            [](const HandlerReference& h, std::vector<std::byte>* o) {
                encode_hdlr(h, o);
                return true;
            });
    case LeafLayout::DataReference:
        return encode_as<DataReference>(leaf, out, encode_dref);
    case LeafLayout::DataEntryUrl:
    case LeafLayout::DataEntryUrn:
        return encode_as<DataEntry>(
            leaf, out, [](const DataEntry& d, std::vector<std::byte>* o) {
                encode_data_entry(d, o);
                return true;
            });
    case LeafLayout::SampleDescription:
        return encode_as<SampleDescription>(leaf, out, encode_stsd);
    case LeafLayout::SampleSize:
        return encode_as<SampleSize>(leaf, out, encode_stsz);
    case LeafLayout::ChunkOffset:
        return encode_as<ChunkOffsets>(
            leaf, out, [](const ChunkOffsets& c, std::vector<std::byte>* o) {
                return encode_chunk_offsets(c, false, o);
            });
    case LeafLayout::ChunkLargeOffset:
        return encode_as<ChunkOffsets>(
            leaf, out, [](const ChunkOffsets& c, std::vector<std::byte>* o) {
                return encode_chunk_offsets(c, true, o);
            });
    case LeafLayout::TimeToSample:
        return encode_as<TimeToSample>(leaf, out, encode_stts);
    case LeafLayout::CompositionOffset:
        return encode_as<CompositionOffset>(leaf, out, encode_ctts);
    case LeafLayout::SampleToChunk:
        return encode_as<SampleToChunk>(leaf, out, encode_stsc);
    case LeafLayout::SyncSample:
        return encode_as<SyncSample>(leaf, out, encode_stss);
    }
    return BoxStatus::Malformed;
}


BoxDecoder::BoxDecoder(const BoxSchema& schema,
                       const BoxParseLimits& limits) noexcept
    : schema_(&schema)
    , limits_(limits)
{
}


BoxStatus
BoxDecoder::decode_list(std::span<const std::byte> bytes,
                        const BoxSchema& schema, bool extend_eof,
                        uint32_t depth, uint32_t* count,
                        std::vector<Box>* out) const noexcept
{
    if (depth > limits_.max_depth) {
        return BoxStatus::LimitExceeded;
    }

    uint64_t pos = 0;
    while (bytes.size() - pos >= 8) {
        const std::span<const std::byte> rest = bytes.subspan(
            static_cast<size_t>(pos));
        SpanSource src(rest);
        BoxHeader h;
        BoxStatus status = parse_box_header(src, static_cast<int64_t>(
                                                     rest.size()),
                                            extend_eof, &h);
        if (status != BoxStatus::Ok) {
            return status;
        }
        if (h.header_size == 0) {
            break;
        }
        *count += 1;
        if (*count > limits_.max_boxes) {
            return BoxStatus::LimitExceeded;
        }

        const uint64_t payload_size = static_cast<uint64_t>(h.maxsize);
        const std::span<const std::byte> payload
            = rest.subspan(h.header_size, static_cast<size_t>(payload_size));

        Box box;
        box.type                    = h.type;
        const BoxSchemaEntry* entry = schema.find(h.type);
        if (entry && entry->kind == BoxKind::Container) {
            box.kind = BoxKind::Container;
            status   = decode_list(payload, *entry->children, false, depth + 1,
                                   count, &box.children);
            if (status != BoxStatus::Ok) {
                return status;
            }
        } else if (entry && entry->kind == BoxKind::Leaf) {
            box.kind = BoxKind::Leaf;
            status   = decode_leaf_payload(entry->layout, payload, &box.leaf);
            if (status != BoxStatus::Ok) {
                return status;
            }
        } else {
            box.kind = BoxKind::Opaque;
            box.data.assign(payload.begin(), payload.end());
        }
        out->push_back(std::move(box));

        pos += h.header_size + payload_size;
    }
    return BoxStatus::Ok;
}


BoxStatus
BoxDecoder::decode_box_list(std::span<const std::byte> bytes, bool extend_eof,
                            std::vector<Box>* out) const noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    uint32_t count = 0;
    return decode_list(bytes, *schema_, extend_eof, 0, &count, out);
}


BoxStatus
BoxDecoder::decode_box(std::span<const std::byte> bytes, bool extend_eof,
                       Box* out) const noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    std::vector<Box> boxes;
    const BoxStatus status = decode_box_list(bytes, extend_eof, &boxes);
    if (status != BoxStatus::Ok) {
        return status;
    }
    if (boxes.empty()) {
        return BoxStatus::NotFound;
    }
    *out = std::move(boxes.front());
    return BoxStatus::Ok;
}


BoxEncoder::BoxEncoder(const BoxSchema& schema) noexcept
    : schema_(&schema)
{
}

namespace {

    static BoxStatus encode_with(const Box& box, const BoxSchema& schema,
                                 std::vector<std::byte>* out) noexcept
    {
        const size_t start = out->size();
        append_u32be(out, 0);
        append_u32be(out, box.type);

        BoxStatus status            = BoxStatus::Ok;
        const BoxSchemaEntry* entry = schema.find(box.type);
        if (entry && entry->kind == BoxKind::Container) {
            if (box.kind != BoxKind::Container) {
                status = BoxStatus::Malformed;
            }
            for (size_t i = 0;
                 status == BoxStatus::Ok && i < box.children.size(); ++i) {
                status = encode_with(box.children[i], *entry->children, out);
            }
        } else if (entry && entry->kind == BoxKind::Leaf) {
            status = box.kind == BoxKind::Leaf
                         ? encode_leaf_payload(entry->layout, box.leaf, out)
                         : BoxStatus::Malformed;
        } else if (box.kind == BoxKind::Opaque) {
            out->insert(out->end(), box.data.begin(), box.data.end());
        } else {
            status = BoxStatus::Malformed;
        }

        if (status == BoxStatus::Ok) {
            const uint64_t size = out->size() - start;
            if (size > 0xFFFFFFFFULL) {
                status = BoxStatus::SizeOverflow;
            } else {
                patch_u32be(out, start, static_cast<uint32_t>(size));
            }
        }
        if (status != BoxStatus::Ok) {
            out->resize(start);
        }
        return status;
    }

}  // namespace

BoxStatus
BoxEncoder::encode_box(const Box& box, std::vector<std::byte>* out) const
    noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    return encode_with(box, *schema_, out);
}


BoxStatus
BoxEncoder::encode_box_list(std::span<const Box> boxes,
                            std::vector<std::byte>* out) const noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    const size_t start = out->size();
    for (const Box& box : boxes) {
        const BoxStatus status = encode_with(box, *schema_, out);
        if (status != BoxStatus::Ok) {
            out->resize(start);
            return status;
        }
    }
    return BoxStatus::Ok;
}

namespace {

    template<typename BoxVec, typename BoxPtr>
    static BoxPtr find_in(BoxVec& boxes, std::span<const uint32_t> path) noexcept
    {
        if (path.empty()) {
            return nullptr;
        }
        for (auto& box : boxes) {
            if (box.type != path.front()) {
                continue;
            }
            if (path.size() == 1) {
                return &box;
            }
            if (box.kind != BoxKind::Container) {
                continue;
            }
            BoxPtr found = find_in<BoxVec, BoxPtr>(box.children,
                                                   path.subspan(1));
            if (found) {
                return found;
            }
        }
        return nullptr;
    }

}  // namespace

const Box*
find_box_at_path(const std::vector<Box>& boxes,
                 std::span<const uint32_t> path) noexcept
{
    return find_in<const std::vector<Box>, const Box*>(boxes, path);
}


Box*
find_box_at_path(std::vector<Box>& boxes,
                 std::span<const uint32_t> path) noexcept
{
    return find_in<std::vector<Box>, Box*>(boxes, path);
}


BoxStatus
find_box_at_pathx(const std::vector<Box>& boxes,
                  std::span<const uint32_t> path, const Box** out) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    *out = find_box_at_path(boxes, path);
    return *out ? BoxStatus::Ok : BoxStatus::NotFound;
}

}  // namespace openmotion
