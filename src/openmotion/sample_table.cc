#include "openmotion/sample_table.h"

#include <utility>

namespace openmotion {
namespace {

    // Expands (count, value) runs into at most `limit` values, zero padded.
    template<typename Entry, typename Value, typename Get>
    static void expand_runs(const std::vector<Entry>& entries, size_t limit,
                            Get get, std::vector<Value>* out)
    {
        out->clear();
        out->reserve(limit);
        for (const Entry& e : entries) {
            for (uint32_t i = 0; i < e.sample_count && out->size() < limit;
                 ++i) {
                out->push_back(get(e));
            }
            if (out->size() >= limit) {
                break;
            }
        }
        while (out->size() < limit) {
            out->push_back(Value {});
        }
    }


    struct StblTables final {
        const SampleDescription* stsd = nullptr;
        const SampleSize* stsz        = nullptr;
        const ChunkOffsets* offsets   = nullptr;
        const SampleToChunk* stsc     = nullptr;
        const TimeToSample* stts      = nullptr;
        const CompositionOffset* ctts = nullptr;
        const SyncSample* stss        = nullptr;
    };


    static StblTables collect_tables(const std::vector<Box>& children) noexcept
    {
        StblTables t;
        for (const Box& b : children) {
            if (const SampleDescription* v = leaf_as<SampleDescription>(b)) {
                t.stsd = v;
            } else if (const SampleSize* v = leaf_as<SampleSize>(b)) {
                t.stsz = v;
            } else if (const ChunkOffsets* v = leaf_as<ChunkOffsets>(b)) {
                t.offsets = v;
            } else if (const SampleToChunk* v = leaf_as<SampleToChunk>(b)) {
                t.stsc = v;
            } else if (const TimeToSample* v = leaf_as<TimeToSample>(b)) {
                t.stts = v;
            } else if (const CompositionOffset* v
                       = leaf_as<CompositionOffset>(b)) {
                t.ctts = v;
            } else if (const SyncSample* v = leaf_as<SyncSample>(b)) {
                t.stss = v;
            }
        }
        return t;
    }


    class SampleEmitter final {
    public:
        SampleEmitter(const std::vector<uint32_t>& sizes,
                      const std::vector<uint32_t>& deltas,
                      const std::vector<int64_t>& comp_offsets,
                      const std::vector<uint8_t>& syncs,
                      std::span<const uint64_t> chunk_offsets,
                      std::vector<RawSample>* out) noexcept
            : sizes_(sizes)
            , deltas_(deltas)
            , comp_offsets_(comp_offsets)
            , syncs_(syncs)
            , chunk_offsets_(chunk_offsets)
            , out_(out)
        {
        }

        bool done() const noexcept { return sample_idx_ >= sizes_.size(); }

        BoxStatus emit_chunk(const SampleToChunkEntry& entry) noexcept
        {
            if (chunk_idx_ >= chunk_offsets_.size()) {
                return BoxStatus::Malformed;
            }
            uint64_t offset = chunk_offsets_[chunk_idx_];
            for (uint32_t i = 0; i < entry.samples_per_chunk && !done(); ++i) {
                RawSample s;
                s.description_idx    = entry.sample_description_index;
                s.offset             = offset;
                s.size               = sizes_[sample_idx_];
                s.timedelta          = deltas_[sample_idx_];
                s.composition_offset = comp_offsets_[sample_idx_];
                s.is_sync            = syncs_[sample_idx_] != 0;
                out_->push_back(s);
                offset += s.size;
                sample_idx_ += 1;
            }
            chunk_idx_ += 1;
            return BoxStatus::Ok;
        }

    private:
        const std::vector<uint32_t>& sizes_;
        const std::vector<uint32_t>& deltas_;
        const std::vector<int64_t>& comp_offsets_;
        const std::vector<uint8_t>& syncs_;
        std::span<const uint64_t> chunk_offsets_;
        std::vector<RawSample>* out_ = nullptr;
        size_t sample_idx_           = 0;
        size_t chunk_idx_            = 0;
    };

}  // namespace


BoxStatus
extract_raw_samples_from_stbl_boxes(const std::vector<Box>& stbl_children,
                                    StblSamples* out,
                                    const SampleTableLimits& limits) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    out->descriptions.clear();
    out->samples.clear();

    const StblTables t = collect_tables(stbl_children);
    if (t.stsd) {
        out->descriptions = t.stsd->entries;
    }

    std::vector<uint32_t> sizes;
    if (t.stsz) {
        if (t.stsz->sample_size != 0) {
            if (t.stsz->sample_count > limits.max_samples) {
                return BoxStatus::LimitExceeded;
            }
            sizes.assign(t.stsz->sample_count, t.stsz->sample_size);
        } else {
            if (t.stsz->entries.size() > limits.max_samples) {
                return BoxStatus::LimitExceeded;
            }
            sizes = t.stsz->entries;
        }
    }
    if (sizes.empty() || !t.stsc || t.stsc->entries.empty()) {
        return BoxStatus::Ok;
    }

    std::vector<uint32_t> deltas;
    if (t.stts) {
        expand_runs(t.stts->entries, sizes.size(),
                    [](const TimeToSampleEntry& e) { return e.sample_delta; },
                    &deltas);
    } else {
        deltas.assign(sizes.size(), 0);
    }

    std::vector<int64_t> comp_offsets;
    if (t.ctts) {
        expand_runs(t.ctts->entries, sizes.size(),
                    [](const CompositionOffsetEntry& e) {
                        return e.sample_offset;
                    },
                    &comp_offsets);
    } else {
        comp_offsets.assign(sizes.size(), 0);
    }

    // stss is 1-based; absent means every sample is sync.
    std::vector<uint8_t> syncs(sizes.size(), t.stss ? 0 : 1);
    if (t.stss) {
        for (uint32_t n : t.stss->entries) {
            if (n >= 1 && n <= syncs.size()) {
                syncs[n - 1] = 1;
            }
        }
    }

    std::span<const uint64_t> chunk_offsets;
    if (t.offsets) {
        chunk_offsets = t.offsets->entries;
    }

    out->samples.reserve(sizes.size());
    SampleEmitter emitter(sizes, deltas, comp_offsets, syncs, chunk_offsets,
                          &out->samples);

    const std::vector<SampleToChunkEntry>& entries = t.stsc->entries;
    for (size_t i = 0; i < entries.size() && !emitter.done(); ++i) {
        uint64_t nbr_chunks = 1;
        if (i + 1 < entries.size()) {
            nbr_chunks = entries[i + 1].first_chunk > entries[i].first_chunk
                             ? entries[i + 1].first_chunk
                                   - entries[i].first_chunk
                             : 0;
        }
        for (uint64_t c = 0; c < nbr_chunks && !emitter.done(); ++c) {
            const BoxStatus status = emitter.emit_chunk(entries[i]);
            if (status != BoxStatus::Ok) {
                return status;
            }
        }
    }

    // A single trailing entry covers every remaining chunk.
    const SampleToChunkEntry& last = entries.back();
    while (!emitter.done()) {
        if (last.samples_per_chunk == 0) {
            return BoxStatus::Malformed;
        }
        const BoxStatus status = emitter.emit_chunk(last);
        if (status != BoxStatus::Ok) {
            return status;
        }
    }
    return BoxStatus::Ok;
}


BoxStatus
extract_raw_samples_from_stbl_data(std::span<const std::byte> stbl_data,
                                   StblSamples* out,
                                   const SampleTableLimits& limits) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    std::vector<Box> children;
    const BoxDecoder decoder(stbl_schema());
    const BoxStatus status = decoder.decode_box_list(stbl_data, false,
                                                     &children);
    if (status != BoxStatus::Ok) {
        return status;
    }
    return extract_raw_samples_from_stbl_boxes(children, out, limits);
}


std::vector<Sample>
resolve_samples(std::span<const RawSample> raw_samples,
                std::span<const SampleEntry> descriptions, uint32_t timescale)
{
    std::vector<Sample> out;
    out.reserve(raw_samples.size());
    const double scale = timescale != 0 ? static_cast<double>(timescale)
                                        : 1.0;
    uint64_t acc_delta = 0;
    for (const RawSample& raw : raw_samples) {
        Sample s;
        s.raw             = raw;
        s.exact_time      = static_cast<double>(acc_delta) / scale;
        s.exact_timedelta = static_cast<double>(raw.timedelta) / scale;
        s.exact_composition_time
            = (static_cast<double>(acc_delta)
               + static_cast<double>(raw.composition_offset))
              / scale;
        if (raw.description_idx >= 1
            && raw.description_idx <= descriptions.size()) {
            s.description = &descriptions[raw.description_idx - 1];
        }
        out.push_back(s);
        acc_delta += raw.timedelta;
    }
    return out;
}


std::vector<SampleChunk>
build_chunks(std::span<const RawSample> raw_samples)
{
    std::vector<SampleChunk> chunks;
    const RawSample* prev = nullptr;
    for (const RawSample& s : raw_samples) {
        const bool same_description
            = !chunks.empty()
              && s.description_idx == chunks.back().sample_description_index;
        const bool contiguous = prev && s.offset == prev->offset + prev->size;
        if (same_description && contiguous) {
            chunks.back().samples_per_chunk += 1;
        } else {
            SampleChunk c;
            c.samples_per_chunk        = 1;
            c.sample_description_index = s.description_idx;
            c.offset                   = s.offset;
            chunks.push_back(c);
        }
        prev = &s;
    }
    return chunks;
}


std::vector<Box>
build_stbl_from_raw_samples(std::span<const SampleEntry> descriptions,
                            std::span<const RawSample> raw_samples)
{
    std::vector<Box> boxes;

    SampleDescription stsd;
    stsd.entries.assign(descriptions.begin(), descriptions.end());
    boxes.push_back(make_leaf_box(fourcc('s', 't', 's', 'd'), std::move(stsd)));

    TimeToSample stts;
    for (const RawSample& s : raw_samples) {
        if (!stts.entries.empty()
            && stts.entries.back().sample_delta == s.timedelta
            && stts.entries.back().sample_count < UINT32_MAX) {
            stts.entries.back().sample_count += 1;
        } else {
            stts.entries.push_back(TimeToSampleEntry { 1, s.timedelta });
        }
    }
    boxes.push_back(make_leaf_box(fourcc('s', 't', 't', 's'), std::move(stts)));

    const std::vector<SampleChunk> chunks = build_chunks(raw_samples);

    SampleToChunk stsc;
    stsc.entries.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        SampleToChunkEntry e;
        e.first_chunk              = static_cast<uint32_t>(i + 1);
        e.samples_per_chunk        = chunks[i].samples_per_chunk;
        e.sample_description_index = chunks[i].sample_description_index;
        stsc.entries.push_back(e);
    }
    boxes.push_back(make_leaf_box(fourcc('s', 't', 's', 'c'), std::move(stsc)));

    SampleSize stsz;
    stsz.sample_count = static_cast<uint32_t>(raw_samples.size());
    bool same_size    = !raw_samples.empty();
    for (const RawSample& s : raw_samples) {
        if (s.size != raw_samples.front().size) {
            same_size = false;
            break;
        }
    }
    if (same_size) {
        stsz.sample_size = raw_samples.front().size;
    } else {
        stsz.entries.reserve(raw_samples.size());
        for (const RawSample& s : raw_samples) {
            stsz.entries.push_back(s.size);
        }
    }
    boxes.push_back(make_leaf_box(fourcc('s', 't', 's', 'z'), std::move(stsz)));

    // co64 keeps the encoded size independent of the offset values.
    ChunkOffsets co64;
    co64.entries.reserve(chunks.size());
    for (const SampleChunk& c : chunks) {
        co64.entries.push_back(c.offset);
    }
    boxes.push_back(make_leaf_box(fourcc('c', 'o', '6', '4'), std::move(co64)));

    bool any_offset   = false;
    bool any_negative = false;
    bool any_non_sync = false;
    for (const RawSample& s : raw_samples) {
        any_offset   = any_offset || s.composition_offset != 0;
        any_negative = any_negative || s.composition_offset < 0;
        any_non_sync = any_non_sync || !s.is_sync;
    }

    if (any_offset) {
        CompositionOffset ctts;
        ctts.version = any_negative ? 1 : 0;
        for (const RawSample& s : raw_samples) {
            if (!ctts.entries.empty()
                && ctts.entries.back().sample_offset == s.composition_offset
                && ctts.entries.back().sample_count < UINT32_MAX) {
                ctts.entries.back().sample_count += 1;
            } else {
                ctts.entries.push_back(
                    CompositionOffsetEntry { 1, s.composition_offset });
            }
        }
        boxes.push_back(
            make_leaf_box(fourcc('c', 't', 't', 's'), std::move(ctts)));
    }

    if (any_non_sync) {
        SyncSample stss;
        for (size_t i = 0; i < raw_samples.size(); ++i) {
            if (raw_samples[i].is_sync) {
                stss.entries.push_back(static_cast<uint32_t>(i + 1));
            }
        }
        boxes.push_back(
            make_leaf_box(fourcc('s', 't', 's', 's'), std::move(stss)));
    }
    return boxes;
}

}  // namespace openmotion
