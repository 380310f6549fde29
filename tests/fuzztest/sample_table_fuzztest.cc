#include "openmotion/box_schema.h"
#include "openmotion/sample_table.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstdint>
#include <limits>
#include <vector>

namespace openmotion {

struct SampleOp final {
    uint32_t size              = 0;
    uint32_t timedelta         = 0;
    int32_t composition_offset = 0;
    bool is_sync               = true;
    uint8_t gap                = 0;
};

static std::vector<RawSample>
samples_from_ops(const std::vector<SampleOp>& ops)
{
    std::vector<RawSample> out;
    uint64_t offset = 48;
    for (const SampleOp& op : ops) {
        offset += op.gap;
        RawSample s;
        s.offset             = offset;
        s.size               = op.size;
        s.timedelta          = op.timedelta;
        s.composition_offset = op.composition_offset;
        s.is_sync            = op.is_sync;
        out.push_back(s);
        offset += op.size;
    }
    return out;
}


static void
stbl_preserves_samples(const std::vector<SampleOp>& ops)
{
    const std::vector<RawSample> samples = samples_from_ops(ops);
    SampleEntry entry;
    entry.format = fourcc('t', 'e', 's', 't');
    const std::vector<SampleEntry> descriptions = { entry };

    std::vector<std::byte> encoded;
    const BoxEncoder encoder(stbl_schema());
    ASSERT_EQ(encoder.encode_box_list(
                  build_stbl_from_raw_samples(descriptions, samples),
                  &encoded),
              BoxStatus::Ok);

    StblSamples table;
    ASSERT_EQ(extract_raw_samples_from_stbl_data(encoded, &table),
              BoxStatus::Ok);
    ASSERT_EQ(table.descriptions.size(), 1U);
    ASSERT_EQ(table.samples.size(), samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        const RawSample& want = samples[i];
        const RawSample& got  = table.samples[i];
        ASSERT_EQ(got.description_idx, 1U);
        ASSERT_EQ(got.offset, want.offset);
        ASSERT_EQ(got.size, want.size);
        ASSERT_EQ(got.timedelta, want.timedelta);
        ASSERT_EQ(got.composition_offset, want.composition_offset);
        ASSERT_EQ(got.is_sync, want.is_sync);
    }
}


FUZZ_TEST(SampleTableFuzz, stbl_preserves_samples)
    .WithDomains(
        fuzztest::VectorOf(
            fuzztest::StructOf<SampleOp>(
                fuzztest::InRange<uint32_t>(0, 1U << 20),
                fuzztest::InRange<uint32_t>(0, 4),
                fuzztest::InRange<int32_t>(std::numeric_limits<int32_t>::min(),
                                           std::numeric_limits<int32_t>::max()),
                fuzztest::Arbitrary<bool>(), fuzztest::InRange<uint8_t>(0, 3)))
            .WithMaxSize(256));

}  // namespace openmotion
