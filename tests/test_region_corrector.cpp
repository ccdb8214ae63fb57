#include <gtest/gtest.h>

#include <sstream>

#include "algorithms/region_corrector.h"
#include "test_data.h"

using namespace gccorrect;

namespace {

// GC 0 -> 1.5, GC 10 -> 3.0, everything between -> 1.0
RateTable stepped_rates() {
    std::ostringstream ss;
    for (int gc = 0; gc <= 10; ++gc) {
        double rate = gc == 0 ? 1.5 : gc == 10 ? 3.0 : 1.0;
        ss << gc << "\t1000\t1000\t" << rate << "\n";
    }
    std::istringstream in(ss.str());
    return RateTable::read(in);
}

fixtures::SimRead read_at(int64_t pos, int length, bool reverse = false) {
    fixtures::SimRead r;
    r.contig = "chr1";
    r.pos = pos;
    r.length = length;
    r.reverse = reverse;
    return r;
}

}  // namespace

class RegionCorrectorFixture : public ::testing::Test {
protected:
    void SetUp() override {
        sequence = std::string(250, 'G') + std::string(350, 'A');
        ref.add("chr1", sequence);
        mask = MappabilityMask(ref);
        mask.mark("chr1", 0, 400);
        mask.mark("chr1", 410, 600);
        rates = stepped_rates();
        params.window = 10;
        params.min_mapq = 30;
        log.console_level = Verbosity::Quiet;

        std::vector<fixtures::SimRead> reads = {
            read_at(250, 30),           // forward start on 250
            read_at(220, 30, true),     // reverse end on 250
            read_at(100, 30),           // forward start on 100
            read_at(100, 50, true),     // reverse end on 150
            read_at(170, 30, true),     // reverse end on 200
            read_at(405, 20),           // masked start
        };
        fixtures::SimRead low = read_at(300, 30);
        low.mapq = 10;
        reads.push_back(low);
        fixtures::SimRead dup = read_at(310, 30);
        dup.extra_flags = BAM_FDUP;
        reads.push_back(dup);
        fixtures::write_bam(dir.file("aln.bam"), {{"chr1", sequence}}, reads);
    }

    fixtures::TempDir dir;
    std::string sequence;
    ReferenceIndex ref;
    MappabilityMask mask;
    RateTable rates;
    CorrectParams params;
    CancellationToken token;
    Logger log{"test"};
};

TEST_F(RegionCorrectorFixture, WindowRatesFollowStrandWindows) {
    std::vector<float> forward, reverse;
    window_rates(ref[0], mask.mask("chr1"), rates, {0, 0, 600}, params, forward, reverse);
    ASSERT_EQ(forward.size(), 600u);

    EXPECT_FLOAT_EQ(forward[0], 3.0f);
    EXPECT_FLOAT_EQ(reverse[0], -1.0f);     // empty reverse window
    EXPECT_FLOAT_EQ(forward[245], 1.0f);    // 5 G + 5 A
    EXPECT_FLOAT_EQ(forward[250], 1.5f);
    EXPECT_FLOAT_EQ(reverse[250], 3.0f);
    EXPECT_FLOAT_EQ(reverse[255], 1.0f);
    EXPECT_FLOAT_EQ(forward[405], -1.0f);   // not mappable
    EXPECT_FLOAT_EQ(forward[599], 1.5f);    // clipped to one base
}

TEST_F(RegionCorrectorFixture, ShiftMovesBothWindowsAwayFromTheBase) {
    params.shift = 5;
    std::vector<float> forward, reverse;
    window_rates(ref[0], mask.mask("chr1"), rates, {0, 0, 600}, params, forward, reverse);

    EXPECT_FLOAT_EQ(forward[240], 1.0f);    // [245, 255): 5 G + 5 A
    EXPECT_FLOAT_EQ(forward[245], 1.5f);    // [250, 260): all A
    EXPECT_FLOAT_EQ(reverse[255], 3.0f);    // [240, 250): all G
    EXPECT_FLOAT_EQ(reverse[260], 1.0f);    // [245, 255)
    EXPECT_FLOAT_EQ(reverse[5], -1.0f);     // [-10, 0) is empty
    EXPECT_FLOAT_EQ(reverse[6], 1.0f);      // clipped to [0, 1): one G
    EXPECT_FLOAT_EQ(forward[595], -1.0f);   // [600, 610) is empty
}

TEST_F(RegionCorrectorFixture, ReadEndsLandOnTheirStrandPosition) {
    AlignmentFile file(dir.file("aln.bam"));
    BaseCounts counts = correct_region(file, ref[0], mask.mask("chr1"), rates,
                                       {0, 0, 600}, params, token);
    ASSERT_EQ(counts.size(), 600u);

    EXPECT_TRUE(counts.excluded(0));
    EXPECT_TRUE(counts.excluded(405));
    EXPECT_EQ(counts.raw[405], BaseCounts::SENTINEL);
    EXPECT_FLOAT_EQ(counts.corrected[405], -1.0f);

    EXPECT_EQ(counts.raw[250], 2);
    EXPECT_FLOAT_EQ(counts.corrected[250], 4.5f);
    EXPECT_EQ(counts.raw[100], 1);
    EXPECT_FLOAT_EQ(counts.corrected[100], 3.0f);
    EXPECT_EQ(counts.raw[150], 1);
    EXPECT_FLOAT_EQ(counts.corrected[150], 3.0f);

    EXPECT_EQ(counts.raw[300], 0);    // low mapping quality
    EXPECT_EQ(counts.raw[310], 0);    // duplicate
    EXPECT_EQ(counts.raw[220], 0);    // reverse reads do not count their start

    int64_t total = 0;
    for (size_t i = 0; i < counts.size(); ++i) {
        if (!counts.excluded(i)) total += counts.raw[i];
    }
    EXPECT_EQ(total, 5);
}

TEST_F(RegionCorrectorFixture, ReverseReadEndingAtContigEndIsNotCounted) {
    fixtures::write_bam(dir.file("end.bam"), {{"chr1", sequence}},
                        {read_at(569, 30, true), read_at(570, 30, true)});
    AlignmentFile file(dir.file("end.bam"));
    BaseCounts counts = correct_region(file, ref[0], mask.mask("chr1"), rates,
                                       {0, 300, 600}, params, token);
    ASSERT_EQ(counts.size(), 300u);

    EXPECT_FALSE(counts.excluded(299));
    EXPECT_EQ(counts.raw[299], 1);          // end 599
    int64_t total = 0;
    for (size_t i = 0; i < counts.size(); ++i) {
        if (!counts.excluded(i)) total += counts.raw[i];
    }
    EXPECT_EQ(total, 1);                    // end 600 has no base
}

TEST_F(RegionCorrectorFixture, CancelledTokenStopsInsideTheUnit) {
    AlignmentFile file(dir.file("aln.bam"));
    token.cancel();
    EXPECT_THROW(correct_region(file, ref[0], mask.mask("chr1"), rates, {0, 0, 600}, params,
                                token),
                 InterruptedError);
}

TEST_F(RegionCorrectorFixture, UnitsConcatenateToSingleThreadResult) {
    BaseCounts one = correct_contig(dir.file("aln.bam"), ref[0], 0, mask.mask("chr1"), rates,
                                    params, 1, token, log);
    BaseCounts three = correct_contig(dir.file("aln.bam"), ref[0], 0, mask.mask("chr1"), rates,
                                      params, 3, token, log);
    ASSERT_EQ(one.size(), 600u);
    EXPECT_EQ(one.raw, three.raw);
    EXPECT_EQ(one.corrected, three.corrected);
    EXPECT_EQ(three.raw[200], 1);    // reverse end on a unit boundary
}

TEST(PlanCorrectUnits, CoversContigWithoutGaps) {
    auto units = plan_correct_units(2, 1001, 4);
    ASSERT_EQ(units.size(), 4u);
    EXPECT_EQ(units[0].start, 0);
    for (size_t i = 1; i < units.size(); ++i) EXPECT_EQ(units[i].start, units[i - 1].end);
    EXPECT_EQ(units.back().end, 1001);
    EXPECT_EQ(units[3].contig, 2u);
    EXPECT_TRUE(plan_correct_units(0, 0, 4).empty());
}
