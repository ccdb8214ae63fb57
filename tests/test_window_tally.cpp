#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "algorithms/window_tally.h"
#include "test_data.h"

using namespace gccorrect;

namespace {

int64_t naive_gc(const std::string& seq, int64_t begin, int64_t end) {
    begin = std::max<int64_t>(begin, 0);
    end = std::min<int64_t>(end, seq.size());
    return begin < end ? count_gc(seq, begin, end) : 0;
}

}  // namespace

TEST(NucleotideTally, CountsAddedAndRemovedBases) {
    NucleotideTally t;
    for (char c : std::string("ACGTNGG")) t.add(c);
    EXPECT_EQ(t.size(), 7);
    EXPECT_EQ(t.gc(), 4);
    EXPECT_EQ(t.count('G'), 3);
    EXPECT_EQ(t.count('N'), 1);

    t.remove('G');
    t.remove('A');
    EXPECT_EQ(t.size(), 5);
    EXPECT_EQ(t.gc(), 3);
    EXPECT_EQ(t.count('A'), 0);

    t.clear();
    EXPECT_EQ(t.size(), 0);
    EXPECT_EQ(t.gc(), 0);
}

TEST(SlidingWindow, ForwardWindowMatchesRecount) {
    std::mt19937_64 rng(7);
    const std::string seq = fixtures::random_sequence(500, 0.5, rng);
    const int64_t length = 23;

    SlidingWindow w(seq, 0, length);
    w.reset(0);
    for (int64_t pos = 0; pos < static_cast<int64_t>(seq.size()); ++pos) {
        if (pos > 0) w.advance();
        ASSERT_EQ(w.tally().gc(), naive_gc(seq, pos, pos + length)) << "pos " << pos;
        ASSERT_EQ(w.tally().size(), std::min<int64_t>(length, seq.size() - pos));
    }
}

TEST(SlidingWindow, ReverseWindowEndsBeforePosition) {
    std::mt19937_64 rng(11);
    const std::string seq = fixtures::random_sequence(300, 0.3, rng);
    const int64_t length = 17;

    SlidingWindow w(seq, -length, length);
    w.reset(0);
    EXPECT_EQ(w.tally().size(), 0);
    for (int64_t pos = 0; pos < static_cast<int64_t>(seq.size()); ++pos) {
        if (pos > 0) w.advance();
        ASSERT_EQ(w.begin(), std::max<int64_t>(pos - length, 0));
        ASSERT_EQ(w.end(), pos);
        ASSERT_EQ(w.tally().gc(), naive_gc(seq, pos - length, pos)) << "pos " << pos;
    }
}

TEST(SlidingWindow, SeekAgreesWithReset) {
    std::mt19937_64 rng(3);
    const std::string seq = fixtures::random_sequence(1000, 0.6, rng);
    SlidingWindow w(seq, 5, 40);

    // never reset: the first seek must initialize the window
    w.seek(10);
    EXPECT_EQ(w.tally().gc(), naive_gc(seq, 15, 55));

    for (int64_t pos : {12, 13, 30, 200, 201, 150, 990}) {
        w.seek(pos);
        ASSERT_EQ(w.position(), pos);
        ASSERT_EQ(w.tally().gc(), naive_gc(seq, pos + 5, pos + 45)) << "pos " << pos;
    }
}

TEST(SlidingWindow, FullOnlyInsideSequence) {
    const std::string seq = "GGGGCCCCAA";
    SlidingWindow w(seq, 0, 4);
    w.reset(6);
    EXPECT_TRUE(w.full());
    EXPECT_EQ(w.tally().gc(), 2);
    w.advance();
    EXPECT_FALSE(w.full());
    EXPECT_EQ(w.tally().size(), 3);
}
