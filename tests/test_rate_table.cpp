#include <gtest/gtest.h>

#include <sstream>

#include "algorithms/rate_table.h"

using namespace gccorrect;

TEST(RateTable, RateIsGlobalMeanOverLocalRate) {
    RateTable t(3);
    t.add(0, 100, 50);
    t.add(1, 100, 200);
    t.add(2, 5, 5);       // under-sampled
    t.add(3, 400, 0);     // no fragments
    t.finalize(10);

    const double global = (50.0 + 200.0 + 5.0 + 0.0) / (100 + 100 + 5 + 400);
    EXPECT_DOUBLE_EQ(t.global_mean_rate(), global);
    ASSERT_TRUE(t.has_rate(0));
    ASSERT_TRUE(t.has_rate(1));
    EXPECT_DOUBLE_EQ(t.rate(0), global * 100.0 / 50.0);
    EXPECT_DOUBLE_EQ(t.rate(1), global * 100.0 / 200.0);
    EXPECT_FALSE(t.has_rate(2));
    EXPECT_FALSE(t.has_rate(3));
    EXPECT_FALSE(t.has_rate(4));
    EXPECT_FALSE(t.has_rate(-1));
}

TEST(RateTable, AccumulatesPerGcVectors) {
    RateTable t(2);
    t.add(std::vector<GcCounts>{{1, 2}, {3, 4}});
    t.add(std::vector<GcCounts>{{10, 0}, {0, 0}, {7, 7}});
    EXPECT_EQ(t.counts(0).positions, 11u);
    EXPECT_EQ(t.counts(1).fragments, 4u);
    EXPECT_EQ(t.counts(2).positions, 7u);
    EXPECT_EQ(t.total_positions(), 21u);
    EXPECT_EQ(t.total_fragments(), 13u);
    EXPECT_EQ(t.insert_length(), 2);
}

TEST(RateTable, UnderSampledListsThinValues) {
    RateTable t(4);
    t.add(0, 1000, 1);
    t.add(2, 999, 1);
    t.add(4, 5000, 1);
    EXPECT_EQ(t.under_sampled(1000), (std::vector<int>{1, 2, 3}));
}

TEST(RateTable, WrittenTableReadsBack) {
    RateTable t(3);
    t.add(0, 2000, 100);
    t.add(1, 3000, 90);
    t.add(2, 10, 1);
    t.finalize(1000);

    std::stringstream ss;
    t.write(ss);
    EXPECT_NE(ss.str().find("2\t10\t1\t-\n"), std::string::npos);
    EXPECT_NE(ss.str().find("3\t0\t0\t-\n"), std::string::npos);

    RateTable back = RateTable::read(ss);
    EXPECT_EQ(back.insert_length(), 3);
    EXPECT_TRUE(back.has_rate(0));
    EXPECT_TRUE(back.has_rate(1));
    EXPECT_FALSE(back.has_rate(2));
    EXPECT_NEAR(back.rate(0), t.rate(0), 1e-9);
    EXPECT_NEAR(back.rate(1), t.rate(1), 1e-9);
    EXPECT_DOUBLE_EQ(back.global_mean_rate(), t.global_mean_rate());
}

TEST(RateTable, ReadRejectsGapsAndGarbage) {
    std::istringstream gap("0\t1\t1\t1.0\n2\t1\t1\t1.0\n");
    EXPECT_THROW(RateTable::read(gap), std::runtime_error);

    std::istringstream bad_rate("0\t1\t1\tabc\n");
    EXPECT_THROW(RateTable::read(bad_rate), std::runtime_error);

    std::istringstream empty("");
    EXPECT_THROW(RateTable::read(empty), std::runtime_error);

    EXPECT_THROW(RateTable::read_file("/nonexistent/rates.txt"), std::runtime_error);
}
