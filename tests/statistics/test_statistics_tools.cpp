#include <gtest/gtest.h>
#include "cross_stats/statistics/statistics_tools.hpp"
#include <Eigen/Dense>
#include <vector>
#include <cmath>

using namespace cross_stats;
using namespace cross_stats::statistics;

// ============================================================================
// Reducers
// ============================================================================

class ReducerTest : public ::testing::Test {
protected:
    std::vector<double> values_{4.0, 1.0, 3.0, 2.0};
};

TEST_F(ReducerTest, PresentValuesSkipsMissing) {
    std::vector<NumericCell> cells{1.0, std::nullopt, 3.0, std::nullopt};
    EXPECT_EQ(present_values(cells), (std::vector<double>{1.0, 3.0}));
}

TEST_F(ReducerTest, MeanAndMedian) {
    EXPECT_DOUBLE_EQ(mean(values_), 2.5);
    EXPECT_DOUBLE_EQ(median(values_), 2.5);
    EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
    EXPECT_DOUBLE_EQ(median({7.0}), 7.0);
}

TEST_F(ReducerTest, PopulationStandardDeviation) {
    // Deviations from 2.5: squares sum to 5.0 over 4 values
    EXPECT_NEAR(population_std(values_, 2.5), std::sqrt(1.25), 1e-12);
    EXPECT_DOUBLE_EQ(population_std({3.0, 3.0}, 3.0), 0.0);
}

TEST_F(ReducerTest, SummarizeCollectsEverything) {
    Summary summary = summarize(values_);

    EXPECT_EQ(summary.count, 4u);
    EXPECT_DOUBLE_EQ(summary.mean, 2.5);
    EXPECT_DOUBLE_EQ(summary.median, 2.5);
    EXPECT_DOUBLE_EQ(summary.min, 1.0);
    EXPECT_DOUBLE_EQ(summary.max, 4.0);
    EXPECT_LE(summary.min, summary.median);
    EXPECT_LE(summary.median, summary.max);
    EXPECT_LE(summary.min, summary.mean);
    EXPECT_LE(summary.mean, summary.max);
}

TEST_F(ReducerTest, EmptyInputIsNaN) {
    std::vector<double> empty;
    EXPECT_TRUE(std::isnan(mean(empty)));
    EXPECT_TRUE(std::isnan(median(empty)));
    EXPECT_TRUE(std::isnan(population_std(empty, 0.0)));

    Summary summary = summarize(empty);
    EXPECT_EQ(summary.count, 0u);
    EXPECT_TRUE(std::isnan(summary.mean));
    EXPECT_TRUE(std::isnan(summary.std_dev));
    EXPECT_TRUE(std::isnan(summary.min));
    EXPECT_TRUE(std::isnan(summary.max));
}

// ============================================================================
// Correlation
// ============================================================================

class CorrelationTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = Eigen::MatrixXd(5, 3);
        data_ << 1.0, 10.0, 2.0,
                 2.0, 8.0, 2.0,
                 3.0, 6.0, 2.0,
                 4.0, 4.0, 2.0,
                 5.0, 2.0, 2.0;
    }

    Eigen::MatrixXd data_;
};

TEST_F(CorrelationTest, PerfectlyAntiCorrelatedColumns) {
    Eigen::MatrixXd corr = pearson_matrix(data_);

    ASSERT_EQ(corr.rows(), 3);
    ASSERT_EQ(corr.cols(), 3);
    EXPECT_DOUBLE_EQ(corr(0, 0), 1.0);
    EXPECT_NEAR(corr(0, 1), -1.0, 1e-12);
    EXPECT_NEAR(corr(1, 0), -1.0, 1e-12);
}

TEST_F(CorrelationTest, ConstantColumnHasUndefinedCorrelation) {
    Eigen::MatrixXd corr = pearson_matrix(data_);

    EXPECT_DOUBLE_EQ(corr(2, 2), 1.0);
    EXPECT_TRUE(std::isnan(corr(0, 2)));
    EXPECT_TRUE(std::isnan(corr(2, 1)));
}

TEST_F(CorrelationTest, MatrixIsSymmetricAndBounded) {
    Eigen::MatrixXd samples(4, 2);
    samples << 1.0, 2.0,
               2.0, 1.0,
               3.0, 4.0,
               4.0, 3.5;
    Eigen::MatrixXd corr = pearson_matrix(samples);

    EXPECT_DOUBLE_EQ(corr(0, 1), corr(1, 0));
    EXPECT_GE(corr(0, 1), -1.0);
    EXPECT_LE(corr(0, 1), 1.0);
    EXPECT_GT(corr(0, 1), 0.0);
}

TEST_F(CorrelationTest, NoObservationsGivesNaNMatrix) {
    Eigen::MatrixXd corr = pearson_matrix(Eigen::MatrixXd(0, 2));

    ASSERT_EQ(corr.rows(), 2);
    EXPECT_TRUE(std::isnan(corr(0, 0)));
    EXPECT_TRUE(std::isnan(corr(0, 1)));
}

TEST_F(CorrelationTest, PearsonOfSeries) {
    EXPECT_NEAR(pearson({1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}), 1.0, 1e-12);
    EXPECT_TRUE(std::isnan(pearson({1.0}, {2.0})));
    EXPECT_TRUE(std::isnan(pearson({1.0, 2.0}, {1.0, 2.0, 3.0})));
}
