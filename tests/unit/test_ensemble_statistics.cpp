/**
 * @file test_ensemble_statistics.cpp
 * @brief Unit tests for ensemble aggregation on hand-built ensembles
 */

#include <gtest/gtest.h>
#include "EnsembleStatistics.hpp"
#include "StochasticEnsemble.hpp"
#include "SEBM.hpp"
#include <cmath>

using namespace SEBM;

class EnsembleStatisticsTest : public ::testing::Test {
protected:
    // Two runs over four steps:
    //   run 0: T = 1, 2, 3, 4      a = 0.3 (constant)
    //   run 1: T = 10, 10, 10, 10  a = 0.2, 0.4, 0.2, 0.4
    void SetUp() override {
        ensemble = Ensemble(linspace(0.0, 3.0, 4), 2);
        for (size_t i = 0; i < 4; ++i) {
            ensemble.setState(0, i, ClimateState(1.0 + i, 0.3));
            ensemble.setState(1, i, ClimateState(10.0, (i % 2 == 0) ? 0.2 : 0.4));
        }
    }

    Ensemble ensemble;
};

TEST_F(EnsembleStatisticsTest, PerRunTemporalStatistics) {
    SummaryStatistics stats = EnsembleStatistics::summarize(ensemble);
    ASSERT_EQ(stats.runs.size(), 2u);

    // Population std of {1,2,3,4} is sqrt(1.25)
    EXPECT_DOUBLE_EQ(stats.runs[0].temperature_mean, 2.5);
    EXPECT_NEAR(stats.runs[0].temperature_std, std::sqrt(1.25), 1e-14);
    EXPECT_NEAR(stats.runs[0].temperature_cov, std::sqrt(1.25) / 2.5, 1e-14);
    EXPECT_NEAR(stats.runs[0].albedo_mean, 0.3, 1e-15);
    EXPECT_NEAR(stats.runs[0].albedo_std, 0.0, 1e-15);

    EXPECT_DOUBLE_EQ(stats.runs[1].temperature_mean, 10.0);
    EXPECT_DOUBLE_EQ(stats.runs[1].temperature_std, 0.0);
    EXPECT_DOUBLE_EQ(stats.runs[1].temperature_cov, 0.0);
    EXPECT_NEAR(stats.runs[1].albedo_mean, 0.3, 1e-15);
    EXPECT_NEAR(stats.runs[1].albedo_std, 0.1, 1e-15);
}

TEST_F(EnsembleStatisticsTest, CrossRunDistributions) {
    SummaryStatistics stats = EnsembleStatistics::summarize(ensemble);

    ASSERT_EQ(stats.final_temperatures.size(), 2u);
    EXPECT_DOUBLE_EQ(stats.final_temperatures[0], 4.0);
    EXPECT_DOUBLE_EQ(stats.final_temperatures[1], 10.0);

    EXPECT_DOUBLE_EQ(stats.final_temperature.mean, 7.0);
    EXPECT_DOUBLE_EQ(stats.final_temperature.min, 4.0);
    EXPECT_DOUBLE_EQ(stats.final_temperature.max, 10.0);
    // Sample std of {4, 10}
    EXPECT_NEAR(stats.final_temperature.std_dev, std::sqrt(18.0), 1e-14);

    EXPECT_DOUBLE_EQ(stats.ensemble_mean_temperature, 6.25);
    // Sample std of run means {2.5, 10} over sqrt(2)
    EXPECT_NEAR(stats.standard_error, std::sqrt(28.125) / std::sqrt(2.0), 1e-12);

    std::vector<double> means = stats.runMeans();
    ASSERT_EQ(means.size(), 2u);
    EXPECT_DOUBLE_EQ(means[0], 2.5);
    EXPECT_EQ(stats.runStdDevs().size(), 2u);
    EXPECT_EQ(stats.runCoVs().size(), 2u);
}

TEST_F(EnsembleStatisticsTest, BurnInDropsLeadingSteps) {
    SummaryStatistics stats = EnsembleStatistics::summarize(ensemble, 2);

    EXPECT_EQ(stats.burn_in_steps, 2u);
    EXPECT_DOUBLE_EQ(stats.runs[0].temperature_mean, 3.5);
    EXPECT_NEAR(stats.runs[0].temperature_std, 0.5, 1e-15);

    // Final-time values are unaffected
    EXPECT_DOUBLE_EQ(stats.final_temperatures[0], 4.0);

    EXPECT_THROW(EnsembleStatistics::summarize(ensemble, 4), std::invalid_argument);
}

TEST_F(EnsembleStatisticsTest, ZeroMeanRunRaisesUndefinedCoV) {
    // Run 1 symmetric around zero
    ensemble.setState(1, 0, ClimateState(-1.0, 0.3));
    ensemble.setState(1, 1, ClimateState(1.0, 0.3));
    ensemble.setState(1, 2, ClimateState(-2.0, 0.3));
    ensemble.setState(1, 3, ClimateState(2.0, 0.3));

    try {
        EnsembleStatistics::summarize(ensemble);
        FAIL() << "Expected UndefinedCoV";
    } catch (const UndefinedCoV& e) {
        EXPECT_EQ(e.run(), 1);
    }
}

TEST_F(EnsembleStatisticsTest, UndefinedCoVIsDomainError) {
    EXPECT_THROW(EnsembleStatistics::coefficientOfVariation(0.0, 1.0), std::domain_error);
    EXPECT_DOUBLE_EQ(EnsembleStatistics::coefficientOfVariation(-2.0, 1.0), -0.5);
}

TEST_F(EnsembleStatisticsTest, EmptyEnsembleRejected) {
    Ensemble empty;
    EXPECT_THROW(EnsembleStatistics::summarize(empty), std::invalid_argument);
}

TEST_F(EnsembleStatisticsTest, DivergedRunsMustBeDroppedFirst) {
    ensemble.recordFailure(RunFailure{0, 2, 2.0});
    EXPECT_THROW(EnsembleStatistics::summarize(ensemble), std::invalid_argument);

    SummaryStatistics stats = EnsembleStatistics::summarize(
        ensemble.subset(ensemble.completedRuns()));
    ASSERT_EQ(stats.runs.size(), 1u);
    EXPECT_DOUBLE_EQ(stats.runs[0].temperature_mean, 10.0);
}

TEST(StatisticsHelpersTest, MeanAndStdDev) {
    const std::vector<double> x = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    EXPECT_DOUBLE_EQ(EnsembleStatistics::mean(x), 5.0);
    EXPECT_DOUBLE_EQ(EnsembleStatistics::stdDev(x), 2.0);
    EXPECT_NEAR(EnsembleStatistics::sampleStdDev(x), std::sqrt(32.0 / 7.0), 1e-14);

    EXPECT_DOUBLE_EQ(EnsembleStatistics::sampleStdDev({3.0}), 0.0);
    EXPECT_THROW(EnsembleStatistics::mean(std::vector<double>{}), std::invalid_argument);
}

TEST(StatisticsHelpersTest, PercentileInterpolates) {
    const std::vector<double> x = {5.0, 1.0, 4.0, 2.0, 3.0};
    EXPECT_DOUBLE_EQ(EnsembleStatistics::percentile(x, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(EnsembleStatistics::percentile(x, 0.5), 3.0);
    EXPECT_DOUBLE_EQ(EnsembleStatistics::percentile(x, 1.0), 5.0);
    EXPECT_NEAR(EnsembleStatistics::percentile(x, 0.1), 1.4, 1e-14);
    EXPECT_NEAR(EnsembleStatistics::percentile(x, 0.9), 4.6, 1e-14);

    EXPECT_THROW(EnsembleStatistics::percentile(x, 1.5), std::invalid_argument);
    EXPECT_THROW(EnsembleStatistics::percentile({}, 0.5), std::invalid_argument);
}

TEST(StatisticsHelpersTest, DescribeSingleValue) {
    DistributionSummary d = EnsembleStatistics::describe({42.0});
    EXPECT_DOUBLE_EQ(d.mean, 42.0);
    EXPECT_DOUBLE_EQ(d.std_dev, 0.0);
    EXPECT_DOUBLE_EQ(d.p10, 42.0);
    EXPECT_DOUBLE_EQ(d.p90, 42.0);
}
