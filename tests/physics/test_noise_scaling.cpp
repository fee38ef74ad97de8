/**
 * @file test_noise_scaling.cpp
 * @brief Statistical properties of the Euler-Maruyama ensemble
 *
 * Near the warm equilibrium with η_a = 0 and slow albedo the temperature is
 * an Ornstein-Uhlenbeck process with restoring rate k = 4 T0 (εσ/S0) T*³,
 * so Var[T(t)] = η_T² (1 - exp(-2kt)) / (2k) independent of the step size.
 */

#include <gtest/gtest.h>
#include "StochasticEnsemble.hpp"
#include "EnsembleStatistics.hpp"
#include "EquilibriumSolver.hpp"
#include "EnergyBalanceModel.hpp"
#include "SEBM.hpp"
#include <cmath>

using namespace SEBM;

class NoiseScalingTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);

        params.noise_temperature = 1.0;
        params.noise_albedo = 0.0;
        EnergyBalanceModel model(params);

        EquilibriumSolver solver;
        EquilibriumPoint warm = solver.solve(model, 290.0);
        start = ClimateState(warm.temperature, warm.albedo);

        k = 4.0 * params.reference_temperature * model.outgoingFlux(warm.temperature) /
            warm.temperature;
    }

    double finalVariance(double dt, double horizon, int runs, std::uint64_t seed) const {
        const int steps = static_cast<int>(std::lround(horizon / dt)) + 1;
        StochasticEnsembleSimulator sim(4);
        Ensemble ens = sim.run(params, start, dt, steps, runs, seed);
        const double sd = EnsembleStatistics::sampleStdDev(ens.finalTemperatures());
        return sd * sd;
    }

    int rank;
    PhysicalParameters params;
    ClimateState start;
    double k = 0.0;
};

TEST_F(NoiseScalingTest, VarianceInvariantWhenDtDoubles) {
    const double horizon = 2.0;
    const double var_fine = finalVariance(0.01, horizon, 2000, 101u);
    const double var_coarse = finalVariance(0.02, horizon, 2000, 202u);

    const double ratio = var_coarse / var_fine;
    EXPECT_GT(ratio, 0.8);
    EXPECT_LT(ratio, 1.25);

    // An unscaled N(0,1) increment would give ratio dt_coarse/dt_fine = 2
    // in the opposite direction; the band above excludes it
}

TEST_F(NoiseScalingTest, VarianceMatchesOrnsteinUhlenbeck) {
    const double horizon = 2.0;
    const double expected = (1.0 - std::exp(-2.0 * k * horizon)) / (2.0 * k);

    const double var = finalVariance(0.01, horizon, 2000, 303u);
    EXPECT_NEAR(var, expected, 0.15 * expected);
}

TEST_F(NoiseScalingTest, ShortHorizonVarianceGrowsLinearly) {
    // For kt << 1 the process is close to free Brownian motion: Var ≈ η² t
    const double horizon = 0.05;
    const double var = finalVariance(0.001, horizon, 4000, 404u);
    EXPECT_NEAR(var, horizon, 0.15 * horizon);
}

TEST_F(NoiseScalingTest, MeanSpreadShrinksAsInverseSqrtRuns) {
    const int repeats = 200;
    const double dt = 0.01;
    const int steps = 101;
    StochasticEnsembleSimulator sim(4);

    auto spreadOfMeans = [&](int runs, std::uint64_t seed_base, double& mean_se) {
        std::vector<double> means;
        mean_se = 0.0;
        for (int m = 0; m < repeats; ++m) {
            Ensemble ens = sim.run(params, start, dt, steps, runs,
                                   seed_base + static_cast<std::uint64_t>(m));
            SummaryStatistics stats = EnsembleStatistics::summarize(ens);
            means.push_back(stats.ensemble_mean_temperature);
            mean_se += stats.standard_error;
        }
        mean_se /= repeats;
        return EnsembleStatistics::sampleStdDev(means);
    };

    double se_small = 0.0, se_large = 0.0;
    const double spread_small = spreadOfMeans(25, 10000u, se_small);
    const double spread_large = spreadOfMeans(100, 20000u, se_large);

    const double ratio = spread_small / spread_large;
    EXPECT_GT(ratio, 1.5);
    EXPECT_LT(ratio, 2.7);

    // The per-ensemble standard error estimates the same spread
    EXPECT_NEAR(se_large, spread_large, 0.25 * spread_large);
    EXPECT_NEAR(se_small, spread_small, 0.25 * spread_small);
}

TEST_F(NoiseScalingTest, ZeroNoiseHasNoSpread) {
    PhysicalParameters quiet = params;
    quiet.noise_temperature = 0.0;
    StochasticEnsembleSimulator sim;
    Ensemble ens = sim.run(quiet, ClimateState(240.0, 0.35), 0.01, 100, 10, 1u);

    SummaryStatistics stats = EnsembleStatistics::summarize(ens);
    EXPECT_DOUBLE_EQ(stats.final_temperature.std_dev, 0.0);
    EXPECT_DOUBLE_EQ(stats.standard_error, 0.0);
    EXPECT_DOUBLE_EQ(stats.final_temperature.min, stats.final_temperature.max);
}
