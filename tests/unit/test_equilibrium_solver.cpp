/**
 * @file test_equilibrium_solver.cpp
 * @brief Unit tests for Newton root finding on the net flux
 */

#include <gtest/gtest.h>
#include "EquilibriumSolver.hpp"
#include "EnergyBalanceModel.hpp"
#include "SEBM.hpp"
#include <cmath>

using namespace SEBM;

class EquilibriumSolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    int rank;
    PhysicalParameters params;
    EnergyBalanceModel model;
};

TEST_F(EquilibriumSolverTest, ColdAndWarmBasinsGiveDistinctRoots) {
    EquilibriumSolver solver;

    const double cold = solver.findRoot(params, 220.0);
    const double warm = solver.findRoot(params, 290.0);

    EXPECT_LT(std::abs(model.netFlux(cold)), 1e-6);
    EXPECT_LT(std::abs(model.netFlux(warm)), 1e-6);

    EXPECT_GT(cold, 230.0);
    EXPECT_LT(cold, 237.0);
    EXPECT_GT(warm, 285.0);
    EXPECT_LT(warm, 291.0);
    EXPECT_GT(warm - cold, 40.0);
}

TEST_F(EquilibriumSolverTest, SolveReportsStability) {
    EquilibriumSolver solver;

    EquilibriumPoint cold = solver.solve(model, 220.0);
    EquilibriumPoint middle = solver.solve(model, 265.0);
    EquilibriumPoint warm = solver.solve(model, 290.0);

    EXPECT_TRUE(cold.stable);
    EXPECT_FALSE(middle.stable);
    EXPECT_TRUE(warm.stable);

    EXPECT_GT(middle.temperature, 262.0);
    EXPECT_LT(middle.temperature, 268.0);

    EXPECT_DOUBLE_EQ(warm.albedo, model.albedoEquilibrium(warm.temperature));
    EXPECT_LT(warm.residual, 1e-6);
    EXPECT_GE(warm.iterations, 1);
}

TEST_F(EquilibriumSolverTest, TighterToleranceIsHonoured) {
    EquilibriumSolver solver;
    EquilibriumPoint p = solver.solve(model, 290.0, 1e-12, 100);
    EXPECT_LT(p.residual, 1e-12);
}

TEST_F(EquilibriumSolverTest, IterationLimitReached) {
    EquilibriumSolver solver;
    try {
        solver.findRoot(params, 220.0, 1e-6, 1);
        FAIL() << "Expected NoConvergence";
    } catch (const NoConvergence& e) {
        EXPECT_EQ(e.iterations(), 1);
        // One Newton step from 220 K lands close to 234.7 K
        EXPECT_NEAR(e.lastEstimate(), 234.7, 1.0);
        EXPECT_GE(e.residual(), 1e-6);
        EXPECT_TRUE(std::isfinite(e.residual()));
    }
}

TEST_F(EquilibriumSolverTest, RejectsInvalidArguments) {
    EquilibriumSolver solver;
    EXPECT_THROW(solver.findRoot(params, 250.0, 0.0, 100), std::invalid_argument);
    EXPECT_THROW(solver.findRoot(params, 250.0, 1e-6, 0), std::invalid_argument);
}

TEST_F(EquilibriumSolverTest, FindRootsMapsAllBranches) {
    EquilibriumSolver solver;
    const std::vector<double> guesses = {215.0, 220.0, 230.0, 265.0, 290.0, 300.0};

    std::vector<EquilibriumPoint> roots = solver.findRoots(model, guesses);

    ASSERT_EQ(roots.size(), 3u);
    EXPECT_LT(roots[0].temperature, roots[1].temperature);
    EXPECT_LT(roots[1].temperature, roots[2].temperature);
    EXPECT_TRUE(roots[0].stable);
    EXPECT_FALSE(roots[1].stable);
    EXPECT_TRUE(roots[2].stable);
}

TEST_F(EquilibriumSolverTest, FindRootsSkipsFailedGuesses) {
    EquilibriumSolver solver;
    solver.setVerbose(true);
    EquilibriumConfig config;
    config.max_iterations = 1;

    // Nothing converges in a single step from these guesses
    std::vector<EquilibriumPoint> roots = solver.findRoots(model, {220.0, 320.0}, config);
    EXPECT_TRUE(roots.empty());
}

TEST_F(EquilibriumSolverTest, SingleBranchUnderStrongForcing) {
    // Bright sun removes the ice branch: every guess lands on one warm root
    params.solar_constant = 1800.0;
    EnergyBalanceModel hot(params);
    EquilibriumSolver solver;

    std::vector<EquilibriumPoint> roots = solver.findRoots(hot, {290.0, 300.0, 320.0, 340.0});
    ASSERT_EQ(roots.size(), 1u);
    EXPECT_GT(roots[0].temperature, 305.0);
    EXPECT_LT(roots[0].temperature, 312.0);
    EXPECT_TRUE(roots[0].stable);
}

TEST_F(EquilibriumSolverTest, SingleBranchUnderWeakForcing) {
    params.solar_constant = 1100.0;
    EnergyBalanceModel faint(params);
    EquilibriumSolver solver;

    EquilibriumPoint p = solver.solve(faint, 220.0);
    EXPECT_LT(p.temperature, params.transition_temperature);
    EXPECT_NEAR(p.temperature, 221.0, 1.0);
    EXPECT_TRUE(p.stable);
}
