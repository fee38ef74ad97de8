/**
 * @file test_energy_balance_model.cpp
 * @brief Unit tests for the radiative flux model
 */

#include <gtest/gtest.h>
#include "EnergyBalanceModel.hpp"
#include "SEBM.hpp"
#include <cmath>

using namespace SEBM;

class EnergyBalanceModelTest : public ::testing::Test {
protected:
    EnergyBalanceModel model;
    PhysicalParameters params;
};

TEST_F(EnergyBalanceModelTest, DefaultParameters) {
    const PhysicalParameters& p = model.parameters();
    EXPECT_DOUBLE_EQ(p.solar_constant, 1368.0);
    EXPECT_DOUBLE_EQ(p.reference_temperature, 288.0);
    EXPECT_DOUBLE_EQ(p.emissivity, 0.61);
    EXPECT_DOUBLE_EQ(p.stefan_boltzmann, 5.67e-8);
    EXPECT_DOUBLE_EQ(p.albedo_ice, 0.7);
    EXPECT_DOUBLE_EQ(p.albedo_water, 0.3);
    EXPECT_DOUBLE_EQ(p.transition_temperature, 265.0);
    EXPECT_DOUBLE_EQ(p.transition_width, 20.0);
    EXPECT_DOUBLE_EQ(p.albedo_relaxation_rate, 1.0e-2);
    EXPECT_DOUBLE_EQ(p.noise_temperature, 0.0);
    EXPECT_DOUBLE_EQ(p.noise_albedo, 0.0);
}

TEST_F(EnergyBalanceModelTest, IncomingFlux) {
    EXPECT_DOUBLE_EQ(model.incomingFlux(0.0), 0.25);
    EXPECT_DOUBLE_EQ(model.incomingFlux(1.0), 0.0);
    EXPECT_DOUBLE_EQ(model.incomingFlux(0.3), 0.175);

    // No bounds on the albedo argument
    EXPECT_DOUBLE_EQ(model.incomingFlux(-1.0), 0.5);
    EXPECT_DOUBLE_EQ(model.incomingFlux(2.0), -0.25);
}

TEST_F(EnergyBalanceModelTest, OutgoingFlux) {
    const double coef = 0.61 * 5.67e-8 / 1368.0;
    EXPECT_NEAR(model.outgoingFlux(288.0), coef * std::pow(288.0, 4), 1e-15);
    EXPECT_DOUBLE_EQ(model.outgoingFlux(0.0), 0.0);

    // Even power: sign of T does not matter
    EXPECT_DOUBLE_EQ(model.outgoingFlux(-250.0), model.outgoingFlux(250.0));
}

TEST_F(EnergyBalanceModelTest, AlbedoEquilibriumAtTransitionCenter) {
    EXPECT_NEAR(model.albedoEquilibrium(265.0), 0.5, 1e-15);
}

TEST_F(EnergyBalanceModelTest, AlbedoEquilibriumMonotoneAndBounded) {
    double previous = model.albedoEquilibrium(-1000.0);
    for (double T = -1000.0; T <= 1000.0; T += 0.5) {
        const double a = model.albedoEquilibrium(T);
        EXPECT_LE(a, previous + 1e-15) << "Not non-increasing at T = " << T;
        EXPECT_GE(a, params.albedo_water - 1e-15);
        EXPECT_LE(a, params.albedo_ice + 1e-15);
        previous = a;
    }
}

TEST_F(EnergyBalanceModelTest, AlbedoEquilibriumLimits) {
    EXPECT_NEAR(model.albedoEquilibrium(400.0), params.albedo_water, 1e-9);
    EXPECT_NEAR(model.albedoEquilibrium(100.0), params.albedo_ice, 1e-9);
}

TEST_F(EnergyBalanceModelTest, AlbedoSlopeMatchesFiniteDifference) {
    const double h = 1e-4;
    for (double T : {230.0, 255.0, 265.0, 280.0, 300.0}) {
        const double fd = (model.albedoEquilibrium(T + h) - model.albedoEquilibrium(T - h)) / (2.0 * h);
        EXPECT_NEAR(model.albedoEquilibriumSlope(T), fd, 1e-8);
        EXPECT_LT(model.albedoEquilibriumSlope(T), 0.0);
    }
}

TEST_F(EnergyBalanceModelTest, TemperatureDerivativeIsFluxImbalance) {
    const double T = 250.0, a = 0.4;
    EXPECT_DOUBLE_EQ(model.temperatureDerivative(T, a),
                     model.incomingFlux(a) - model.outgoingFlux(T));
}

TEST_F(EnergyBalanceModelTest, AlbedoDerivativeRelaxesToEquilibrium) {
    const double T = 288.0;
    const double a_eq = model.albedoEquilibrium(T);

    EXPECT_NEAR(model.albedoDerivative(T, a_eq), 0.0, 1e-15);
    EXPECT_GT(model.albedoDerivative(T, a_eq - 0.1), 0.0);
    EXPECT_LT(model.albedoDerivative(T, a_eq + 0.1), 0.0);
    EXPECT_NEAR(model.albedoDerivative(T, a_eq - 0.1), 0.01 * 0.1, 1e-15);
}

TEST_F(EnergyBalanceModelTest, NetFluxSignPattern) {
    // Three roots near 233.5, 264.9 and 288 K
    EXPECT_GT(model.netFlux(220.0), 0.0);
    EXPECT_LT(model.netFlux(250.0), 0.0);
    EXPECT_GT(model.netFlux(275.0), 0.0);
    EXPECT_LT(model.netFlux(300.0), 0.0);
}

TEST_F(EnergyBalanceModelTest, NetFluxDerivativeMatchesFiniteDifference) {
    const double h = 1e-4;
    for (double T : {220.0, 250.0, 265.0, 288.0}) {
        const double fd = (model.netFlux(T + h) - model.netFlux(T - h)) / (2.0 * h);
        EXPECT_NEAR(model.netFluxDerivative(T), fd, 1e-9);
    }
}

TEST_F(EnergyBalanceModelTest, TendencyScalesTemperatureOnly) {
    const ClimateState s(260.0, 0.45);
    const ClimateState rate = model.tendency(s);

    EXPECT_DOUBLE_EQ(rate.temperature, 288.0 * model.temperatureDerivative(260.0, 0.45));
    EXPECT_DOUBLE_EQ(rate.albedo, model.albedoDerivative(260.0, 0.45));
}

TEST_F(EnergyBalanceModelTest, VectorOverloadsMatchScalar) {
    const std::vector<double> T = {200.0, 240.0, 265.0, 290.0, 330.0};
    const std::vector<double> a = {0.0, 0.3, 0.5, 0.7, 1.0};

    std::vector<double> in = model.incomingFlux(a);
    std::vector<double> out = model.outgoingFlux(T);
    std::vector<double> aeq = model.albedoEquilibrium(T);
    std::vector<double> net = model.netFlux(T);

    ASSERT_EQ(in.size(), a.size());
    ASSERT_EQ(out.size(), T.size());
    for (size_t i = 0; i < T.size(); ++i) {
        EXPECT_DOUBLE_EQ(in[i], model.incomingFlux(a[i]));
        EXPECT_DOUBLE_EQ(out[i], model.outgoingFlux(T[i]));
        EXPECT_DOUBLE_EQ(aeq[i], model.albedoEquilibrium(T[i]));
        EXPECT_DOUBLE_EQ(net[i], model.netFlux(T[i]));
    }

    EXPECT_TRUE(model.netFlux(std::vector<double>{}).empty());
}

TEST_F(EnergyBalanceModelTest, CustomParametersAreUsed) {
    params.solar_constant = 1500.0;
    params.albedo_ice = 0.6;
    params.albedo_water = 0.2;
    EnergyBalanceModel custom(params);

    EXPECT_NEAR(custom.albedoEquilibrium(265.0), 0.4, 1e-15);
    EXPECT_LT(custom.outgoingFlux(288.0), model.outgoingFlux(288.0));
}

TEST(ClimateStateTest, FiniteCheck) {
    EXPECT_TRUE(ClimateState(288.0, 0.3).isFinite());
    EXPECT_FALSE(ClimateState(NAN, 0.3).isFinite());
    EXPECT_FALSE(ClimateState(288.0, INFINITY).isFinite());
}

TEST(LinspaceTest, EndpointsAndSpacing) {
    std::vector<double> t = linspace(0.0, 6.0, 500);
    ASSERT_EQ(t.size(), 500u);
    EXPECT_DOUBLE_EQ(t.front(), 0.0);
    EXPECT_DOUBLE_EQ(t.back(), 6.0);
    EXPECT_NEAR(t[1] - t[0], 6.0 / 499.0, 1e-15);
}
