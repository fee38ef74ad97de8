/**
 * @file EnergyBalanceModel.cpp
 * @brief Radiative fluxes and tendencies of the energy balance model
 */

#include "EnergyBalanceModel.hpp"
#include <algorithm>
#include <cmath>

namespace SEBM {

EnergyBalanceModel::EnergyBalanceModel(const PhysicalParameters& params)
    : params_(params) {}

double EnergyBalanceModel::incomingFlux(double albedo) const {
    return (1.0 - albedo) / 4.0;
}

double EnergyBalanceModel::outgoingFlux(double temperature) const {
    const double T2 = temperature * temperature;
    return radiativeCoefficient() * T2 * T2;
}

double EnergyBalanceModel::albedoEquilibrium(double temperature) const {
    const double A = 0.5 * (params_.albedo_ice + params_.albedo_water);
    const double B = 0.5 * (params_.albedo_ice - params_.albedo_water);
    const double half_width = 0.5 * params_.transition_width;
    return A - B * std::tanh((temperature - params_.transition_temperature) / half_width);
}

double EnergyBalanceModel::albedoEquilibriumSlope(double temperature) const {
    const double B = 0.5 * (params_.albedo_ice - params_.albedo_water);
    const double half_width = 0.5 * params_.transition_width;
    const double th = std::tanh((temperature - params_.transition_temperature) / half_width);
    // d/dx tanh(x) = 1 - tanh²(x)
    return -B * (1.0 - th * th) / half_width;
}

double EnergyBalanceModel::temperatureDerivative(double temperature, double albedo) const {
    return incomingFlux(albedo) - outgoingFlux(temperature);
}

double EnergyBalanceModel::albedoDerivative(double temperature, double albedo) const {
    return params_.albedo_relaxation_rate * (albedoEquilibrium(temperature) - albedo);
}

double EnergyBalanceModel::netFlux(double temperature) const {
    return incomingFlux(albedoEquilibrium(temperature)) - outgoingFlux(temperature);
}

double EnergyBalanceModel::netFluxDerivative(double temperature) const {
    const double T3 = temperature * temperature * temperature;
    return -0.25 * albedoEquilibriumSlope(temperature) - 4.0 * radiativeCoefficient() * T3;
}

ClimateState EnergyBalanceModel::tendency(const ClimateState& state) const {
    return ClimateState(
        params_.reference_temperature * temperatureDerivative(state.temperature, state.albedo),
        albedoDerivative(state.temperature, state.albedo));
}

std::vector<double> EnergyBalanceModel::incomingFlux(const std::vector<double>& albedo) const {
    std::vector<double> result(albedo.size());
    std::transform(albedo.begin(), albedo.end(), result.begin(),
                   [this](double a) { return incomingFlux(a); });
    return result;
}

std::vector<double> EnergyBalanceModel::outgoingFlux(const std::vector<double>& temperature) const {
    std::vector<double> result(temperature.size());
    std::transform(temperature.begin(), temperature.end(), result.begin(),
                   [this](double T) { return outgoingFlux(T); });
    return result;
}

std::vector<double> EnergyBalanceModel::albedoEquilibrium(const std::vector<double>& temperature) const {
    std::vector<double> result(temperature.size());
    std::transform(temperature.begin(), temperature.end(), result.begin(),
                   [this](double T) { return albedoEquilibrium(T); });
    return result;
}

std::vector<double> EnergyBalanceModel::netFlux(const std::vector<double>& temperature) const {
    std::vector<double> result(temperature.size());
    std::transform(temperature.begin(), temperature.end(), result.begin(),
                   [this](double T) { return netFlux(T); });
    return result;
}

} // namespace SEBM
