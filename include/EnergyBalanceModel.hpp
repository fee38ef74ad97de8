#ifndef ENERGY_BALANCE_MODEL_HPP
#define ENERGY_BALANCE_MODEL_HPP

#include "SEBM.hpp"
#include <vector>

namespace SEBM {

/**
 * @brief Physical constants and tunables of the energy balance model
 *
 * Fixed at configuration time. All fluxes are normalized by the solar
 * constant, so only the ratio emissivity * sigma / S0 enters the outgoing
 * radiation.
 */
struct PhysicalParameters {
    double solar_constant = 1368.0;         // S0 [W/m²]
    double reference_temperature = 288.0;   // T0 [K], converts flux imbalance to K per time unit
    double emissivity = 0.61;               // ε [-], effective (greenhouse-reduced)
    double stefan_boltzmann = 5.67e-8;      // σ [W/(m²·K⁴)]
    double albedo_ice = 0.7;                // a_ice [-], cold limit
    double albedo_water = 0.3;              // a_water [-], warm limit
    double transition_temperature = 265.0;  // Tc [K], center of the albedo step
    double transition_width = 20.0;         // wT [K], full width of the albedo step
    double albedo_relaxation_rate = 1.0e-2; // δ [-], ratio of thermal to albedo timescale
    double noise_temperature = 0.0;         // η_T [K/√time]
    double noise_albedo = 0.0;              // η_a [1/√time]
};

inline bool operator==(const PhysicalParameters& a, const PhysicalParameters& b) {
    return a.solar_constant == b.solar_constant &&
           a.reference_temperature == b.reference_temperature &&
           a.emissivity == b.emissivity && a.stefan_boltzmann == b.stefan_boltzmann &&
           a.albedo_ice == b.albedo_ice && a.albedo_water == b.albedo_water &&
           a.transition_temperature == b.transition_temperature &&
           a.transition_width == b.transition_width &&
           a.albedo_relaxation_rate == b.albedo_relaxation_rate &&
           a.noise_temperature == b.noise_temperature && a.noise_albedo == b.noise_albedo;
}

inline bool operator!=(const PhysicalParameters& a, const PhysicalParameters& b) {
    return !(a == b);
}

/**
 * @brief Zero-dimensional energy balance model with ice-albedo feedback
 *
 * Governing equations (time in units where the thermal inertia is absorbed
 * into T0):
 *
 *   dT/dt = T0 * [ (1 - a)/4 - (ε σ / S0) T⁴ ]
 *   da/dt = δ  * [ a_eq(T) - a ]
 *
 *   a_eq(T) = A - B tanh( (T - Tc) / (wT/2) ),
 *   A = (a_ice + a_water)/2,  B = (a_ice - a_water)/2
 *
 * In the fast-albedo limit a = a_eq(T) the steady states are the roots of
 * the net flux, which has up to three roots (S-shaped response): a cold and
 * a warm stable branch separated by an unstable one near Tc.
 *
 * Every member function is pure and defined for all real inputs; physically
 * meaningless inputs (negative T, albedo outside [0,1]) are evaluated as-is.
 */
class EnergyBalanceModel {
public:
    EnergyBalanceModel() = default;
    explicit EnergyBalanceModel(const PhysicalParameters& params);

    const PhysicalParameters& parameters() const { return params_; }

    // Absorbed shortwave, normalized by S0
    double incomingFlux(double albedo) const;

    // Emitted longwave, normalized by S0
    double outgoingFlux(double temperature) const;

    double albedoEquilibrium(double temperature) const;

    // d(a_eq)/dT, strictly negative when a_ice > a_water
    double albedoEquilibriumSlope(double temperature) const;

    // Flux imbalance incomingFlux(a) - outgoingFlux(T)
    double temperatureDerivative(double temperature, double albedo) const;

    double albedoDerivative(double temperature, double albedo) const;

    // Flux imbalance with the albedo at its instantaneous equilibrium
    double netFlux(double temperature) const;

    // d(netFlux)/dT; negative at a stable equilibrium
    double netFluxDerivative(double temperature) const;

    /**
     * @brief Right-hand side in physical time units
     *
     * Applies the T0 scale to the temperature equation. Both integrators go
     * through this function so they advance the same system.
     */
    ClimateState tendency(const ClimateState& state) const;

    // Element-wise versions for curve evaluation
    std::vector<double> incomingFlux(const std::vector<double>& albedo) const;
    std::vector<double> outgoingFlux(const std::vector<double>& temperature) const;
    std::vector<double> albedoEquilibrium(const std::vector<double>& temperature) const;
    std::vector<double> netFlux(const std::vector<double>& temperature) const;

private:
    PhysicalParameters params_{};

    double radiativeCoefficient() const {
        return params_.emissivity * params_.stefan_boltzmann / params_.solar_constant;
    }
};

} // namespace SEBM

#endif // ENERGY_BALANCE_MODEL_HPP
