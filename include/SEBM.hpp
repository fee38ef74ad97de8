#ifndef SEBM_HPP
#define SEBM_HPP

#include <petsc.h>
#include <petscts.h>
#include <petscsnes.h>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace SEBM {

// Forward declarations
class EnergyBalanceModel;
class DeterministicIntegrator;
class EquilibriumSolver;
class StochasticEnsembleSimulator;
class EnsembleStatistics;
class Ensemble;
class ConfigReader;

/**
 * @brief Prognostic state of the zero-dimensional climate model
 *
 * Temperature is a Kelvin-like scale, albedo is dimensionless. Neither is
 * clamped: under large noise the albedo can leave [0,1] and the temperature
 * can become negative.
 */
struct ClimateState {
    double temperature = 288.0;     ///< T [K]
    double albedo = 0.3;            ///< a [-]

    ClimateState() = default;
    ClimateState(double T, double a) : temperature(T), albedo(a) {}

    bool isFinite() const {
        return std::isfinite(temperature) && std::isfinite(albedo);
    }
};

inline bool operator==(const ClimateState& lhs, const ClimateState& rhs) {
    return lhs.temperature == rhs.temperature && lhs.albedo == rhs.albedo;
}

inline bool operator!=(const ClimateState& lhs, const ClimateState& rhs) {
    return !(lhs == rhs);
}

/**
 * @brief States sampled on a time grid by one integration run
 */
struct Trajectory {
    std::vector<double> times;
    std::vector<ClimateState> states;

    std::size_t size() const { return states.size(); }
    const ClimateState& front() const { return states.front(); }
    const ClimateState& back() const { return states.back(); }

    std::vector<double> temperatures() const;
    std::vector<double> albedos() const;
};

// =============================================================================
// Error taxonomy
// =============================================================================

/**
 * @brief State became non-finite during integration
 *
 * run is -1 for deterministic integration.
 */
class NumericalDivergence : public std::runtime_error {
public:
    NumericalDivergence(const std::string& what, int run, long step, double time)
        : std::runtime_error(what), run_(run), step_(step), time_(time) {}

    int run() const { return run_; }
    long step() const { return step_; }
    double time() const { return time_; }

private:
    int run_;
    long step_;
    double time_;
};

/**
 * @brief Root solver hit its iteration limit or diverged
 */
class NoConvergence : public std::runtime_error {
public:
    NoConvergence(const std::string& what, double last_estimate,
                  double residual, int iterations)
        : std::runtime_error(what), last_estimate_(last_estimate),
          residual_(residual), iterations_(iterations) {}

    double lastEstimate() const { return last_estimate_; }
    double residual() const { return residual_; }
    int iterations() const { return iterations_; }

private:
    double last_estimate_;
    double residual_;
    int iterations_;
};

/**
 * @brief Coefficient of variation requested for a run with zero mean
 */
class UndefinedCoV : public std::domain_error {
public:
    UndefinedCoV(const std::string& what, int run)
        : std::domain_error(what), run_(run) {}

    int run() const { return run_; }

private:
    int run_;
};

// =============================================================================
// Run configuration records
// =============================================================================

struct DeterministicConfig {
    double start_time = 0.0;
    double end_time = 6.0;
    int num_samples = 500;
    double max_internal_dt = 1.0e-2;    // Largest RK4 step inside an output interval
};

struct EquilibriumConfig {
    std::vector<double> guesses{220.0, 265.0, 290.0};
    double tolerance = 1.0e-6;          // |netFlux| target
    int max_iterations = 100;
    double merge_tolerance = 0.1;       // Roots closer than this are the same [K]
};

struct EnsembleConfig {
    double start_time = 0.0;
    double dt = 6.0 / 499.0;
    int num_steps = 500;
    int num_runs = 100;
    std::uint64_t seed = 0;
    bool has_seed = false;              // false: draw a seed from std::random_device
    int num_threads = 1;
    int burn_in_steps = 0;              // Leading steps excluded from temporal statistics
    bool discard_diverged = false;      // Drop non-finite runs instead of failing
};

struct OutputConfig {
    std::string prefix = "sebm_output";
    bool write_trajectory = true;
    bool write_ensemble = false;
    bool write_statistics = true;
};

/**
 * @brief Uniformly spaced time points, both ends included
 */
std::vector<double> linspace(double start, double end, int num);

} // namespace SEBM

#endif // SEBM_HPP
