#ifndef STOCHASTIC_ENSEMBLE_HPP
#define STOCHASTIC_ENSEMBLE_HPP

#include "SEBM.hpp"
#include "EnergyBalanceModel.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace SEBM {

/**
 * @brief Gaussian noise source owned by a single realization
 *
 * Each ensemble member gets its own generator seeded from (seed, member),
 * so streams never overlap and results do not depend on which thread runs
 * which member.
 */
class NoiseStream {
public:
    NoiseStream(std::uint64_t seed, std::uint64_t member);

    // Standard normal draw
    double standardNormal() { return normal_(generator_); }

    // Brownian increment dW ~ N(0, dt)
    double increment(double dt) { return std::sqrt(dt) * normal_(generator_); }

private:
    std::mt19937_64 generator_;
    std::normal_distribution<double> normal_{0.0, 1.0};
};

/**
 * @brief Where a realization stopped because its state became non-finite
 */
struct RunFailure {
    std::size_t run = 0;
    long step = 0;          // First step with a non-finite state
    double time = 0.0;
};

inline bool operator==(const RunFailure& lhs, const RunFailure& rhs) {
    return lhs.run == rhs.run && lhs.step == rhs.step && lhs.time == rhs.time;
}

/**
 * @brief Independent realizations sharing a time grid and initial state
 *
 * Storage is two contiguous runs x steps buffers (temperature and albedo),
 * row-major by run, so every run occupies its own slice.
 *
 * A failed run keeps the states it reached; entries from its failing step
 * on are NaN.
 */
class Ensemble {
public:
    Ensemble() = default;
    Ensemble(std::vector<double> times, std::size_t num_runs,
             const ClimateState& initial = ClimateState(),
             const PhysicalParameters& params = PhysicalParameters(),
             std::uint64_t seed = 0);

    std::size_t numRuns() const { return num_runs_; }
    std::size_t numSteps() const { return times_.size(); }
    const std::vector<double>& times() const { return times_; }

    const ClimateState& initialState() const { return initial_; }
    const PhysicalParameters& parameters() const { return params_; }
    std::uint64_t seed() const { return seed_; }

    ClimateState state(std::size_t run, std::size_t step) const;
    void setState(std::size_t run, std::size_t step, const ClimateState& s);

    double temperature(std::size_t run, std::size_t step) const {
        return temperature_[index(run, step)];
    }
    double albedo(std::size_t run, std::size_t step) const {
        return albedo_[index(run, step)];
    }

    // Pointers to the first step of a run; numSteps() values follow
    const double* temperatureRun(std::size_t run) const { return &temperature_[index(run, 0)]; }
    const double* albedoRun(std::size_t run) const { return &albedo_[index(run, 0)]; }
    double* temperatureRun(std::size_t run) { return &temperature_[index(run, 0)]; }
    double* albedoRun(std::size_t run) { return &albedo_[index(run, 0)]; }

    Trajectory trajectory(std::size_t run) const;

    // Temperature of every run at the last step
    std::vector<double> finalTemperatures() const;

    // Failures sorted by run index
    const std::vector<RunFailure>& failures() const { return failures_; }
    bool hasFailures() const { return !failures_.empty(); }
    bool failed(std::size_t run) const;
    void recordFailure(const RunFailure& failure);

    // Indices of the runs that reached the last step
    std::vector<std::size_t> completedRuns() const;

    /**
     * @brief Copy of the selected runs, renumbered 0..runs.size()-1
     * @throws std::out_of_range for an invalid run index
     */
    Ensemble subset(const std::vector<std::size_t>& runs) const;

    // Same grid, parameters, seed, failures and buffers (NaN matches NaN)
    bool operator==(const Ensemble& other) const;

private:
    std::vector<double> times_;
    std::size_t num_runs_ = 0;
    ClimateState initial_{};
    PhysicalParameters params_{};
    std::uint64_t seed_ = 0;

    std::vector<double> temperature_;
    std::vector<double> albedo_;
    std::vector<RunFailure> failures_;

    std::size_t index(std::size_t run, std::size_t step) const;
};

/**
 * @brief One or more realizations of an ensemble became non-finite
 *
 * run(), step() and time() describe the lowest failing run. The full
 * ensemble, with every completed run intact and every failure recorded, is
 * available through ensemble(), so the caller can discard the failed runs,
 * rerun them with other noise, or abort.
 */
class EnsembleDivergence : public NumericalDivergence {
public:
    // partial must hold at least one failure
    EnsembleDivergence(const std::string& what, Ensemble partial);

    const Ensemble& ensemble() const { return *ensemble_; }
    const std::vector<RunFailure>& failures() const { return ensemble_->failures(); }

private:
    std::shared_ptr<const Ensemble> ensemble_;
};

/**
 * @brief Euler-Maruyama ensemble of the stochastic energy balance model
 *
 *   T[i] = T[i-1] + T0 * dT(T[i-1], a[i-1]) dt + η_T dW_T
 *   a[i] = a[i-1] +      da(T[i-1], a[i-1]) dt + η_a dW_a
 *
 * with dW ~ N(0, dt), independent per component, step and run. The
 * sqrt(dt) scaling keeps the diffusion variance per unit time independent
 * of the step size. With η_T = η_a = 0 this is exactly forward Euler.
 *
 * Runs are distributed over a worker pool; steps within a run are strictly
 * sequential. States are never clamped. A run that becomes non-finite stops
 * on its own without affecting the others; once all runs are done the
 * failures are reported together as an EnsembleDivergence.
 */
class StochasticEnsembleSimulator {
public:
    explicit StochasticEnsembleSimulator(int num_threads = 1);

    void setNumThreads(int num_threads);
    int numThreads() const { return num_threads_; }

    // One line per run() call: size, seed and thread count
    void setVerbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief Simulate num_runs realizations on t0 + i*dt, i = 0..num_steps-1
     * @param seed Base seed; the same seed reproduces the ensemble bit for bit
     * @throws EnsembleDivergence if any run went non-finite, carrying the
     *         partial ensemble
     * @throws NumericalDivergence if the initial state is not finite
     * @throws std::invalid_argument for dt <= 0, num_steps < 1 or num_runs < 1
     */
    Ensemble run(const PhysicalParameters& params, const ClimateState& initial,
                 double dt, int num_steps, int num_runs, std::uint64_t seed,
                 double t0 = 0.0) const;

    // Seed drawn from std::random_device; recorded in Ensemble::seed()
    Ensemble run(const PhysicalParameters& params, const ClimateState& initial,
                 double dt, int num_steps, int num_runs) const;

    // Uses config.num_threads instead of numThreads(); draws a seed unless
    // config.has_seed
    Ensemble run(const EnergyBalanceModel& model, const ClimateState& initial,
                 const EnsembleConfig& config) const;

    /**
     * @brief Advance one realization in place
     *
     * Fills temperature[0..n) and albedo[0..n) starting from initial.
     */
    static void simulateRun(const EnergyBalanceModel& model, const ClimateState& initial,
                            double dt, double t0, std::size_t num_steps,
                            NoiseStream& noise, int run_index,
                            double* temperature, double* albedo);

private:
    int num_threads_;
    bool verbose_ = false;

    Ensemble simulate(const PhysicalParameters& params, const ClimateState& initial,
                      double dt, int num_steps, int num_runs, std::uint64_t seed,
                      double t0, int num_threads) const;
};

} // namespace SEBM

#endif // STOCHASTIC_ENSEMBLE_HPP
