/**
 * @file StochasticEnsemble.cpp
 * @brief Euler-Maruyama ensemble integration
 */

#include "StochasticEnsemble.hpp"
#include "ThreadPool.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace SEBM {

// =============================================================================
// NoiseStream
// =============================================================================

NoiseStream::NoiseStream(std::uint64_t seed, std::uint64_t member) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffu),
                      static_cast<std::uint32_t>(seed >> 32),
                      static_cast<std::uint32_t>(member & 0xffffffffu),
                      static_cast<std::uint32_t>(member >> 32)};
    generator_.seed(seq);
}

// =============================================================================
// Ensemble
// =============================================================================

Ensemble::Ensemble(std::vector<double> times, std::size_t num_runs,
                   const ClimateState& initial, const PhysicalParameters& params,
                   std::uint64_t seed)
    : times_(std::move(times)), num_runs_(num_runs), initial_(initial),
      params_(params), seed_(seed),
      temperature_(num_runs * times_.size(), 0.0),
      albedo_(num_runs * times_.size(), 0.0) {}

std::size_t Ensemble::index(std::size_t run, std::size_t step) const {
    if (run >= num_runs_ || step >= times_.size()) {
        std::ostringstream msg;
        msg << "Ensemble: index (run " << run << ", step " << step
            << ") outside " << num_runs_ << " x " << times_.size();
        throw std::out_of_range(msg.str());
    }
    return run * times_.size() + step;
}

ClimateState Ensemble::state(std::size_t run, std::size_t step) const {
    const std::size_t k = index(run, step);
    return ClimateState(temperature_[k], albedo_[k]);
}

void Ensemble::setState(std::size_t run, std::size_t step, const ClimateState& s) {
    const std::size_t k = index(run, step);
    temperature_[k] = s.temperature;
    albedo_[k] = s.albedo;
}

Trajectory Ensemble::trajectory(std::size_t run) const {
    Trajectory traj;
    traj.times = times_;
    traj.states.reserve(times_.size());
    const double* T = temperatureRun(run);
    const double* a = albedoRun(run);
    for (std::size_t i = 0; i < times_.size(); ++i) {
        traj.states.emplace_back(T[i], a[i]);
    }
    return traj;
}

std::vector<double> Ensemble::finalTemperatures() const {
    std::vector<double> finals;
    if (times_.empty()) return finals;
    finals.reserve(num_runs_);
    for (std::size_t r = 0; r < num_runs_; ++r) {
        finals.push_back(temperature(r, times_.size() - 1));
    }
    return finals;
}

bool Ensemble::failed(std::size_t run) const {
    for (const auto& f : failures_) {
        if (f.run == run) return true;
    }
    return false;
}

void Ensemble::recordFailure(const RunFailure& failure) {
    if (failure.run >= num_runs_) {
        throw std::out_of_range("Ensemble: failure recorded for a run outside the ensemble");
    }
    auto it = std::lower_bound(failures_.begin(), failures_.end(), failure,
                               [](const RunFailure& a, const RunFailure& b) {
                                   return a.run < b.run;
                               });
    if (it != failures_.end() && it->run == failure.run) {
        *it = failure;
    } else {
        failures_.insert(it, failure);
    }
}

std::vector<std::size_t> Ensemble::completedRuns() const {
    std::vector<std::size_t> runs;
    runs.reserve(num_runs_);
    std::size_t next_failure = 0;
    for (std::size_t r = 0; r < num_runs_; ++r) {
        if (next_failure < failures_.size() && failures_[next_failure].run == r) {
            ++next_failure;
            continue;
        }
        runs.push_back(r);
    }
    return runs;
}

Ensemble Ensemble::subset(const std::vector<std::size_t>& runs) const {
    Ensemble result(times_, runs.size(), initial_, params_, seed_);
    const std::size_t n = times_.size();
    for (std::size_t k = 0; k < runs.size(); ++k) {
        const std::size_t src = index(runs[k], 0);
        std::copy(temperature_.begin() + src, temperature_.begin() + src + n,
                  result.temperature_.begin() + k * n);
        std::copy(albedo_.begin() + src, albedo_.begin() + src + n,
                  result.albedo_.begin() + k * n);
        for (const auto& f : failures_) {
            if (f.run == runs[k]) {
                RunFailure moved = f;
                moved.run = k;
                result.recordFailure(moved);
            }
        }
    }
    return result;
}

namespace {

bool sameValues(const std::vector<double>& a, const std::vector<double>& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](double x, double y) {
                          return x == y || (std::isnan(x) && std::isnan(y));
                      });
}

} // namespace

bool Ensemble::operator==(const Ensemble& other) const {
    return times_ == other.times_ && num_runs_ == other.num_runs_ &&
           initial_ == other.initial_ && params_ == other.params_ &&
           seed_ == other.seed_ && failures_ == other.failures_ &&
           sameValues(temperature_, other.temperature_) &&
           sameValues(albedo_, other.albedo_);
}

// =============================================================================
// EnsembleDivergence
// =============================================================================

EnsembleDivergence::EnsembleDivergence(const std::string& what, Ensemble partial)
    : NumericalDivergence(what, static_cast<int>(partial.failures().front().run),
                          partial.failures().front().step,
                          partial.failures().front().time),
      ensemble_(std::make_shared<const Ensemble>(std::move(partial))) {}

// =============================================================================
// StochasticEnsembleSimulator
// =============================================================================

StochasticEnsembleSimulator::StochasticEnsembleSimulator(int num_threads)
    : num_threads_(1) {
    setNumThreads(num_threads);
}

void StochasticEnsembleSimulator::setNumThreads(int num_threads) {
    if (num_threads < 1) {
        throw std::invalid_argument("StochasticEnsembleSimulator: need at least one thread");
    }
    num_threads_ = num_threads;
}

void StochasticEnsembleSimulator::simulateRun(const EnergyBalanceModel& model,
                                              const ClimateState& initial,
                                              double dt, double t0, std::size_t num_steps,
                                              NoiseStream& noise, int run_index,
                                              double* temperature, double* albedo) {
    const PhysicalParameters& p = model.parameters();

    ClimateState x = initial;
    temperature[0] = x.temperature;
    albedo[0] = x.albedo;

    for (std::size_t i = 1; i < num_steps; ++i) {
        const ClimateState drift = model.tendency(x);
        // Both increments are drawn every step so the stream layout does not
        // depend on which intensities are zero
        const double dW_T = noise.increment(dt);
        const double dW_a = noise.increment(dt);

        x.temperature += drift.temperature * dt + p.noise_temperature * dW_T;
        x.albedo += drift.albedo * dt + p.noise_albedo * dW_a;

        if (!x.isFinite()) {
            const double t = t0 + static_cast<double>(i) * dt;
            std::ostringstream msg;
            msg << "StochasticEnsembleSimulator: run " << run_index
                << " became non-finite at step " << i << " (t=" << t << ")";
            throw NumericalDivergence(msg.str(), run_index, static_cast<long>(i), t);
        }

        temperature[i] = x.temperature;
        albedo[i] = x.albedo;
    }
}

Ensemble StochasticEnsembleSimulator::run(const PhysicalParameters& params,
                                          const ClimateState& initial,
                                          double dt, int num_steps, int num_runs,
                                          std::uint64_t seed, double t0) const {
    return simulate(params, initial, dt, num_steps, num_runs, seed, t0, num_threads_);
}

Ensemble StochasticEnsembleSimulator::run(const PhysicalParameters& params,
                                          const ClimateState& initial,
                                          double dt, int num_steps, int num_runs) const {
    std::random_device rd;
    const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    return simulate(params, initial, dt, num_steps, num_runs, seed, 0.0, num_threads_);
}

Ensemble StochasticEnsembleSimulator::run(const EnergyBalanceModel& model,
                                          const ClimateState& initial,
                                          const EnsembleConfig& config) const {
    if (config.num_threads < 1) {
        throw std::invalid_argument("StochasticEnsembleSimulator: need at least one thread");
    }
    std::uint64_t seed = config.seed;
    if (!config.has_seed) {
        std::random_device rd;
        seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }
    return simulate(model.parameters(), initial, config.dt, config.num_steps,
                    config.num_runs, seed, config.start_time, config.num_threads);
}

Ensemble StochasticEnsembleSimulator::simulate(const PhysicalParameters& params,
                                               const ClimateState& initial,
                                               double dt, int num_steps, int num_runs,
                                               std::uint64_t seed, double t0,
                                               int num_threads) const {
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw std::invalid_argument("StochasticEnsembleSimulator: dt must be positive and finite");
    }
    if (num_steps < 1) {
        throw std::invalid_argument("StochasticEnsembleSimulator: num_steps must be at least 1");
    }
    if (num_runs < 1) {
        throw std::invalid_argument("StochasticEnsembleSimulator: num_runs must be at least 1");
    }
    if (!initial.isFinite()) {
        throw NumericalDivergence("StochasticEnsembleSimulator: initial state is not finite",
                                  0, 0, t0);
    }

    if (verbose_) {
        PetscErrorCode ierr = PetscPrintf(PETSC_COMM_SELF,
                                          "StochasticEnsembleSimulator: %d runs x %d steps, seed %llu, %d threads\n",
                                          num_runs, num_steps,
                                          static_cast<unsigned long long>(seed), num_threads);
        if (ierr) throw std::runtime_error("StochasticEnsembleSimulator: PetscPrintf failed");
    }

    std::vector<double> times(static_cast<std::size_t>(num_steps));
    for (int i = 0; i < num_steps; ++i) {
        times[static_cast<std::size_t>(i)] = t0 + static_cast<double>(i) * dt;
    }

    const std::size_t runs = static_cast<std::size_t>(num_runs);
    const std::size_t steps = static_cast<std::size_t>(num_steps);
    Ensemble ensemble(std::move(times), runs, initial, params, seed);
    const EnergyBalanceModel model(params);

    // One slot per run, written only by the worker that owns the run
    std::vector<RunFailure> failure_slots(runs);
    std::vector<char> diverged(runs, 0);

    auto body = [&](std::size_t begin, std::size_t end) {
        for (std::size_t r = begin; r < end; ++r) {
            NoiseStream noise(seed, r);
            double* T = ensemble.temperatureRun(r);
            double* a = ensemble.albedoRun(r);
            try {
                simulateRun(model, initial, dt, t0, steps, noise, static_cast<int>(r), T, a);
            } catch (const NumericalDivergence& e) {
                const std::size_t first = static_cast<std::size_t>(e.step());
                std::fill(T + first, T + steps, std::numeric_limits<double>::quiet_NaN());
                std::fill(a + first, a + steps, std::numeric_limits<double>::quiet_NaN());
                failure_slots[r] = RunFailure{r, e.step(), e.time()};
                diverged[r] = 1;
            }
        }
    };

    const std::size_t workers = std::min<std::size_t>(static_cast<std::size_t>(num_threads), runs);
    if (workers <= 1) {
        body(0, runs);
    } else {
        ThreadPool pool(workers);
        pool.parallelFor(0, runs, body);
    }

    for (std::size_t r = 0; r < runs; ++r) {
        if (diverged[r]) ensemble.recordFailure(failure_slots[r]);
    }

    if (ensemble.hasFailures()) {
        const RunFailure& first = ensemble.failures().front();
        std::ostringstream msg;
        msg << "StochasticEnsembleSimulator: " << ensemble.failures().size() << " of "
            << runs << " runs became non-finite; first is run " << first.run
            << " at step " << first.step << " (t=" << first.time << ")";
        throw EnsembleDivergence(msg.str(), std::move(ensemble));
    }

    return ensemble;
}

} // namespace SEBM
