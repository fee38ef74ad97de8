#ifndef DETERMINISTIC_INTEGRATOR_HPP
#define DETERMINISTIC_INTEGRATOR_HPP

#include "SEBM.hpp"
#include "EnergyBalanceModel.hpp"
#include <petscts.h>
#include <string>
#include <vector>

namespace SEBM {

/**
 * @brief Deterministic integration of the coupled (T, a) system with PETSc TS
 *
 * Uses the classical 4th-order Runge-Kutta scheme (TSRK / TSRK4) with a
 * fixed internal step: every interval between two requested output times is
 * split into equal substeps no larger than the configured maximum, so the
 * solution lands exactly on the requested grid without interpolation.
 * Step-size adaptivity is switched off (TSADAPTNONE).
 *
 * The TS object lives on PETSC_COMM_SELF and is reused across calls. Its
 * options prefix ("det_" by default) allows the scheme to be overridden
 * from the command line, e.g. -det_ts_rk_type 5dp.
 */
class DeterministicIntegrator {
public:
    explicit DeterministicIntegrator(double max_internal_dt = 1.0e-2);
    ~DeterministicIntegrator();

    DeterministicIntegrator(const DeterministicIntegrator&) = delete;
    DeterministicIntegrator& operator=(const DeterministicIntegrator&) = delete;

    void setMaxInternalStep(double dt);
    double maxInternalStep() const { return max_internal_dt_; }

    // Must be called before the first integration to take effect
    void setOptionsPrefix(const std::string& prefix) { options_prefix_ = prefix; }

    /**
     * @brief Sample the trajectory at the requested times
     * @param params Physical parameters (noise intensities are ignored)
     * @param initial State at time_points.front()
     * @param time_points Strictly increasing, at least two entries
     * @return One state per time point; states.front() == initial
     * @throws NumericalDivergence if the state becomes non-finite
     * @throws std::invalid_argument on a malformed time grid
     */
    Trajectory integrate(const PhysicalParameters& params,
                         const ClimateState& initial,
                         const std::vector<double>& time_points);

    Trajectory integrate(const EnergyBalanceModel& model,
                         const ClimateState& initial,
                         const std::vector<double>& time_points);

    // Equally spaced samples from config.start_time to config.end_time, with
    // config.max_internal_dt bounding the substeps of this call only
    Trajectory integrate(const EnergyBalanceModel& model,
                         const ClimateState& initial,
                         const DeterministicConfig& config);

    // Total RK4 steps taken by the last integrate() call
    long lastStepCount() const { return last_step_count_; }

    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    double max_internal_dt_;
    std::string options_prefix_ = "det_";

    TS ts_ = nullptr;
    Vec solution_ = nullptr;
    Vec rhs_ = nullptr;

    EnergyBalanceModel model_{};
    bool non_finite_ = false;
    long last_step_count_ = 0;
    bool verbose_ = false;

    PetscErrorCode setupTS();
    PetscErrorCode setState(const ClimateState& state);
    PetscErrorCode getState(ClimateState& state) const;
    PetscErrorCode advance(double t_from, double t_to, double max_dt,
                           TSConvergedReason& reason);

    Trajectory integrateWith(const EnergyBalanceModel& model,
                             const ClimateState& initial,
                             const std::vector<double>& time_points,
                             double max_dt);

    static PetscErrorCode FormRHSFunction(TS ts, PetscReal t, Vec U, Vec F, void* ctx);
};

} // namespace SEBM

#endif // DETERMINISTIC_INTEGRATOR_HPP
