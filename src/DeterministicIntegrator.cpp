/**
 * @file DeterministicIntegrator.cpp
 * @brief Fixed-step RK4 integration of the energy balance model via PETSc TS
 */

#include "DeterministicIntegrator.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace SEBM {

DeterministicIntegrator::DeterministicIntegrator(double max_internal_dt)
    : max_internal_dt_(max_internal_dt) {
    if (!(max_internal_dt_ > 0.0)) {
        throw std::invalid_argument("DeterministicIntegrator: max internal step must be positive");
    }
}

DeterministicIntegrator::~DeterministicIntegrator() {
    if (rhs_) VecDestroy(&rhs_);
    if (solution_) VecDestroy(&solution_);
    if (ts_) TSDestroy(&ts_);
}

void DeterministicIntegrator::setMaxInternalStep(double dt) {
    if (!(dt > 0.0)) {
        throw std::invalid_argument("DeterministicIntegrator: max internal step must be positive");
    }
    max_internal_dt_ = dt;
}

PetscErrorCode DeterministicIntegrator::setupTS() {
    PetscErrorCode ierr;

    PetscFunctionBeginUser;

    ierr = VecCreateSeq(PETSC_COMM_SELF, 2, &solution_); CHKERRQ(ierr);
    ierr = VecDuplicate(solution_, &rhs_); CHKERRQ(ierr);

    ierr = TSCreate(PETSC_COMM_SELF, &ts_); CHKERRQ(ierr);
    ierr = TSSetOptionsPrefix(ts_, options_prefix_.c_str()); CHKERRQ(ierr);
    ierr = TSSetProblemType(ts_, TS_NONLINEAR); CHKERRQ(ierr);
    ierr = TSSetRHSFunction(ts_, rhs_, FormRHSFunction, this); CHKERRQ(ierr);

    ierr = TSSetType(ts_, TSRK); CHKERRQ(ierr);
    ierr = TSRKSetType(ts_, TSRK4); CHKERRQ(ierr);  // Classical RK4

    TSAdapt adapt;
    ierr = TSGetAdapt(ts_, &adapt); CHKERRQ(ierr);
    ierr = TSAdaptSetType(adapt, TSADAPTNONE); CHKERRQ(ierr);

    ierr = TSSetExactFinalTime(ts_, TS_EXACTFINALTIME_MATCHSTEP); CHKERRQ(ierr);

    ierr = TSSetFromOptions(ts_); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode DeterministicIntegrator::setState(const ClimateState& state) {
    PetscErrorCode ierr;
    PetscScalar* x;

    PetscFunctionBeginUser;

    ierr = VecGetArray(solution_, &x); CHKERRQ(ierr);
    x[0] = state.temperature;
    x[1] = state.albedo;
    ierr = VecRestoreArray(solution_, &x); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode DeterministicIntegrator::getState(ClimateState& state) const {
    PetscErrorCode ierr;
    const PetscScalar* x;

    PetscFunctionBeginUser;

    ierr = VecGetArrayRead(solution_, &x); CHKERRQ(ierr);
    state.temperature = PetscRealPart(x[0]);
    state.albedo = PetscRealPart(x[1]);
    ierr = VecRestoreArrayRead(solution_, &x); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode DeterministicIntegrator::advance(double t_from, double t_to, double max_dt,
                                                TSConvergedReason& reason) {
    PetscErrorCode ierr;

    PetscFunctionBeginUser;

    const double span = t_to - t_from;
    const PetscInt substeps = std::max<PetscInt>(
        1, static_cast<PetscInt>(std::ceil(span / max_dt * (1.0 - 1.0e-12))));
    const double h = span / static_cast<double>(substeps);

    ierr = TSSetTime(ts_, t_from); CHKERRQ(ierr);
    ierr = TSSetTimeStep(ts_, h); CHKERRQ(ierr);
    ierr = TSSetMaxTime(ts_, t_to); CHKERRQ(ierr);
    ierr = TSSetStepNumber(ts_, 0); CHKERRQ(ierr);
    // One spare step absorbs a rounding remainder at the end of the interval
    ierr = TSSetMaxSteps(ts_, substeps + 1); CHKERRQ(ierr);

    ierr = TSSolve(ts_, solution_); CHKERRQ(ierr);

    PetscInt steps;
    ierr = TSGetStepNumber(ts_, &steps); CHKERRQ(ierr);
    last_step_count_ += static_cast<long>(steps);

    ierr = TSGetConvergedReason(ts_, &reason); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

Trajectory DeterministicIntegrator::integrate(const PhysicalParameters& params,
                                              const ClimateState& initial,
                                              const std::vector<double>& time_points) {
    return integrate(EnergyBalanceModel(params), initial, time_points);
}

Trajectory DeterministicIntegrator::integrate(const EnergyBalanceModel& model,
                                              const ClimateState& initial,
                                              const DeterministicConfig& config) {
    if (config.num_samples < 2) {
        throw std::invalid_argument("DeterministicIntegrator: at least two samples are required");
    }
    if (!(config.max_internal_dt > 0.0)) {
        throw std::invalid_argument("DeterministicIntegrator: max internal step must be positive");
    }
    return integrateWith(model, initial,
                         linspace(config.start_time, config.end_time, config.num_samples),
                         config.max_internal_dt);
}

Trajectory DeterministicIntegrator::integrate(const EnergyBalanceModel& model,
                                              const ClimateState& initial,
                                              const std::vector<double>& time_points) {
    return integrateWith(model, initial, time_points, max_internal_dt_);
}

Trajectory DeterministicIntegrator::integrateWith(const EnergyBalanceModel& model,
                                                  const ClimateState& initial,
                                                  const std::vector<double>& time_points,
                                                  double max_dt) {
    if (time_points.size() < 2) {
        throw std::invalid_argument("DeterministicIntegrator: at least two time points are required");
    }
    for (std::size_t i = 1; i < time_points.size(); ++i) {
        if (!(time_points[i] > time_points[i - 1])) {
            std::ostringstream msg;
            msg << "DeterministicIntegrator: time points must be strictly increasing (index "
                << i << ")";
            throw std::invalid_argument(msg.str());
        }
    }
    if (!initial.isFinite()) {
        throw NumericalDivergence("DeterministicIntegrator: initial state is not finite",
                                  -1, 0, time_points.front());
    }

    PetscErrorCode ierr;

    model_ = model;
    non_finite_ = false;
    last_step_count_ = 0;

    if (!ts_) {
        ierr = setupTS();
        if (ierr) throw std::runtime_error("DeterministicIntegrator: PETSc TS setup failed");
    }

    ierr = setState(initial);
    if (ierr) throw std::runtime_error("DeterministicIntegrator: cannot set initial state");

    Trajectory traj;
    traj.times = time_points;
    traj.states.reserve(time_points.size());
    traj.states.push_back(initial);

    for (std::size_t i = 1; i < time_points.size(); ++i) {
        TSConvergedReason reason = TS_CONVERGED_ITERATING;
        ierr = advance(time_points[i - 1], time_points[i], max_dt, reason);

        ClimateState state;
        PetscErrorCode read_ierr = getState(state);

        if (non_finite_ || (!read_ierr && !state.isFinite())) {
            std::ostringstream msg;
            msg << "DeterministicIntegrator: state became non-finite between t="
                << time_points[i - 1] << " and t=" << time_points[i];
            throw NumericalDivergence(msg.str(), -1, static_cast<long>(i), time_points[i]);
        }
        if (ierr || read_ierr) {
            throw std::runtime_error("DeterministicIntegrator: PETSc TSSolve failed");
        }
        if (reason < 0) {
            std::ostringstream msg;
            msg << "DeterministicIntegrator: TS diverged (" << TSConvergedReasons[reason] << ")";
            throw std::runtime_error(msg.str());
        }

        traj.states.push_back(state);
    }

    if (verbose_) {
        ierr = PetscPrintf(PETSC_COMM_SELF, "DeterministicIntegrator: %d samples to t=%g, %ld RK steps\n",
                           static_cast<int>(time_points.size()),
                           static_cast<double>(time_points.back()), last_step_count_);
        if (ierr) throw std::runtime_error("DeterministicIntegrator: PetscPrintf failed");
    }

    return traj;
}

PetscErrorCode DeterministicIntegrator::FormRHSFunction(TS ts, PetscReal t, Vec U, Vec F, void* ctx) {
    (void)ts;  // Part of PETSc callback interface - accessed via ctx
    (void)t;   // Autonomous system

    PetscFunctionBeginUser;
    DeterministicIntegrator* self = static_cast<DeterministicIntegrator*>(ctx);
    PetscErrorCode ierr;

    const PetscScalar* u;
    PetscScalar* f;
    ierr = VecGetArrayRead(U, &u); CHKERRQ(ierr);
    ierr = VecGetArray(F, &f); CHKERRQ(ierr);

    const ClimateState state(PetscRealPart(u[0]), PetscRealPart(u[1]));
    const ClimateState rate = self->model_.tendency(state);
    f[0] = rate.temperature;
    f[1] = rate.albedo;

    if (!state.isFinite() || !rate.isFinite()) {
        self->non_finite_ = true;
    }

    ierr = VecRestoreArray(F, &f); CHKERRQ(ierr);
    ierr = VecRestoreArrayRead(U, &u); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

} // namespace SEBM
