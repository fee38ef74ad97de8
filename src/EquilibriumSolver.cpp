/**
 * @file EquilibriumSolver.cpp
 * @brief Newton root finding on the net flux via PETSc SNES
 */

#include "EquilibriumSolver.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace SEBM {

EquilibriumSolver::EquilibriumSolver() {}

EquilibriumSolver::~EquilibriumSolver() {
    if (J_) MatDestroy(&J_);
    if (r_) VecDestroy(&r_);
    if (x_) VecDestroy(&x_);
    if (snes_) SNESDestroy(&snes_);
}

PetscErrorCode EquilibriumSolver::setupSNES() {
    PetscErrorCode ierr;

    PetscFunctionBeginUser;

    ierr = VecCreateSeq(PETSC_COMM_SELF, 1, &x_); CHKERRQ(ierr);
    ierr = VecDuplicate(x_, &r_); CHKERRQ(ierr);
    ierr = MatCreateSeqDense(PETSC_COMM_SELF, 1, 1, nullptr, &J_); CHKERRQ(ierr);

    ierr = SNESCreate(PETSC_COMM_SELF, &snes_); CHKERRQ(ierr);
    ierr = SNESSetOptionsPrefix(snes_, options_prefix_.c_str()); CHKERRQ(ierr);
    ierr = SNESSetFunction(snes_, r_, FormFunction, this); CHKERRQ(ierr);
    ierr = SNESSetJacobian(snes_, J_, J_, FormJacobian, this); CHKERRQ(ierr);
    ierr = SNESSetType(snes_, SNESNEWTONLS); CHKERRQ(ierr);

    // Scalar problem: direct solve of the 1x1 Newton system
    KSP ksp;
    PC pc;
    ierr = SNESGetKSP(snes_, &ksp); CHKERRQ(ierr);
    ierr = KSPSetType(ksp, KSPPREONLY); CHKERRQ(ierr);
    ierr = KSPGetPC(ksp, &pc); CHKERRQ(ierr);
    ierr = PCSetType(pc, PCLU); CHKERRQ(ierr);

    ierr = SNESSetFromOptions(snes_); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode EquilibriumSolver::runNewton(double guess, double tolerance, int max_iterations,
                                            double& root, PetscInt& iterations,
                                            SNESConvergedReason& reason) {
    PetscErrorCode ierr;

    PetscFunctionBeginUser;

    // Absolute residual test only
    ierr = SNESSetTolerances(snes_, tolerance, 0.0, 0.0, max_iterations, PETSC_DEFAULT); CHKERRQ(ierr);
    ierr = VecSet(x_, guess); CHKERRQ(ierr);

    ierr = SNESSolve(snes_, nullptr, x_); CHKERRQ(ierr);

    ierr = SNESGetIterationNumber(snes_, &iterations); CHKERRQ(ierr);
    ierr = SNESGetConvergedReason(snes_, &reason); CHKERRQ(ierr);

    const PetscScalar* x;
    ierr = VecGetArrayRead(x_, &x); CHKERRQ(ierr);
    root = PetscRealPart(x[0]);
    ierr = VecRestoreArrayRead(x_, &x); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

double EquilibriumSolver::findRoot(const PhysicalParameters& params, double guess,
                                   double tolerance, int max_iterations) {
    return solve(EnergyBalanceModel(params), guess, tolerance, max_iterations).temperature;
}

EquilibriumPoint EquilibriumSolver::solve(const EnergyBalanceModel& model, double guess,
                                          double tolerance, int max_iterations) {
    if (!(tolerance > 0.0)) {
        throw std::invalid_argument("EquilibriumSolver: tolerance must be positive");
    }
    if (max_iterations < 1) {
        throw std::invalid_argument("EquilibriumSolver: iteration cap must be at least 1");
    }

    PetscErrorCode ierr;

    model_ = model;

    if (!snes_) {
        ierr = setupSNES();
        if (ierr) throw std::runtime_error("EquilibriumSolver: PETSc SNES setup failed");
    }

    double root = guess;
    PetscInt iterations = 0;
    SNESConvergedReason reason = SNES_CONVERGED_ITERATING;
    ierr = runNewton(guess, tolerance, max_iterations, root, iterations, reason);
    if (ierr) throw std::runtime_error("EquilibriumSolver: PETSc SNESSolve failed");

    const double residual = std::abs(model_.netFlux(root));

    if (reason <= 0 || !std::isfinite(root) || !(residual < tolerance)) {
        std::ostringstream msg;
        msg << "EquilibriumSolver: no convergence from guess " << guess
            << " after " << iterations << " iterations (" << SNESConvergedReasons[reason]
            << "), last estimate " << root << ", |netFlux| = " << residual;
        throw NoConvergence(msg.str(), root, residual, static_cast<int>(iterations));
    }

    EquilibriumPoint point;
    point.temperature = root;
    point.albedo = model_.albedoEquilibrium(root);
    point.residual = residual;
    point.iterations = static_cast<int>(iterations);
    point.stable = model_.netFluxDerivative(root) < 0.0;

    if (verbose_) {
        ierr = PetscPrintf(PETSC_COMM_SELF, "EquilibriumSolver: T*=%g from guess %g in %d iterations (%s)\n",
                           root, guess, static_cast<int>(iterations),
                           point.stable ? "stable" : "unstable");
        if (ierr) throw std::runtime_error("EquilibriumSolver: PetscPrintf failed");
    }

    return point;
}

std::vector<EquilibriumPoint> EquilibriumSolver::findRoots(const EnergyBalanceModel& model,
                                                           const std::vector<double>& guesses,
                                                           const EquilibriumConfig& config) {
    std::vector<EquilibriumPoint> roots;

    for (double guess : guesses) {
        EquilibriumPoint point;
        try {
            point = solve(model, guess, config.tolerance, config.max_iterations);
        } catch (const NoConvergence& e) {
            if (verbose_) {
                PetscErrorCode ierr = PetscPrintf(PETSC_COMM_SELF, "Warning: skipping guess %g: %s\n",
                                                  guess, e.what());
                if (ierr) throw std::runtime_error("EquilibriumSolver: PetscPrintf failed");
            }
            continue;
        }

        bool duplicate = false;
        for (const auto& existing : roots) {
            if (std::abs(existing.temperature - point.temperature) < config.merge_tolerance) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            roots.push_back(point);
        }
    }

    std::sort(roots.begin(), roots.end(),
              [](const EquilibriumPoint& a, const EquilibriumPoint& b) {
                  return a.temperature < b.temperature;
              });
    return roots;
}

PetscErrorCode EquilibriumSolver::FormFunction(SNES snes, Vec X, Vec F, void* ctx) {
    (void)snes;  // Part of PETSc callback interface - accessed via ctx

    PetscFunctionBeginUser;
    EquilibriumSolver* solver = static_cast<EquilibriumSolver*>(ctx);
    PetscErrorCode ierr;

    const PetscScalar* x;
    PetscScalar* f;
    ierr = VecGetArrayRead(X, &x); CHKERRQ(ierr);
    ierr = VecGetArray(F, &f); CHKERRQ(ierr);

    f[0] = solver->model_.netFlux(PetscRealPart(x[0]));

    ierr = VecRestoreArray(F, &f); CHKERRQ(ierr);
    ierr = VecRestoreArrayRead(X, &x); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode EquilibriumSolver::FormJacobian(SNES snes, Vec X, Mat J, Mat P, void* ctx) {
    (void)snes;  // Part of PETSc callback interface - accessed via ctx

    PetscFunctionBeginUser;
    EquilibriumSolver* solver = static_cast<EquilibriumSolver*>(ctx);
    PetscErrorCode ierr;

    const PetscScalar* x;
    ierr = VecGetArrayRead(X, &x); CHKERRQ(ierr);
    const PetscScalar slope = solver->model_.netFluxDerivative(PetscRealPart(x[0]));
    ierr = VecRestoreArrayRead(X, &x); CHKERRQ(ierr);

    ierr = MatSetValue(P, 0, 0, slope, INSERT_VALUES); CHKERRQ(ierr);
    ierr = MatAssemblyBegin(P, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);
    ierr = MatAssemblyEnd(P, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);
    if (J != P) {
        ierr = MatAssemblyBegin(J, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);
        ierr = MatAssemblyEnd(J, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);
    }

    PetscFunctionReturn(0);
}

} // namespace SEBM
