#ifndef EQUILIBRIUM_SOLVER_HPP
#define EQUILIBRIUM_SOLVER_HPP

#include "SEBM.hpp"
#include "EnergyBalanceModel.hpp"
#include <petscsnes.h>
#include <string>
#include <vector>

namespace SEBM {

/**
 * @brief Steady state of the model in the fast-albedo limit
 */
struct EquilibriumPoint {
    double temperature = 0.0;   // T* [K]
    double albedo = 0.0;        // a_eq(T*)
    double residual = 0.0;      // |netFlux(T*)|
    int iterations = 0;
    bool stable = false;        // d(netFlux)/dT < 0
};

/**
 * @brief Local root finder for the net radiative flux
 *
 * Newton iteration on netFlux(T) through PETSc SNES (SNESNEWTONLS with the
 * analytic 1x1 Jacobian). Convergence is declared when |netFlux| drops below
 * the absolute tolerance; relative and step tolerances are disabled.
 *
 * The search is local: with the default parameters the net flux has three
 * roots (cold stable, unstable, warm stable) and the one returned depends on
 * the starting guess. Use findRoots() with several guesses to map all of
 * them.
 */
class EquilibriumSolver {
public:
    EquilibriumSolver();
    ~EquilibriumSolver();

    EquilibriumSolver(const EquilibriumSolver&) = delete;
    EquilibriumSolver& operator=(const EquilibriumSolver&) = delete;

    // Must be called before the first solve to take effect
    void setOptionsPrefix(const std::string& prefix) { options_prefix_ = prefix; }

    // Report every root and every skipped guess
    void setVerbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief Find T* with |netFlux(T*)| < tolerance starting from guess
     * @throws NoConvergence with the last iterate when the iteration limit is reached
     * @throws std::invalid_argument for tolerance <= 0 or max_iterations < 1
     */
    double findRoot(const PhysicalParameters& params, double guess,
                    double tolerance = 1.0e-6, int max_iterations = 100);

    EquilibriumPoint solve(const EnergyBalanceModel& model, double guess,
                           double tolerance = 1.0e-6, int max_iterations = 100);

    /**
     * @brief Run the local solver from every guess and merge duplicates
     *
     * Guesses that fail to converge are skipped. Roots within
     * merge_tolerance of an already found root are dropped.
     * @return Distinct equilibria sorted by temperature
     */
    std::vector<EquilibriumPoint> findRoots(const EnergyBalanceModel& model,
                                            const std::vector<double>& guesses,
                                            const EquilibriumConfig& config = EquilibriumConfig{});

private:
    std::string options_prefix_ = "eq_";
    bool verbose_ = false;

    SNES snes_ = nullptr;
    Vec x_ = nullptr;
    Vec r_ = nullptr;
    Mat J_ = nullptr;

    EnergyBalanceModel model_{};

    PetscErrorCode setupSNES();
    PetscErrorCode runNewton(double guess, double tolerance, int max_iterations,
                             double& root, PetscInt& iterations,
                             SNESConvergedReason& reason);

    static PetscErrorCode FormFunction(SNES snes, Vec X, Vec F, void* ctx);
    static PetscErrorCode FormJacobian(SNES snes, Vec X, Mat J, Mat P, void* ctx);
};

} // namespace SEBM

#endif // EQUILIBRIUM_SOLVER_HPP
