/*
 * Example: Noise Scaling of the Euler-Maruyama Ensemble
 *
 * Runs the same stochastic ensemble at successively halved time steps over a
 * fixed horizon. Because every Brownian increment has variance dt, the
 * spread of the final temperature does not depend on the step size. The
 * last column shows what an unscaled N(0,1) increment would give instead.
 *
 * Usage:
 *   ./ex_noise_scaling [-runs 2000] [-horizon 2.0] [-eta_T 1.0] [-seed 42]
 *                      [-threads 4]
 */

#include "SEBM.hpp"
#include "EnergyBalanceModel.hpp"
#include "EquilibriumSolver.hpp"
#include "StochasticEnsemble.hpp"
#include "EnsembleStatistics.hpp"
#include <cmath>
#include <iostream>

static char help[] = "Example: step-size invariance of the ensemble variance\n"
                     "Usage: ./ex_noise_scaling [-runs <N>] [-horizon <t>] [-eta_T <K>] "
                     "[-seed <n>] [-threads <n>]\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    MPI_Comm comm = PETSC_COMM_WORLD;
    int rank;
    MPI_Comm_rank(comm, &rank);

    PetscInt num_runs = 2000;
    PetscInt seed = 42;
    PetscInt threads = 1;
    PetscReal horizon = 2.0;
    PetscReal eta_T = 1.0;
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-runs", &num_runs, nullptr); CHKERRQ(ierr);
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-seed", &seed, nullptr); CHKERRQ(ierr);
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-threads", &threads, nullptr); CHKERRQ(ierr);
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-horizon", &horizon, nullptr); CHKERRQ(ierr);
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-eta_T", &eta_T, nullptr); CHKERRQ(ierr);

    int status = 0;
    if (rank == 0) {
        try {
            SEBM::PhysicalParameters params;
            params.noise_temperature = eta_T;
            params.noise_albedo = 0.0;
            SEBM::EnergyBalanceModel model(params);

            // Start on the warm equilibrium so only the noise moves the state
            SEBM::EquilibriumSolver solver;
            SEBM::EquilibriumPoint warm = solver.solve(model, 290.0);
            const SEBM::ClimateState initial(warm.temperature, warm.albedo);

            // Ornstein-Uhlenbeck limit around T*: Var = eta^2 (1 - e^{-2 k t}) / (2 k).
            // Albedo relaxes on a 1/delta timescale, so over the horizon only the
            // longwave term restores T.
            const double k = 4.0 * params.reference_temperature *
                             model.outgoingFlux(warm.temperature) / warm.temperature;
            const double var_exact = eta_T * eta_T * (1.0 - std::exp(-2.0 * k * horizon)) / (2.0 * k);

            PetscPrintf(comm, "================================================\n");
            PetscPrintf(comm, "  Euler-Maruyama Noise Scaling\n");
            PetscPrintf(comm, "================================================\n\n");
            PetscPrintf(comm, "Start at T* = %.4f K, horizon %g, eta_T = %g, %d runs\n",
                        warm.temperature, horizon, eta_T, static_cast<int>(num_runs));
            PetscPrintf(comm, "Linearized variance: %.5f K^2\n\n", var_exact);
            PetscPrintf(comm, "%10s  %8s  %14s  %14s\n",
                        "dt", "steps", "Var(T_final)", "unscaled");

            SEBM::StochasticEnsembleSimulator sim(static_cast<int>(threads));
            double dt = 0.04;
            for (int level = 0; level < 4; ++level, dt *= 0.5) {
                const int steps = static_cast<int>(std::lround(horizon / dt)) + 1;
                SEBM::Ensemble ens = sim.run(params, initial, dt, steps,
                                             static_cast<int>(num_runs),
                                             static_cast<std::uint64_t>(seed));
                const double sd = SEBM::EnsembleStatistics::sampleStdDev(ens.finalTemperatures());
                // Increments of N(0,1) instead of N(0,dt) inflate the variance by 1/dt
                PetscPrintf(comm, "%10.5f  %8d  %14.5f  %14.5f\n",
                            dt, steps, sd * sd, sd * sd / dt);
            }
            PetscPrintf(comm, "\n");
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            status = 1;
        }
    }

    ierr = PetscFinalize();
    return status;
}
