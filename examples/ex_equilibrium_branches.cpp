/*
 * Example: Equilibrium Branches of the Ice-Albedo Feedback
 *
 * Sweeps the solar constant and maps every steady state of the net flux.
 * Between the two saddle-node points the model has three equilibria (cold
 * stable, unstable, warm stable); outside it only one branch survives. The
 * table traces the S-shaped response curve behind ice-albedo hysteresis.
 *
 * Usage:
 *   ./ex_equilibrium_branches [-c config/default.config]
 *                             [-s0_min 1100] [-s0_max 1700] [-n 25]
 */

#include "SEBM.hpp"
#include "EnergyBalanceModel.hpp"
#include "EquilibriumSolver.hpp"
#include "ConfigReader.hpp"
#include <iostream>

static char help[] = "Example: equilibrium branches versus solar constant\n"
                     "Usage: ./ex_equilibrium_branches [-c <config_file>] "
                     "[-s0_min <W/m2>] [-s0_max <W/m2>] [-n <count>]\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    MPI_Comm comm = PETSC_COMM_WORLD;
    int rank;
    MPI_Comm_rank(comm, &rank);

    char config_file[PETSC_MAX_PATH_LEN] = "";
    PetscBool config_provided = PETSC_FALSE;
    PetscReal s0_min = 1100.0, s0_max = 1700.0;
    PetscInt n = 25;
    ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                 sizeof(config_file), &config_provided); CHKERRQ(ierr);
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-s0_min", &s0_min, nullptr); CHKERRQ(ierr);
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-s0_max", &s0_max, nullptr); CHKERRQ(ierr);
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-n", &n, nullptr); CHKERRQ(ierr);

    SEBM::PhysicalParameters base;
    SEBM::EquilibriumConfig eq_config;
    if (config_provided) {
        SEBM::ConfigReader reader;
        if (!reader.loadFile(config_file)) {
            ierr = PetscFinalize();
            return 1;
        }
        reader.parsePhysicalParameters(base);
        reader.parseEquilibriumConfig(eq_config);
    }

    // Dense guesses so every branch is bracketed
    const std::vector<double> guesses = SEBM::linspace(180.0, 340.0, 33);

    int status = 0;
    if (rank == 0) {
        PetscPrintf(comm, "================================================\n");
        PetscPrintf(comm, "  Equilibrium Branches vs Solar Constant\n");
        PetscPrintf(comm, "================================================\n\n");
        PetscPrintf(comm, "%10s  %6s  %12s  %12s  %12s\n",
                    "S0 [W/m2]", "roots", "cold [K]", "middle [K]", "warm [K]");

        try {
            SEBM::EquilibriumSolver solver;
            for (double s0 : SEBM::linspace(s0_min, s0_max, static_cast<int>(n))) {
                SEBM::PhysicalParameters params = base;
                params.solar_constant = s0;
                SEBM::EnergyBalanceModel model(params);

                std::vector<SEBM::EquilibriumPoint> roots =
                    solver.findRoots(model, guesses, eq_config);

                PetscPrintf(comm, "%10.1f  %6d", s0, static_cast<int>(roots.size()));
                if (roots.size() == 3) {
                    PetscPrintf(comm, "  %12.3f  %12.3f  %12.3f\n",
                                roots[0].temperature, roots[1].temperature, roots[2].temperature);
                } else if (roots.size() == 1) {
                    // Single surviving branch, reported by its side of Tc
                    if (roots[0].temperature < params.transition_temperature) {
                        PetscPrintf(comm, "  %12.3f  %12s  %12s\n", roots[0].temperature, "-", "-");
                    } else {
                        PetscPrintf(comm, "  %12s  %12s  %12.3f\n", "-", "-", roots[0].temperature);
                    }
                } else {
                    for (const auto& r : roots) PetscPrintf(comm, "  %12.3f", r.temperature);
                    PetscPrintf(comm, "\n");
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            status = 1;
        }
    }

    ierr = PetscFinalize();
    return status;
}
