#include "SEBM.hpp"
#include "EnergyBalanceModel.hpp"
#include "DeterministicIntegrator.hpp"
#include "EquilibriumSolver.hpp"
#include "StochasticEnsemble.hpp"
#include "EnsembleStatistics.hpp"
#include "ConfigReader.hpp"
#include "OutputWriter.hpp"
#include <petsc.h>
#include <algorithm>
#include <iostream>
#include <string>

static char help[] = "SEBM - Stochastic Energy Balance Model\n"
                    "Usage: sebm [options]\n\n"
                    "Options:\n"
                    "  -c <file>               Configuration file (.config)\n"
                    "  -o <prefix>             Output file prefix (overrides [output] prefix)\n"
                    "  -mode <name>            all, deterministic, equilibrium, ensemble\n"
                    "  -generate_config <file> Write a template configuration and exit\n"
                    "  -det_ts_rk_type <type>  Runge-Kutta scheme of the deterministic run\n"
                    "  -eq_snes_monitor        Monitor the equilibrium Newton iterations\n"
                    "  -verbose                Per-solve diagnostics from the solvers\n\n"
                    "Examples:\n"
                    "  sebm -c config/default.config\n"
                    "  sebm -c config/default.config -mode ensemble -o results/run1\n"
                    "  sebm -generate_config my_config.config\n\n";

namespace {

void runDeterministic(MPI_Comm comm, const SEBM::EnergyBalanceModel& model,
                      const SEBM::ClimateState& initial,
                      const SEBM::DeterministicConfig& config,
                      const SEBM::OutputConfig& output, bool verbose) {
    PetscPrintf(comm, "Deterministic integration (RK4, %d samples, t = %g .. %g)\n",
                config.num_samples, config.start_time, config.end_time);

    SEBM::DeterministicIntegrator integrator;
    integrator.setVerbose(verbose);
    SEBM::Trajectory traj = integrator.integrate(model, initial, config);

    PetscPrintf(comm, "  Initial state: T = %.4f K, a = %.5f\n",
                traj.front().temperature, traj.front().albedo);
    PetscPrintf(comm, "  Final state:   T = %.4f K, a = %.5f\n",
                traj.back().temperature, traj.back().albedo);
    PetscPrintf(comm, "  RK4 steps:     %ld\n\n", integrator.lastStepCount());

    if (output.write_trajectory) {
        const std::string file = output.prefix + "_trajectory.csv";
        SEBM::OutputWriter::writeTrajectory(file, traj);
        PetscPrintf(comm, "  Trajectory written to %s\n\n", file.c_str());
    }
}

void runEquilibrium(MPI_Comm comm, const SEBM::EnergyBalanceModel& model,
                    const SEBM::EquilibriumConfig& config,
                    const SEBM::OutputConfig& output, bool verbose) {
    PetscPrintf(comm, "Equilibrium search (%d guesses, tol = %g)\n",
                static_cast<int>(config.guesses.size()), config.tolerance);

    SEBM::EquilibriumSolver solver;
    solver.setVerbose(verbose);
    std::vector<SEBM::EquilibriumPoint> roots = solver.findRoots(model, config.guesses, config);

    if (roots.empty()) {
        PetscPrintf(comm, "  No equilibrium found from the given guesses\n\n");
    }
    for (const auto& r : roots) {
        PetscPrintf(comm, "  T* = %9.4f K   a_eq = %.5f   |netFlux| = %.2e   %s\n",
                    r.temperature, r.albedo, r.residual, r.stable ? "stable" : "unstable");
    }
    PetscPrintf(comm, "\n");

    if (output.write_statistics) {
        const std::string file = output.prefix + "_equilibria.csv";
        SEBM::OutputWriter::writeEquilibria(file, roots);
        PetscPrintf(comm, "  Equilibria written to %s\n\n", file.c_str());
    }
}

void runEnsemble(MPI_Comm comm, const SEBM::EnergyBalanceModel& model,
                 const SEBM::ClimateState& initial,
                 const SEBM::EnsembleConfig& config,
                 const SEBM::OutputConfig& output, bool verbose) {
    const SEBM::PhysicalParameters& p = model.parameters();
    PetscPrintf(comm, "Stochastic ensemble (%d runs x %d steps, dt = %g, eta_T = %g, eta_a = %g)\n",
                config.num_runs, config.num_steps, config.dt,
                p.noise_temperature, p.noise_albedo);

    SEBM::StochasticEnsembleSimulator simulator(config.num_threads);
    simulator.setVerbose(verbose);
    double t_start = MPI_Wtime();
    SEBM::Ensemble ensemble;
    try {
        ensemble = simulator.run(model, initial, config);
    } catch (const SEBM::EnsembleDivergence& e) {
        const std::vector<std::size_t> kept = e.ensemble().completedRuns();
        if (!config.discard_diverged || kept.empty()) throw;
        PetscPrintf(comm, "  Warning: %d of %d runs diverged and were discarded\n",
                    static_cast<int>(e.failures().size()), config.num_runs);
        ensemble = e.ensemble().subset(kept);
    }
    double t_end = MPI_Wtime();

    SEBM::SummaryStatistics stats = SEBM::EnsembleStatistics::summarize(
        ensemble, static_cast<std::size_t>(config.burn_in_steps));

    PetscPrintf(comm, "  Seed:          %llu\n",
                static_cast<unsigned long long>(ensemble.seed()));
    PetscPrintf(comm, "  Wall time:     %.3f s\n", t_end - t_start);
    PetscPrintf(comm, "  Ensemble mean T: %.4f K (standard error %.4f K)\n",
                stats.ensemble_mean_temperature, stats.standard_error);

    const SEBM::DistributionSummary& f = stats.final_temperature;
    PetscPrintf(comm, "  Final T:  mean %.4f  std %.4f  min %.4f  max %.4f\n",
                f.mean, f.std_dev, f.min, f.max);
    PetscPrintf(comm, "            P10 %.4f  P50 %.4f  P90 %.4f\n\n",
                f.p10, f.p50, f.p90);

    if (output.write_statistics) {
        const std::string file = output.prefix + "_ensemble_stats.csv";
        SEBM::OutputWriter::writeRunStatistics(file, stats);
        PetscPrintf(comm, "  Run statistics written to %s\n", file.c_str());
    }
    if (output.write_ensemble) {
        const std::string file = output.prefix + "_ensemble.csv";
        SEBM::OutputWriter::writeEnsemble(file, ensemble);
        PetscPrintf(comm, "  Ensemble written to %s\n", file.c_str());
    }
    PetscPrintf(comm, "\n");
}

} // namespace

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            int status = 0;
            if (rank == 0) {
                if (SEBM::ConfigReader::generateTemplate(generate_config)) {
                    PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                } else {
                    status = 1;
                }
            }
            ierr = PetscFinalize();
            return status;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        char mode[64] = "all";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool prefix_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &prefix_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-mode", mode,
                                     sizeof(mode), nullptr); CHKERRQ(ierr);
        PetscBool verbose = PETSC_FALSE;
        ierr = PetscOptionsGetBool(nullptr, nullptr, "-verbose", &verbose, nullptr); CHKERRQ(ierr);

        const std::string run_mode(mode);
        if (run_mode != "all" && run_mode != "deterministic" &&
            run_mode != "equilibrium" && run_mode != "ensemble") {
            PetscPrintf(comm, "Error: Unknown -mode '%s'\n", mode);
            PetscPrintf(comm, "Run with -help for usage information\n");
            ierr = PetscFinalize();
            return 1;
        }

        SEBM::ConfigReader reader;
        if (config_provided && !reader.loadFile(config_file)) {
            PetscPrintf(comm, "Error: Failed to load configuration file %s\n", config_file);
            ierr = PetscFinalize();
            return 1;
        }

        SEBM::ConfigReader::ValidationResult validation = reader.validate();
        for (const auto& w : validation.warnings) {
            PetscPrintf(comm, "Warning: %s\n", w.c_str());
        }
        if (!validation.valid) {
            for (const auto& e : validation.errors) {
                PetscPrintf(comm, "Error: %s\n", e.c_str());
            }
            ierr = PetscFinalize();
            return 1;
        }

        SEBM::PhysicalParameters params;
        SEBM::ClimateState initial;
        SEBM::DeterministicConfig det_config;
        SEBM::EquilibriumConfig eq_config;
        SEBM::EnsembleConfig ens_config;
        SEBM::OutputConfig out_config;
        reader.parsePhysicalParameters(params);
        reader.parseInitialState(initial);
        reader.parseDeterministicConfig(det_config);
        reader.parseEquilibriumConfig(eq_config);
        reader.parseEnsembleConfig(ens_config);
        reader.parseOutputConfig(out_config);
        if (prefix_provided) out_config.prefix = output_prefix;

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  SEBM - Stochastic Energy Balance Model\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "Config file:   %s\n", config_provided ? config_file : "(defaults)");
        PetscPrintf(comm, "Mode:          %s\n", mode);
        PetscPrintf(comm, "Output prefix: %s\n", out_config.prefix.c_str());
        PetscPrintf(comm, "Initial state: T = %g K, a = %g\n\n", initial.temperature, initial.albedo);

        int status = 0;
        // Single-process model; other ranks only take part in init/finalize
        if (rank == 0) {
            try {
                SEBM::EnergyBalanceModel model(params);

                if (run_mode == "all" || run_mode == "deterministic") {
                    runDeterministic(comm, model, initial, det_config, out_config, verbose);
                }
                if (run_mode == "all" || run_mode == "equilibrium") {
                    runEquilibrium(comm, model, eq_config, out_config, verbose);
                }
                if (run_mode == "all" || run_mode == "ensemble") {
                    runEnsemble(comm, model, initial, ens_config, out_config, verbose);
                }

                PetscPrintf(comm, "============================================================\n");
            } catch (const SEBM::EnsembleDivergence& e) {
                std::cerr << "\nError: " << e.what() << std::endl;
                const std::vector<SEBM::RunFailure>& failed = e.failures();
                const std::size_t shown = std::min<std::size_t>(failed.size(), 10);
                for (std::size_t i = 0; i < shown; ++i) {
                    std::cerr << "  run " << failed[i].run << ", step " << failed[i].step
                              << ", t = " << failed[i].time << std::endl;
                }
                if (failed.size() > shown) {
                    std::cerr << "  ... " << failed.size() - shown << " more" << std::endl;
                }
                std::cerr << "  Set [ensemble] discard_diverged = true to keep the "
                          << e.ensemble().completedRuns().size() << " finite runs" << std::endl;
                status = 1;
            } catch (const SEBM::NumericalDivergence& e) {
                std::cerr << "\nError: " << e.what() << std::endl;
                std::cerr << "  run " << e.run() << ", step " << e.step()
                          << ", t = " << e.time() << std::endl;
                status = 1;
            } catch (const std::exception& e) {
                std::cerr << "\nError: " << e.what() << std::endl;
                status = 1;
            }
        }

        MPI_Bcast(&status, 1, MPI_INT, 0, comm);
        if (status != 0) {
            ierr = PetscFinalize();
            return status;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return 0;
}
