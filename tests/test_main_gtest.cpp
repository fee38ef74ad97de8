/**
 * @file test_main_gtest.cpp
 * @brief Entry point for the SEBM GTest suite
 *
 * PETSc must be live for the TS/SNES based components, so it is brought up
 * once here rather than per fixture.
 */

#include <gtest/gtest.h>
#include <mpi.h>
#include <petsc.h>

int main(int argc, char **argv) {
    MPI_Init(&argc, &argv);

    // PETSc attaches to the existing MPI environment and leaves it running
    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, nullptr);
    if (ierr) {
        MPI_Finalize();
        return static_cast<int>(ierr);
    }

    ::testing::InitGoogleTest(&argc, argv);

    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    // Only rank 0 reports
    if (rank != 0) {
        ::testing::TestEventListeners& listeners =
            ::testing::UnitTest::GetInstance()->listeners();
        delete listeners.Release(listeners.default_result_printer());
    }

    int result = RUN_ALL_TESTS();

    PetscFinalize();
    MPI_Finalize();

    return result;
}
