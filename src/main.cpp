/**
 * mazerl - Main Entry Point
 */

#include <csignal>
#include <iostream>

#include "mazerl/core/context.hpp"
#include "mazerl/core/solver.hpp"

// Ctrl+C asks every engine loop to stop at its next iteration
extern "C" void HandleInterrupt(int)
{
    mazerl::core::SolverContext::instance().signalStop();
}

int main(int argc, char *argv[]) {
    // 1. Instantiate the solver
    mazerl::MazeSolver solver;

    // 2. Initialize (CLI, run configuration, learner parameters)
    if (!solver.init(argc, argv)) return solver.exitCode();

    std::signal(SIGINT, HandleInterrupt);

    // 3. Generate and solve
    try {
        solver.run();
    } catch (const std::exception &e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
