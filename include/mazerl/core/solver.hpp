/**
 * mazerl - Solver driver
 * Generates mazes and runs the configured algorithms on each of them
 */

#pragma once

#include "mazerl/core/data.hpp"
#include "mazerl/core/observer.hpp"

namespace mazerl {

    /**
    * @brief Command line orchestrator: configuration, algorithm registry, runs
    */
    class MazeSolver {
    public:
        // -------------------------------------------------------------------------
        // CONSTRUCTOR
        // -------------------------------------------------------------------------
        MazeSolver();

        // registry entries capture this
        MazeSolver(const MazeSolver&) = delete;
        MazeSolver& operator=(const MazeSolver&) = delete;

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        // Parses the command line and loads both configuration files.
        // Returns false when the program should stop (help, parse or config error);
        // exitCode() then holds the process status.
        bool init(int argc, char* argv[]);

        // Reads a plain `key value` run configuration file
        void parseConfigFile(const std::string& configPath);

        // Generates MAXRUNS mazes and runs every active algorithm on each
        void run();

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        int exitCode() const { return exitCode_; }
        const core::TRunData& getRunData() const { return runData_; }
        const std::vector<std::string>& getActiveAlgorithms() const { return activeAlgorithms_; }
        const core::TLearnParams& getMonteCarloParams() const { return monteCarloParams_; }
        const core::TLearnParams& getQLearningParams() const { return qLearningParams_; }

    private:
        // An algorithm entry may return more than one record (training + exploration)
        using AlgorithmFunc = std::function<std::vector<core::TMetrics>(const core::TGrid&, core::IStepObserver&)>;

        struct TAlgorithmStats {
            int runs = 0;                   // records accumulated
            int found = 0;                  // records with isPathFound
            double nodes = 0.0;             // sum of nodesVisited
            double length = 0.0;            // sum of pathLength over found records
            double time = 0.0;              // sum of executionTime (ms)
        };

        void registerAlgorithms();
        void loadParameters();
        void updateStatistics(const core::TMetrics& metrics);
        void displayResults() const;

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        std::string configPath_;
        std::string paramsPath_;
        std::string outputPath_;
        int seed_;
        int exitCode_;

        core::TRunData runData_;
        core::TLearnParams monteCarloParams_;
        core::TLearnParams qLearningParams_;

        std::map<std::string, AlgorithmFunc> algoRegistry_;
        std::vector<std::string> activeAlgorithms_;
        std::map<std::string, TAlgorithmStats> statistics_;
    };

} // namespace mazerl
