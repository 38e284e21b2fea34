#include "mazerl/core/solver.hpp"
#include "mazerl/core/context.hpp"
#include "mazerl/core/method.hpp"
#include "mazerl/core/policy.hpp"

// CLI11
#include <CLI/CLI.hpp>

// Engines
#include "mazerl/gen/maze.hpp"
#include "mazerl/search/dfs.hpp"
#include "mazerl/search/bfs.hpp"
#include "mazerl/search/astar.hpp"
#include "mazerl/rl/monte_carlo.hpp"
#include "mazerl/rl/q_learning.hpp"
#include "mazerl/utils/io.hpp"

namespace mazerl {

    MazeSolver::MazeSolver()
        : configPath_("config/config.txt"),
          paramsPath_("config/params.yaml"),
          seed_(-1),
          exitCode_(0),
          monteCarloParams_(core::DefaultMonteCarloParams()),
          qLearningParams_(core::DefaultQLearningParams())
    {
        registerAlgorithms();
        core::SolverContext::instance().resetStopFlag();
    }

    void MazeSolver::registerAlgorithms() {
        algoRegistry_["DFS"] = [](const core::TGrid& grid, core::IStepObserver& observer) {
            return std::vector<core::TMetrics>{ search::DFS(grid, observer) };
        };
        algoRegistry_["BFS"] = [](const core::TGrid& grid, core::IStepObserver& observer) {
            return std::vector<core::TMetrics>{ search::BFS(grid, observer) };
        };
        algoRegistry_["AStar"] = [](const core::TGrid& grid, core::IStepObserver& observer) {
            return std::vector<core::TMetrics>{ search::AStar(grid, observer) };
        };

        // learners: train, then follow the learned table
        algoRegistry_["MonteCarlo"] = [this](const core::TGrid& grid, core::IStepObserver& observer) {
            core::TMetrics training = rl::MonteCarlo(grid, observer, monteCarloParams_);
            const core::TValueFunction& V = training.monteCarlo().valueFunction;
            if (runData_.debug) core::PrintValueFunction(grid, V);
            core::TMetrics walk = rl::MonteCarloExploration(grid, observer, V);
            return std::vector<core::TMetrics>{ training, walk };
        };
        algoRegistry_["QLearning"] = [this](const core::TGrid& grid, core::IStepObserver& observer) {
            core::TMetrics training = rl::QLearning(grid, observer, qLearningParams_);
            const core::TQTable& Q = training.qLearning().qTable;
            if (runData_.debug) core::PrintQTable(grid, Q);
            core::TMetrics walk = rl::QLearningExploration(grid, observer, Q);
            return std::vector<core::TMetrics>{ training, walk };
        };
    }

    bool MazeSolver::init(int argc, char* argv[]) {
        CLI::App app{"mazerl - Maze generation and solving"};

        int rows = 0;
        int cols = 0;
        bool debug = false;
        std::vector<std::string> algorithms;

        app.add_option("--rows", rows, "Maze height")->check(CLI::Range(core::MIN_GRID_SIZE, core::MAX_GRID_SIZE));
        app.add_option("--cols", cols, "Maze width")->check(CLI::Range(core::MIN_GRID_SIZE, core::MAX_GRID_SIZE));
        app.add_option("-a,--algorithm", algorithms, "Algorithm to run (DFS, BFS, AStar, MonteCarlo, QLearning); repeatable");
        app.add_option("-c,--config", configPath_, "Path to run configuration file")->default_val("config/config.txt");
        app.add_option("-p,--params", paramsPath_, "Path to YAML learner parameters")->default_val("config/params.yaml");
        app.add_option("-o,--output", outputPath_, "Append tab-separated results to this file");
        app.add_option("-s,--seed", seed_, "RNG Seed (default: random)");
        app.add_flag("-d,--debug", debug, "Print progress and learned tables");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError &e) {
            exitCode_ = app.exit(e);
            return false;
        }

        try {
            parseConfigFile(configPath_);

            // command line wins over the configuration file
            if (app.count("--rows")) runData_.rows = rows;
            if (app.count("--cols")) runData_.cols = cols;
            if (debug) runData_.debug = 1;
            if (!algorithms.empty()) {
                activeAlgorithms_.clear();
                for (const std::string& name : algorithms) {
                    if (!algoRegistry_.count(name)) {
                        throw core::InvalidParameter("Unknown algorithm: " + name);
                    }
                    activeAlgorithms_.push_back(name);
                }
            }

            loadParameters();

            if (seed_ >= 0) core::SolverContext::instance().setSeed((unsigned int)seed_);
            core::SolverContext::instance().setStepDelay(std::chrono::milliseconds(runData_.stepDelayMs));
            return true;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            exitCode_ = 1;
            return false;
        }
    }

    void MazeSolver::parseConfigFile(const std::string& configPath) {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            // built-in defaults
            std::cerr << "Config file " << configPath << " not found, using defaults.\n";
            return;
        }

        std::string line, key;
        activeAlgorithms_.clear();

        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') continue;
            std::stringstream ss(line);
            if (!(ss >> key)) continue;

            if (algoRegistry_.count(key)) {
                activeAlgorithms_.push_back(key);
            }
            else if (key == "MAXRUNS" || key == "runs") ss >> runData_.MAXRUNS;
            else if (key == "rows")        ss >> runData_.rows;
            else if (key == "cols")        ss >> runData_.cols;
            else if (key == "debug")       ss >> runData_.debug;
            else if (key == "stepDelayMs") ss >> runData_.stepDelayMs;
            else {
                std::cerr << "Ignoring unknown config key '" << key << "' in " << configPath << "\n";
            }
        }

        core::ValidateRunData(runData_);
    }

    void MazeSolver::loadParameters() {
        core::readParametersYaml(paramsPath_, "MonteCarlo", monteCarloParams_);
        core::readParametersYaml(paramsPath_, "QLearning", qLearningParams_);

        core::ValidateLearnParams(monteCarloParams_);
        core::ValidateLearnParams(qLearningParams_);
    }

    void MazeSolver::updateStatistics(const core::TMetrics& metrics) {
        TAlgorithmStats& s = statistics_[core::AlgorithmName(metrics.algorithm)];
        s.runs++;
        s.nodes += metrics.nodesVisited;
        s.time += metrics.executionTime;
        if (metrics.isPathFound) {
            s.found++;
            s.length += metrics.pathLength;
        }
    }

    void MazeSolver::run() {
        if (activeAlgorithms_.empty()) {
            std::cerr << "Error: No algorithms selected.\n";
            return;
        }

        // progress lines for the learners in debug mode
        core::CallbackObserver observer([this](const core::TStep& step) {
            if (!runData_.debug) return;

            if (const auto* mc = std::get_if<core::TMonteCarloData>(&step.metrics.detail)) {
                if (mc->totalEpisodes > 0)
                    std::cout << "\n  MonteCarlo episode " << mc->episodesCompleted << "/" << mc->totalEpisodes;
            }
            else if (const auto* ql = std::get_if<core::TQLearningData>(&step.metrics.detail)) {
                if (ql->totalEpisodes > 0)
                    std::cout << "\n  QLearning episode " << ql->episodesCompleted << "/" << ql->totalEpisodes;
            }
        });

        std::cout << "Maze: " << runData_.rows << "x" << runData_.cols << "\nRuns: ";

        for (int run = 0; run < runData_.MAXRUNS; run++)
        {
            if (core::SolverContext::instance().shouldStop()) break;

            std::cout << (run + 1) << " " << std::flush;

            core::TGrid grid = gen::GenerateMaze(runData_.rows, runData_.cols);

            for (const std::string& name : activeAlgorithms_)
            {
                if (runData_.debug) {
                    std::cout << "\n[Run " << (run + 1) << "] Start: " << name;
                }

                std::vector<core::TMetrics> results = algoRegistry_[name](grid, observer);

                for (const core::TMetrics& metrics : results) {
                    updateStatistics(metrics);
                    if (runData_.debug) utils::WriteMetricsScreen(metrics);
                    if (!outputPath_.empty()) utils::WriteResults(outputPath_, run + 1, grid, metrics);
                }
            }
        }

        displayResults();
    }

    void MazeSolver::displayResults() const {
        std::cout << "\n\n=== FINAL RESULT ===\n";

        for (const auto& [name, s] : statistics_) {
            if (s.runs == 0) continue;

            std::cout << std::left << std::setw(22) << name << std::right
                      << " found " << s.found << "/" << s.runs
                      << "  avg nodes " << std::fixed << std::setprecision(1) << s.nodes / s.runs
                      << "  avg length " << (s.found ? s.length / s.found : 0.0)
                      << "  avg time " << std::setprecision(3) << s.time / s.runs << " ms\n";
        }

        if (core::SolverContext::instance().shouldStop()) {
            std::cout << "(interrupted)\n";
        }
    }

} // namespace mazerl
