#include "mazerl/core/method.hpp"

#include <yaml-cpp/yaml.h>

namespace mazerl::core {

    const int DIR_ROW[NUM_ACTIONS] = {-1, 0, 1, 0};
    const int DIR_COL[NUM_ACTIONS] = {0, 1, 0, -1};

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double randomico(double min, double max)
    {
        return std::uniform_real_distribution<double>(min, max)(MAZERL_RNG);
    }

    int irandomico(int min, int max)
    {
        // the real distribution may round up to its upper bound
        return std::min(max, (int)randomico(0, max - min + 1) + min);
    }

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    double elapsed_ms(double start)
    {
        return (get_time_in_seconds() - start) * 1000.0;
    }

    std::array<int, NUM_ACTIONS> ShuffleDirections()
    {
        std::array<int, NUM_ACTIONS> directions = {0, 1, 2, 3};
        for (int i = 0; i < NUM_ACTIONS; i++) {
            int randIndex = irandomico(0, NUM_ACTIONS - 1);
            std::swap(directions[i], directions[randIndex]);
        }
        return directions;
    }

    int ManhattanDistance(const TPos& a, const TPos& b)
    {
        return std::abs(a.row - b.row) + std::abs(a.col - b.col);
    }

    // -----------------------------------------------------------------------------
    // Grid annotation helpers
    // -----------------------------------------------------------------------------

    void MarkVisited(TGrid& grid, const TPos& p)
    {
        TCell& c = grid.at(p);
        if (!c.isStart && !c.isEnd) {
            c.isVisited = true;
        }
    }

    void MarkPath(TGrid& grid, const std::vector<TPos>& path)
    {
        for (const TPos& p : path) {
            TCell& c = grid.at(p);
            if (!c.isStart && !c.isEnd) {
                c.isPath = true;
            }
        }
    }

    std::vector<int> OpenDirections(const TGrid& grid, const TPos& p)
    {
        std::vector<int> open;
        open.reserve(NUM_ACTIONS);
        for (int a = 0; a < NUM_ACTIONS; a++) {
            if (grid.isOpen(p.row + DIR_ROW[a], p.col + DIR_COL[a])) {
                open.push_back(a);
            }
        }
        return open;
    }

    // -----------------------------------------------------------------------------
    // Parameters
    // -----------------------------------------------------------------------------

    void ValidateLearnParams(const TLearnParams& params)
    {
        if (params.episodes < 1)
            throw InvalidParameter("episodes must be >= 1");
        if (!(params.epsilon >= 0.0 && params.epsilon <= 1.0))
            throw InvalidParameter("epsilon must lie in [0, 1]");
        if (!(params.discountFactor >= 0.0 && params.discountFactor <= 1.0))
            throw InvalidParameter("discountFactor must lie in [0, 1]");
        if (!(params.learningRate >= 0.0 && params.learningRate <= 1.0))
            throw InvalidParameter("learningRate must lie in [0, 1]");
        if (!std::isfinite(params.rewardValue) || !std::isfinite(params.stuckPenalty))
            throw InvalidParameter("rewardValue and stuckPenalty must be finite");
    }

    void ValidateRunData(const TRunData& runData)
    {
        if (runData.rows < MIN_GRID_SIZE || runData.rows > MAX_GRID_SIZE ||
            runData.cols < MIN_GRID_SIZE || runData.cols > MAX_GRID_SIZE)
            throw InvalidParameter("rows and cols must lie in [" + std::to_string(MIN_GRID_SIZE) +
                                   ", " + std::to_string(MAX_GRID_SIZE) + "]");
        if (runData.MAXRUNS < 1)
            throw InvalidParameter("MAXRUNS must be at least 1");
        if (runData.stepDelayMs < 0)
            throw InvalidParameter("stepDelayMs must not be negative");
    }

    void LoadYamlLogic(const std::string& paramFile, const std::string& method, TLearnParams& params)
    {
        YAML::Node config;
        try {
            config = YAML::LoadFile(paramFile);
        } catch (const YAML::BadFile&) {
            throw std::runtime_error("Cannot open YAML file: " + paramFile);
        } catch (const YAML::ParserException& e) {
            throw std::runtime_error("YAML syntax error in " + paramFile + ": " + e.what());
        }

        // Guard Clause 1: method not present, keep defaults
        if (!config[method]) {
            std::cerr << "Method '" << method << "' not found in " << paramFile << std::endl;
            return;
        }

        const YAML::Node& methodNode = config[method];

        // Guard Clause 2: invalid layout
        if (!methodNode.IsMap()) {
            throw std::runtime_error("Invalid format for method " + method + " in " + paramFile + " (expected a map).");
        }

        try {
            if (methodNode["episodes"])       params.episodes       = methodNode["episodes"].as<int>();
            if (methodNode["epsilon"])        params.epsilon        = methodNode["epsilon"].as<double>();
            if (methodNode["discountFactor"]) params.discountFactor = methodNode["discountFactor"].as<double>();
            if (methodNode["learningRate"])   params.learningRate   = methodNode["learningRate"].as<double>();
            if (methodNode["rewardValue"])    params.rewardValue    = methodNode["rewardValue"].as<double>();
            if (methodNode["stuckPenalty"])   params.stuckPenalty   = methodNode["stuckPenalty"].as<double>();
        } catch (const YAML::BadConversion& e) {
            throw std::runtime_error("Bad value for method " + method + " in " + paramFile + ": " + e.what());
        }
    }

    void readParametersYaml(const std::string& paramFile, const std::string& method, TLearnParams& params)
    {
        std::ifstream probe(paramFile);
        if (!probe.is_open()) {
            return;
        }
        probe.close();

        LoadYamlLogic(paramFile, method, params);
    }

} // namespace mazerl::core
