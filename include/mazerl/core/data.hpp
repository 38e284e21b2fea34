#pragma once

#include "mazerl/core/common.hpp"

namespace mazerl::core {

    //--------------------------------------------------------------------------
    // Errors
    //--------------------------------------------------------------------------

    // Grid without a start or an end cell
    class MalformedGrid : public std::runtime_error {
    public:
        explicit MalformedGrid(const std::string& what) : std::runtime_error(what) {}
    };

    // Out-of-contract value handed directly to a core entry point
    class InvalidParameter : public std::invalid_argument {
    public:
        explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
    };

    //--------------------------------------------------------------------------
    // Struct: TPos
    // Description: (row, col) coordinate inside a grid
    //--------------------------------------------------------------------------
    struct TPos
    {
        int row = 0;
        int col = 0;

        bool operator==(const TPos& other) const {
            return row == other.row && col == other.col;
        }
        bool operator!=(const TPos& other) const {
            return !(*this == other);
        }
    };

    //--------------------------------------------------------------------------
    // Struct: TCell
    // Description: One maze cell. isVisited/isPath are owned by the algorithms
    //--------------------------------------------------------------------------
    struct TCell
    {
        int row = 0;
        int col = 0;
        bool isWall = true;
        bool isStart = false;
        bool isEnd = false;
        bool isVisited = false;
        bool isPath = false;

        bool operator==(const TCell& other) const = default;
    };

    //--------------------------------------------------------------------------
    // Struct: TGrid
    // Description: Rectangular maze stored row-major. The cell key used by every
    //              per-cell table is index(row, col) = row * cols + col.
    //--------------------------------------------------------------------------
    struct TGrid
    {
        int rows = 0;
        int cols = 0;
        std::vector<TCell> cells;

        int size() const { return rows * cols; }

        int index(int row, int col) const { return row * cols + col; }
        int index(const TPos& p) const { return p.row * cols + p.col; }

        TPos position(int idx) const { return TPos{idx / cols, idx % cols}; }

        bool inBounds(int row, int col) const {
            return row >= 0 && row < rows && col >= 0 && col < cols;
        }

        // in bounds and not a wall
        bool isOpen(int row, int col) const {
            return inBounds(row, col) && !cells[index(row, col)].isWall;
        }

        TCell& at(int row, int col) { return cells[index(row, col)]; }
        const TCell& at(int row, int col) const { return cells[index(row, col)]; }

        TCell& at(const TPos& p) { return cells[index(p)]; }
        const TCell& at(const TPos& p) const { return cells[index(p)]; }

        bool operator==(const TGrid& other) const = default;
    };

    //--------------------------------------------------------------------------
    // Learned tables, indexed by cell key
    //--------------------------------------------------------------------------
    using TValueFunction = std::vector<double>;
    using TQRow = std::array<double, NUM_ACTIONS>;
    using TQTable = std::vector<TQRow>;

    //--------------------------------------------------------------------------
    // Enum: TAlgorithm
    // Description: Discriminates which engine produced a metrics record
    //--------------------------------------------------------------------------
    enum class TAlgorithm
    {
        DFS,
        BFS,
        AStar,
        MonteCarlo,
        MonteCarloExploration,
        QLearning,
        QLearningExploration
    };

    const char* AlgorithmName(TAlgorithm algorithm);

    //--------------------------------------------------------------------------
    // Struct: TMonteCarloData
    // Description: Monte Carlo specific part of a metrics record
    //--------------------------------------------------------------------------
    struct TMonteCarloData
    {
        TValueFunction valueFunction;                       // V(s) per cell key
        std::vector<TValueFunction> valueFunctionHistory;   // snapshots for progress charts
        double epsilon = 0.0;                               // exploration rate used
        double discountFactor = 0.0;                        // gamma used
        int episodesCompleted = 0;
        int totalEpisodes = 0;
        double rewardValue = 0.0;                           // reward for reaching the goal
        double stuckPenalty = 0.0;                          // reward for ending stuck
        int successfulEpisodes = 0;                         // episodes that reached the goal
    };

    //--------------------------------------------------------------------------
    // Struct: TQLearningData
    // Description: Q-Learning specific part of a metrics record
    //--------------------------------------------------------------------------
    struct TQLearningData
    {
        TQTable qTable;                 // Q(s,a) per cell key, actions up/right/down/left
        double epsilon = 0.0;
        double discountFactor = 0.0;
        double learningRate = 0.0;
        double rewardValue = 0.0;
        double stuckPenalty = 0.0;
        int episodesCompleted = 0;
        int totalEpisodes = 0;
        int successfulEpisodes = 0;
    };

    //--------------------------------------------------------------------------
    // Struct: TMetrics
    // Description: Common result of every engine plus an algorithm payload
    //--------------------------------------------------------------------------
    struct TMetrics
    {
        TAlgorithm algorithm = TAlgorithm::BFS;
        int nodesVisited = 0;           // expanded nodes / states entered
        int pathLength = 0;             // edges of the final path
        double executionTime = 0.0;     // milliseconds
        bool isPathFound = false;
        bool cancelled = false;         // stopped through the context stop flag

        std::variant<std::monostate, TMonteCarloData, TQLearningData> detail;

        TMonteCarloData& monteCarlo() { return std::get<TMonteCarloData>(detail); }
        const TMonteCarloData& monteCarlo() const { return std::get<TMonteCarloData>(detail); }

        TQLearningData& qLearning() { return std::get<TQLearningData>(detail); }
        const TQLearningData& qLearning() const { return std::get<TQLearningData>(detail); }
    };

    //--------------------------------------------------------------------------
    // Struct: TStep
    // Description: Independent snapshot handed to step observers
    //--------------------------------------------------------------------------
    struct TStep
    {
        TGrid grid;
        TMetrics metrics;
    };

    //--------------------------------------------------------------------------
    // Struct: TLearnParams
    // Description: Hyperparameters of the episodic learners
    //--------------------------------------------------------------------------
    struct TLearnParams
    {
        int episodes = 100;             // number of training episodes
        double epsilon = 0.1;           // probability of a random action
        double discountFactor = 0.9;    // gamma
        double learningRate = 0.1;      // alpha (Q-Learning only)
        double rewardValue = 100.0;     // terminal reward at the goal
        double stuckPenalty = -1.0;     // terminal reward on a dead end
    };

    TLearnParams DefaultMonteCarloParams();
    TLearnParams DefaultQLearningParams();

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration of a driver run
    //--------------------------------------------------------------------------
    struct TRunData
    {
        int rows = 15;                  // maze height
        int cols = 15;                  // maze width
        int MAXRUNS = 1;                // number of mazes generated and solved
        int debug = 0;                  // 1 - print progress and learned tables
        int stepDelayMs = 0;            // pause after each emitted step
    };

} // namespace mazerl::core
