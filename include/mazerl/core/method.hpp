#pragma once

#include "mazerl/core/data.hpp"
#include "mazerl/core/context.hpp"

namespace mazerl::core {

    // -----------------------------------------------------------------------------
    // Direction tables (0 = up, 1 = right, 2 = down, 3 = left)
    // -----------------------------------------------------------------------------
    extern const int DIR_ROW[NUM_ACTIONS];
    extern const int DIR_COL[NUM_ACTIONS];

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    double randomico(double min, double max);
    int irandomico(int min, int max);
    double get_time_in_seconds();

    // milliseconds elapsed since a get_time_in_seconds() reading
    double elapsed_ms(double start);

    // random permutation of the four directions
    std::array<int, NUM_ACTIONS> ShuffleDirections();

    int ManhattanDistance(const TPos& a, const TPos& b);

    // -----------------------------------------------------------------------------
    // Grid annotation helpers
    // -----------------------------------------------------------------------------

    // isVisited = true unless the cell is the start or the end
    void MarkVisited(TGrid& grid, const TPos& p);

    // isPath = true along the path, start and end excluded
    void MarkPath(TGrid& grid, const std::vector<TPos>& path);

    // directions leading to an in-bounds, non-wall neighbour
    std::vector<int> OpenDirections(const TGrid& grid, const TPos& p);

    // -----------------------------------------------------------------------------
    // Parameters
    // -----------------------------------------------------------------------------

    /**
     * Method: ValidateLearnParams
     * Description: throws InvalidParameter when a learner parameter is out of contract
     */
    void ValidateLearnParams(const TLearnParams& params);

    // throws InvalidParameter unless rows/cols lie in [MIN_GRID_SIZE, MAX_GRID_SIZE],
    // MAXRUNS >= 1 and stepDelayMs >= 0
    void ValidateRunData(const TRunData& runData);

    /**
     * Method: readParametersYaml
     * Description: override the fields of params with the keys found under
     * the `method` node of a YAML file. A missing file leaves params unchanged.
     */
    void readParametersYaml(const std::string& paramFile, const std::string& method, TLearnParams& params);

} // namespace mazerl::core
