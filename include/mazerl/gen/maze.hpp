#pragma once

#include "mazerl/core/data.hpp"

namespace mazerl::gen {

    /**
     * Method: GenerateMaze
     * Description: Random perfect maze carved by recursive backtracking, start at
     * (0,1), end at (rows-1, cols-2), with a repair pass that guarantees a
     * start-to-end connection. Throws InvalidParameter when rows or cols < 5.
     */
    mazerl::core::TGrid GenerateMaze(int rows, int cols);

    /**
     * Method: EnsurePathExists
     * Description: Open a start-to-end route. Uses the BFS path over open cells
     * when one exists, otherwise carves a row-then-column Manhattan walk.
     * Returns true when a path already existed.
     */
    bool EnsurePathExists(mazerl::core::TGrid& grid, const mazerl::core::TPos& start, const mazerl::core::TPos& end);

} // namespace mazerl::gen
