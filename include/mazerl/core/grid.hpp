#pragma once

#include "mazerl/core/data.hpp"

namespace mazerl::core {

    /**
     * Method: MakeWallGrid
     * Description: rows x cols grid where every cell is a wall
     */
    TGrid MakeWallGrid(int rows, int cols);

    /**
     * Method: FindTerminals
     * Description: locate the start and end cells (first, second).
     * Throws MalformedGrid when either one is missing.
     */
    std::pair<TPos, TPos> FindTerminals(const TGrid& grid);

    /**
     * Method: CloneGrid
     * Description: deep, independent copy of a grid
     */
    TGrid CloneGrid(const TGrid& grid);

    /**
     * Method: ClearAnnotations
     * Description: reset isVisited/isPath on every cell, leaving the layout untouched
     */
    void ClearAnnotations(TGrid& grid);

} // namespace mazerl::core
