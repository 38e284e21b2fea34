#pragma once

#include "mazerl/core/data.hpp"
#include "mazerl/core/observer.hpp"

namespace mazerl::search {

    /**
     * Method: AStar
     * Description: A* search with Manhattan-distance heuristic. Stops on the first pop of the end cell, which is optimal.
     */
    mazerl::core::TMetrics AStar(const mazerl::core::TGrid &grid, mazerl::core::IStepObserver &observer);

} // namespace mazerl::search
