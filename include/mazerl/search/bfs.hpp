#pragma once

#include "mazerl/core/data.hpp"
#include "mazerl/core/observer.hpp"

namespace mazerl::search {

    /**
     * Method: BFS
     * Description: Breadth-First Search (BFS). Fixed direction order; the first path reaching the end is a shortest one.
     */
    mazerl::core::TMetrics BFS(const mazerl::core::TGrid &grid, mazerl::core::IStepObserver &observer);

} // namespace mazerl::search
