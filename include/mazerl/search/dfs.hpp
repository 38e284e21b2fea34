#pragma once

#include "mazerl/core/data.hpp"
#include "mazerl/core/observer.hpp"

namespace mazerl::search {

    /**
     * Method: DFS
     * Description: Depth-First Search (DFS). Directions are shuffled at every expansion, so the path found is valid but not necessarily shortest.
     */
    mazerl::core::TMetrics DFS(const mazerl::core::TGrid &grid, mazerl::core::IStepObserver &observer);

} // namespace mazerl::search
