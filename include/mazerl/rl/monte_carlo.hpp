#pragma once

#include "mazerl/core/data.hpp"
#include "mazerl/core/observer.hpp"

namespace mazerl::rl {

    /**
     * Method: MonteCarlo
     * Description: First-visit Monte Carlo learning of a state-value function.
     * Runs params.episodes epsilon-greedy episodes from the start cell and
     * archives value-function snapshots for progress charts. Progress steps
     * carry the unmodified input grid.
     */
    mazerl::core::TMetrics MonteCarlo(const mazerl::core::TGrid &grid, mazerl::core::IStepObserver &observer,
                                      const mazerl::core::TLearnParams &params);

    /**
     * Method: MonteCarloExploration
     * Description: Greedy walk over a learned value function. The walked cells
     * are marked as path whether or not the goal is reached.
     */
    mazerl::core::TMetrics MonteCarloExploration(const mazerl::core::TGrid &grid, mazerl::core::IStepObserver &observer,
                                                 const mazerl::core::TValueFunction &valueFunction);

} // namespace mazerl::rl
