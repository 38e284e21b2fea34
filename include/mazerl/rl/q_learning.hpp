#pragma once

#include "mazerl/core/data.hpp"
#include "mazerl/core/observer.hpp"

namespace mazerl::rl {

    /**
     * Method: QLearning
     * Description: Tabular one-step Q-Learning with an epsilon-greedy behaviour
     * policy. Progress steps carry the unmodified input grid.
     */
    mazerl::core::TMetrics QLearning(const mazerl::core::TGrid &grid, mazerl::core::IStepObserver &observer,
                                     const mazerl::core::TLearnParams &params);

    /**
     * Method: QLearningExploration
     * Description: Greedy walk over a learned Q-table, stopping at the goal, at a
     * cell without valid actions, or when a move re-enters a visited cell.
     */
    mazerl::core::TMetrics QLearningExploration(const mazerl::core::TGrid &grid, mazerl::core::IStepObserver &observer,
                                                const mazerl::core::TQTable &qTable);

} // namespace mazerl::rl
