#include "mazerl/rl/monte_carlo.hpp"

// Internal dependencies
#include "mazerl/core/grid.hpp"
#include "mazerl/core/method.hpp"    // DIR_ROW/DIR_COL, ValidateLearnParams, get_time
#include "mazerl/core/policy.hpp"    // ChooseAction, GreedyIndex

namespace mazerl::rl {

    using namespace mazerl::core;

    namespace {

        enum class TOutcome { Goal, Stuck, MaxSteps };

        // snapshot cadence: every episode for the first 20, then ~20 snapshots
        // for short runs and ~100 for long ones
        bool IsHistoryCheckpoint(int episode, int episodes)
        {
            if (episode < 20) return true;

            int every = (episodes <= 100) ? std::max(1, episodes / 20)
                                          : std::max(1, episodes / 100);
            return episode % every == 0;
        }

    } // namespace

    TMetrics MonteCarlo(const TGrid &initialGrid, IStepObserver &observer, const TLearnParams &params)
    {
        ValidateLearnParams(params);

        double start_time = get_time_in_seconds();     // start computational time

        TGrid grid = CloneGrid(initialGrid);
        auto [start, end] = FindTerminals(grid);

        const int maxSteps = grid.rows * grid.cols * 2;            // step budget of an episode
        const int reportEvery = std::max(1, params.episodes / 10); // progress step cadence

        TMetrics metrics;
        metrics.algorithm = TAlgorithm::MonteCarlo;
        metrics.detail = TMonteCarloData{};

        TMonteCarloData &mc = metrics.monteCarlo();
        mc.epsilon = params.epsilon;
        mc.discountFactor = params.discountFactor;
        mc.totalEpisodes = params.episodes;
        mc.rewardValue = params.rewardValue;
        mc.stuckPenalty = params.stuckPenalty;

        // V(s) = 0 for every cell, the goal is fixed at the reward
        mc.valueFunction.assign(grid.size(), 0.0);
        mc.valueFunction[grid.index(end)] = params.rewardValue;

        std::vector<int> visitCounts(grid.size(), 0);   // first visits per cell, for averaging

        mc.valueFunctionHistory.push_back(mc.valueFunction);

        // ---------------------------------------------------------------------
        // Training: one simulated trajectory per episode
        // ---------------------------------------------------------------------
        for (int episode = 0; episode < params.episodes; episode++)
        {
            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            std::vector<int> trajectory;                        // cell keys in visiting order
            std::vector<char> episodeVisits(grid.size(), 0);
            TPos cur = start;
            TOutcome outcome = TOutcome::MaxSteps;
            bool isEpisodeComplete = false;
            int steps = 0;

            while (!isEpisodeComplete && steps < maxSteps)
            {
                if (MAZERL_SHOULD_STOP) break;

                steps++;
                int key = grid.index(cur);
                trajectory.push_back(key);
                episodeVisits[key] = 1;
                metrics.nodesVisited++;

                if (cur == end) {
                    outcome = TOutcome::Goal;
                    isEpisodeComplete = true;
                    continue;
                }

                // moves into open cells not yet visited in this episode
                std::vector<int> validActions;
                std::vector<double> actionValues;
                for (int a = 0; a < NUM_ACTIONS; a++)
                {
                    int nr = cur.row + DIR_ROW[a];
                    int nc = cur.col + DIR_COL[a];
                    if (grid.isOpen(nr, nc) && !episodeVisits[grid.index(nr, nc)]) {
                        validActions.push_back(a);
                        actionValues.push_back(mc.valueFunction[grid.index(nr, nc)]);
                    }
                }

                if (validActions.empty()) {
                    outcome = TOutcome::Stuck;
                    isEpisodeComplete = true;
                    continue;
                }

                int action = validActions[ChooseAction(actionValues, params.epsilon)];
                cur.row += DIR_ROW[action];
                cur.col += DIR_COL[action];
            }

            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            // terminal reward only on the last transition; none when the budget ran out
            double terminalReward = 0.0;
            if (outcome == TOutcome::Goal)       terminalReward = params.rewardValue;
            else if (outcome == TOutcome::Stuck) terminalReward = params.stuckPenalty;

            // discounted returns, walking backwards so the earliest visit wins
            std::vector<double> returns(grid.size(), 0.0);
            double G = 0.0;
            for (int i = (int)trajectory.size() - 1; i >= 0; i--)
            {
                double reward = (i == (int)trajectory.size() - 1) ? terminalReward : 0.0;
                G = reward + params.discountFactor * G;
                returns[trajectory[i]] = G;
            }

            // first-visit incremental average
            std::vector<char> updated(grid.size(), 0);
            for (int key : trajectory)
            {
                if (updated[key]) continue;
                updated[key] = 1;

                visitCounts[key]++;
                double &v = mc.valueFunction[key];
                v += (returns[key] - v) / visitCounts[key];
            }

            if (outcome == TOutcome::Goal) mc.successfulEpisodes++;
            mc.episodesCompleted = episode + 1;

            if (IsHistoryCheckpoint(episode, params.episodes)) {
                mc.valueFunctionHistory.push_back(mc.valueFunction);
            }

            // metrics-only progress, the grid is the caller's layout
            if (episode % reportEvery == 0 || episode == params.episodes - 1) {
                metrics.isPathFound = mc.successfulEpisodes > 0;
                EmitStep(observer, initialGrid, metrics);
            }
        }

        // final snapshot
        mc.valueFunctionHistory.push_back(mc.valueFunction);

        metrics.isPathFound = mc.successfulEpisodes > 0;
        metrics.executionTime = elapsed_ms(start_time);
        return metrics;
    }

    TMetrics MonteCarloExploration(const TGrid &initialGrid, IStepObserver &observer, const TValueFunction &valueFunction)
    {
        if ((int)valueFunction.size() != initialGrid.size()) {
            throw InvalidParameter("value function does not match the grid size");
        }

        double start_time = get_time_in_seconds();

        TGrid grid = CloneGrid(initialGrid);
        auto [start, end] = FindTerminals(grid);

        TMetrics metrics;
        metrics.algorithm = TAlgorithm::MonteCarloExploration;
        metrics.detail = TMonteCarloData{};
        metrics.monteCarlo().valueFunction = valueFunction;
        metrics.monteCarlo().valueFunctionHistory.push_back(valueFunction);

        const int maxSteps = grid.rows * grid.cols * 2;

        TPos cur = start;
        std::vector<TPos> path{cur};
        std::vector<char> visited(grid.size(), 0);
        int steps = 0;

        // follow the learned values greedily
        while (steps < maxSteps)
        {
            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            steps++;
            int key = grid.index(cur);

            // loop guard, the start is exempt only on the first step
            if (visited[key] && steps != 1) break;

            visited[key] = 1;
            metrics.nodesVisited++;

            if (cur == end) {
                metrics.isPathFound = true;
                break;
            }

            MarkVisited(grid, cur);
            EmitStep(observer, grid, metrics);

            std::vector<int> actions = OpenDirections(grid, cur);
            if (actions.empty()) break;

            std::vector<double> values;
            values.reserve(actions.size());
            for (int a : actions) {
                values.push_back(valueFunction[grid.index(cur.row + DIR_ROW[a], cur.col + DIR_COL[a])]);
            }

            int action = actions[GreedyIndex(values)];
            cur.row += DIR_ROW[action];
            cur.col += DIR_COL[action];
            path.push_back(cur);
        }

        // show the walk whether or not it reached the goal
        MarkPath(grid, path);

        metrics.pathLength = (int)path.size() - 1;
        metrics.executionTime = elapsed_ms(start_time);

        EmitStep(observer, grid, metrics);
        return metrics;
    }

} // namespace mazerl::rl
