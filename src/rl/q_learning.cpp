#include "mazerl/rl/q_learning.hpp"

#include "mazerl/core/grid.hpp"
#include "mazerl/core/method.hpp"
#include "mazerl/core/policy.hpp"    // ChooseAction, GreedyIndex, MaxQ

namespace mazerl::rl {

    using namespace mazerl::core;

    TMetrics QLearning(const TGrid &initialGrid, IStepObserver &observer, const TLearnParams &params)
    {
        ValidateLearnParams(params);

        double start_time = get_time_in_seconds();     // start computational time

        TGrid grid = CloneGrid(initialGrid);
        auto [start, end] = FindTerminals(grid);

        const int maxSteps = grid.rows * grid.cols * 2;            // prevents endless episodes
        const int reportEvery = std::max(1, params.episodes / 20); // ~20 progress points

        TMetrics metrics;
        metrics.algorithm = TAlgorithm::QLearning;
        metrics.detail = TQLearningData{};

        TQLearningData &ql = metrics.qLearning();
        ql.epsilon = params.epsilon;
        ql.discountFactor = params.discountFactor;
        ql.learningRate = params.learningRate;
        ql.rewardValue = params.rewardValue;
        ql.stuckPenalty = params.stuckPenalty;
        ql.totalEpisodes = params.episodes;

        // Q(s,a) = 0 everywhere; wall rows are never read
        ql.qTable.assign(grid.size(), TQRow{0.0, 0.0, 0.0, 0.0});
        TQTable &Q = ql.qTable;

        for (int episode = 0; episode < params.episodes; episode++)
        {
            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            TPos cur = start;
            bool isTerminal = false;
            bool reachedGoal = false;
            int steps = 0;

            while (!isTerminal && steps < maxSteps)
            {
                if (MAZERL_SHOULD_STOP) break;

                steps++;
                metrics.nodesVisited++;
                int st = grid.index(cur);

                // valid actions lead into open, in-bounds cells
                std::vector<int> validActions = OpenDirections(grid, cur);

                // nowhere to go: the episode ends without any update
                if (validActions.empty()) {
                    isTerminal = true;
                    continue;
                }

                std::vector<double> qValues;
                qValues.reserve(validActions.size());
                for (int a : validActions) qValues.push_back(Q[st][a]);

                int at = validActions[ChooseAction(qValues, params.epsilon)];

                // take action, observe next state and reward
                TPos next{cur.row + DIR_ROW[at], cur.col + DIR_COL[at]};
                double R = 0.0;

                if (next == end) {
                    R = params.rewardValue;
                    isTerminal = true;
                    reachedGoal = true;
                }
                else if (OpenDirections(grid, next).empty()) {
                    // moved into a dead end
                    R = params.stuckPenalty;
                    isTerminal = true;
                }

                int st_1 = grid.index(next);
                double maxNextQ = isTerminal ? 0.0 : MaxQ(Q[st_1]);

                // one-step temporal-difference update
                Q[st][at] = Q[st][at] + params.learningRate * (R + params.discountFactor * maxNextQ - Q[st][at]);

                cur = next;
            }

            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            if (reachedGoal) ql.successfulEpisodes++;
            ql.episodesCompleted = episode + 1;

            if (episode % reportEvery == 0 || episode == params.episodes - 1) {
                metrics.isPathFound = ql.successfulEpisodes > 0;
                EmitStep(observer, initialGrid, metrics);
            }
        }

        metrics.isPathFound = ql.successfulEpisodes > 0;
        metrics.executionTime = elapsed_ms(start_time);
        return metrics;
    }

    TMetrics QLearningExploration(const TGrid &initialGrid, IStepObserver &observer, const TQTable &qTable)
    {
        if ((int)qTable.size() != initialGrid.size()) {
            throw InvalidParameter("Q-table does not match the grid size");
        }

        double start_time = get_time_in_seconds();

        TGrid grid = CloneGrid(initialGrid);
        auto [start, end] = FindTerminals(grid);

        TMetrics metrics;
        metrics.algorithm = TAlgorithm::QLearningExploration;
        metrics.detail = TQLearningData{};
        metrics.qLearning().qTable = qTable;

        const int maxSteps = grid.rows * grid.cols * 2;

        TPos cur = start;
        std::vector<TPos> path{cur};
        std::vector<char> visited(grid.size(), 0);
        visited[grid.index(cur)] = 1;
        int steps = 0;

        while (steps < maxSteps)
        {
            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            steps++;
            metrics.nodesVisited++;

            if (cur == end) {
                metrics.isPathFound = true;
                break;
            }

            MarkVisited(grid, cur);
            EmitStep(observer, grid, metrics);

            std::vector<int> validActions = OpenDirections(grid, cur);
            if (validActions.empty()) break;

            const TQRow &q = qTable[grid.index(cur)];
            std::vector<double> qValues;
            qValues.reserve(validActions.size());
            for (int a : validActions) qValues.push_back(q[a]);

            int at = validActions[GreedyIndex(qValues)];
            cur.row += DIR_ROW[at];
            cur.col += DIR_COL[at];

            // loop guard after moving
            int key = grid.index(cur);
            if (visited[key]) break;

            visited[key] = 1;
            path.push_back(cur);
        }

        MarkPath(grid, path);

        metrics.pathLength = (int)path.size() - 1;
        metrics.executionTime = elapsed_ms(start_time);

        EmitStep(observer, grid, metrics);
        return metrics;
    }

} // namespace mazerl::rl
