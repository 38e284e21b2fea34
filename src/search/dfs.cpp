#include "mazerl/search/dfs.hpp"

// Internal dependencies
#include "mazerl/core/grid.hpp"
#include "mazerl/core/method.hpp"    // ShuffleDirections, MarkVisited, MarkPath, get_time

namespace mazerl::search {

    mazerl::core::TMetrics DFS(const mazerl::core::TGrid &initialGrid, mazerl::core::IStepObserver &observer)
    {
        using namespace mazerl::core;

        struct TNode {
            TPos pos;                       // cell being expanded
            std::vector<TPos> path;         // start .. pos
        };

        double start_time = get_time_in_seconds();     // start computational time

        TGrid grid = CloneGrid(initialGrid);
        auto [start, end] = FindTerminals(grid);

        TMetrics metrics;
        metrics.algorithm = TAlgorithm::DFS;

        std::stack<TNode> stack;
        stack.push(TNode{start, {start}});

        std::vector<char> visited(grid.size(), 0);
        visited[grid.index(start)] = 1;

        while (!stack.empty())
        {
            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            TNode node = std::move(stack.top());
            stack.pop();

            MarkVisited(grid, node.pos);
            metrics.nodesVisited++;

            EmitStep(observer, grid, metrics);

            // reached the end
            if (node.pos == end)
            {
                MarkPath(grid, node.path);

                metrics.isPathFound = true;
                metrics.pathLength = (int)node.path.size() - 1;
                metrics.executionTime = elapsed_ms(start_time);

                EmitStep(observer, grid, metrics);
                return metrics;
            }

            // a fresh order per expansion keeps the exploration organic
            for (int dir : ShuffleDirections())
            {
                int nr = node.pos.row + DIR_ROW[dir];
                int nc = node.pos.col + DIR_COL[dir];

                if (grid.isOpen(nr, nc) && !visited[grid.index(nr, nc)])
                {
                    visited[grid.index(nr, nc)] = 1;

                    std::vector<TPos> newPath = node.path;
                    newPath.push_back(TPos{nr, nc});
                    stack.push(TNode{TPos{nr, nc}, std::move(newPath)});
                }
            }
        }

        // no path found
        metrics.isPathFound = false;
        metrics.executionTime = elapsed_ms(start_time);

        EmitStep(observer, grid, metrics);
        return metrics;
    }

} // namespace mazerl::search
