#include "mazerl/search/bfs.hpp"

#include "mazerl/core/grid.hpp"
#include "mazerl/core/method.hpp"

namespace mazerl::search {

    mazerl::core::TMetrics BFS(const mazerl::core::TGrid &initialGrid, mazerl::core::IStepObserver &observer)
    {
        using namespace mazerl::core;

        struct TNode {
            TPos pos;
            std::vector<TPos> path;
        };

        double start_time = get_time_in_seconds();

        TGrid grid = CloneGrid(initialGrid);
        auto [start, end] = FindTerminals(grid);

        TMetrics metrics;
        metrics.algorithm = TAlgorithm::BFS;

        std::queue<TNode> queue;
        queue.push(TNode{start, {start}});

        std::vector<char> visited(grid.size(), 0);
        visited[grid.index(start)] = 1;

        while (!queue.empty())
        {
            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            TNode node = std::move(queue.front());
            queue.pop();

            MarkVisited(grid, node.pos);
            metrics.nodesVisited++;

            EmitStep(observer, grid, metrics);

            // first dequeue of the end carries a shortest path
            if (node.pos == end)
            {
                MarkPath(grid, node.path);

                metrics.isPathFound = true;
                metrics.pathLength = (int)node.path.size() - 1;
                metrics.executionTime = elapsed_ms(start_time);

                EmitStep(observer, grid, metrics);
                return metrics;
            }

            // up, right, down, left
            for (int dir = 0; dir < NUM_ACTIONS; dir++)
            {
                int nr = node.pos.row + DIR_ROW[dir];
                int nc = node.pos.col + DIR_COL[dir];

                if (grid.isOpen(nr, nc) && !visited[grid.index(nr, nc)])
                {
                    visited[grid.index(nr, nc)] = 1;

                    std::vector<TPos> newPath = node.path;
                    newPath.push_back(TPos{nr, nc});
                    queue.push(TNode{TPos{nr, nc}, std::move(newPath)});
                }
            }
        }

        metrics.isPathFound = false;
        metrics.executionTime = elapsed_ms(start_time);

        EmitStep(observer, grid, metrics);
        return metrics;
    }

} // namespace mazerl::search
