#include "mazerl/search/astar.hpp"

#include "mazerl/core/grid.hpp"
#include "mazerl/core/method.hpp"    // ManhattanDistance, MarkVisited, MarkPath

namespace mazerl::search {

    mazerl::core::TMetrics AStar(const mazerl::core::TGrid &initialGrid, mazerl::core::IStepObserver &observer)
    {
        using namespace mazerl::core;

        struct TNode {
            TPos pos;
            std::vector<TPos> path;
            int f;                          // g + h at push time
        };

        // min-heap on f
        auto byF = [](const TNode &a, const TNode &b) { return a.f > b.f; };

        double start_time = get_time_in_seconds();

        TGrid grid = CloneGrid(initialGrid);
        auto [start, end] = FindTerminals(grid);

        TMetrics metrics;
        metrics.algorithm = TAlgorithm::AStar;

        const int INF = std::numeric_limits<int>::max();
        std::vector<int> gScore(grid.size(), INF);     // best known distance from start
        std::vector<char> closed(grid.size(), 0);      // finalized cells

        std::priority_queue<TNode, std::vector<TNode>, decltype(byF)> openSet(byF);

        gScore[grid.index(start)] = 0;
        openSet.push(TNode{start, {start}, ManhattanDistance(start, end)});

        while (!openSet.empty())
        {
            if (MAZERL_SHOULD_STOP) {
                metrics.cancelled = true;
                break;
            }

            TNode node = openSet.top();
            openSet.pop();

            int cur = grid.index(node.pos);

            // stale entry
            if (closed[cur]) continue;

            closed[cur] = 1;
            metrics.nodesVisited++;

            MarkVisited(grid, node.pos);
            EmitStep(observer, grid, metrics);

            if (node.pos == end)
            {
                MarkPath(grid, node.path);
                metrics.isPathFound = true;
                metrics.pathLength = (int)node.path.size() - 1;
                break;
            }

            for (int dir = 0; dir < NUM_ACTIONS; dir++)
            {
                TPos next{node.pos.row + DIR_ROW[dir], node.pos.col + DIR_COL[dir]};

                if (!grid.isOpen(next.row, next.col)) continue;

                int nxt = grid.index(next);
                if (closed[nxt]) continue;

                int tentativeG = gScore[cur] + 1;

                // only a strict improvement re-queues the neighbour
                if (tentativeG < gScore[nxt])
                {
                    gScore[nxt] = tentativeG;

                    std::vector<TPos> newPath = node.path;
                    newPath.push_back(next);
                    openSet.push(TNode{next, std::move(newPath), tentativeG + ManhattanDistance(next, end)});
                }
            }
        }

        metrics.executionTime = elapsed_ms(start_time);

        // final update with the path, if any
        EmitStep(observer, grid, metrics);
        return metrics;
    }

} // namespace mazerl::search
