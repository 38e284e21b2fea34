// tests/test_helpers.hpp
//
// Fixtures shared by the test files: hand-built grids, a reachability check
// and an observer that keeps every step.
#pragma once

#include "mazerl/core/context.hpp"
#include "mazerl/core/data.hpp"
#include "mazerl/core/grid.hpp"
#include "mazerl/core/method.hpp"
#include "mazerl/core/observer.hpp"

#include <queue>
#include <vector>

namespace mazerl_test {

using mazerl::core::TGrid;
using mazerl::core::TPos;
using mazerl::core::TStep;

class RecordingObserver final : public mazerl::core::IStepObserver {
public:
    void onStep(const TStep& step) override { steps.push_back(step); }

    std::vector<TStep> steps;
};

// Raises the stop flag for the lifetime of the guard
struct StopGuard {
    StopGuard() { mazerl::core::SolverContext::instance().signalStop(); }
    ~StopGuard() { mazerl::core::SolverContext::instance().resetStopFlag(); }
};

inline void OpenCell(TGrid& g, int r, int c) { g.at(r, c).isWall = false; }

// 5x5 corridor (0,1) -> (2,1) -> (2,3) -> (4,3); 6 moves, equal to the
// Manhattan distance between the terminals
inline TGrid CorridorGrid()
{
    TGrid g = mazerl::core::MakeWallGrid(5, 5);
    const int cells[][2] = {{0, 1}, {1, 1}, {2, 1}, {2, 2}, {2, 3}, {3, 3}, {4, 3}};
    for (const auto& c : cells) OpenCell(g, c[0], c[1]);
    g.at(0, 1).isStart = true;
    g.at(4, 3).isEnd = true;
    return g;
}

// start enclosed by walls, end unreachable
inline TGrid IsolatedStartGrid()
{
    TGrid g = mazerl::core::MakeWallGrid(7, 7);
    OpenCell(g, 0, 1);
    g.at(0, 1).isStart = true;
    for (int r = 2; r < 7; r++) OpenCell(g, r, 5);
    g.at(6, 5).isEnd = true;
    return g;
}

// number of open cells reachable from start through 4-neighbour moves
inline int CountReachable(const TGrid& g, const TPos& from)
{
    std::vector<char> seen(g.size(), 0);
    std::queue<TPos> q;
    q.push(from);
    seen[g.index(from)] = 1;
    int count = 0;

    while (!q.empty()) {
        TPos p = q.front();
        q.pop();
        count++;
        for (int a = 0; a < mazerl::core::NUM_ACTIONS; a++) {
            int nr = p.row + mazerl::core::DIR_ROW[a];
            int nc = p.col + mazerl::core::DIR_COL[a];
            if (g.isOpen(nr, nc) && !seen[g.index(nr, nc)]) {
                seen[g.index(nr, nc)] = 1;
                q.push(TPos{nr, nc});
            }
        }
    }
    return count;
}

inline int CountOpen(const TGrid& g)
{
    int n = 0;
    for (const auto& c : g.cells) n += c.isWall ? 0 : 1;
    return n;
}

inline int CountIf(const TGrid& g, bool mazerl::core::TCell::*flag)
{
    int n = 0;
    for (const auto& c : g.cells) n += (c.*flag) ? 1 : 0;
    return n;
}

} // namespace mazerl_test
