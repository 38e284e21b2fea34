#include "mazerl/gen/maze.hpp"

#include "mazerl/core/grid.hpp"
#include "mazerl/core/method.hpp"

namespace mazerl::gen {

    using namespace mazerl::core;

    // carve (r,c) and recurse two cells away in a shuffled direction order
    static void CarvePath(TGrid &grid, std::vector<char> &visited, int r, int c)
    {
        visited[grid.index(r, c)] = 1;
        grid.at(r, c).isWall = false;

        for (int dir : ShuffleDirections())
        {
            int nr = r + DIR_ROW[dir] * 2;
            int nc = c + DIR_COL[dir] * 2;

            if (grid.inBounds(nr, nc) && !visited[grid.index(nr, nc)])
            {
                // carve through the wall between current and new cell
                grid.at(r + DIR_ROW[dir], c + DIR_COL[dir]).isWall = false;
                CarvePath(grid, visited, nr, nc);
            }
        }
    }

    bool EnsurePathExists(TGrid &grid, const TPos &start, const TPos &end)
    {
        std::vector<int> parent(grid.size(), -1);
        std::vector<char> visited(grid.size(), 0);
        std::queue<TPos> queue;

        queue.push(start);
        visited[grid.index(start)] = 1;

        while (!queue.empty())
        {
            TPos cur = queue.front();
            queue.pop();

            if (cur == end)
            {
                // open every cell along the discovered route
                for (int idx = grid.index(end); idx != -1; idx = parent[idx]) {
                    grid.cells[idx].isWall = false;
                }
                return true;
            }

            for (int a = 0; a < NUM_ACTIONS; a++)
            {
                int nr = cur.row + DIR_ROW[a];
                int nc = cur.col + DIR_COL[a];
                if (grid.isOpen(nr, nc) && !visited[grid.index(nr, nc)])
                {
                    visited[grid.index(nr, nc)] = 1;
                    parent[grid.index(nr, nc)] = grid.index(cur);
                    queue.push(TPos{nr, nc});
                }
            }
        }

        // no route: walk row first, then column, opening every cell
        TPos cur = start;
        while (cur != end)
        {
            if (cur.row < end.row)       cur.row++;
            else if (cur.row > end.row)  cur.row--;
            else if (cur.col < end.col)  cur.col++;
            else                         cur.col--;

            grid.at(cur).isWall = false;
        }

        return false;
    }

    TGrid GenerateMaze(int rows, int cols)
    {
        if (rows < MIN_GRID_SIZE || cols < MIN_GRID_SIZE) {
            throw InvalidParameter("maze dimensions must be at least 5x5");
        }

        TGrid grid = MakeWallGrid(rows, cols);

        const TPos start{0, 1};
        const TPos end{rows - 1, cols - 2};

        grid.at(start).isWall = false;
        grid.at(start).isStart = true;

        grid.at(end).isWall = false;
        grid.at(end).isEnd = true;

        // recursive backtracking over odd coordinates
        std::vector<char> visited(grid.size(), 0);
        CarvePath(grid, visited, 1, 1);

        EnsurePathExists(grid, start, end);

        return grid;
    }

} // namespace mazerl::gen
