#include "mazerl/core/grid.hpp"

namespace mazerl::core {

    TGrid MakeWallGrid(int rows, int cols)
    {
        TGrid grid;
        grid.rows = rows;
        grid.cols = cols;
        grid.cells.resize(static_cast<size_t>(rows) * cols);

        for (int i = 0; i < rows; i++) {
            for (int j = 0; j < cols; j++) {
                TCell& c = grid.at(i, j);
                c.row = i;
                c.col = j;
                c.isWall = true;
            }
        }
        return grid;
    }

    std::pair<TPos, TPos> FindTerminals(const TGrid& grid)
    {
        bool hasStart = false;
        bool hasEnd = false;
        TPos start, end;

        for (const TCell& c : grid.cells) {
            if (c.isStart) {
                start = TPos{c.row, c.col};
                hasStart = true;
            }
            if (c.isEnd) {
                end = TPos{c.row, c.col};
                hasEnd = true;
            }
        }

        if (!hasStart) throw MalformedGrid("grid has no start cell");
        if (!hasEnd)   throw MalformedGrid("grid has no end cell");

        return {start, end};
    }

    TGrid CloneGrid(const TGrid& grid)
    {
        // cells are plain values, so the member-wise copy is already deep
        return grid;
    }

    void ClearAnnotations(TGrid& grid)
    {
        for (TCell& c : grid.cells) {
            c.isVisited = false;
            c.isPath = false;
        }
    }

} // namespace mazerl::core
