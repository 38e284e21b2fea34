#pragma once

#include "mazerl/core/data.hpp"

namespace mazerl::core {

    /**
     * Method: GreedyIndex
     * Description: index of the highest value, ties broken uniformly at random.
     * Returns -1 for an empty vector.
     */
    int GreedyIndex(const std::vector<double>& values);

    /**
     * Method: ChooseAction
     * Description: epsilon-greedy choice over candidate values. With probability
     * epsilon a uniformly random index, otherwise GreedyIndex.
     */
    int ChooseAction(const std::vector<double>& values, double epsilon);

    /**
     * Method: MaxQ
     * Description: largest of the four stored action-values of a state
     */
    double MaxQ(const TQRow& row);

    /**
     * Method: PrintValueFunction
     * Description: print V(s) as a matrix, walls shown as '#'
     */
    void PrintValueFunction(const TGrid& grid, const TValueFunction& valueFunction);

    /**
     * Method: PrintQTable
     * Description: print the Q-values of every open cell
     */
    void PrintQTable(const TGrid& grid, const TQTable& qTable);

} // namespace mazerl::core
