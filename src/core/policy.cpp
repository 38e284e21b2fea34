#include "mazerl/core/policy.hpp"
#include "mazerl/core/method.hpp" // randomico() and irandomico()

namespace mazerl::core {

    int GreedyIndex(const std::vector<double>& values)
    {
        if (values.empty()) return -1;

        double maxValue = -std::numeric_limits<double>::infinity();
        std::vector<int> maxIndices;

        for (int i = 0; i < (int)values.size(); i++) {
            if (values[i] > maxValue) {
                maxValue = values[i];
                maxIndices.assign(1, i);
            } else if (values[i] == maxValue) {
                maxIndices.push_back(i);
            }
        }

        // every value was -inf or NaN
        if (maxIndices.empty()) {
            return irandomico(0, (int)values.size() - 1);
        }

        return maxIndices[irandomico(0, (int)maxIndices.size() - 1)];
    }

    int ChooseAction(const std::vector<double>& values, double epsilon)
    {
        if (values.empty()) return -1;

        // epsilon-greedy policy
        if (randomico(0, 1) < epsilon) {
            // choose a randomly selected action
            return irandomico(0, (int)values.size() - 1);
        }

        // choose the action with highest value
        return GreedyIndex(values);
    }

    double MaxQ(const TQRow& row)
    {
        return *std::max_element(row.begin(), row.end());
    }

    void PrintValueFunction(const TGrid& grid, const TValueFunction& valueFunction)
    {
        std::cout << "\nValue function:" << std::endl;

        for (int i = 0; i < grid.rows; i++) {
            for (int j = 0; j < grid.cols; j++) {
                if (grid.at(i, j).isWall) {
                    std::cout << std::setw(9) << "#";
                } else {
                    std::cout << std::setw(9) << std::fixed << std::setprecision(2)
                              << valueFunction[grid.index(i, j)];
                }
            }
            std::cout << "\n";
        }
        std::cout << std::flush;
    }

    void PrintQTable(const TGrid& grid, const TQTable& qTable)
    {
        static const char* ACTION_NAMES[NUM_ACTIONS] = {"up", "right", "down", "left"};

        std::cout << "\nQ-table:" << std::endl;

        for (int i = 0; i < grid.rows; i++) {
            for (int j = 0; j < grid.cols; j++) {
                if (grid.at(i, j).isWall) continue;

                const TQRow& q = qTable[grid.index(i, j)];
                std::cout << "\n (" << i << "," << j << "): \t";
                for (int a = 0; a < NUM_ACTIONS; a++) {
                    std::cout << ACTION_NAMES[a] << " (" << std::fixed << std::setprecision(3) << q[a] << ") \t";
                }
            }
        }
        std::cout << std::endl;
    }

} // namespace mazerl::core
