#include "mazerl/core/data.hpp"

namespace mazerl::core {

    const char* AlgorithmName(TAlgorithm algorithm)
    {
        switch (algorithm) {
            case TAlgorithm::DFS:                   return "DFS";
            case TAlgorithm::BFS:                   return "BFS";
            case TAlgorithm::AStar:                 return "AStar";
            case TAlgorithm::MonteCarlo:            return "MonteCarlo";
            case TAlgorithm::MonteCarloExploration: return "MonteCarloExploration";
            case TAlgorithm::QLearning:             return "QLearning";
            case TAlgorithm::QLearningExploration:  return "QLearningExploration";
        }
        return "Unknown";
    }

    TLearnParams DefaultMonteCarloParams()
    {
        TLearnParams p;
        p.episodes = 100;
        p.epsilon = 0.1;
        p.discountFactor = 0.9;
        p.learningRate = 0.1;   // unused by Monte Carlo
        p.rewardValue = 100.0;
        p.stuckPenalty = -1.0;
        return p;
    }

    TLearnParams DefaultQLearningParams()
    {
        TLearnParams p;
        p.episodes = 1000;
        p.epsilon = 0.1;
        p.discountFactor = 0.9;
        p.learningRate = 0.1;
        p.rewardValue = 1.0;
        p.stuckPenalty = -1.0;
        return p;
    }

} // namespace mazerl::core
