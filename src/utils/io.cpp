#include "mazerl/utils/io.hpp"

namespace mazerl::utils {

    void WriteMetricsScreen(const mazerl::core::TMetrics &metrics)
    {
        using namespace mazerl::core;

        std::cout << "\n" << AlgorithmName(metrics.algorithm)
                  << "\n  path found: " << (metrics.isPathFound ? "yes" : "no")
                  << "\n  nodes visited: " << metrics.nodesVisited
                  << "\n  path length: " << metrics.pathLength
                  << "\n  time: " << std::fixed << std::setprecision(3) << metrics.executionTime << " ms";

        if (metrics.cancelled) {
            std::cout << "\n  cancelled";
        }

        if (const auto *mc = std::get_if<TMonteCarloData>(&metrics.detail)) {
            if (mc->totalEpisodes > 0) {
                std::cout << "\n  episodes: " << mc->episodesCompleted << "/" << mc->totalEpisodes
                          << " (" << mc->successfulEpisodes << " reached the goal)"
                          << "\n  snapshots: " << mc->valueFunctionHistory.size();
            }
        }
        else if (const auto *ql = std::get_if<TQLearningData>(&metrics.detail)) {
            if (ql->totalEpisodes > 0) {
                std::cout << "\n  episodes: " << ql->episodesCompleted << "/" << ql->totalEpisodes
                          << " (" << ql->successfulEpisodes << " reached the goal)";
            }
        }

        std::cout << std::endl;
    }

    void WriteResults(const std::string &fileName, int run, const mazerl::core::TGrid &grid,
                      const mazerl::core::TMetrics &metrics)
    {
        bool isNew = !std::ifstream(fileName).good();

        FILE *File = fopen(fileName.c_str(), "a");
        if (!File) {
            throw std::runtime_error("Cannot open results file " + fileName);
        }

        if (isNew) {
            fprintf(File, "run\trows\tcols\talgorithm\tfound\tnodes\tlength\ttime_ms\tcancelled\n");
        }

        fprintf(File, "%d\t%d\t%d\t%s\t%d\t%d\t%d\t%.3f\t%d\n",
                run, grid.rows, grid.cols, mazerl::core::AlgorithmName(metrics.algorithm),
                metrics.isPathFound ? 1 : 0, metrics.nodesVisited, metrics.pathLength,
                metrics.executionTime, metrics.cancelled ? 1 : 0);

        fclose(File);
    }

} // namespace mazerl::utils
