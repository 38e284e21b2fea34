#pragma once

#include "mazerl/core/data.hpp"

namespace mazerl::utils {

    /**
     * Outputs a metrics record to the screen.
     */
    void WriteMetricsScreen(const mazerl::core::TMetrics &metrics);

    /**
     * Appends one summary row per metrics record to a tab-separated results file, writing the
     * header when the file is new. Throws std::runtime_error when the file
     * cannot be opened.
     */
    void WriteResults(const std::string &fileName, int run, const mazerl::core::TGrid &grid,
                      const mazerl::core::TMetrics &metrics);

} // namespace mazerl::utils
