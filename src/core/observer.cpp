#include "mazerl/core/observer.hpp"
#include "mazerl/core/context.hpp"

namespace mazerl::core {

    void EmitStep(IStepObserver& observer, const TGrid& grid, const TMetrics& metrics)
    {
        TStep step{grid, metrics};
        observer.onStep(step);

        // visualization pacing only, results never depend on it
        auto delay = SolverContext::instance().getStepDelay();
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }

} // namespace mazerl::core
