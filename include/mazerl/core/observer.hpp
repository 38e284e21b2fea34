#pragma once
#include "mazerl/core/data.hpp"

namespace mazerl::core {

    // Receives the progress snapshots emitted by the engines
    class IStepObserver {
        public:
            virtual ~IStepObserver() = default;

            // Every step carries its own grid and metrics copies; the
            // observer may keep them for as long as it wants.
            virtual void onStep(const TStep& step) = 0;
        };

    using StepCallback = std::function<void(const TStep&)>;

    // Adapts a plain callable to the observer interface
    class CallbackObserver : public IStepObserver {
        public:
            explicit CallbackObserver(StepCallback callback) : callback_(std::move(callback)) {}

            void onStep(const TStep& step) override {
                if (callback_) callback_(step);
            }

        private:
            StepCallback callback_;
        };

    // Discards every step
    class NullObserver : public IStepObserver {
        public:
            void onStep(const TStep&) override {}
        };

    /**
     * Method: EmitStep
     * Description: Copy grid and metrics into a step, hand it to the observer
     *              and wait for the configured pacing delay (0 by default)
     */
    void EmitStep(IStepObserver& observer, const TGrid& grid, const TMetrics& metrics);

}
