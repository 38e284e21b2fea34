/**
 * mazerl - Solver Context Singleton
 * Centralizes shared runtime state without global variables
 */

#pragma once

#include <random>
#include <atomic>
#include <chrono>
#include "mazerl/core/data.hpp"

namespace mazerl {
    namespace core {

    /**
    * @brief Singleton that holds the process-wide runtime state
    *
    * Holds the random source used for direction shuffling, epsilon-greedy
    * choices and tie-breaking, the external stop flag checked by every engine
    * loop, and the pacing delay applied after each emitted step.
    */
    class SolverContext {
      public:
          // -------------------------------------------------------------------------
          // SINGLETON ACCESS
          // -------------------------------------------------------------------------
          static SolverContext& instance() {
              static SolverContext instance;
              return instance;
          }

          // Delete copy/move constructors
          SolverContext(const SolverContext&) = delete;
          SolverContext& operator=(const SolverContext&) = delete;
          SolverContext(SolverContext&&) = delete;
          SolverContext& operator=(SolverContext&&) = delete;

          // -------------------------------------------------------------------------
          // SHARED STATE ACCESSORS
          // -------------------------------------------------------------------------

          std::mt19937& getRng() { return rng_; }

          std::atomic<bool>& getStopFlag() { return stopExecution_; }

          void setSeed(unsigned int seed) { rng_.seed(seed); }

          void resetStopFlag() { stopExecution_.store(false); }

          void signalStop() { stopExecution_.store(true); }

          bool shouldStop() const { return stopExecution_.load(); }

          // -------------------------------------------------------------------------
          // STEP PACING
          // -------------------------------------------------------------------------

          void setStepDelay(std::chrono::milliseconds delay) { stepDelay_ = delay; }

          std::chrono::milliseconds getStepDelay() const { return stepDelay_; }

      private:
          SolverContext()
              : rng_(std::random_device{}()),
                stopExecution_(false),
                stepDelay_(0)
          {}

          ~SolverContext() = default;

          // Shared state
          std::mt19937 rng_;
          std::atomic<bool> stopExecution_;
          std::chrono::milliseconds stepDelay_;
      };

      // -------------------------------------------------------------------------
      // CONVENIENCE MACROS
      // -------------------------------------------------------------------------
      #define MAZERL_RNG         mazerl::core::SolverContext::instance().getRng()
      #define MAZERL_SHOULD_STOP mazerl::core::SolverContext::instance().shouldStop()

      } // namespace core
} // namespace mazerl
