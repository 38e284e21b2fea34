// tests/test_q_learning.cpp (doctest)
#include <doctest/doctest.h>

#include "mazerl/gen/maze.hpp"
#include "mazerl/rl/q_learning.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace mazerl::core;
using namespace mazerl_test;

namespace mazerl_ql_test {

inline TLearnParams Params(int episodes)
{
    TLearnParams p = DefaultQLearningParams();
    p.episodes = episodes;
    p.epsilon = 0.1;
    p.discountFactor = 0.9;
    p.learningRate = 0.1;
    p.rewardValue = 1.0;
    p.stuckPenalty = -1.0;
    return p;
}

} // namespace mazerl_ql_test

using namespace mazerl_ql_test;

TEST_CASE("Q values stay finite and bounded on a generated maze") {
    TGrid maze = mazerl::gen::GenerateMaze(15, 15);
    NullObserver observer;

    TMetrics m = mazerl::rl::QLearning(maze, observer, Params(1000));
    const TQLearningData& ql = m.qLearning();

    CHECK(m.algorithm == TAlgorithm::QLearning);
    CHECK(ql.totalEpisodes == 1000);
    CHECK(ql.episodesCompleted == 1000);
    REQUIRE(ql.qTable.size() == (size_t)maze.size());

    // |R| <= 1 and gamma = 0.9 bound every value by 1 / (1 - 0.9)
    for (const TQRow& row : ql.qTable) {
        for (double q : row) {
            CHECK(std::isfinite(q));
            CHECK(std::fabs(q) <= 10.0 + 1e-9);
        }
    }
    CHECK(m.isPathFound == (ql.successfulEpisodes > 0));
}

TEST_CASE("metrics record the hyperparameters") {
    TGrid g = CorridorGrid();
    NullObserver observer;

    TLearnParams p = Params(40);
    p.epsilon = 0.3;
    p.learningRate = 0.5;
    p.discountFactor = 0.7;
    p.rewardValue = 2.0;
    p.stuckPenalty = -3.0;

    TMetrics m = mazerl::rl::QLearning(g, observer, p);
    const TQLearningData& ql = m.qLearning();

    CHECK(ql.epsilon == doctest::Approx(0.3));
    CHECK(ql.learningRate == doctest::Approx(0.5));
    CHECK(ql.discountFactor == doctest::Approx(0.7));
    CHECK(ql.rewardValue == doctest::Approx(2.0));
    CHECK(ql.stuckPenalty == doctest::Approx(-3.0));
    CHECK(m.pathLength == 0);
    CHECK(m.nodesVisited > 0);
}

TEST_CASE("trained corridor policy walks straight to the goal") {
    TGrid g = CorridorGrid();
    NullObserver quiet;

    TMetrics trained = mazerl::rl::QLearning(g, quiet, Params(1000));
    REQUIRE(trained.qLearning().successfulEpisodes > 0);

    // forward actions dominate along the corridor
    const TQTable& Q = trained.qLearning().qTable;
    CHECK(Q[g.index(0, 1)][2] > 0.0);
    CHECK(Q[g.index(3, 3)][2] > Q[g.index(3, 3)][0]);

    RecordingObserver observer;
    TMetrics walk = mazerl::rl::QLearningExploration(g, observer, Q);

    CHECK(walk.algorithm == TAlgorithm::QLearningExploration);
    CHECK(walk.isPathFound);
    CHECK(walk.pathLength == 6);
    CHECK(walk.nodesVisited == 7);

    REQUIRE_FALSE(observer.steps.empty());
    CHECK(CountIf(observer.steps.back().grid, &TCell::isPath) == 5);
}

TEST_CASE("enclosed start learns nothing") {
    TGrid g = IsolatedStartGrid();
    NullObserver observer;

    TMetrics m = mazerl::rl::QLearning(g, observer, Params(50));
    const TQLearningData& ql = m.qLearning();

    CHECK_FALSE(m.isPathFound);
    CHECK(ql.successfulEpisodes == 0);
    CHECK(ql.episodesCompleted == 50);
    CHECK(m.nodesVisited == 50);

    for (const TQRow& row : ql.qTable) {
        for (double q : row) CHECK(q == 0.0);
    }

    RecordingObserver walker;
    TMetrics walk = mazerl::rl::QLearningExploration(g, walker, ql.qTable);
    CHECK_FALSE(walk.isPathFound);
    CHECK(walk.pathLength == 0);
    CHECK(walk.nodesVisited == 1);
}

TEST_CASE("exploration stops before re-entering a cell") {
    TGrid g = CorridorGrid();

    // down from the start, then straight back up
    TQTable Q(g.size(), TQRow{0.0, 0.0, 0.0, 0.0});
    Q[g.index(0, 1)][2] = 1.0;
    Q[g.index(1, 1)][0] = 1.0;

    RecordingObserver observer;
    TMetrics walk = mazerl::rl::QLearningExploration(g, observer, Q);

    CHECK_FALSE(walk.isPathFound);
    CHECK(walk.pathLength == 1);
    CHECK(walk.nodesVisited == 2);

    REQUIRE_FALSE(observer.steps.empty());
    const TGrid& last = observer.steps.back().grid;
    CHECK(CountIf(last, &TCell::isPath) == 1);
    CHECK(last.at(1, 1).isPath);
    CHECK_FALSE(last.at(0, 1).isPath);
}

TEST_CASE("exploration annotates open cells only") {
    TGrid maze = mazerl::gen::GenerateMaze(13, 13);
    NullObserver quiet;

    TMetrics trained = mazerl::rl::QLearning(maze, quiet, Params(300));

    RecordingObserver observer;
    TMetrics walk = mazerl::rl::QLearningExploration(maze, observer, trained.qLearning().qTable);

    REQUIRE_FALSE(observer.steps.empty());
    const TGrid& last = observer.steps.back().grid;
    for (size_t i = 0; i < last.cells.size(); i++) {
        const TCell& c = last.cells[i];
        CHECK(c.isWall == maze.cells[i].isWall);
        if (c.isWall || c.isStart || c.isEnd) {
            CHECK_FALSE(c.isPath);
            CHECK_FALSE(c.isVisited);
        }
    }
    CHECK(walk.pathLength >= 0);
    CHECK(walk.pathLength < walk.nodesVisited + 1);
}

TEST_CASE("training progress steps") {
    TGrid g = CorridorGrid();
    RecordingObserver observer;

    mazerl::rl::QLearning(g, observer, Params(100));

    // episodes 0,5,..,95 plus the last one
    REQUIRE(observer.steps.size() == 21u);
    for (const TStep& step : observer.steps) {
        CHECK(step.grid == g);
    }
    CHECK(observer.steps.back().metrics.qLearning().episodesCompleted == 100);
}

TEST_CASE("exploration rejects a Q-table of the wrong size") {
    TGrid g = CorridorGrid();
    NullObserver observer;
    CHECK_THROWS_AS(mazerl::rl::QLearningExploration(g, observer, TQTable(2)), InvalidParameter);
}

TEST_CASE("out-of-contract parameters are rejected") {
    TGrid g = CorridorGrid();
    NullObserver observer;

    TLearnParams p = Params(10);
    p.learningRate = 1.2;
    CHECK_THROWS_AS(mazerl::rl::QLearning(g, observer, p), InvalidParameter);

    p = Params(10);
    p.rewardValue = std::nan("");
    CHECK_THROWS_AS(mazerl::rl::QLearning(g, observer, p), InvalidParameter);
}

TEST_CASE("stop flag cancels training") {
    TGrid g = CorridorGrid();
    StopGuard stop;
    NullObserver observer;

    TMetrics m = mazerl::rl::QLearning(g, observer, Params(100));

    CHECK(m.cancelled);
    CHECK(m.qLearning().episodesCompleted == 0);
    CHECK(m.nodesVisited == 0);
}
