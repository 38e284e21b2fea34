// tests/test_params.cpp (doctest)
#include <doctest/doctest.h>

#include "mazerl/core/method.hpp"

#include <filesystem>
#include <fstream>
#include <limits>

using namespace mazerl::core;

namespace mazerl_params_test {

// YAML file removed when the test case ends
struct TempYaml {
    std::filesystem::path path;

    TempYaml(const std::string& name, const std::string& body)
        : path(std::filesystem::temp_directory_path() / name)
    {
        std::ofstream out(path);
        out << body;
    }
    ~TempYaml()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // namespace mazerl_params_test

using namespace mazerl_params_test;

TEST_CASE("default hyperparameters") {
    TLearnParams mc = DefaultMonteCarloParams();
    CHECK(mc.episodes == 100);
    CHECK(mc.epsilon == doctest::Approx(0.1));
    CHECK(mc.discountFactor == doctest::Approx(0.9));
    CHECK(mc.rewardValue == doctest::Approx(100.0));
    CHECK(mc.stuckPenalty == doctest::Approx(-1.0));

    TLearnParams ql = DefaultQLearningParams();
    CHECK(ql.episodes == 1000);
    CHECK(ql.learningRate == doctest::Approx(0.1));
    CHECK(ql.rewardValue == doctest::Approx(1.0));
    CHECK(ql.stuckPenalty == doctest::Approx(-1.0));
}

TEST_CASE("YAML overrides only the keys it names") {
    TempYaml file("mazerl_params_subset.yaml",
                  "QLearning:\n"
                  "  episodes: 250\n"
                  "  learningRate: 0.25\n");

    TLearnParams p = DefaultQLearningParams();
    readParametersYaml(file.path.string(), "QLearning", p);

    CHECK(p.episodes == 250);
    CHECK(p.learningRate == doctest::Approx(0.25));
    CHECK(p.epsilon == doctest::Approx(0.1));
    CHECK(p.discountFactor == doctest::Approx(0.9));
    CHECK(p.rewardValue == doctest::Approx(1.0));
}

TEST_CASE("absent method keeps defaults") {
    TempYaml file("mazerl_params_other.yaml",
                  "QLearning:\n"
                  "  episodes: 5\n");

    TLearnParams p = DefaultMonteCarloParams();
    readParametersYaml(file.path.string(), "MonteCarlo", p);
    CHECK(p.episodes == 100);
}

TEST_CASE("missing file keeps defaults") {
    TLearnParams p = DefaultMonteCarloParams();
    readParametersYaml("/nonexistent/mazerl/params.yaml", "MonteCarlo", p);
    CHECK(p.episodes == 100);
    CHECK(p.rewardValue == doctest::Approx(100.0));
}

TEST_CASE("broken YAML is reported") {
    TLearnParams p = DefaultMonteCarloParams();

    SUBCASE("syntax error") {
        TempYaml file("mazerl_params_syntax.yaml", "MonteCarlo: [1, 2\n");
        CHECK_THROWS_AS(readParametersYaml(file.path.string(), "MonteCarlo", p), std::runtime_error);
    }
    SUBCASE("method is not a map") {
        TempYaml file("mazerl_params_scalar.yaml", "MonteCarlo: 5\n");
        CHECK_THROWS_AS(readParametersYaml(file.path.string(), "MonteCarlo", p), std::runtime_error);
    }
    SUBCASE("value of the wrong type") {
        TempYaml file("mazerl_params_type.yaml",
                      "MonteCarlo:\n"
                      "  episodes: many\n");
        CHECK_THROWS_AS(readParametersYaml(file.path.string(), "MonteCarlo", p), std::runtime_error);
    }
}

TEST_CASE("parameter validation") {
    TLearnParams p = DefaultQLearningParams();
    CHECK_NOTHROW(ValidateLearnParams(p));

    SUBCASE("episodes") {
        p.episodes = 0;
        CHECK_THROWS_AS(ValidateLearnParams(p), InvalidParameter);
    }
    SUBCASE("epsilon") {
        p.epsilon = -0.01;
        CHECK_THROWS_AS(ValidateLearnParams(p), InvalidParameter);
    }
    SUBCASE("discount factor") {
        p.discountFactor = 1.01;
        CHECK_THROWS_AS(ValidateLearnParams(p), InvalidParameter);
    }
    SUBCASE("learning rate") {
        p.learningRate = std::numeric_limits<double>::quiet_NaN();
        CHECK_THROWS_AS(ValidateLearnParams(p), InvalidParameter);
    }
    SUBCASE("rewards") {
        p.stuckPenalty = -std::numeric_limits<double>::infinity();
        CHECK_THROWS_AS(ValidateLearnParams(p), InvalidParameter);
    }
    SUBCASE("bounds are inclusive") {
        p.epsilon = 1.0;
        p.discountFactor = 0.0;
        p.learningRate = 1.0;
        CHECK_NOTHROW(ValidateLearnParams(p));
    }
}

TEST_CASE("run configuration bounds") {
    TRunData run;
    CHECK_NOTHROW(ValidateRunData(run));

    SUBCASE("smallest and largest sides are accepted") {
        run.rows = MIN_GRID_SIZE;
        run.cols = MAX_GRID_SIZE;
        CHECK_NOTHROW(ValidateRunData(run));
    }
    SUBCASE("sides below the minimum") {
        run.rows = 4;
        CHECK_THROWS_AS(ValidateRunData(run), InvalidParameter);
    }
    SUBCASE("sides above the maximum") {
        run.cols = 31;
        CHECK_THROWS_AS(ValidateRunData(run), InvalidParameter);
    }
    SUBCASE("runs") {
        run.MAXRUNS = 0;
        CHECK_THROWS_AS(ValidateRunData(run), InvalidParameter);
    }
    SUBCASE("step delay") {
        run.stepDelayMs = -1;
        CHECK_THROWS_AS(ValidateRunData(run), InvalidParameter);
    }
}
