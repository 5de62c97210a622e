#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "quanttrade/optimization/parameter_optimizer.hpp"

using namespace quanttrade;
using namespace quanttrade::backtest;
using namespace quanttrade::testing;

class ParameterOptimizerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        pipeline_ = std::make_shared<BacktestPipeline>();
        train_ = std::make_unique<PricePanel>(make_panel({"A"}, {random_walk(200, 100.0, 41)}));
        momentum_ = StrategyConfig::parse({{"type", "momentum"},
                                           {"symbols", {"A"}},
                                           {"lookback_period", 7},
                                           {"momentum_threshold", 0.015}})
                        .take_value();
    }

    std::shared_ptr<const BacktestPipeline> pipeline_;
    std::unique_ptr<PricePanel> train_;
    StrategyConfig momentum_;
    BacktestConfig config_;
};

TEST_F(ParameterOptimizerTest, GridCandidatesPerStrategy) {
    GridSearchOptimizer grid(OptimizerConfig{}, pipeline_);
    EXPECT_EQ(grid.candidates(*train_, momentum_).size(), 25u);

    StrategyConfig mean_reversion =
        StrategyConfig::parse({{"type", "mean_reversion"}, {"symbols", {"A"}}}).take_value();
    auto mr = grid.candidates(*train_, mean_reversion);
    ASSERT_EQ(mr.size(), 15u);
    EXPECT_DOUBLE_EQ(mr.front().at("lookback_period"), 10.0);
    EXPECT_DOUBLE_EQ(mr.front().at("std_dev"), 1.5);

    StrategyConfig pairs =
        StrategyConfig::parse({{"type", "pairs_trading"}, {"symbols", {"A", "B"}}}).take_value();
    auto pt = grid.candidates(*train_, pairs);
    ASSERT_EQ(pt.size(), 9u);
    EXPECT_DOUBLE_EQ(pt.back().at("entry_threshold"), 2.5);
    EXPECT_DOUBLE_EQ(pt.back().at("exit_threshold"), 0.75);
}

TEST_F(ParameterOptimizerTest, GridPicksBestObjective) {
    GridSearchOptimizer grid(OptimizerConfig{}, pipeline_);
    auto chosen = grid.optimize(*train_, momentum_, config_);
    ASSERT_TRUE(chosen.is_ok()) << chosen.error()->what();

    // Brute force the same grid; ties keep the earlier candidate
    bool found = false;
    double best_score = 0.0;
    ParameterSet best;
    for (const auto& candidate : grid.candidates(*train_, momentum_)) {
        StrategyConfig trial = momentum_.with_parameters(candidate);
        auto output = pipeline_->run(*train_, trial, config_);
        ASSERT_TRUE(output.is_ok());
        double score = output.value().results.sharpe_ratio;
        if (!found || score > best_score) {
            found = true;
            best_score = score;
            best = trial.parameters();
        }
    }
    EXPECT_EQ(chosen.value(), best);
}

TEST_F(ParameterOptimizerTest, ObjectiveSelection) {
    OptimizerConfig config;
    config.objective = "total_return";
    GridSearchOptimizer grid(config, pipeline_);
    auto chosen = grid.optimize(*train_, momentum_, config_);
    ASSERT_TRUE(chosen.is_ok());

    double chosen_return =
        pipeline_->run(*train_, momentum_.with_parameters(chosen.value()), config_)
            .value()
            .results.total_return;
    for (const auto& candidate : grid.candidates(*train_, momentum_)) {
        auto output = pipeline_->run(*train_, momentum_.with_parameters(candidate), config_);
        ASSERT_TRUE(output.is_ok());
        EXPECT_LE(output.value().results.total_return, chosen_return);
    }
}

TEST_F(ParameterOptimizerTest, ObjectiveValue) {
    BacktestResults results;
    results.sharpe_ratio = 1.2;
    results.total_return = 0.3;
    results.annual_return = 0.1;
    results.sortino_ratio = 1.8;
    results.calmar_ratio = 0.7;

    EXPECT_DOUBLE_EQ(objective_value(results, "sharpe_ratio").value(), 1.2);
    EXPECT_DOUBLE_EQ(objective_value(results, "total_return").value(), 0.3);
    EXPECT_DOUBLE_EQ(objective_value(results, "annual_return").value(), 0.1);
    EXPECT_DOUBLE_EQ(objective_value(results, "sortino_ratio").value(), 1.8);
    EXPECT_DOUBLE_EQ(objective_value(results, "calmar_ratio").value(), 0.7);

    auto unknown = objective_value(results, "alpha");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ParameterOptimizerTest, FactoryValidatesConfig) {
    OptimizerConfig config;
    config.method = "annealing";
    auto bad_method = create_parameter_optimizer(config, pipeline_);
    ASSERT_TRUE(bad_method.is_error());
    EXPECT_EQ(bad_method.error()->code(), ErrorCode::INVALID_ARGUMENT);

    config.method = "grid";
    config.objective = "alpha";
    EXPECT_TRUE(create_parameter_optimizer(config, pipeline_).is_error());

    config.method = "random";
    config.objective = "sharpe_ratio";
    config.num_samples = 0;
    EXPECT_TRUE(create_parameter_optimizer(config, pipeline_).is_error());

    config.num_samples = 5;
    auto random = create_parameter_optimizer(config, pipeline_);
    ASSERT_TRUE(random.is_ok());
    EXPECT_NE(dynamic_cast<const RandomSearchOptimizer*>(random.value().get()), nullptr);
}

TEST_F(ParameterOptimizerTest, RandomSearchIsDeterministic) {
    OptimizerConfig config;
    config.method = "random";
    config.num_samples = 12;
    RandomSearchOptimizer random(config, pipeline_);

    auto first = random.candidates(*train_, momentum_);
    auto second = random.candidates(*train_, momentum_);
    ASSERT_EQ(first.size(), 12u);
    EXPECT_EQ(first, second);

    for (const auto& candidate : first) {
        double lookback = candidate.at("lookback_period");
        EXPECT_GE(lookback, 10.0);
        EXPECT_LE(lookback, 29.0);
        EXPECT_DOUBLE_EQ(lookback, std::round(lookback));
        EXPECT_GE(candidate.at("momentum_threshold"), 0.01);
        EXPECT_LT(candidate.at("momentum_threshold"), 0.05);
    }

    auto chosen_a = random.optimize(*train_, momentum_, config_);
    auto chosen_b = random.optimize(*train_, momentum_, config_);
    ASSERT_TRUE(chosen_a.is_ok());
    ASSERT_TRUE(chosen_b.is_ok());
    EXPECT_EQ(chosen_a.value(), chosen_b.value());
}

TEST_F(ParameterOptimizerTest, RandomSearchDependsOnTrainingSlice) {
    OptimizerConfig config;
    config.method = "random";
    RandomSearchOptimizer random(config, pipeline_);

    PricePanel later = train_->slice(train_->dates()[50], train_->dates().back());
    EXPECT_NE(random.candidates(*train_, momentum_), random.candidates(later, momentum_));
}

TEST_F(ParameterOptimizerTest, KeepsCurrentParametersWhenNothingRuns) {
    // Shorter than every grid lookback
    PricePanel tiny = make_panel({"A"}, {{100.0, 101.0, 99.0, 102.0, 103.0}});
    GridSearchOptimizer grid(OptimizerConfig{}, pipeline_);

    auto chosen = grid.optimize(tiny, momentum_, config_);
    ASSERT_TRUE(chosen.is_ok());
    EXPECT_EQ(chosen.value(), momentum_.parameters());
}

TEST_F(ParameterOptimizerTest, ConfigJson) {
    OptimizerConfig config;
    config.from_json({{"method", "random"}, {"objective", "sortino_ratio"}, {"num_samples", 40}});
    EXPECT_EQ(config.method, "random");
    EXPECT_EQ(config.objective, "sortino_ratio");
    EXPECT_EQ(config.num_samples, 40);
    EXPECT_EQ(config.seed, 42u);
    EXPECT_TRUE(config.validate().is_ok());

    nlohmann::json j = config.to_json();
    EXPECT_EQ(j["method"], "random");
    EXPECT_EQ(j["num_samples"], 40);
}
