#include "core/agents/evolution/PerformanceRecorder.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace AgentEvo;

class PerformanceRecorderTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
    std::vector<AgentGenome> population;

    void SetUp() override
    {
        for (int i = 0; i < 3; i++) {
            population.push_back(AgentGenome::random(0, rng));
        }
    }

    PerformanceReport report(bool success, double innovation = 0.0, int helped = 0) const
    {
        return PerformanceReport{
            .agentId = population[1].id,
            .campaignSuccess = success,
            .innovationLevel = innovation,
            .activistsHelped = helped,
        };
    }
};

TEST_F(PerformanceRecorderTest, SuccessRateIsIncrementalMean)
{
    const auto& history = population[1].performanceHistory;

    ASSERT_TRUE(recordPerformance(population, report(true)));
    EXPECT_DOUBLE_EQ(history.successRate, 1.0);

    ASSERT_TRUE(recordPerformance(population, report(false)));
    EXPECT_DOUBLE_EQ(history.successRate, 0.5);

    ASSERT_TRUE(recordPerformance(population, report(true)));
    EXPECT_NEAR(history.successRate, 0.667, 0.001);
    EXPECT_EQ(history.campaignsAssisted, 3);
}

TEST_F(PerformanceRecorderTest, InnovationScoreIsExponentiallySmoothed)
{
    const auto& history = population[1].performanceHistory;

    recordPerformance(population, report(false, 1.0));
    EXPECT_NEAR(history.innovationScore, 0.1, 1e-12);

    recordPerformance(population, report(false, 1.0));
    EXPECT_NEAR(history.innovationScore, 0.19, 1e-12);

    recordPerformance(population, report(false, 0.0));
    EXPECT_NEAR(history.innovationScore, 0.171, 1e-12);
}

TEST_F(PerformanceRecorderTest, ActivistsAccumulate)
{
    recordPerformance(population, report(true, 0.5, 12));
    recordPerformance(population, report(false, 0.5, 30));

    EXPECT_EQ(population[1].performanceHistory.activistsSupported, 42);
}

TEST_F(PerformanceRecorderTest, UnknownAgentIsIgnored)
{
    const auto before = population;
    PerformanceReport stray = report(true, 1.0, 5);
    stray.agentId = AgentId::generate(rng);

    EXPECT_FALSE(recordPerformance(population, stray));
    for (size_t i = 0; i < population.size(); i++) {
        EXPECT_EQ(population[i].performanceHistory, before[i].performanceHistory);
    }
}

TEST_F(PerformanceRecorderTest, OnlyTheMatchingAgentChanges)
{
    recordPerformance(population, report(true, 0.4, 1));

    EXPECT_EQ(population[0].performanceHistory, PerformanceHistory{});
    EXPECT_EQ(population[1].performanceHistory.campaignsAssisted, 1);
    EXPECT_EQ(population[2].performanceHistory, PerformanceHistory{});
}

TEST_F(PerformanceRecorderTest, OutOfRangeInputKeepsHistoryInvariants)
{
    PerformanceHistory history;
    applyPerformanceReport(
        history,
        PerformanceReport{ .campaignSuccess = true, .innovationLevel = 7.0, .activistsHelped = -3 });

    EXPECT_NEAR(history.innovationScore, 0.1, 1e-12);
    EXPECT_EQ(history.activistsSupported, 0);
    EXPECT_LE(history.successRate, 1.0);
}

TEST_F(PerformanceRecorderTest, ReportParsesFromHostJson)
{
    const nlohmann::json j = {
        { "agentId", population[2].id.toString() },
        { "campaignSuccess", true },
        { "innovationLevel", 0.75 },
        { "activistsHelped", 9 },
    };

    const auto parsed = j.get<PerformanceReport>();

    EXPECT_EQ(parsed.agentId, population[2].id);
    EXPECT_TRUE(parsed.campaignSuccess);
    EXPECT_DOUBLE_EQ(parsed.innovationLevel, 0.75);
    EXPECT_EQ(parsed.activistsHelped, 9);
}
