#include "core/agents/AgentGenome.h"
#include "core/agents/evolution/FitnessEvaluator.h"
#include "core/agents/evolution/GenerationStepper.h"

#include <algorithm>
#include <gtest/gtest.h>

using namespace AgentEvo;

class GenerationStepperTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    EvolutionConfig makeConfig(int populationSize, int elitismCount)
    {
        return EvolutionConfig{
            .populationSize = populationSize,
            .mutationRate = 0.1,
            .crossoverRate = 0.7,
            .elitismCount = elitismCount,
            .fitnessFunction = FitnessFunction::Balanced,
        };
    }

    PopulationState makeState(int size)
    {
        return PopulationState{ .agents = createRandomPopulation(size, 0, rng), .generation = 0 };
    }

    // Agents in the order the stepper ranks them.
    std::vector<AgentGenome> ranked(std::vector<AgentGenome> agents, FitnessFunction function)
    {
        for (auto& agent : agents) {
            agent.fitness = evaluateFitness(agent, function);
        }
        std::stable_sort(agents.begin(), agents.end(), [](const auto& a, const auto& b) {
            return a.fitness > b.fitness;
        });
        return agents;
    }

    static const AgentGenome* findById(const std::vector<AgentGenome>& agents, const AgentId& id)
    {
        for (const auto& agent : agents) {
            if (agent.id == id) {
                return &agent;
            }
        }
        return nullptr;
    }
};

TEST_F(GenerationStepperTest, CreateRandomPopulationHasUniqueIdsAndBoundedGenes)
{
    const auto population = createRandomPopulation(25, 3, rng);

    ASSERT_EQ(population.size(), 25u);
    for (size_t i = 0; i < population.size(); i++) {
        EXPECT_EQ(population[i].generation, 3);
        EXPECT_TRUE(population[i].genesWithinBounds());
        for (size_t j = i + 1; j < population.size(); j++) {
            EXPECT_NE(population[i].id, population[j].id);
        }
    }
}

TEST_F(GenerationStepperTest, PopulationSizeIsPreservedForAnyElitism)
{
    for (const int elitism : { 0, 1, 5, 10 }) {
        const EvolutionConfig config = makeConfig(10, elitism);
        PopulationState state = makeState(10);

        for (int gen = 0; gen < 5; gen++) {
            const GenerationStats stats = stepGeneration(state, config, rng);
            ASSERT_EQ(state.agents.size(), 10u) << "elitism " << elitism;
            EXPECT_EQ(
                stats.eliteCarryoverCount + stats.offspringCrossoverCount
                    + stats.offspringCloneCount,
                10);
            EXPECT_EQ(stats.eliteCarryoverCount, elitism);
        }
    }
}

TEST_F(GenerationStepperTest, GenerationCounterAdvancesAndStampsOffspring)
{
    const EvolutionConfig config = makeConfig(12, 2);
    PopulationState state = makeState(12);

    for (int expected = 1; expected <= 3; expected++) {
        const GenerationStats stats = stepGeneration(state, config, rng);
        EXPECT_EQ(state.generation, expected);
        EXPECT_EQ(stats.generation, expected);
    }

    // Non-elite slots all come from the last step.
    for (size_t i = 2; i < state.agents.size(); i++) {
        EXPECT_EQ(state.agents[i].generation, 3);
    }
}

TEST_F(GenerationStepperTest, ElitesCarryOverUnchangedExceptAge)
{
    const EvolutionConfig config = makeConfig(20, 3);
    PopulationState state = makeState(20);
    state.agents[4].age = 2;
    state.agents[4].performanceHistory.campaignsAssisted = 7;

    const auto expectedElites = ranked(state.agents, config.fitnessFunction);

    stepGeneration(state, config, rng);

    for (int i = 0; i < config.elitismCount; i++) {
        const AgentGenome& before = expectedElites[i];
        const AgentGenome* after = findById(state.agents, before.id);
        ASSERT_NE(after, nullptr) << "elite " << i << " missing";
        EXPECT_EQ(after->genes, before.genes);
        EXPECT_EQ(after->generation, before.generation);
        EXPECT_EQ(after->performanceHistory, before.performanceHistory);
        EXPECT_DOUBLE_EQ(after->fitness, before.fitness);
        EXPECT_EQ(after->age, before.age + 1);
    }
}

TEST_F(GenerationStepperTest, ZeroRatesOnlyCloneExistingGenes)
{
    EvolutionConfig config = makeConfig(15, 0);
    config.crossoverRate = 0.0;
    config.mutationRate = 0.0;
    PopulationState state = makeState(15);
    for (size_t i = 0; i < state.agents.size(); i++) {
        state.agents[i].age = static_cast<int>(i % 3);
        state.agents[i].performanceHistory.campaignsAssisted = static_cast<int>(i) + 1;
        state.agents[i].performanceHistory.successRate = 0.5;
    }
    const auto before = state.agents;

    const GenerationStats stats = stepGeneration(state, config, rng);

    EXPECT_EQ(stats.offspringCloneCount, 15);
    EXPECT_EQ(stats.mutatedGeneCount, 0);
    for (const auto& child : state.agents) {
        EXPECT_TRUE(child.parentIds.empty());
        EXPECT_EQ(findById(before, child.id), nullptr);
        const auto source = std::find_if(before.begin(), before.end(), [&](const auto& a) {
            return a.genes == child.genes;
        });
        ASSERT_NE(source, before.end());
        EXPECT_EQ(child.age, source->age);
        EXPECT_EQ(child.performanceHistory, source->performanceHistory);
        EXPECT_DOUBLE_EQ(child.fitness, evaluateFitness(*source, config.fitnessFunction));
    }
}

TEST_F(GenerationStepperTest, StatisticsReadStoredFitnessAfterBreeding)
{
    // One elite, the rest crossover children with fitness 0.
    EvolutionConfig config = makeConfig(8, 1);
    config.crossoverRate = 1.0;
    config.mutationRate = 0.0;
    PopulationState state = makeState(8);

    const double eliteFitness = ranked(state.agents, config.fitnessFunction).front().fitness;

    const GenerationStats stats = stepGeneration(state, config, rng);

    EXPECT_EQ(stats.offspringCrossoverCount, 7);
    EXPECT_DOUBLE_EQ(stats.bestFitness, eliteFitness);
    EXPECT_NEAR(stats.averageFitness, eliteFitness / 8.0, 1e-12);
    EXPECT_GE(stats.geneticDiversity, 0.0);
    EXPECT_LE(stats.geneticDiversity, 1.0);
}

TEST_F(GenerationStepperTest, EmptyPopulationIsSeededFirst)
{
    const EvolutionConfig config = makeConfig(6, 2);
    PopulationState state;

    const GenerationStats stats = stepGeneration(state, config, rng);

    EXPECT_EQ(state.agents.size(), 6u);
    EXPECT_EQ(state.generation, 1);
    EXPECT_EQ(stats.generation, 1);
}

TEST_F(GenerationStepperTest, SameSeedGivesSameResult)
{
    const EvolutionConfig config = makeConfig(10, 2);

    std::mt19937 rngA{ 7 };
    std::mt19937 rngB{ 7 };
    PopulationState a{ .agents = createRandomPopulation(10, 0, rngA), .generation = 0 };
    PopulationState b{ .agents = createRandomPopulation(10, 0, rngB), .generation = 0 };

    for (int gen = 0; gen < 3; gen++) {
        stepGeneration(a, config, rngA);
        stepGeneration(b, config, rngB);
    }

    ASSERT_EQ(a.agents.size(), b.agents.size());
    for (size_t i = 0; i < a.agents.size(); i++) {
        EXPECT_EQ(a.agents[i].id, b.agents[i].id);
        EXPECT_EQ(a.agents[i].genes, b.agents[i].genes);
    }
}
