#include "core/agents/AgentGenome.h"
#include "core/agents/evolution/Selection.h"

#include <gtest/gtest.h>

using namespace AgentEvo;

class SelectionTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    std::vector<AgentGenome> createPopulation(const std::vector<double>& fitness)
    {
        std::vector<AgentGenome> pop;
        for (const double f : fitness) {
            AgentGenome genome = AgentGenome::random(0, rng);
            genome.fitness = f;
            pop.push_back(genome);
        }
        return pop;
    }
};

TEST_F(SelectionTest, TournamentSelectReturnsElementFromPopulation)
{
    const auto population = createPopulation({ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 });

    const AgentGenome& selected = tournamentSelect(population, rng);

    bool found = false;
    for (const auto& g : population) {
        if (&g == &selected) {
            found = true;
            break;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(SelectionTest, SingleMemberPopulationAlwaysWins)
{
    const auto population = createPopulation({ 0.3 });

    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(&tournamentSelect(population, rng), &population[0]);
    }
}

TEST_F(SelectionTest, LargeTournamentFindsTheBest)
{
    const auto population = createPopulation({ 0.1, 0.9, 0.5 });

    const AgentGenome& selected = tournamentSelect(population, rng, 200);

    EXPECT_EQ(selected.id, population[1].id);
}

TEST_F(SelectionTest, TiesKeepTheFirstDrawn)
{
    const auto population = createPopulation({ 0.5, 0.5, 0.5, 0.5, 0.5, 0.5 });

    // Replay the first draw the tournament will make.
    std::mt19937 replay = rng;
    std::uniform_int_distribution<size_t> dist(0, population.size() - 1);
    const size_t firstDrawn = dist(replay);

    const AgentGenome& selected = tournamentSelect(population, rng);

    EXPECT_EQ(&selected, &population[firstDrawn]);
}

TEST_F(SelectionTest, SelectionDoesNotChangePopulation)
{
    const auto population = createPopulation({ 3, 1, 2 });
    const auto before = population;

    for (int i = 0; i < 20; i++) {
        tournamentSelect(population, rng);
    }

    ASSERT_EQ(population.size(), before.size());
    for (size_t i = 0; i < population.size(); i++) {
        EXPECT_EQ(population[i].id, before[i].id);
        EXPECT_EQ(population[i].fitness, before[i].fitness);
        EXPECT_EQ(population[i].genes, before[i].genes);
    }
}

TEST_F(SelectionTest, DefaultTournamentDrawsFiveContestants)
{
    const auto population = createPopulation({ 0.2, 0.4, 0.6, 0.8 });

    std::mt19937 replay = rng;
    std::uniform_int_distribution<size_t> dist(0, population.size() - 1);
    for (int i = 0; i < kTournamentSize; i++) {
        dist(replay);
    }

    tournamentSelect(population, rng);

    EXPECT_EQ(kTournamentSize, 5);
    EXPECT_EQ(rng, replay);
}
