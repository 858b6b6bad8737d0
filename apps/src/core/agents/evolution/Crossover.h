#pragma once

#include <random>

namespace AgentEvo {

struct AgentGenome;

enum class CrossoverOutcome {
    Clone,   // Copy of parent1 under a new id, no parent ids.
    Uniform, // Each trait taken whole from one parent.
};

/**
 * Produce one offspring for targetGeneration.
 *
 * With probability (1 - crossoverRate) the child is a clone of parent1: same genes, fitness,
 * age and performance history, but no parent ids. Otherwise every trait is copied
 * bit-for-bit from parent1 or parent2 with equal odds (never blended), parentIds records both
 * parents, and the child starts at age 0 with zero fitness and an empty history. Either way
 * the child gets a fresh id and targetGeneration.
 */
AgentGenome crossover(
    const AgentGenome& parent1,
    const AgentGenome& parent2,
    double crossoverRate,
    int targetGeneration,
    std::mt19937& rng,
    CrossoverOutcome* outcome = nullptr);

} // namespace AgentEvo
