#pragma once

#include <cstdint>
#include <random>

// Source of food placement choices. Injected into SnakeCore so games replay
// identically for a given seed and tests can script exact placements.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [0, bound). Throws std::invalid_argument when bound <= 0.
    virtual int nextIndex(int bound) = 0;
};

class MersenneRandomSource : public RandomSource {
public:
    explicit MersenneRandomSource(uint32_t seed);

    int nextIndex(int bound) override;

    uint32_t getSeed() const { return m_seed; }

private:
    uint32_t m_seed;
    std::mt19937 m_gen;
};

// Non-deterministic seed for when the user did not ask for one
uint32_t makeRandomSeed();
