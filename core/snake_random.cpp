#include "snake_random.h"
#include <stdexcept>

MersenneRandomSource::MersenneRandomSource(uint32_t seed) : m_seed(seed), m_gen(seed) {}

int MersenneRandomSource::nextIndex(int bound) {
    if (bound <= 0) {
        throw std::invalid_argument("nextIndex bound must be positive");
    }
    std::uniform_int_distribution<int> dis(0, bound - 1);
    return dis(m_gen);
}

uint32_t makeRandomSeed() {
    std::random_device rd;
    return rd();
}
