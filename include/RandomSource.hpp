#ifndef RANDOMSOURCE_HPP
#define RANDOMSOURCE_HPP

#include <random>
#include <cstdint>

// Abstract interface for the one random decision the AI makes
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [0, bound). bound must be positive.
    virtual int nextIndex(int bound) = 0;
};

// Default source backed by a Mersenne Twister
class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource() : rng_(std::random_device{}()) {}
    explicit MersenneRandomSource(uint32_t seed) : rng_(seed) {}
    ~MersenneRandomSource() override = default;

    int nextIndex(int bound) override {
        std::uniform_int_distribution<int> dist(0, bound - 1);
        return dist(rng_);
    }

    void seed(uint32_t value) { rng_.seed(value); }

private:
    std::mt19937 rng_;
};

#endif // RANDOMSOURCE_HPP
