#pragma once

#include <cstdint>
#include <random>

class RandomStream {
  public:
    virtual ~RandomStream() = default;
    virtual double uniform(double lo = 0.0, double hi = 1.0) = 0;
};

// Stream that owns its engine, for per-attempt and per-stage randomness.
class SeededRandomStream : public RandomStream {
  public:
    explicit SeededRandomStream(std::uint64_t seed);

    double uniform(double lo, double hi) override;

  private:
    std::mt19937_64 rng_;
};
