#include "random_stream.hpp"

namespace {

double draw_uniform(std::mt19937_64& rng, double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng);
}

}  // namespace

SeededRandomStream::SeededRandomStream(std::uint64_t seed) : rng_(seed) {}

double SeededRandomStream::uniform(double lo, double hi) {
    return draw_uniform(rng_, lo, hi);
}
