#pragma once
#include <cstdint>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @brief Seeded random source shared by every generation step of one world.
 *
 * Draws go straight to the raw mt19937 output (no std distributions) so a
 * seed reproduces the same world on every standard library.
 */
class RandomSource {
public:
    explicit RandomSource(uint64_t seed)
        : rng(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32))) {}

    // Uniform integer in [0, n).
    uint32_t below(uint32_t n) {
        if (n == 0) throw std::invalid_argument("RandomSource::below(0)");
        // Rejection sampling keeps the draw unbiased.
        const uint32_t limit = 0xFFFFFFFFu - (0xFFFFFFFFu % n);
        uint32_t v;
        do { v = static_cast<uint32_t>(rng()); } while (v >= limit);
        return v % n;
    }

    // Uniform real in [0, 1).
    double random() {
        return static_cast<double>(rng()) / 4294967296.0;
    }

    template <typename T>
    void shuffle(std::vector<T>& v) {
        for (size_t i = v.size(); i > 1; --i) {
            size_t j = below(static_cast<uint32_t>(i));
            std::swap(v[i - 1], v[j]);
        }
    }

    template <typename T>
    const T& choice(const std::vector<T>& v) {
        if (v.empty()) throw std::invalid_argument("RandomSource::choice on empty sequence");
        return v[below(static_cast<uint32_t>(v.size()))];
    }

    // k draws with replacement.
    template <typename T>
    std::vector<T> choices(const std::vector<T>& v, size_t k) {
        std::vector<T> out;
        out.reserve(k);
        for (size_t i = 0; i < k; ++i) out.push_back(choice(v));
        return out;
    }

private:
    std::mt19937 rng;
};
