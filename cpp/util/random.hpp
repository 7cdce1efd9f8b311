#ifndef UTIL_RANDOM_HPP
#define UTIL_RANDOM_HPP

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace util {

// Seeded pseudo-random source. Not thread safe.
class Random {
 public:
  explicit Random(uint64_t seed) : engine_(seed) {}

  // Uniform value in [0, 1).
  double Uniform() { return std::uniform_real_distribution<double>()(engine_); }

  // Uniform integer in [0, n). n must be positive.
  size_t Below(size_t n) {
    return std::uniform_int_distribution<size_t>(0, n - 1)(engine_);
  }

  // Fisher-Yates: every permutation of v is equally likely.
  template <typename T>
  void Shuffle(std::vector<T>* v) {
    for (size_t i = v->size(); i > 1; i--) {
      std::swap((*v)[i - 1], (*v)[Below(i)]);
    }
  }

  // A seed drawn from the operating system.
  static uint64_t RandomSeed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
  }

 private:
  std::mt19937_64 engine_;
};

}  // namespace util

#endif
