#include "util/random.hpp"
#include <algorithm>
#include <numeric>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::UnorderedElementsAreArray;

// NOLINTNEXTLINE
TEST(Random, ShuffleIsPermutation) {
  util::Random random(42);
  std::vector<int> v(100);
  std::iota(v.begin(), v.end(), 0);
  std::vector<int> shuffled = v;
  random.Shuffle(&shuffled);
  EXPECT_THAT(shuffled, UnorderedElementsAreArray(v));
  EXPECT_NE(shuffled, v);
}

// NOLINTNEXTLINE
TEST(Random, ShuffleIsUniform) {
  // Every element must land in every position about equally often.
  const int n = 5;
  const int rounds = 50000;
  util::Random random(7);
  std::vector<std::vector<int>> counts(n, std::vector<int>(n));
  for (int r = 0; r < rounds; r++) {
    std::vector<int> v(n);
    std::iota(v.begin(), v.end(), 0);
    random.Shuffle(&v);
    for (int pos = 0; pos < n; pos++) counts[v[pos]][pos]++;
  }
  double expected = static_cast<double>(rounds) / n;
  double chi2 = 0;
  for (int i = 0; i < n; i++) {
    for (int j = 0; j < n; j++) {
      chi2 += (counts[i][j] - expected) * (counts[i][j] - expected) / expected;
    }
  }
  // 16 degrees of freedom, p = 0.001.
  EXPECT_LT(chi2, 39.25);
}

// NOLINTNEXTLINE
TEST(Random, SameSeedSameSequence) {
  util::Random a(1234);
  util::Random b(1234);
  for (int i = 0; i < 10; i++) EXPECT_EQ(a.Uniform(), b.Uniform());
}

// NOLINTNEXTLINE
TEST(Random, Ranges) {
  util::Random random(99);
  for (int i = 0; i < 1000; i++) {
    double u = random.Uniform();
    EXPECT_GE(u, 0.0);
    EXPECT_LT(u, 1.0);
    EXPECT_LT(random.Below(3), 3);
  }
}

}  // namespace
