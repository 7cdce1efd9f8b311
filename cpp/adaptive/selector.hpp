#ifndef ADAPTIVE_SELECTOR_HPP
#define ADAPTIVE_SELECTOR_HPP

#include <set>
#include <string>
#include <vector>

#include "catalog/catalog.hpp"
#include "util/random.hpp"

namespace adaptive {

struct Config {
  double initial_difficulty = 0.5;
  double adjustment_factor = 0.3;
  double min_difficulty = 0.1;
  double max_difficulty = 0.9;
  double confidence_threshold = 0.8;
  uint32_t min_questions = 10;
  uint32_t max_questions = 50;
};

struct HistoryEntry {
  std::string question_id;
  bool is_correct = false;
  int64_t response_millis = 0;
  double difficulty = 0;
  double ability_before = 0;
};

struct State {
  double ability = 0.5;
  double difficulty = 0.5;
  double confidence = 0;
  uint32_t answered = 0;
  uint32_t correct = 0;
  std::vector<double> difficulty_history;
  std::vector<double> ability_history;
  std::vector<HistoryEntry> history;
  bool complete = false;
  std::string completion_reason;
};

struct Analysis {
  // 1 minus the variance of correctness.
  double consistency = 0;
  // "improving", "declining" or "stable".
  std::string trend = "stable";
  // "fast", "slow", "inconsistent" or "normal".
  std::string response_pattern = "normal";
};

struct Results {
  double ability = 0;
  double confidence = 0;
  uint32_t answered = 0;
  uint32_t correct = 0;
  double accuracy = 0;
  int64_t average_response_millis = 0;
  std::vector<double> difficulty_progression;
  std::vector<double> ability_progression;
  Analysis analysis;
  std::string completion_reason;
  uint32_t questions_remaining = 0;
};

// Completion reasons.
extern const char* const kMaximumQuestionsReached;
extern const char* const kConfidenceThresholdReached;
extern const char* const kAbilityStabilized;

// Probability of a correct answer under a logistic model.
double Probability(double ability, double difficulty);

// Population variance, 0 for fewer than two values.
double Variance(const std::vector<double>& values);

// Ability-driven question selection. Stateless: everything lives in State,
// which the caller owns and persists.
class Selector {
 public:
  explicit Selector(Config config) : config_(config) {}

  State Initialize() const;

  // The question of the pool closest to the current difficulty that is not
  // in asked, nullptr if there is none.
  const catalog::Question* SelectNext(
      const State& state, const std::vector<catalog::Question>& pool,
      const std::set<std::string>& asked) const;

  // Feeds one answer: updates ability, difficulty and confidence, then
  // evaluates termination.
  void ProcessAnswer(State* state, const catalog::Question& question,
                     bool is_correct, int64_t response_millis,
                     util::Random* random) const;

  // Sets reason and returns true when the test should stop.
  bool ShouldTerminate(const State& state, std::string* reason) const;

  Analysis Analyze(const State& state) const;

  uint32_t EstimateRemaining(const State& state) const;

  Results Summarize(const State& state) const;

  const Config& config() const { return config_; }

 private:
  double UpdatedAbility(const State& state, double difficulty,
                        bool is_correct, int64_t response_millis) const;
  double Confidence(const State& state) const;

  Config config_;
};

}  // namespace adaptive

#endif
