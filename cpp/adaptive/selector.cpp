#include "adaptive/selector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

const constexpr size_t kWindow = 5;
const constexpr double kRecentPenalty = 0.2;
const constexpr double kMinAbility = 0.05;
const constexpr double kMaxAbility = 0.95;
const constexpr double kTimeBonus = 0.05;
const constexpr double kStep = 0.05;
const constexpr double kBaseResponseMillis = 30000;
const constexpr double kResponseMillisPerDifficulty = 60000;
const constexpr uint32_t kMinAnswersForStability = 10;
const constexpr double kStableVariance = 0.01;

double Clamp(double v, double lo, double hi) {
  return std::min(hi, std::max(lo, v));
}

template <typename T>
std::vector<T> Last(const std::vector<T>& v, size_t n) {
  return std::vector<T>(v.end() - std::min(n, v.size()), v.end());
}

double Mean(const std::vector<double>& values) {
  if (values.empty()) return 0;
  double sum = 0;
  for (double v : values) sum += v;
  return sum / values.size();
}

}  // namespace

namespace adaptive {

const char* const kMaximumQuestionsReached = "maximum_questions_reached";
const char* const kConfidenceThresholdReached = "confidence_threshold_reached";
const char* const kAbilityStabilized = "ability_stabilized";

double Probability(double ability, double difficulty) {
  return 1 / (1 + std::exp(-(ability - difficulty)));
}

double Variance(const std::vector<double>& values) {
  if (values.size() < 2) return 0;
  double mean = Mean(values);
  double sum = 0;
  for (double v : values) sum += (v - mean) * (v - mean);
  return sum / values.size();
}

State Selector::Initialize() const {
  State state;
  state.ability = config_.initial_difficulty;
  state.difficulty = config_.initial_difficulty;
  state.difficulty_history.push_back(config_.initial_difficulty);
  state.ability_history.push_back(config_.initial_difficulty);
  return state;
}

const catalog::Question* Selector::SelectNext(
    const State& state, const std::vector<catalog::Question>& pool,
    const std::set<std::string>& asked) const {
  std::set<std::string> recent;
  for (const HistoryEntry& entry : Last(state.history, kWindow)) {
    recent.insert(entry.question_id);
  }
  const catalog::Question* best = nullptr;
  double best_distance = std::numeric_limits<double>::infinity();
  for (const catalog::Question& question : pool) {
    if (asked.count(question.id)) continue;
    double distance = std::abs(question.difficulty - state.difficulty);
    if (recent.count(question.id)) distance += kRecentPenalty;
    if (distance < best_distance) {
      best_distance = distance;
      best = &question;
    }
  }
  return best;
}

double Selector::UpdatedAbility(const State& state, double difficulty,
                                bool is_correct,
                                int64_t response_millis) const {
  double expected = Probability(state.ability, difficulty);
  double observed = is_correct ? 1 : 0;
  double adjustment =
      std::abs(observed - expected) * config_.adjustment_factor;
  double ability = state.ability + (is_correct ? adjustment : -adjustment);

  double expected_millis =
      kBaseResponseMillis + difficulty * kResponseMillisPerDifficulty;
  double ratio = response_millis / expected_millis;
  if (ratio < 0.5) {
    ability += kTimeBonus;
  } else if (ratio > 2) {
    ability -= kTimeBonus;
  }
  return Clamp(ability, kMinAbility, kMaxAbility);
}

double Selector::Confidence(const State& state) const {
  if (state.answered < 3) return 0;
  double stability = std::max(
      0.0, 1 - Variance(Last(state.ability_history, kWindow)) * 10);

  std::vector<HistoryEntry> recent = Last(state.history, kWindow);
  double match = 0;
  double correct = 0;
  for (const HistoryEntry& entry : recent) {
    double observed = entry.is_correct ? 1 : 0;
    match += 1 - std::abs(observed -
                          Probability(entry.ability_before, entry.difficulty));
    correct += observed;
  }
  match /= recent.size();
  double rate = correct / recent.size();
  double uncertainty = std::min(rate, 1 - rate);
  return Clamp(0.4 * stability + 0.4 * match + 0.2 * uncertainty, 0, 1);
}

void Selector::ProcessAnswer(State* state, const catalog::Question& question,
                             bool is_correct, int64_t response_millis,
                             util::Random* random) const {
  HistoryEntry entry;
  entry.question_id = question.id;
  entry.is_correct = is_correct;
  entry.response_millis = response_millis;
  entry.difficulty = question.difficulty;
  entry.ability_before = state->ability;
  state->history.push_back(entry);
  state->answered++;
  if (is_correct) state->correct++;

  state->ability = UpdatedAbility(*state, question.difficulty, is_correct,
                                  response_millis);
  state->ability_history.push_back(state->ability);

  // Explore more while the estimate is uncertain.
  double noise_range = state->confidence < 0.5 ? 0.2 : 0.1;
  double difficulty =
      state->ability + (random->Uniform() - 0.5) * noise_range;
  difficulty += is_correct ? kStep : -kStep;
  state->difficulty =
      Clamp(difficulty, config_.min_difficulty, config_.max_difficulty);
  state->difficulty_history.push_back(state->difficulty);

  state->confidence = Confidence(*state);

  std::string reason;
  if (ShouldTerminate(*state, &reason)) {
    state->complete = true;
    state->completion_reason = reason;
  }
}

bool Selector::ShouldTerminate(const State& state, std::string* reason) const {
  if (state.answered >= config_.max_questions) {
    *reason = kMaximumQuestionsReached;
    return true;
  }
  if (state.answered < config_.min_questions) return false;
  if (state.confidence >= config_.confidence_threshold) {
    *reason = kConfidenceThresholdReached;
    return true;
  }
  if (state.answered >= kMinAnswersForStability &&
      Variance(Last(state.ability_history, kWindow)) < kStableVariance) {
    *reason = kAbilityStabilized;
    return true;
  }
  return false;
}

Analysis Selector::Analyze(const State& state) const {
  Analysis analysis;
  if (state.history.size() < kWindow) return analysis;

  std::vector<double> correctness;
  std::vector<double> times;
  for (const HistoryEntry& entry : state.history) {
    correctness.push_back(entry.is_correct ? 1 : 0);
    times.push_back(entry.response_millis);
  }
  analysis.consistency = Clamp(1 - Variance(correctness), 0, 1);

  const std::vector<double>& abilities = state.ability_history;
  size_t half = abilities.size() / 2;
  double first = Mean(std::vector<double>(abilities.begin(),
                                          abilities.begin() + half));
  double second =
      Mean(std::vector<double>(abilities.begin() + half, abilities.end()));
  if (second > first + 0.05) {
    analysis.trend = "improving";
  } else if (second < first - 0.05) {
    analysis.trend = "declining";
  }

  double average = Mean(times);
  if (average < 20000) {
    analysis.response_pattern = "fast";
  } else if (average > 60000) {
    analysis.response_pattern = "slow";
  } else if (Variance(times) > 1e9) {
    analysis.response_pattern = "inconsistent";
  }
  return analysis;
}

uint32_t Selector::EstimateRemaining(const State& state) const {
  if (state.complete) return 0;
  if (state.answered < config_.min_questions) {
    return config_.min_questions - state.answered;
  }
  double gap = std::max(0.0, config_.confidence_threshold - state.confidence);
  uint32_t estimate = static_cast<uint32_t>(std::ceil(gap * 20));
  uint32_t left = config_.max_questions > state.answered
                      ? config_.max_questions - state.answered
                      : 0;
  return std::min(estimate, left);
}

Results Selector::Summarize(const State& state) const {
  Results results;
  results.ability = state.ability;
  results.confidence = state.confidence;
  results.answered = state.answered;
  results.correct = state.correct;
  results.accuracy =
      state.answered ? static_cast<double>(state.correct) / state.answered : 0;
  int64_t total_millis = 0;
  for (const HistoryEntry& entry : state.history) {
    total_millis += entry.response_millis;
  }
  results.average_response_millis =
      state.history.empty() ? 0 : total_millis / state.history.size();
  results.difficulty_progression = state.difficulty_history;
  results.ability_progression = state.ability_history;
  results.analysis = Analyze(state);
  results.completion_reason =
      state.complete ? state.completion_reason : "manual_completion";
  results.questions_remaining = EstimateRemaining(state);
  return results;
}

}  // namespace adaptive
