#include "bandit/reliability_math.h"

#include <algorithm>
#include <cmath>

namespace adaptive_engine {

std::string GradeForRecord(std::int64_t wins, std::int64_t losses) {
  const std::int64_t total = wins + losses;
  if (total < kMinGradeSamples) {
    return "C";
  }
  const double win_rate = static_cast<double>(wins) / static_cast<double>(total);
  if (win_rate > 0.90) {
    return "S";
  }
  if (win_rate >= 0.80) {
    return "A+";
  }
  if (win_rate >= 0.70) {
    return "A";
  }
  if (win_rate >= 0.60) {
    return "B";
  }
  if (win_rate >= 0.50) {
    return "C";
  }
  if (win_rate >= 0.40) {
    return "D";
  }
  return "F";
}

double Ucb1Score(std::int64_t wins,
                 std::int64_t observations,
                 std::int64_t total_observations,
                 double exploration) {
  const double n = static_cast<double>(std::max<std::int64_t>(observations, 1));
  const double total =
      static_cast<double>(std::max<std::int64_t>(total_observations, 1));
  const double win_rate = static_cast<double>(wins) / n;
  const double bonus = std::sqrt(exploration * std::log(total) / n);
  return std::clamp((win_rate + bonus) * kUcbScale, 0.0, kUcbScale);
}

double StoredSourceScore(std::int64_t wins,
                         std::int64_t losses,
                         std::int64_t total_observations,
                         double exploration) {
  const std::int64_t observations = wins + losses;
  if (observations < kMinGradeSamples) {
    return kColdStartSourceScore;
  }
  return Ucb1Score(wins, observations,
                   std::max(total_observations, observations), exploration);
}

double BetaMean(double alpha, double beta) {
  if (alpha + beta <= 0.0) {
    return 0.5;
  }
  return alpha / (alpha + beta);
}

double SampleBeta(double alpha, double beta, std::mt19937_64& rng) {
  std::gamma_distribution<double> gamma_a(alpha, 1.0);
  std::gamma_distribution<double> gamma_b(beta, 1.0);
  const double x = gamma_a(rng);
  const double y = gamma_b(rng);
  if (x + y <= 0.0) {
    return 0.5;
  }
  return x / (x + y);
}

}  // namespace adaptive_engine
