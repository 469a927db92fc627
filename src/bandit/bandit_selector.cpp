#include "bandit/bandit_selector.h"

#include <algorithm>
#include <utility>

#include "bandit/reliability_math.h"

namespace adaptive_engine {

namespace {

std::uint64_t SeedFromConfig(const BanditConfig& config) {
  if (config.rng_seed != 0) {
    return static_cast<std::uint64_t>(config.rng_seed);
  }
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32U) ^
         static_cast<std::uint64_t>(device());
}

void SortDescending(std::vector<RankedStrategy>* ranked) {
  std::stable_sort(ranked->begin(), ranked->end(),
                   [](const RankedStrategy& lhs, const RankedStrategy& rhs) {
                     return lhs.score > rhs.score;
                   });
}

}  // namespace

BanditSelector::BanditSelector(const ReliabilityStore& store, BanditConfig config)
    : store_(store), config_(std::move(config)), rng_(SeedFromConfig(config_)) {}

std::vector<RankedStrategy> BanditSelector::RankStats(
    const std::vector<StrategyStat>& stats) {
  std::vector<RankedStrategy> ranked;
  ranked.reserve(stats.size());
  {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    for (const auto& stat : stats) {
      ranked.push_back(RankedStrategy{
          stat.name,
          SampleBeta(static_cast<double>(stat.alpha),
                     static_cast<double>(stat.beta), rng_)});
    }
  }
  SortDescending(&ranked);
  return ranked;
}

bool BanditSelector::RankStrategies(std::vector<RankedStrategy>* out_ranked,
                                    std::string* out_error) {
  if (out_ranked == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_ranked 为空";
    }
    return false;
  }
  std::vector<StrategyStat> stats;
  if (!store_.ListReadableStrategies(&stats, out_error)) {
    return false;
  }
  *out_ranked = RankStats(stats);
  return true;
}

bool BanditSelector::RankStrategiesByExpectation(
    std::vector<RankedStrategy>* out_ranked,
    std::string* out_error) const {
  if (out_ranked == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_ranked 为空";
    }
    return false;
  }
  std::vector<StrategyStat> stats;
  if (!store_.ListReadableStrategies(&stats, out_error)) {
    return false;
  }
  out_ranked->clear();
  for (const auto& stat : stats) {
    out_ranked->push_back(RankedStrategy{
        stat.name,
        BetaMean(static_cast<double>(stat.alpha), static_cast<double>(stat.beta))});
  }
  SortDescending(out_ranked);
  return true;
}

bool BanditSelector::ScoreSource(const std::string& name,
                                 SourceScore* out_score,
                                 std::string* out_error) const {
  if (out_score == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_score 为空";
    }
    return false;
  }
  std::vector<SourceStat> sources;
  if (!store_.ListReadableSources(&sources, out_error)) {
    return false;
  }

  SourceScore result;
  result.name = name;
  std::int64_t wins = 0;
  for (const auto& source : sources) {
    result.total_observations += source.wins + source.losses;
    if (source.name == name) {
      wins = source.wins;
      result.observations = source.wins + source.losses;
      result.grade = source.grade;
    }
  }
  result.cold_start = result.observations < kMinGradeSamples;
  if (result.observations == 0) {
    result.score = config_.new_source_score;
  } else {
    result.score = Ucb1Score(wins, result.observations, result.total_observations,
                             config_.ucb_exploration);
  }
  *out_score = result;
  return true;
}

}  // namespace adaptive_engine
