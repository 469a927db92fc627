#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace adaptive_engine {

/// 评级所需最小样本数；不足时评级固定为中性 "C"。
inline constexpr std::int64_t kMinGradeSamples = 5;
/// 冷启动信号源（样本不足）的中性存储分数。
inline constexpr double kColdStartSourceScore = 50.0;
/// UCB 分数刻度：胜率与探索奖励按 0-100 输出。
inline constexpr double kUcbScale = 100.0;

/**
 * @brief 由胜负计数推导评级（纯函数）
 *
 * 样本 >= kMinGradeSamples 时按胜率：
 * S > 90%，A+ [80%,90%]，A [70%,80%)，B [60%,70%)，C [50%,60%)，D [40%,50%)，F < 40%。
 */
std::string GradeForRecord(std::int64_t wins, std::int64_t losses);

/**
 * @brief UCB1 分数（0-100）
 *
 * score = 100 * (win_rate + sqrt(exploration * ln(total) / n))，截断到 [0,100]。
 * `total` 下限截断为 1，`n` 必须 > 0（调用方负责零样本分支）。
 */
double Ucb1Score(std::int64_t wins,
                 std::int64_t observations,
                 std::int64_t total_observations,
                 double exploration);

/// 存储侧分数：样本不足 kMinGradeSamples 时返回冷启动中性分，否则为 UCB1。
double StoredSourceScore(std::int64_t wins,
                         std::int64_t losses,
                         std::int64_t total_observations,
                         double exploration);

/// Beta(alpha, beta) 均值。
double BetaMean(double alpha, double beta);

/// 通过两次 Gamma 抽样得到一次 Beta(alpha, beta) 样本。
double SampleBeta(double alpha, double beta, std::mt19937_64& rng);

}  // namespace adaptive_engine
