/**
 * @file pslq.hpp
 * @brief PSLQ 整数関係探索
 */
#ifndef FR_SEARCH_PSLQ_HPP
#define FR_SEARCH_PSLQ_HPP

#include "fr_search/numeric.hpp"
#include <optional>
#include <vector>

namespace fr_search {

constexpr size_t PSLQ_MAX_COEFF = 1000;
constexpr size_t PSLQ_MAX_STEPS = 100;

/**
 * @brief 実数列 x に対して sum(c_i * x_i) ~ 0 となる整数 c_i を探す
 *
 * 作業精度（working_digits()）に 60 ビットを足した固定小数点整数で計算する。
 *
 * @param x 2 個以上の非ゼロの実数
 * @param tolerance |sum(c_i * x_i)| の許容誤差
 * @param max_coeff 係数の絶対値の上限（未満の関係のみ返す）
 * @param max_steps 反復回数の上限
 * @return 見つかった関係。係数上限か反復上限に達したら std::nullopt
 * @throws std::invalid_argument x が 2 個未満、またはゼロを含む場合
 */
std::optional<std::vector<BigInt>> pslq(const std::vector<BigFloat>& x,
                                        const BigFloat& tolerance,
                                        size_t max_coeff = PSLQ_MAX_COEFF,
                                        size_t max_steps = PSLQ_MAX_STEPS);

} // namespace fr_search

#endif // FR_SEARCH_PSLQ_HPP
