/**
 * @file evaluator.hpp
 * @brief GCF の値を高い深さで計算する
 */
#ifndef FR_SEARCH_EVALUATOR_HPP
#define FR_SEARCH_EVALUATOR_HPP

#include "fr_search/numeric.hpp"

namespace fr_search {

/**
 * @brief 計算した値と達成した精度
 */
struct EvaluatedValue {
    BigFloat value;
    unsigned precision;  ///< 有効桁数（十進）
    size_t depth;        ///< 値を計算した深さ
};

/**
 * @brief GCF の値を計算するインターフェース
 *
 * 深さ・精度をどこまで上げるかは実装が決める。
 */
class ValueEvaluator {
public:
    virtual ~ValueEvaluator() = default;

    /**
     * @brief a(n), b(n) の係数から GCF の値を計算
     */
    virtual EvaluatedValue evaluate(const CoefTuple& an_coef, const CoefTuple& bn_coef) = 0;
};

/**
 * @brief 近似分数 p/q を深さを倍々にして計算する評価器
 *
 * min_depth から始めて深さを 2 倍ずつ増やし、直前の深さの値との差から精度を見積もる。
 * target_digits 桁に達するか max_depth を越えたら止める。
 */
class ConvergentEvaluator : public ValueEvaluator {
public:
    ConvergentEvaluator(size_t min_depth, size_t max_depth, unsigned target_digits);

    /**
     * @throws std::domain_error 最終深さで q = 0 になった場合
     */
    EvaluatedValue evaluate(const CoefTuple& an_coef, const CoefTuple& bn_coef) override;

private:
    size_t min_depth_;
    size_t max_depth_;
    unsigned target_digits_;
};

} // namespace fr_search

#endif // FR_SEARCH_EVALUATOR_HPP
