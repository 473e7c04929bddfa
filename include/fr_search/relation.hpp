/**
 * @file relation.hpp
 * @brief GCF の値と定数の間の有理関係
 */
#ifndef FR_SEARCH_RELATION_HPP
#define FR_SEARCH_RELATION_HPP

#include "fr_search/numeric.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fr_search {

/**
 * @brief 値 = (n0 + n1 c + n2 c^2) / (d0 + d1 c + d2 c^2)
 *
 * 係数は低次から順。
 */
struct RelationFraction {
    std::vector<BigInt> numerator;
    std::vector<BigInt> denominator;

    bool operator==(const RelationFraction& other) const {
        return numerator == other.numerator && denominator == other.denominator;
    }
};

/**
 * @brief 分子・分母を定数 c の多項式とみなして既約化
 *
 * 多項式 GCD で割り、全係数の共通因子を除き、分母の最高次の非ゼロ係数を正にする。
 * 定数倍や代数的に同値な関係（例: c / c^2 と 1 / c）は同じ形になる。
 *
 * @param degree 出力する多項式の次数（長さ degree + 1 にゼロ詰め）
 */
RelationFraction reduce_relation(std::vector<BigInt> numerator, std::vector<BigInt> denominator,
                                 size_t degree = 2);

/**
 * @brief [1, c, c^2, -v, -c v, -c^2 v] の整数関係を探し、既約化して返す
 * @param precision value の有効桁数（許容誤差は 10^(1 - precision)）
 * @return 関係が見つからない、または分子か分母がゼロの関係しかない場合は std::nullopt
 * @throws std::invalid_argument PSLQ に渡せない値（ゼロなど）の場合
 */
std::optional<RelationFraction> find_relation(const BigFloat& value, const BigFloat& constant,
                                              unsigned precision,
                                              size_t max_coeff, size_t max_steps);

/**
 * @brief 関係を "(1 + 2*zeta3) / (3*zeta3^2)" の形に整形
 */
std::string format_relation(const RelationFraction& relation, const std::string& constant_name);

} // namespace fr_search

#endif // FR_SEARCH_RELATION_HPP
