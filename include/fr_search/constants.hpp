/**
 * @file constants.hpp
 * @brief 関係探索の対象とする数学定数
 */
#ifndef FR_SEARCH_CONSTANTS_HPP
#define FR_SEARCH_CONSTANTS_HPP

#include "fr_search/numeric.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fr_search {

/**
 * @brief 名前から定数値を作業精度で計算する
 *
 * 対応する名前: pi, e, zeta3, catalan, euler, ln2, sqrt2, golden
 */
class ConstantRegistry {
public:
    /**
     * @brief 定数値を取得
     * @return 未知の名前なら std::nullopt
     */
    static std::optional<BigFloat> value(const std::string& name);

    static bool contains(const std::string& name);

    static const std::vector<std::string>& names();
};

} // namespace fr_search

#endif // FR_SEARCH_CONSTANTS_HPP
