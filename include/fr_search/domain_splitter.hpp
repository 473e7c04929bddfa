/**
 * @file domain_splitter.hpp
 * @brief 探索領域を互いに素な部分領域へ分割
 */
#ifndef FR_SEARCH_DOMAIN_SPLITTER_HPP
#define FR_SEARCH_DOMAIN_SPLITTER_HPP

#include "fr_search/poly_domain.hpp"
#include <vector>

namespace fr_search {

/**
 * @brief 1 つの係数軸のメタデータ
 */
struct AxisInfo {
    SeriesId series;
    size_t index;
    CoefRange range;
    int64_t size;
};

/**
 * @brief a の全軸、続いて b の全軸のメタデータを収集
 */
std::vector<AxisInfo> collect_axis_metadata(const PolyDomain& domain);

/**
 * @brief 区間を parts 個の連続した部分区間に分ける
 *
 * 部分区間のサイズ差は高々 1（先頭側が大きい）。
 * @pre 1 <= parts <= range.size()
 */
std::vector<CoefRange> split_range(CoefRange range, size_t parts);

/**
 * @brief 領域を number_of_instances 個の部分領域に分割
 *
 * 最大の軸を min(N, 軸サイズ) 個に分け、それぞれその軸だけを差し替えた領域を作る。
 * N が軸サイズより大きい場合は、残りのワーカー数を各部分領域に配分して再帰的に分割する。
 * 部分領域は互いに重ならず、和集合は元の領域に一致する。
 * 領域が 1 点しかない場合はそれ以上分割できないため、N 個より少なくなることがある。
 *
 * @throws std::invalid_argument number_of_instances が 0 の場合
 */
std::vector<PolyDomain> split_domain(const PolyDomain& domain, size_t number_of_instances);

} // namespace fr_search

#endif // FR_SEARCH_DOMAIN_SPLITTER_HPP
