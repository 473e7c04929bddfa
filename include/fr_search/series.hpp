/**
 * @file series.hpp
 * @brief 多項式係数から GCF の数列項を生成
 */
#ifndef FR_SEARCH_SERIES_HPP
#define FR_SEARCH_SERIES_HPP

#include "fr_search/numeric.hpp"

namespace fr_search {

/**
 * @brief 多項式を n = 0, 1, ..., depth-1 で評価した数列
 * @param coefs 低次から順の係数
 */
Terms series_from_compact_poly(const CoefTuple& coefs, size_t depth);

/**
 * @brief 直前に要求された係数タプルの数列を保持するキャッシュ
 *
 * 外側ループの系列は内側ループの間ずっと同じなので、1 回だけ計算すればよい。
 */
class SeriesCache {
public:
    explicit SeriesCache(size_t depth) : depth_(depth) {}

    /**
     * @brief 係数タプルの数列を取得（直前と同じなら再計算しない）
     */
    const Terms& get(const CoefTuple& coefs);

    size_t depth() const { return depth_; }

    /**
     * @brief 実際に数列を計算した回数
     */
    size_t computed_count() const { return computed_count_; }

private:
    size_t depth_;
    bool valid_ = false;
    CoefTuple coefs_;
    Terms terms_;
    size_t computed_count_ = 0;
};

} // namespace fr_search

#endif // FR_SEARCH_SERIES_HPP
