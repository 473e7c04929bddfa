/**
 * @file poly_domain.hpp
 * @brief a(n), b(n) 多項式係数の直積探索領域
 */
#ifndef FR_SEARCH_POLY_DOMAIN_HPP
#define FR_SEARCH_POLY_DOMAIN_HPP

#include "fr_search/numeric.hpp"
#include <string>
#include <vector>

namespace fr_search {

/**
 * @brief 係数軸の閉区間 [lo, hi]
 *
 * PolyDomain は size() が int64_t に収まらない区間を受け付けない。
 */
struct CoefRange {
    int64_t lo;
    int64_t hi;

    int64_t size() const { return hi - lo + 1; }
    bool contains(int64_t v) const { return lo <= v && v <= hi; }

    bool operator==(const CoefRange& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const CoefRange& other) const { return !(*this == other); }
};

/**
 * @brief 係数系列の識別子
 */
enum class SeriesId {
    A,  // a(n)
    B   // b(n)
};

/**
 * @brief 系列名（"a" / "b"）を取得
 */
const char* series_name(SeriesId series);

/**
 * @brief 係数タプルを "[1, -2, 3]" の形に整形
 */
std::string format_tuple(const CoefTuple& coefs);

/**
 * @brief 探索領域（a と b の係数軸の直積）
 *
 * 各軸は独立した整数閉区間。a は (a_deg + 1) 軸、b は (b_deg + 1) 軸を持つ。
 * 構築後は不変で、派生値（各系列のサイズ、総サイズ）は構築時に計算する。
 */
class PolyDomain {
public:
    /**
     * @brief 全係数に同じ区間を与えて領域を作成
     * @param a_deg a(n) の次数
     * @param a_range a(n) 各係数の区間
     * @param b_deg b(n) の次数
     * @param b_range b(n) 各係数の区間
     * @param an_leading_coef_positive true なら a の先頭係数を正に制限（符号反転の重複を除く）
     * @param checkpoint_prefix チェックポイントファイル名の接頭辞
     */
    PolyDomain(int a_deg, CoefRange a_range, int b_deg, CoefRange b_range,
               bool an_leading_coef_positive = true,
               std::string checkpoint_prefix = "");

    /**
     * @brief 軸ごとの区間を明示して領域を作成
     * @throws std::invalid_argument 空の系列、空の区間、または幅が int64_t を超える区間を含む場合
     */
    PolyDomain(std::vector<CoefRange> a_ranges, std::vector<CoefRange> b_ranges,
               std::string checkpoint_prefix = "");

    /**
     * @brief 系列の軸区間（低次から順）
     */
    const std::vector<CoefRange>& axis_ranges(SeriesId series) const;

    /**
     * @brief 系列の多項式次数（軸数 - 1）
     */
    int degree(SeriesId series) const;

    /**
     * @brief 系列の組み合わせ数（各軸サイズの積）
     */
    const BigInt& size(SeriesId series) const;

    /**
     * @brief 領域全体の組み合わせ数（a のサイズ × b のサイズ）
     */
    const BigInt& total_size() const { return total_size_; }

    /**
     * @brief 各軸の値を列挙したリストを作成
     * @note 各軸のサイズに比例したメモリを使う。呼び出し側で妥当なサイズを保証すること
     */
    std::vector<std::vector<int64_t>> expand(SeriesId series) const;

    /**
     * @brief 係数タプルが系列の領域内にあるか
     */
    bool contains(SeriesId series, const CoefTuple& coefs) const;

    /**
     * @brief 系列の起点（各軸の最小値）
     */
    CoefTuple origin(SeriesId series) const;

    /**
     * @brief 1 軸だけ区間を差し替えた新しい領域を作成
     * @throws std::out_of_range 軸インデックスが範囲外の場合
     */
    PolyDomain with_axis_range(SeriesId series, size_t index, CoefRange range) const;

    const std::string& checkpoint_prefix() const { return checkpoint_prefix_; }

    /**
     * @brief 区間の正規表現（例: "a=[[1,3],[-3,3]];b=[[-5,5]]"）
     *
     * チェックポイントの識別子の計算とログ出力に使う。
     */
    std::string describe() const;

    /**
     * @brief 先頭（最高次）係数を取得
     * @pre coefs が空でないこと
     */
    static int64_t lead_coef(const CoefTuple& coefs);

    /**
     * @brief 先頭のゼロ係数を除いた次数
     *
     * 最高次から走査し、最初の非ゼロ係数のインデックスを返す。
     * 全係数がゼロの場合は 0。
     */
    static int compact_degree(const CoefTuple& coefs);

    /**
     * @brief 区間列の組み合わせ数
     */
    static BigInt domain_size_by_var_ranges(const std::vector<CoefRange>& ranges);

    bool operator==(const PolyDomain& other) const {
        return a_ranges_ == other.a_ranges_ && b_ranges_ == other.b_ranges_;
    }

private:
    void setup_metadata();

    std::vector<CoefRange> a_ranges_;
    std::vector<CoefRange> b_ranges_;
    std::string checkpoint_prefix_;

    // 派生値
    BigInt a_length_;
    BigInt b_length_;
    BigInt total_size_;
};

} // namespace fr_search

#endif // FR_SEARCH_POLY_DOMAIN_HPP
