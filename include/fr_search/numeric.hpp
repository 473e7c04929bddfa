/**
 * @file numeric.hpp
 * @brief 多倍長整数・多倍長浮動小数点型と作業精度の管理
 */
#ifndef FR_SEARCH_NUMERIC_HPP
#define FR_SEARCH_NUMERIC_HPP

#include <boost/multiprecision/gmp.hpp>
#include <cstdint>
#include <vector>

namespace fr_search {

/// 多倍長整数（GMP mpz）
using BigInt = boost::multiprecision::mpz_int;

/// 可変精度の多倍長浮動小数点（GMP mpf）。精度は十進有効桁数で指定する
using BigFloat = boost::multiprecision::mpf_float;

/// 多項式係数（低次から順: index k が n^k の係数）
using CoefTuple = std::vector<int64_t>;

/// 数列の項（a_0, a_1, ...）
using Terms = std::vector<BigInt>;

/**
 * @brief BigFloat の既定作業精度（十進有効桁数）を設定
 */
void set_working_digits(unsigned digits);

/**
 * @brief BigFloat の既定作業精度（十進有効桁数）を取得
 */
unsigned working_digits();

/**
 * @brief スコープ内だけ作業精度を変更する
 *
 * デストラクタで元の精度に戻す。
 */
class ScopedDigits {
public:
    explicit ScopedDigits(unsigned digits);
    ~ScopedDigits();

    ScopedDigits(const ScopedDigits&) = delete;
    ScopedDigits& operator=(const ScopedDigits&) = delete;

private:
    unsigned saved_;
};

/**
 * @brief 整数係数多項式を n で評価（Horner 法）
 * @param coefs 低次から順の係数
 */
BigInt eval_poly(const CoefTuple& coefs, int64_t n);

} // namespace fr_search

#endif // FR_SEARCH_NUMERIC_HPP
