#include "fr_search/evaluator.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace fr_search {

namespace {

// 2 つの値が一致する小数桁数（作業精度で打ち切り）
unsigned agreement_digits(const BigFloat& a, const BigFloat& b) {
    const unsigned limit = working_digits();
    BigFloat diff = a - b;
    diff = abs(diff);
    if (diff == 0) {
        return limit;
    }
    BigFloat digits = -log10(diff);
    if (digits <= 0) {
        return 0;
    }
    if (digits >= limit) {
        return limit;
    }
    BigFloat whole = floor(digits);
    return static_cast<unsigned>(whole.convert_to<unsigned long>());
}

}  // namespace

ConvergentEvaluator::ConvergentEvaluator(size_t min_depth, size_t max_depth, unsigned target_digits)
    : min_depth_(min_depth)
    , max_depth_(max_depth)
    , target_digits_(target_digits) {
    if (min_depth_ == 0 || max_depth_ < min_depth_) {
        throw std::invalid_argument("Evaluator depths must satisfy 0 < min_depth <= max_depth");
    }
}

EvaluatedValue ConvergentEvaluator::evaluate(const CoefTuple& an_coef, const CoefTuple& bn_coef) {
    BigInt prev_q = 0;
    BigInt q = 1;
    BigInt prev_p = 1;
    BigInt p = eval_poly(an_coef, 0);

    std::optional<EvaluatedValue> result;
    std::optional<BigFloat> previous;
    size_t next_depth = min_depth_;

    for (size_t n = 1; next_depth <= max_depth_; ++n) {
        BigInt a_n = eval_poly(an_coef, static_cast<int64_t>(n));
        BigInt b_n = eval_poly(bn_coef, static_cast<int64_t>(n));

        BigInt next_q = a_n * q + b_n * prev_q;
        BigInt next_p = a_n * p + b_n * prev_p;
        prev_q.swap(q);
        q.swap(next_q);
        prev_p.swap(p);
        p.swap(next_p);

        if (n != next_depth) {
            continue;
        }
        next_depth *= 2;
        if (q == 0) {
            continue;
        }

        BigFloat value = BigFloat(p) / BigFloat(q);
        unsigned precision = previous ? agreement_digits(value, *previous) : 0;
        result = EvaluatedValue{value, precision, n};
        if (precision >= target_digits_) {
            break;
        }
        previous = std::move(value);
    }

    if (!result) {
        throw std::domain_error("Convergent denominator vanished at every evaluated depth");
    }
    return *result;
}

} // namespace fr_search
