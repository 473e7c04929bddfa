#include "fr_search/numeric.hpp"

namespace fr_search {

void set_working_digits(unsigned digits) {
    BigFloat::default_precision(digits);
}

unsigned working_digits() {
    return BigFloat::default_precision();
}

ScopedDigits::ScopedDigits(unsigned digits)
    : saved_(working_digits()) {
    set_working_digits(digits);
}

ScopedDigits::~ScopedDigits() {
    set_working_digits(saved_);
}

BigInt eval_poly(const CoefTuple& coefs, int64_t n) {
    BigInt value = 0;
    for (auto it = coefs.rbegin(); it != coefs.rend(); ++it) {
        value *= n;
        value += *it;
    }
    return value;
}

} // namespace fr_search
