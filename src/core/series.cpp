#include "fr_search/series.hpp"

namespace fr_search {

Terms series_from_compact_poly(const CoefTuple& coefs, size_t depth) {
    Terms terms;
    terms.reserve(depth);
    for (size_t n = 0; n < depth; ++n) {
        terms.push_back(eval_poly(coefs, static_cast<int64_t>(n)));
    }
    return terms;
}

const Terms& SeriesCache::get(const CoefTuple& coefs) {
    if (!valid_ || coefs != coefs_) {
        terms_ = series_from_compact_poly(coefs, depth_);
        coefs_ = coefs;
        valid_ = true;
        ++computed_count_;
    }
    return terms_;
}

} // namespace fr_search
