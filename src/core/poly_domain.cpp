#include "fr_search/poly_domain.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fr_search {

const char* series_name(SeriesId series) {
    return series == SeriesId::A ? "a" : "b";
}

std::string format_tuple(const CoefTuple& coefs) {
    std::string s = "[";
    for (size_t i = 0; i < coefs.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(coefs[i]);
    }
    return s + "]";
}

namespace {

std::vector<CoefRange> replicate_range(int deg, CoefRange range, const char* name) {
    if (deg < 0) {
        throw std::invalid_argument(std::string("Negative degree for series ") + name);
    }
    return std::vector<CoefRange>(static_cast<size_t>(deg) + 1, range);
}

// hi - lo + 1 が int64_t に収まるか
bool size_fits(const CoefRange& r) {
    if (r.lo >= 1) return true;
    return r.hi <= r.lo + (std::numeric_limits<int64_t>::max() - 1);
}

void append_ranges(std::ostringstream& os, const std::vector<CoefRange>& ranges) {
    os << '[';
    for (size_t i = 0; i < ranges.size(); ++i) {
        if (i > 0) os << ',';
        os << '[' << ranges[i].lo << ',' << ranges[i].hi << ']';
    }
    os << ']';
}

}  // namespace

PolyDomain::PolyDomain(int a_deg, CoefRange a_range, int b_deg, CoefRange b_range,
                       bool an_leading_coef_positive, std::string checkpoint_prefix)
    : a_ranges_(replicate_range(a_deg, a_range, "a"))
    , b_ranges_(replicate_range(b_deg, b_range, "b"))
    , checkpoint_prefix_(std::move(checkpoint_prefix)) {
    // a の全係数の符号を反転した GCF は同じ値の符号違いに収束する。
    // 先頭係数がゼロをまたぐ場合は正側のみ探索する
    if (an_leading_coef_positive) {
        auto& lead = a_ranges_.back();
        if (lead.lo <= 0 && lead.hi >= 1) {
            lead.lo = 1;
        }
    }
    setup_metadata();
}

PolyDomain::PolyDomain(std::vector<CoefRange> a_ranges, std::vector<CoefRange> b_ranges,
                       std::string checkpoint_prefix)
    : a_ranges_(std::move(a_ranges))
    , b_ranges_(std::move(b_ranges))
    , checkpoint_prefix_(std::move(checkpoint_prefix)) {
    setup_metadata();
}

void PolyDomain::setup_metadata() {
    for (SeriesId series : {SeriesId::A, SeriesId::B}) {
        const auto& ranges = axis_ranges(series);
        if (ranges.empty()) {
            throw std::invalid_argument(std::string("Series ") + series_name(series) +
                                        " has no coefficient axes");
        }
        for (const auto& r : ranges) {
            if (r.lo > r.hi) {
                std::ostringstream os;
                os << "Empty coefficient range [" << r.lo << ", " << r.hi
                   << "] in series " << series_name(series);
                throw std::invalid_argument(os.str());
            }
            if (!size_fits(r)) {
                std::ostringstream os;
                os << "Coefficient range [" << r.lo << ", " << r.hi
                   << "] in series " << series_name(series) << " is too wide";
                throw std::invalid_argument(os.str());
            }
        }
    }

    a_length_ = domain_size_by_var_ranges(a_ranges_);
    b_length_ = domain_size_by_var_ranges(b_ranges_);
    total_size_ = a_length_ * b_length_;
}

const std::vector<CoefRange>& PolyDomain::axis_ranges(SeriesId series) const {
    return series == SeriesId::A ? a_ranges_ : b_ranges_;
}

int PolyDomain::degree(SeriesId series) const {
    return static_cast<int>(axis_ranges(series).size()) - 1;
}

const BigInt& PolyDomain::size(SeriesId series) const {
    return series == SeriesId::A ? a_length_ : b_length_;
}

std::vector<std::vector<int64_t>> PolyDomain::expand(SeriesId series) const {
    std::vector<std::vector<int64_t>> result;
    for (const auto& r : axis_ranges(series)) {
        const int64_t n = r.size();
        std::vector<int64_t> values;
        values.reserve(static_cast<size_t>(n));
        for (int64_t k = 0; k < n; ++k) {
            values.push_back(r.lo + k);
        }
        result.push_back(std::move(values));
    }
    return result;
}

bool PolyDomain::contains(SeriesId series, const CoefTuple& coefs) const {
    const auto& ranges = axis_ranges(series);
    if (coefs.size() != ranges.size()) return false;
    for (size_t i = 0; i < ranges.size(); ++i) {
        if (!ranges[i].contains(coefs[i])) return false;
    }
    return true;
}

CoefTuple PolyDomain::origin(SeriesId series) const {
    CoefTuple result;
    for (const auto& r : axis_ranges(series)) {
        result.push_back(r.lo);
    }
    return result;
}

PolyDomain PolyDomain::with_axis_range(SeriesId series, size_t index, CoefRange range) const {
    std::vector<CoefRange> a_ranges = a_ranges_;
    std::vector<CoefRange> b_ranges = b_ranges_;
    auto& target = (series == SeriesId::A) ? a_ranges : b_ranges;
    if (index >= target.size()) {
        throw std::out_of_range("Axis index out of range");
    }
    target[index] = range;
    return PolyDomain(std::move(a_ranges), std::move(b_ranges), checkpoint_prefix_);
}

std::string PolyDomain::describe() const {
    std::ostringstream os;
    os << "a=";
    append_ranges(os, a_ranges_);
    os << ";b=";
    append_ranges(os, b_ranges_);
    return os.str();
}

int64_t PolyDomain::lead_coef(const CoefTuple& coefs) {
    return coefs.back();
}

int PolyDomain::compact_degree(const CoefTuple& coefs) {
    for (size_t i = coefs.size(); i > 0; --i) {
        if (coefs[i - 1] != 0) {
            return static_cast<int>(i - 1);
        }
    }
    return 0;  // ゼロ多項式は次数 0 とみなす
}

BigInt PolyDomain::domain_size_by_var_ranges(const std::vector<CoefRange>& ranges) {
    BigInt size = 1;
    for (const auto& r : ranges) {
        size *= r.size();
    }
    return size;
}

} // namespace fr_search
