#include "fr_search/domain_splitter.hpp"
#include <algorithm>
#include <stdexcept>

namespace fr_search {

namespace {

void append_axis_metadata(std::vector<AxisInfo>& out, const PolyDomain& domain, SeriesId series) {
    const auto& ranges = domain.axis_ranges(series);
    for (size_t i = 0; i < ranges.size(); ++i) {
        out.push_back(AxisInfo{series, i, ranges[i], ranges[i].size()});
    }
}

// count 個の仕事を parts 個に配分（先頭側に余りを寄せる）
std::vector<size_t> distribute(size_t count, size_t parts) {
    std::vector<size_t> result(parts, count / parts);
    for (size_t i = 0; i < count % parts; ++i) {
        ++result[i];
    }
    return result;
}

}  // namespace

std::vector<AxisInfo> collect_axis_metadata(const PolyDomain& domain) {
    std::vector<AxisInfo> result;
    append_axis_metadata(result, domain, SeriesId::A);
    append_axis_metadata(result, domain, SeriesId::B);
    return result;
}

std::vector<CoefRange> split_range(CoefRange range, size_t parts) {
    if (parts == 0 || static_cast<int64_t>(parts) > range.size()) {
        throw std::invalid_argument("Cannot split a range into that many parts");
    }
    std::vector<CoefRange> result;
    int64_t lo = range.lo;
    for (size_t chunk : distribute(static_cast<size_t>(range.size()), parts)) {
        int64_t hi = lo + static_cast<int64_t>(chunk) - 1;
        result.push_back(CoefRange{lo, hi});
        lo = hi + 1;
    }
    return result;
}

std::vector<PolyDomain> split_domain(const PolyDomain& domain, size_t number_of_instances) {
    if (number_of_instances == 0) {
        throw std::invalid_argument("Number of instances must be positive");
    }

    auto axes = collect_axis_metadata(domain);
    const AxisInfo* biggest = &axes.front();
    for (const auto& axis : axes) {
        if (axis.size > biggest->size) {
            biggest = &axis;
        }
    }

    const auto axis_size = static_cast<size_t>(biggest->size);
    if (axis_size == 1) {
        // 1 点のみの領域
        return {domain};
    }

    size_t number_of_sub_arrays = std::min(number_of_instances, axis_size);
    std::vector<PolyDomain> sub_domains;
    for (const auto& chunk : split_range(biggest->range, number_of_sub_arrays)) {
        sub_domains.push_back(domain.with_axis_range(biggest->series, biggest->index, chunk));
    }

    if (axis_size >= number_of_instances) {
        return sub_domains;
    }

    // 1 軸では足りない: 残りのワーカー数を各部分領域に配分して再分割
    std::vector<PolyDomain> smaller_sub_domains;
    auto counts = distribute(number_of_instances, sub_domains.size());
    for (size_t i = 0; i < sub_domains.size(); ++i) {
        for (auto& d : split_domain(sub_domains[i], counts[i])) {
            smaller_sub_domains.push_back(std::move(d));
        }
    }
    return smaller_sub_domains;
}

} // namespace fr_search
