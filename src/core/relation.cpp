#include "fr_search/relation.hpp"
#include "fr_search/pslq.hpp"
#include <algorithm>
#include <sstream>

namespace fr_search {

namespace {

using Poly = std::vector<BigInt>;  // 低次から順

void trim(Poly& p) {
    while (!p.empty() && p.back() == 0) {
        p.pop_back();
    }
}

BigInt content(const Poly& p) {
    BigInt c = 0;
    for (const auto& v : p) {
        c = boost::multiprecision::gcd(c, v);
    }
    return c;
}

// 内容で割り、最高次係数を正にする
Poly primitive_part(Poly p) {
    trim(p);
    if (p.empty()) return p;
    BigInt c = content(p);
    if (p.back() < 0) c = -c;
    for (auto& v : p) {
        v /= c;
    }
    return p;
}

// lc(b)^k * a を b で割った余り
Poly pseudo_remainder(Poly a, const Poly& b) {
    trim(a);
    while (a.size() >= b.size()) {
        const BigInt lead_a = a.back();
        const size_t shift = a.size() - b.size();
        for (auto& v : a) {
            v *= b.back();
        }
        for (size_t i = 0; i < b.size(); ++i) {
            a[i + shift] -= lead_a * b[i];
        }
        trim(a);
    }
    return a;
}

Poly poly_gcd(Poly a, Poly b) {
    a = primitive_part(std::move(a));
    b = primitive_part(std::move(b));
    while (!b.empty()) {
        Poly r = primitive_part(pseudo_remainder(a, b));
        a = std::move(b);
        b = std::move(r);
    }
    return a;
}

// b が a を割り切ることを前提とした整数係数の除算
Poly exact_div(Poly a, const Poly& b) {
    trim(a);
    if (a.size() < b.size()) return Poly{};
    Poly q(a.size() - b.size() + 1);
    while (!a.empty() && a.size() >= b.size()) {
        const size_t shift = a.size() - b.size();
        BigInt t = a.back() / b.back();
        q[shift] = t;
        for (size_t i = 0; i < b.size(); ++i) {
            a[i + shift] -= t * b[i];
        }
        trim(a);
    }
    return q;
}

void append_term(std::ostringstream& os, const BigInt& coef, size_t power,
                 const std::string& name, bool& first) {
    if (coef == 0) return;
    BigInt magnitude = abs(coef);
    if (first) {
        if (coef < 0) os << '-';
    } else {
        os << (coef < 0 ? " - " : " + ");
    }
    first = false;
    if (power == 0) {
        os << magnitude;
        return;
    }
    if (magnitude != 1) os << magnitude << '*';
    os << name;
    if (power > 1) os << '^' << power;
}

std::string format_poly(const Poly& p, const std::string& name) {
    std::ostringstream os;
    bool first = true;
    for (size_t k = 0; k < p.size(); ++k) {
        append_term(os, p[k], k, name, first);
    }
    if (first) os << '0';
    return os.str();
}

bool is_zero(const Poly& p) {
    return std::all_of(p.begin(), p.end(), [](const BigInt& v) { return v == 0; });
}

}  // namespace

RelationFraction reduce_relation(std::vector<BigInt> numerator, std::vector<BigInt> denominator,
                                 size_t degree) {
    trim(numerator);
    trim(denominator);

    Poly g = poly_gcd(numerator, denominator);
    if (g.size() > 1) {
        numerator = exact_div(std::move(numerator), g);
        denominator = exact_div(std::move(denominator), g);
    }

    BigInt c = boost::multiprecision::gcd(content(numerator), content(denominator));
    if (c > 1) {
        for (auto& v : numerator) v /= c;
        for (auto& v : denominator) v /= c;
    }

    const Poly& sign_source = denominator.empty() ? numerator : denominator;
    if (!sign_source.empty() && sign_source.back() < 0) {
        for (auto& v : numerator) v = -v;
        for (auto& v : denominator) v = -v;
    }

    numerator.resize(std::max(numerator.size(), degree + 1));
    denominator.resize(std::max(denominator.size(), degree + 1));
    return RelationFraction{std::move(numerator), std::move(denominator)};
}

std::optional<RelationFraction> find_relation(const BigFloat& value, const BigFloat& constant,
                                              unsigned precision,
                                              size_t max_coeff, size_t max_steps) {
    std::vector<BigFloat> x;
    x.emplace_back(1);
    x.push_back(constant);
    x.push_back(constant * constant);
    x.push_back(-value);
    x.push_back(-constant * value);
    x.push_back(-(constant * constant) * value);

    BigFloat exponent(1 - static_cast<long>(precision));
    BigFloat tol = pow(BigFloat(10), exponent);

    auto relation = pslq(x, tol, max_coeff, max_steps);
    if (!relation) {
        return std::nullopt;
    }
    // 同じ値に対して複数の関係が見つかりうる（例: c/c^2 = 1/c）ので既約化する
    std::vector<BigInt> num(relation->begin(), relation->begin() + 3);
    std::vector<BigInt> den(relation->begin() + 3, relation->end());
    // 片側がゼロなら定数自身の恒等式（例: sqrt2^2 - 2 = 0）で、値については何も言っていない
    if (is_zero(num) || is_zero(den)) {
        return std::nullopt;
    }
    return reduce_relation(std::move(num), std::move(den), 2);
}

std::string format_relation(const RelationFraction& relation, const std::string& constant_name) {
    return "(" + format_poly(relation.numerator, constant_name) + ") / (" +
           format_poly(relation.denominator, constant_name) + ")";
}

} // namespace fr_search
