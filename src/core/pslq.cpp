#include "fr_search/pslq.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fr_search {

namespace {

using Matrix = std::vector<std::vector<BigInt>>;

// floor(a / b)
BigInt floor_div(const BigInt& a, const BigInt& b) {
    BigInt r;
    mpz_fdiv_q(r.backend().data(), a.backend().data(), b.backend().data());
    return r;
}

// floor(sqrt(x)) を prec ビットの固定小数点で
BigInt sqrt_fixed(const BigInt& x, unsigned prec) {
    BigInt shifted = x << prec;
    BigInt r;
    mpz_sqrt(r.backend().data(), shifted.backend().data());
    return r;
}

BigInt round_fixed(const BigInt& x, unsigned prec) {
    BigInt half = BigInt(1) << (prec - 1);
    BigInt r = (x + half) >> prec;
    return r << prec;
}

BigInt to_fixed(const BigFloat& v, unsigned prec) {
    BigFloat scaled = v;
    mpf_mul_2exp(scaled.backend().data(), scaled.backend().data(), prec);
    BigInt r;
    mpz_set_f(r.backend().data(), scaled.backend().data());
    return r;
}

unsigned working_bits() {
    return static_cast<unsigned>(std::ceil(working_digits() * 3.3219280948873626));
}

struct PslqState {
    size_t n;
    unsigned prec;
    std::vector<BigInt> y;
    Matrix A;
    Matrix B;
    Matrix H;

    // 行 i から行 j の t 倍を引く（H, A）。B は列操作
    void reduce(size_t i, size_t j, const BigInt& t) {
        y[j] += (t * y[i]) >> prec;
        for (size_t k = 1; k <= j; ++k) {
            H[i][k] -= (t * H[j][k]) >> prec;
        }
        for (size_t k = 1; k <= n; ++k) {
            A[i][k] -= (t * A[j][k]) >> prec;
            B[k][j] += (t * B[k][i]) >> prec;
        }
    }
};

}  // namespace

std::optional<std::vector<BigInt>> pslq(const std::vector<BigFloat>& values,
                                        const BigFloat& tolerance,
                                        size_t max_coeff, size_t max_steps) {
    const size_t n = values.size();
    if (n < 2) {
        throw std::invalid_argument("PSLQ needs at least two numbers");
    }

    const unsigned prec = working_bits() + 60;
    const BigInt tol = to_fixed(tolerance, prec);
    const BigInt maxcoeff(static_cast<unsigned long long>(max_coeff));

    std::vector<BigInt> x(n + 1);
    for (size_t k = 1; k <= n; ++k) {
        x[k] = to_fixed(values[k - 1], prec);
    }

    BigInt minx = abs(x[1]);
    for (size_t k = 2; k <= n; ++k) {
        BigInt a = abs(x[k]);
        if (a < minx) minx = a;
    }
    if (minx == 0) {
        throw std::invalid_argument("PSLQ requires a vector of nonzero numbers");
    }
    if (minx < tol / 100) {
        return std::nullopt;  // 小さすぎる要素がある
    }

    const BigInt g = sqrt_fixed(floor_div(BigInt(4) << prec, BigInt(3)), prec);

    PslqState st{n, prec, {}, Matrix(n + 1, std::vector<BigInt>(n + 1)),
                 Matrix(n + 1, std::vector<BigInt>(n + 1)),
                 Matrix(n + 1, std::vector<BigInt>(n + 1))};
    for (size_t i = 1; i <= n; ++i) {
        st.A[i][i] = BigInt(1) << prec;
        st.B[i][i] = BigInt(1) << prec;
    }

    // 部分和のノルム
    std::vector<BigInt> s(n + 1);
    for (size_t k = 1; k <= n; ++k) {
        BigInt t = 0;
        for (size_t j = k; j <= n; ++j) {
            t += (x[j] * x[j]) >> prec;
        }
        s[k] = sqrt_fixed(t, prec);
    }
    const BigInt s1 = s[1];
    st.y = x;
    for (size_t k = 1; k <= n; ++k) {
        st.y[k] = floor_div(x[k] << prec, s1);
        s[k] = floor_div(s[k] << prec, s1);
    }

    // 下台形行列 H の初期化
    for (size_t i = 1; i <= n; ++i) {
        if (i <= n - 1) {
            st.H[i][i] = (s[i] != 0) ? floor_div(s[i + 1] << prec, s[i]) : BigInt(0);
        }
        for (size_t j = 1; j < i; ++j) {
            BigInt sjj1 = s[j] * s[j + 1];
            st.H[i][j] = (sjj1 != 0) ? floor_div((-st.y[i] * st.y[j]) << prec, sjj1) : BigInt(0);
        }
    }

    // H の簡約
    for (size_t i = 2; i <= n; ++i) {
        for (size_t j = i - 1; j >= 1; --j) {
            if (st.H[j][j] != 0) {
                BigInt t = round_fixed(floor_div(st.H[i][j] << prec, st.H[j][j]), prec);
                st.reduce(i, j, t);
            }
        }
    }

    for (size_t rep = 0; rep < max_steps; ++rep) {
        // 交換する行 m の選択
        size_t m = 0;
        BigInt szmax = -1;
        for (size_t i = 1; i < n; ++i) {
            BigInt sz = (pow(g, static_cast<unsigned>(i)) * abs(st.H[i][i])) >> (prec * (i - 1));
            if (sz > szmax) {
                m = i;
                szmax = sz;
            }
        }

        std::swap(st.y[m], st.y[m + 1]);
        std::swap(st.H[m], st.H[m + 1]);
        std::swap(st.A[m], st.A[m + 1]);
        for (size_t i = 1; i <= n; ++i) {
            std::swap(st.B[i][m], st.B[i][m + 1]);
        }

        if (m + 2 <= n) {
            BigInt t0 = sqrt_fixed((st.H[m][m] * st.H[m][m] + st.H[m][m + 1] * st.H[m][m + 1]) >> prec, prec);
            // 精度を使い切った
            if (t0 == 0) {
                break;
            }
            BigInt t1 = floor_div(st.H[m][m] << prec, t0);
            BigInt t2 = floor_div(st.H[m][m + 1] << prec, t0);
            for (size_t i = m; i <= n; ++i) {
                BigInt t3 = st.H[i][m];
                BigInt t4 = st.H[i][m + 1];
                st.H[i][m] = (t1 * t3 + t2 * t4) >> prec;
                st.H[i][m + 1] = (-t2 * t3 + t1 * t4) >> prec;
            }
        }

        for (size_t i = m + 1; i <= n; ++i) {
            for (size_t j = std::min(i - 1, m + 1); j >= 1; --j) {
                if (st.H[j][j] == 0) {
                    break;
                }
                BigInt t = round_fixed(floor_div(st.H[i][j] << prec, st.H[j][j]), prec);
                st.reduce(i, j, t);
            }
        }

        for (size_t i = 1; i <= n; ++i) {
            if (abs(st.y[i]) < tol) {
                std::vector<BigInt> vec;
                bool acceptable = true;
                for (size_t j = 1; j <= n; ++j) {
                    vec.push_back(round_fixed(st.B[j][i], prec) >> prec);
                    if (abs(vec.back()) >= maxcoeff) acceptable = false;
                }
                if (acceptable) {
                    return vec;
                }
            }
        }

        // 関係のノルムの下界
        BigInt recnorm = 0;
        for (size_t i = 1; i <= n; ++i) {
            for (size_t j = 1; j <= n; ++j) {
                BigInt h = abs(st.H[i][j]);
                if (h > recnorm) recnorm = h;
            }
        }
        if (recnorm != 0) {
            BigInt norm = floor_div(BigInt(1) << (2 * prec), recnorm) >> prec;
            norm /= 100;
            if (norm >= maxcoeff) {
                break;
            }
        }
    }

    return std::nullopt;
}

} // namespace fr_search
