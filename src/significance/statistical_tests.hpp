#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

// ---------------------------------------------------------------------------
// TestResult — outcome of one pairwise comparison
// skipped = the test was not run (base too small, degenerate input);
// `higher` is meaningful only when the test ran.
// ---------------------------------------------------------------------------
struct TestResult {
    double statistic = 0.0;
    double p_value = 1.0;
    bool significant = false;
    bool higher = false;
    bool skipped = false;
    const char* skip_reason = "";
};

// ---------------------------------------------------------------------------
// Distribution functions (double precision)
// ---------------------------------------------------------------------------
namespace detail {

inline double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

// Continued fraction for the regularized incomplete beta (modified Lentz).
inline double beta_continued_fraction(double a, double b, double x) {
    constexpr int MAX_ITER = 300;
    constexpr double EPS = 1e-14;
    constexpr double TINY = 1e-300;

    double qab = a + b, qap = a + 1.0, qam = a - 1.0;
    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < TINY) d = TINY;
    d = 1.0 / d;
    double h = d;
    for (int m = 1; m <= MAX_ITER; ++m) {
        double m2 = 2.0 * m;
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < TINY) d = TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        h *= d * c;
        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < TINY) d = TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < EPS) break;
    }
    return h;
}

// Regularized incomplete beta I_x(a, b).
inline double incomplete_beta(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;
    double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                       a * std::log(x) + b * std::log1p(-x);
    double front = std::exp(log_front);
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * beta_continued_fraction(a, b, x) / a;
    }
    return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
}

// Student t CDF with (possibly fractional) df.
inline double t_cdf(double t, double df) {
    if (std::isinf(t)) return t > 0 ? 1.0 : 0.0;
    if (df <= 0.0) return std::numeric_limits<double>::quiet_NaN();
    double x = df / (df + t * t);
    double tail = 0.5 * incomplete_beta(df / 2.0, 0.5, x);
    return t > 0.0 ? 1.0 - tail : tail;
}

// Regularized lower incomplete gamma P(a, x).
inline double gamma_p(double a, double x) {
    if (x <= 0.0) return 0.0;
    constexpr int MAX_ITER = 500;
    constexpr double EPS = 1e-14;
    double log_front = -x + a * std::log(x) - std::lgamma(a);

    if (x < a + 1.0) {
        // Series expansion
        double ap = a, sum = 1.0 / a, del = sum;
        for (int n = 0; n < MAX_ITER; ++n) {
            ap += 1.0;
            del *= x / ap;
            sum += del;
            if (std::abs(del) < std::abs(sum) * EPS) break;
        }
        return std::min(1.0, sum * std::exp(log_front));
    }

    // Continued fraction for Q(a, x)
    constexpr double TINY = 1e-300;
    double b = x + 1.0 - a, c = 1.0 / TINY, d = 1.0 / b, h = d;
    for (int i = 1; i <= MAX_ITER; ++i) {
        double an = -i * (i - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < TINY) d = TINY;
        c = b + an / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < EPS) break;
    }
    return std::max(0.0, 1.0 - std::exp(log_front) * h);
}

// Chi-squared survival function P(X > x) for df degrees of freedom.
inline double chi2_sf(double x, int df) {
    if (x <= 0.0) return 1.0;
    return 1.0 - gamma_p(static_cast<double>(df) / 2.0, x / 2.0);
}

}  // namespace detail

// Two-sided p-value of a z statistic: 2 * Phi(-|z|).
inline double two_sided_normal_p(double z) {
    return 2.0 * detail::normal_cdf(-std::abs(z));
}

// Two-sided p-value of a t statistic: 2 * P(T < -|t|).
inline double two_sided_t_p(double t, double df) {
    return 2.0 * detail::t_cdf(-std::abs(t), df);
}
