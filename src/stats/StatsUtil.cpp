#include "stats/StatsUtil.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace stats {

double sorted_sum(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    double s = 0.0;
    for (double v : values) s += v;
    return s;
}

Summary summarize(std::vector<double> values) {
    Summary out;
    out.n = values.size();
    if (values.empty()) return out;

    std::sort(values.begin(), values.end());
    double s = 0.0;
    for (double v : values) s += v;
    out.mean = s / static_cast<double>(out.n);

    if (out.n < 2) return out;

    std::vector<double> sq;
    sq.reserve(values.size());
    for (double v : values) {
        const double d = v - out.mean;
        sq.push_back(d * d);
    }
    out.variance = sorted_sum(std::move(sq)) / static_cast<double>(out.n - 1);
    return out;
}

double clamp01(double v) {
    if (!(v > 0.0)) return 0.0;
    if (v > 1.0) return 1.0;
    return v;
}

static std::pair<double, bool> beta_continued_fraction(double a, double b, double x) {
    const int max_iter = std::clamp<int>(400 + static_cast<int>(std::ceil((a + b) * 0.75)), 400, 2000);
    constexpr double eps = 3e-14;
    constexpr double fpmin = 1e-300;

    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < fpmin) d = fpmin;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= max_iter; ++m) {
        const int m2 = 2 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;

        if (std::abs(del - 1.0) <= eps) return {h, true};
    }
    return {h, false};
}

double regularized_beta(double a, double b, double x) {
    if (!(x > 0.0)) return 0.0;
    if (x >= 1.0) return 1.0;
    if (!(a > 0.0) || !(b > 0.0) || !std::isfinite(a) || !std::isfinite(b)) return NAN;

    const double ln_beta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
    const double bt = std::exp(a * std::log(x) + b * std::log(1.0 - x) - ln_beta);

    // unconverged fractions are still accurate well past the precision we report
    if (x < (a + 1.0) / (a + b + 2.0)) {
        const double cf = beta_continued_fraction(a, b, x).first;
        return clamp01(bt * cf / a);
    }
    const double cf = beta_continued_fraction(b, a, 1.0 - x).first;
    return clamp01(1.0 - bt * cf / b);
}

double t_two_tailed_p(double t, std::size_t df) {
    if (df == 0) return 1.0;
    const double nu = static_cast<double>(df);
    const double t_abs = std::abs(t);
    if (!std::isfinite(t_abs) || t_abs > 1e8) return 0.0;

    const double x = nu / (nu + t_abs * t_abs);
    return regularized_beta(nu / 2.0, 0.5, x);
}

double t_critical(double alpha, std::size_t df) {
    if (df == 0 || !std::isfinite(alpha) || alpha <= 0.0 || alpha >= 1.0) return 0.0;

    double lo = 0.0;
    double hi = 2.0;
    while (t_two_tailed_p(hi, df) > alpha && hi < 1e6) hi *= 2.0;

    for (int it = 0; it < 70; ++it) {
        const double mid = 0.5 * (lo + hi);
        if (t_two_tailed_p(mid, df) > alpha) lo = mid;
        else hi = mid;
    }
    return 0.5 * (lo + hi);
}

double normal_two_tailed_p(double z) {
    if (!std::isfinite(z)) return 0.0;
    return std::erfc(std::abs(z) / std::sqrt(2.0));
}

double round_to(double v, double step) {
    if (!(step > 0.0)) return v;
    return std::round(v / step) * step;
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

}
