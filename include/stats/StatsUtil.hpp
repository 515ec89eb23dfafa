#pragma once
#include <cstddef>
#include <vector>

namespace stats {

struct Summary {
    std::size_t n = 0;
    double mean = 0.0;
    double variance = 0.0;   // unbiased (n - 1); 0 when n < 2
};

// Values are sorted before summation so the result does not depend on input order.
double sorted_sum(std::vector<double> values);
Summary summarize(std::vector<double> values);

// Regularized incomplete beta I_x(a, b), continued fraction (Lentz).
double regularized_beta(double a, double b, double x);

double t_two_tailed_p(double t, std::size_t df);

// Two-tailed critical value: P(|T| > t) = alpha. 0 for df == 0 or alpha outside (0,1).
double t_critical(double alpha, std::size_t df);

double normal_two_tailed_p(double z);

double clamp01(double v);

// Round half away from zero to a multiple of step.
double round_to(double v, double step);
double round2(double v);

}
