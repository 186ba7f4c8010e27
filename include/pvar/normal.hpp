#pragma once

namespace pvar {

double normal_cdf(double x);
double normal_pdf(double x);

// Inverse of the standard normal CDF for p in (0, 1).
double normal_quantile(double p);

} // namespace pvar
