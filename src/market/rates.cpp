#include <bw/market/rates.hpp>

#include <cmath>
#include <stdexcept>

namespace bw {
namespace market {

double days_per_period(Frequency f, DayCount dc) noexcept {
  const double year = (dc == DayCount::Actual365) ? 365.0 : 360.0;
  return year / payments_per_year(f);
}

double accrual_fraction(double days_since_last_payment, Frequency f, DayCount dc) {
  if (!std::isfinite(days_since_last_payment) || days_since_last_payment < 0.0) {
    throw std::invalid_argument("accrual_fraction: days_since_last_payment must be >= 0");
  }
  return days_since_last_payment / days_per_period(f, dc);
}

} // namespace market
} // namespace bw
