#include <bw/pricing/bond_pricer.hpp>
#include <bw/core/errors.hpp>
#include <bw/market/rates.hpp>

#include <cmath>     // pow, isfinite
#include <stdexcept>
#include <string>

namespace bw {
namespace pricing {

void check_yield(double yield_per_period) {
  if (!std::isfinite(yield_per_period) || 1.0 + yield_per_period <= 0.0) {
    throw InvalidRateError("price: discount factor undefined, 1 + y must be > 0 (y = "
                           + std::to_string(yield_per_period) + ")");
  }
}

double price(const bw::cashflows::CashFlowSchedule& schedule, double yield_per_period) {
  check_yield(yield_per_period);
  const double base = 1.0 + yield_per_period;
  double pv = 0.0;
  for (const auto& cf : schedule) {
    if (cf.amount == 0.0) continue; // évite 0 * inf quand y -> -1
    pv += cf.amount * std::pow(base, -cf.period_index);
  }
  return pv;
}

double price_annual(const bw::cashflows::CashFlowSchedule& schedule, double annual_yield,
                    bw::market::Frequency frequency) {
  return price(schedule, bw::market::to_periodic(annual_yield, frequency));
}

double price_derivative(const bw::cashflows::CashFlowSchedule& schedule, double yield_per_period) {
  check_yield(yield_per_period);
  const double base = 1.0 + yield_per_period;
  // d/dy [CF (1+y)^{-k}] = -k CF (1+y)^{-k-1}
  double d = 0.0;
  for (const auto& cf : schedule) {
    if (cf.amount == 0.0) continue;
    d -= cf.period_index * cf.amount * std::pow(base, -cf.period_index - 1);
  }
  return d;
}

double accrued_interest(double period_coupon, double fraction_elapsed) {
  if (!(fraction_elapsed >= 0.0 && fraction_elapsed < 1.0)) {
    throw std::invalid_argument("accrued_interest: fraction_elapsed must be in [0, 1)");
  }
  return period_coupon * fraction_elapsed;
}

double accrued_interest(const bw::market::Bond& bond, double fraction_elapsed) {
  return accrued_interest(bond.period_coupon(), fraction_elapsed);
}

PricingResult price_bond(const bw::market::Bond& bond, double yield_per_period,
                         double fraction_elapsed) {
  const auto schedule = bw::cashflows::build(bond);

  PricingResult out{};
  out.dirty_price      = price(schedule, yield_per_period);
  out.accrued_interest = accrued_interest(bond, fraction_elapsed);
  out.clean_price      = out.dirty_price - out.accrued_interest;
  out.price            = out.dirty_price;
  return out;
}

double current_yield(const bw::market::Bond& bond, double price) {
  if (!std::isfinite(price) || price <= 0.0) {
    throw InvalidPriceError("current_yield: price must be > 0");
  }
  return bond.coupon_rate * bond.face_value / price;
}

} // namespace pricing
} // namespace bw
