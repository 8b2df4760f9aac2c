#include "bw/curve/price_yield_curve.hpp"
#include "bw/pricing/bond_pricer.hpp"
#include "bw/market/rates.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace bw::curve {

PriceYieldCurve::PriceYieldCurve(bw::cashflows::CashFlowSchedule schedule,
                                 bw::market::Frequency frequency,
                                 double annual_lo, double annual_hi, std::size_t n_points)
  : schedule_(std::move(schedule)), frequency_(frequency),
    lo_(annual_lo), hi_(annual_hi), n_(n_points) {}

double PriceYieldCurve::yield_at(std::size_t j) const noexcept {
  if (n_ <= 1) return lo_;
  const double u = double(j) / double(n_ - 1);
  return (1.0 - u) * lo_ + u * hi_; // bornes exactes en j=0 et j=n-1
}

CurvePoint PriceYieldCurve::at(std::size_t j) const {
  if (j >= n_) {
    throw std::out_of_range("PriceYieldCurve::at: index " + std::to_string(j)
                            + " >= size " + std::to_string(n_));
  }
  CurvePoint p;
  p.annual_yield     = yield_at(j);
  p.yield_per_period = bw::market::to_periodic(p.annual_yield, frequency_);
  p.price            = bw::pricing::price(schedule_, p.yield_per_period);
  return p;
}

std::vector<CurvePoint> PriceYieldCurve::sample() const {
  std::vector<CurvePoint> out;
  out.reserve(n_);
  for (const auto& p : *this) out.push_back(p);
  return out;
}

PriceYieldCurve default_curve(const bw::cashflows::CashFlowSchedule& schedule,
                              bw::market::Frequency frequency) {
  return PriceYieldCurve(schedule, frequency, 0.01, 0.15, 100);
}

} // namespace bw::curve
