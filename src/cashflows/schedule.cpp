#include <bw/cashflows/schedule.hpp>
#include <bw/core/errors.hpp>

namespace bw {
namespace cashflows {

CashFlowSchedule build(const bw::market::Bond& bond) {
  const int n = bond.num_periods();
  if (n < 1) {
    throw InvalidBondError("build: bond has no payment period");
  }
  const double f      = bw::market::payments_per_year(bond.frequency);
  const double coupon = bond.period_coupon();

  CashFlowSchedule out;
  out.reserve(static_cast<std::size_t>(n));
  for (int i = 1; i <= n; ++i) {
    out.push_back(CashFlow{i, i / f, coupon});
  }
  out.back().amount += bond.face_value; // remboursement in fine
  return out;
}

double total_cash(const CashFlowSchedule& schedule) noexcept {
  double s = 0.0;
  for (const auto& cf : schedule) s += cf.amount;
  return s;
}

} // namespace cashflows
} // namespace bw
