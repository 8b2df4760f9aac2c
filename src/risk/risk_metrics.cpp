#include <bw/risk/risk_metrics.hpp>
#include <bw/pricing/bond_pricer.hpp> // check_yield

#include <cmath>

namespace bw {
namespace risk {

namespace {

// Sommes pondérées par les PV en un seul passage, à un facteur commun près :
// w_k = CF_k (1+y)^-(k - k_ref). Seuls les rapports servent, donc k_ref est
// choisi pour que le poids dominant vaille CF_k (dernier flux non nul si
// 1+y < 1, premier sinon) : ni inf/inf près de y = -1, ni 0/0 pour y grand.
struct WeightedSums {
  double pv    = 0.0; // Σ w_i
  double t_pv  = 0.0; // Σ t_i w_i
  double kk_pv = 0.0; // Σ k_i (k_i + 1) w_i
};

WeightedSums weighted_sums(const bw::cashflows::CashFlowSchedule& schedule, double y) {
  bw::pricing::check_yield(y);
  const double log_base = std::log1p(y);

  int k_ref = 0;
  bool have_ref = false;
  for (const auto& cf : schedule) {
    if (cf.amount == 0.0) continue;
    if (!have_ref || log_base < 0.0) k_ref = cf.period_index;
    have_ref = true;
  }

  WeightedSums s;
  for (const auto& cf : schedule) {
    if (cf.amount == 0.0) continue;
    const double k = cf.period_index;
    const double w = cf.amount * std::exp(-(k - k_ref) * log_base);
    s.pv    += w;
    s.t_pv  += cf.time_in_years * w;
    s.kk_pv += k * (k + 1.0) * w;
  }
  return s;
}

} // unnamed namespace

double macaulay_duration(const bw::cashflows::CashFlowSchedule& schedule, double yield_per_period) {
  const auto s = weighted_sums(schedule, yield_per_period);
  return s.t_pv / s.pv;
}

double modified_duration(double macaulay_duration, double yield_per_period,
                         bw::market::Frequency frequency) {
  bw::pricing::check_yield(yield_per_period);
  (void)bw::market::frequency_from_int(bw::market::payments_per_year(frequency)); // lève si enum forgée
  return macaulay_duration / (1.0 + yield_per_period);
}

double convexity(const bw::cashflows::CashFlowSchedule& schedule, double yield_per_period) {
  const auto s = weighted_sums(schedule, yield_per_period);
  const double base = 1.0 + yield_per_period;
  return s.kk_pv / s.pv / (base * base);
}

double annualized_convexity(const bw::cashflows::CashFlowSchedule& schedule,
                            double yield_per_period,
                            bw::market::Frequency frequency) {
  const double f = bw::market::payments_per_year(frequency);
  return convexity(schedule, yield_per_period) / (f * f);
}

RiskResult compute_risk(const bw::cashflows::CashFlowSchedule& schedule,
                        double yield_per_period,
                        bw::market::Frequency frequency) {
  const auto s = weighted_sums(schedule, yield_per_period);
  const double base = 1.0 + yield_per_period;
  const double f    = bw::market::payments_per_year(frequency);

  RiskResult out{};
  out.macaulay_duration    = s.t_pv / s.pv;
  out.modified_duration    = modified_duration(out.macaulay_duration, yield_per_period, frequency);
  out.convexity            = s.kk_pv / s.pv / (base * base);
  out.annualized_convexity = out.convexity / (f * f);
  return out;
}

PriceChange estimate_price_change(double price, const RiskResult& risk,
                                  double annual_shift) noexcept {
  PriceChange out{};
  out.duration_effect  = -risk.modified_duration * annual_shift;
  out.convexity_effect = 0.5 * risk.annualized_convexity * annual_shift * annual_shift;
  out.total_effect     = out.duration_effect + out.convexity_effect;
  out.price_change     = price * out.total_effect;
  out.new_price        = price + out.price_change;
  return out;
}

} // namespace risk
} // namespace bw
