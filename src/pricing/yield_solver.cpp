#include "bw/pricing/yield_solver.hpp"
#include "bw/pricing/bond_pricer.hpp"
#include "bw/core/errors.hpp"
#include <cmath>
#include <algorithm>
#include <limits>
#include <string>

namespace {

using bw::cashflows::CashFlowSchedule;

// Guess initial : rendement d’un zéro-coupon équivalent, (ΣCF / P)^(1/n) - 1.
// Exact pour un zéro-coupon, raisonnable pour un coupon standard.
inline double initial_guess(const CashFlowSchedule& s, double market_price) {
  const double total = bw::cashflows::total_cash(s);
  const double n     = static_cast<double>(s.back().period_index);
  return std::pow(total / market_price, 1.0 / n) - 1.0;
}

} // namespace

namespace bw::pricing {

YieldResult yield_to_maturity(const CashFlowSchedule& schedule,
                              double market_price,
                              bw::market::Frequency frequency,
                              const bw::config::YieldSolverConfig& cfg) {
  cfg.validate();
  if (!std::isfinite(market_price) || market_price <= 0.0) {
    throw InvalidPriceError("yield_to_maturity: market_price must be > 0");
  }
  if (schedule.empty()) {
    throw InvalidBondError("yield_to_maturity: empty cash-flow schedule");
  }

  auto f = [&](double y) { return price(schedule, y) - market_price; };
  const double tol_price = cfg.tolerance * std::max(1.0, market_price);

  // Bracketing initial : f décroissante → f(a) >= 0 >= f(b)
  double a = cfg.bracket_lo, b = cfg.bracket_hi;
  const double fa = f(a);
  if (fa < 0.0) {
    // Il faudrait y <= bracket_lo (≈ -100 % par période) : on ne devine pas.
    throw YieldNotFoundError("yield_to_maturity: market_price " + std::to_string(market_price)
                             + " above the price at the lower search bound");
  }
  double fb = f(b);
  for (int k = 0; fb > 0.0 && k < cfg.max_bracket_expansions; ++k) {
    b  = a + 2.0 * (b - a);
    fb = f(b);
  }
  if (fb > 0.0) {
    throw YieldNotFoundError("yield_to_maturity: no root below y = " + std::to_string(b)
                             + " (market_price too low)");
  }

  const double ppy = bw::market::payments_per_year(frequency);
  auto done = [&](double y, int it) {
    YieldResult out{};
    out.yield_per_period = y;
    out.annual_yield     = y * ppy;
    out.iterations       = it;
    return out;
  };
  if (fa == 0.0) return done(a, 0);
  if (fb == 0.0) return done(b, 0);

  double y = initial_guess(schedule, market_price);
  if (!(std::isfinite(y) && y > a && y < b)) y = 0.5 * (a + b);

  // Newton sécurisé : pas de Newton seulement s’il reste dans ]a,b[ et
  // réduit le pas d’au moins moitié par rapport à l’avant-dernier, sinon bisection.
  double dx_old = b - a, dx = dx_old;
  int it = 0;
  for (; it < cfg.max_iterations; ++it) {
    const double diff = f(y);
    if (std::fabs(diff) <= tol_price) return done(y, it + 1);

    // Met à jour le bracket (prix trop haut → rendement trop bas)
    if (diff > 0.0) { a = y; } else { b = y; }
    if (std::fabs(b - a) <= cfg.yield_tolerance) return done(y, it + 1);

    const double dpdy = price_derivative(schedule, y);
    double y_newton = std::numeric_limits<double>::quiet_NaN(); // forcera bisection
    if (std::isfinite(dpdy) && dpdy < 0.0) {
      y_newton = y - diff / dpdy;
    }

    const bool newton_ok = std::isfinite(y_newton) && y_newton > a && y_newton < b
                           && std::fabs(y_newton - y) < 0.5 * std::fabs(dx_old);
    dx_old = dx;
    if (newton_ok) {
      dx = y_newton - y;
      y  = y_newton;
    } else {
      dx = 0.5 * (b - a);
      y  = a + dx;
    }
  }

  throw YieldNotFoundError("yield_to_maturity: no convergence after "
                           + std::to_string(it) + " iterations");
}

YieldResult yield_to_maturity(const bw::market::Bond& bond,
                              double market_price,
                              const bw::config::YieldSolverConfig& cfg) {
  return yield_to_maturity(bw::cashflows::build(bond), market_price, bond.frequency, cfg);
}

} // namespace bw::pricing
