#include <bw/risk/risk_metrics.hpp>
#include <bw/pricing/bond_pricer.hpp>
#include <bw/market/rates.hpp>
#include <bw/core/errors.hpp>

#include <cmath>
#include <cassert>
#include <iostream>
#include <algorithm>

using namespace bw;

template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  const auto bond  = market::make_bond(1000.0, 0.05, 10.0, 2);
  const auto sched = cashflows::build(bond);
  const double y   = 0.025;

  // 1) Valeurs "or" (obligation au pair, 5 % semestriel, 10 ans)
  const auto rr = risk::compute_risk(sched, y, bond.frequency);
  assert(std::abs(rr.macaulay_duration - 7.989445671393993) < 1e-9);
  assert(std::abs(rr.modified_duration - 7.794581142823408) < 1e-9);
  assert(std::abs(rr.convexity - 294.51492570625453) < 1e-7);
  assert(std::abs(rr.annualized_convexity - 294.51492570625453 / 4.0) < 1e-8);

  // Fonctions unitaires cohérentes avec compute_risk
  const double mac = risk::macaulay_duration(sched, y);
  assert(std::abs(mac - rr.macaulay_duration) < 1e-12);
  assert(std::abs(risk::modified_duration(mac, y, bond.frequency) - rr.modified_duration) < 1e-12);
  assert(std::abs(risk::convexity(sched, y) - rr.convexity) < 1e-9);
  assert(std::abs(risk::annualized_convexity(sched, y, bond.frequency) - rr.annualized_convexity) < 1e-9);

  // 2) Zéro-coupon : Macaulay = maturité
  const auto zc = market::make_bond(100.0, 0.0, 7.0, 1);
  assert(std::abs(risk::macaulay_duration(cashflows::build(zc), 0.04) - 7.0) < 1e-12);

  // 3) Positivité (duration, convexité) sur une grille de rendements, y > -1
  for (int f : {1, 2, 4, 12}) {
    const auto b = market::make_bond(100.0, 0.06, 20.0, f);
    const auto s = cashflows::build(b);
    for (double yp : {-0.5, -0.01, 0.0, 0.01, 0.05, 0.5}) {
      const auto r = risk::compute_risk(s, yp, b.frequency);
      assert(r.macaulay_duration > 0.0 && r.macaulay_duration <= 20.0 + 1e-12);
      assert(r.modified_duration > 0.0);
      assert(r.convexity > 0.0);
    }
  }

  // Extrêmes : PV brutes en inf (y -> -1) ou en 0 (y grand), rapports finis
  {
    const auto b100 = market::make_bond(1000.0, 0.05, 100.0, 2); // 200 périodes
    const auto s100 = cashflows::build(b100);
    assert(std::isinf(pricing::price(s100, -0.99)));
    const auto r = risk::compute_risk(s100, -0.99, b100.frequency);
    assert(std::isfinite(r.macaulay_duration));
    assert(r.macaulay_duration > 0.0 && r.macaulay_duration <= 100.0 + 1e-12);
    assert(std::isfinite(r.modified_duration) && r.modified_duration > 0.0);
    assert(std::isfinite(r.convexity) && r.convexity > 0.0);
    // le dernier flux écrase les autres d’un facteur 100 par période
    assert(std::abs(r.macaulay_duration - 100.0) < 1e-3);

    const auto zc5 = market::make_bond(1000.0, 0.0, 5.0, 12);
    const auto szc = cashflows::build(zc5);
    assert(pricing::price(szc, 1e6) == 0.0);
    const auto rz = risk::compute_risk(szc, 1e6, zc5.frequency);
    assert(std::abs(rz.macaulay_duration - 5.0) < 1e-12);
    assert(rz.modified_duration > 0.0);
    assert(rz.convexity > 0.0 && std::isfinite(rz.convexity));

    // coupon + y grand : le premier flux domine, Dmac -> t_1
    const auto rc = risk::compute_risk(s100, 1e6, b100.frequency);
    assert(std::abs(rc.macaulay_duration - 0.5) < 1e-6);
    assert(rc.modified_duration > 0.0);
  }

  // 4) D_mod annualisée ≈ -(1/P) dP/dy_annuel (différence centrale)
  const double h  = 1e-6;
  const double p0 = pricing::price_annual(sched, 0.05, bond.frequency);
  const double pu = pricing::price_annual(sched, 0.05 + h, bond.frequency);
  const double pd = pricing::price_annual(sched, 0.05 - h, bond.frequency);
  const double dmod_fd = -(pu - pd) / (2.0 * h * p0);
  assert(std::abs(dmod_fd - rr.modified_duration) < 1e-5);

  // Convexité annualisée ≈ (1/P) d²P/dy_annuel²
  const double h2 = 1e-4;
  const double pu2 = pricing::price_annual(sched, 0.05 + h2, bond.frequency);
  const double pd2 = pricing::price_annual(sched, 0.05 - h2, bond.frequency);
  const double conv_fd = (pu2 - 2.0 * p0 + pd2) / (h2 * h2 * p0);
  assert(std::abs(conv_fd - rr.annualized_convexity) < 1e-2);

  // 5) Estimation duration + convexité vs repricing complet (±100 bp)
  for (double bp : {-100.0, -25.0, 0.0, 25.0, 100.0}) {
    const double dy = bp / 10000.0;
    const auto est  = risk::estimate_price_change(p0, rr, dy);
    const double exact = pricing::price_annual(sched, 0.05 + dy, bond.frequency);
    assert(std::abs(est.total_effect - (est.duration_effect + est.convexity_effect)) < 1e-15);
    assert(est.convexity_effect >= 0.0);
    assert(std::abs(est.new_price - (p0 + est.price_change)) < 1e-9);
    // erreur d’ordre 3 : < 0.05 % du prix pour ±1 %
    assert(std::abs(est.new_price - exact) < 5e-4 * p0);
  }

  // 6) Rendement invalide
  assert(throws<InvalidRateError>([&]{ (void)risk::compute_risk(sched, -1.0, bond.frequency); }));
  assert(throws<InvalidRateError>([&]{ (void)risk::macaulay_duration(sched, -2.0); }));
  assert(throws<InvalidRateError>([&]{ (void)risk::convexity(sched, NAN); }));
  assert(throws<InvalidRateError>([&]{ (void)risk::modified_duration(8.0, -1.0, bond.frequency); }));

  std::cout << "Risk metrics OK. Dmac=" << rr.macaulay_duration
            << " Dmod=" << rr.modified_duration
            << " C=" << rr.convexity << "\n";
  return 0;
}
