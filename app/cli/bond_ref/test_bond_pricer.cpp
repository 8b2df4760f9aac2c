#include <bw/market/bond.hpp>
#include <bw/market/rates.hpp>
#include <bw/cashflows/schedule.hpp>
#include <bw/pricing/bond_pricer.hpp>
#include <bw/core/errors.hpp>

#include <cmath>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace bw;

// true si f() lève une exception du type E
template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  constexpr double EPS = 1e-9;

  // 1) Fabrique + invariants
  const auto ust = market::make_bond(1000.0, 0.05, 10.0, 2);
  assert(ust.frequency == market::Frequency::SemiAnnual);
  assert(ust.num_periods() == 20);
  assert(std::abs(ust.period_coupon() - 25.0) < EPS);

  assert(throws<InvalidBondError>([]{ market::make_bond(0.0,    0.05, 10.0, 2); }));
  assert(throws<InvalidBondError>([]{ market::make_bond(1000.0, -0.01, 10.0, 2); }));
  assert(throws<InvalidBondError>([]{ market::make_bond(1000.0, 0.05, 0.0, 2); }));
  assert(throws<InvalidBondError>([]{ market::make_bond(1000.0, 0.05, 10.0, 3); }));
  assert(throws<InvalidBondError>([]{ market::make_bond(1000.0, 0.05, NAN, 2); }));
  // round(0.2 * 1) == 0 → aucune période
  assert(throws<InvalidBondError>([]{ market::make_bond(1000.0, 0.05, 0.2, 1); }));
  // erreurs de validation = std::invalid_argument
  assert(throws<std::invalid_argument>([]{ market::make_bond(1000.0, 0.05, 0.2, 1); }));

  assert(market::frequency_from_label("Semi-annual") == market::Frequency::SemiAnnual);
  assert(market::frequency_from_label(" monthly ")   == market::Frequency::Monthly);
  assert(market::frequency_from_label("4")           == market::Frequency::Quarterly);
  assert(throws<InvalidBondError>([]{ market::frequency_from_label("Weekly"); }));

  // 2) Échéancier
  const auto sched = cashflows::build(ust);
  assert(sched.size() == 20);
  for (std::size_t i = 0; i < sched.size(); ++i) {
    assert(sched[i].period_index == int(i) + 1);
    assert(std::abs(sched[i].time_in_years - (i + 1) / 2.0) < EPS);
  }
  assert(std::abs(sched.front().amount - 25.0) < EPS);
  assert(std::abs(sched.back().amount - 1025.0) < EPS);
  assert(std::abs(cashflows::total_cash(sched) - 1500.0) < EPS);

  // maturité fractionnaire : 2.9 ans trimestriel → round(11.6) = 12 périodes
  const auto frac = market::make_bond(100.0, 0.04, 2.9, 4);
  assert(cashflows::build(frac).size() == 12);

  // 3) Pair : y = coupon / f → P = nominal
  const double p_par = pricing::price(sched, 0.025);
  assert(std::abs(p_par - 1000.0) < 1e-8);
  for (int f : {1, 2, 4, 12}) {
    const auto b = market::make_bond(500.0, 0.07, 8.0, f);
    const double y = market::to_periodic(0.07, b.frequency);
    assert(std::abs(pricing::price(cashflows::build(b), y) - 500.0) < 1e-8);
    assert(std::abs(pricing::price_annual(cashflows::build(b), 0.07, b.frequency) - 500.0) < 1e-8);
  }

  // 4) Monotonie stricte (y > -1)
  std::vector<double> ys {-0.5, -0.1, -0.01, 0.0, 0.01, 0.025, 0.05, 0.2, 1.0, 5.0};
  for (std::size_t i = 0; i + 1 < ys.size(); ++i) {
    assert(pricing::price(sched, ys[i]) > pricing::price(sched, ys[i + 1]));
  }
  // y = 0 → somme non actualisée
  assert(std::abs(pricing::price(sched, 0.0) - 1500.0) < EPS);

  // dérivée analytique vs différence centrale
  const double h = 1e-6;
  const double fd = (pricing::price(sched, 0.03 + h) - pricing::price(sched, 0.03 - h)) / (2 * h);
  assert(std::abs(pricing::price_derivative(sched, 0.03) - fd) < 1e-3);

  // 5) Facteur d’actualisation non positif
  assert(throws<InvalidRateError>([&]{ pricing::price(sched, -1.0); }));
  assert(throws<InvalidRateError>([&]{ pricing::price(sched, -1.5); }));
  assert(throws<InvalidRateError>([&]{ pricing::price(sched, NAN); }));

  // 6) Coupon couru / clean-dirty
  assert(std::abs(pricing::accrued_interest(25.0, 0.5) - 12.5) < EPS);
  assert(std::abs(pricing::accrued_interest(ust, 0.5) - 12.5) < EPS);
  assert(pricing::accrued_interest(25.0, 0.0) == 0.0);
  assert(throws<std::invalid_argument>([]{ pricing::accrued_interest(25.0, 1.0); }));
  assert(throws<std::invalid_argument>([]{ pricing::accrued_interest(25.0, -0.1); }));

  const auto res = pricing::price_bond(ust, 0.025, 0.5);
  assert(std::abs(res.dirty_price - 1000.0) < 1e-8);
  assert(res.price == res.dirty_price);
  assert(std::abs(res.accrued_interest - 12.5) < EPS);
  assert(std::abs(res.clean_price - (res.dirty_price - 12.5)) < EPS);

  // 7) Day count : 90 jours en 30/360 semestriel = 0.5 période
  assert(std::abs(market::accrual_fraction(90.0, market::Frequency::SemiAnnual) - 0.5) < EPS);
  assert(std::abs(market::accrual_fraction(73.0, market::Frequency::Annual,
                                           market::DayCount::Actual365) - 0.2) < EPS);
  assert(throws<std::invalid_argument>([]{ market::accrual_fraction(-1.0, market::Frequency::Annual); }));

  // 8) Rendement courant
  assert(std::abs(pricing::current_yield(ust, 1000.0) - 0.05) < EPS);
  assert(std::abs(pricing::current_yield(ust, 800.0) - 0.0625) < EPS);
  assert(throws<InvalidPriceError>([&]{ pricing::current_yield(ust, 0.0); }));

  std::cout << "Bond pricer OK. Par price=" << p_par << "\n";
  return 0;
}
