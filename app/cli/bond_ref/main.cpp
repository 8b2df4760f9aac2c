#include <bw/market/bond.hpp>
#include <bw/market/rates.hpp>
#include <bw/cashflows/schedule.hpp>
#include <bw/pricing/bond_pricer.hpp>
#include <bw/risk/risk_metrics.hpp>

#include <iostream>
#include <iomanip>
#include <optional>
#include <vector>
#include <string>
#include <cstdlib>

struct Case {
  double face, coupon, years;
  int    freq;
  double annual_yield;
};

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [FACE COUPON YEARS FREQ ANNUAL_YIELD]"
            << " [--accrued FRAC | --days D [--act365]]\n"
            << "Rates in decimal (0.05 = 5%). FREQ in {1,2,4,12} or Annual|Semi-annual|Quarterly|Monthly.\n"
            << "If no bond is provided, runs 3 reference cases.\n";
}

int main(int argc, char** argv) {
  std::vector<Case> cases;
  double fraction = 0.0;
  std::optional<double> days; // absent : on garde --accrued
  bool act365 = false;

  std::vector<std::string> pos;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a == "--accrued" && i + 1 < argc) fraction = std::stod(argv[++i]);
      else if (a == "--days" && i + 1 < argc) days = std::stod(argv[++i]);
      else if (a == "--act365") act365 = true;
      else if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
      else pos.push_back(a);
    } catch (const std::exception&) {
      print_usage(argv[0]);
      return 1;
    }
  }

  if (pos.empty()) {
    // 2–3 cas “or” pour valider rapidement
    cases.push_back({1000.0, 0.05,  10.0, 2,  0.05});  // pair
    cases.push_back({1000.0, 0.05,  10.0, 2,  0.06});  // sous le pair
    cases.push_back({100.0,  0.00,   7.0, 1,  -0.005}); // zéro-coupon, taux négatif
  } else if (pos.size() == 5) {
    Case c;
    try {
      c.face         = std::stod(pos[0]);
      c.coupon       = std::stod(pos[1]);
      c.years        = std::stod(pos[2]);
      c.freq         = bw::market::payments_per_year(bw::market::frequency_from_label(pos[3]));
      c.annual_yield = std::stod(pos[4]);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      print_usage(argv[0]);
      return 1;
    }
    cases.push_back(c);
  } else {
    print_usage(argv[0]);
    return 1;
  }

  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  try {
    for (const auto& c : cases) {
      const auto bond  = bw::market::make_bond(c.face, c.coupon, c.years, c.freq);
      const auto sched = bw::cashflows::build(bond);
      const double y   = bw::market::to_periodic(c.annual_yield, bond.frequency);

      double frac = fraction;
      if (days) {
        frac = bw::market::accrual_fraction(*days, bond.frequency,
                                            act365 ? bw::market::DayCount::Actual365
                                                   : bw::market::DayCount::Thirty360);
      }

      const auto px = bw::pricing::price_bond(bond, y, frac);
      const auto rr = bw::risk::compute_risk(sched, y, bond.frequency);

      std::cout << "bond          : face=" << bond.face_value
                << " coupon=" << bond.coupon_rate
                << " years=" << bond.years_to_maturity
                << " freq=" << bw::market::to_string(bond.frequency)
                << " (" << bond.num_periods() << " payments)\n"
                << "yield         : annual=" << c.annual_yield << " per_period=" << y << "\n"
                << "dirty_price   : " << px.dirty_price << "\n"
                << "accrued       : " << px.accrued_interest << " (fraction=" << frac << ")\n"
                << "clean_price   : " << px.clean_price << "\n"
                << "current_yield : " << bw::pricing::current_yield(bond, px.dirty_price) << "\n"
                << "period_coupon : " << bond.period_coupon() << "\n"
                << "macaulay      : " << rr.macaulay_duration << "\n"
                << "modified      : " << rr.modified_duration << "\n"
                << "convexity     : " << rr.convexity << " (annualized " << rr.annualized_convexity << ")\n"
                << "-------------------------------------------------------------\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}
