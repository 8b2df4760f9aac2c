// app/cli/ytm_solver/main.cpp
#include "bw/market/bond.hpp"
#include "bw/cashflows/schedule.hpp"
#include "bw/config/solver_config.hpp"
#include "bw/pricing/yield_solver.hpp"
#include "bw/pricing/bond_pricer.hpp"
#include <iostream>
#include <iomanip>
#include <string>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " FACE COUPON YEARS FREQ PRICE"
            << " [--tol X] [--max-iter N] [--lo A] [--hi B] [--expand K]\n"
            << "  PRICE = prix de marché (dirty) ; bornes --lo/--hi en rendement par période.\n";
}

int main(int argc, char** argv) {
  if (argc < 6) { usage(argv[0]); return 1; }

  double face, coupon, years, px; int freq;
  bw::config::YieldSolverConfig cfg;
  try {
    face   = std::stod(argv[1]);
    coupon = std::stod(argv[2]);
    years  = std::stod(argv[3]);
    freq   = bw::market::payments_per_year(bw::market::frequency_from_label(argv[4]));
    px     = std::stod(argv[5]);

    for (int i = 6; i < argc; ++i) {
      std::string a = argv[i];
      if      (a == "--tol"      && i + 1 < argc) cfg.tolerance = std::stod(argv[++i]);
      else if (a == "--max-iter" && i + 1 < argc) cfg.max_iterations = std::stoi(argv[++i]);
      else if (a == "--lo"       && i + 1 < argc) cfg.bracket_lo = std::stod(argv[++i]);
      else if (a == "--hi"       && i + 1 < argc) cfg.bracket_hi = std::stod(argv[++i]);
      else if (a == "--expand"   && i + 1 < argc) cfg.max_bracket_expansions = std::stoi(argv[++i]);
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; usage(argv[0]); return 1;
  }

  try {
    const auto bond  = bw::market::make_bond(face, coupon, years, freq);
    const auto sched = bw::cashflows::build(bond);
    const auto res   = bw::pricing::yield_to_maturity(sched, px, bond.frequency, cfg);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(10);
    std::cout << "yield_per_period: " << res.yield_per_period << "\n"
              << "annual_yield    : " << res.annual_yield << "\n";
    std::cout << std::setprecision(6);
    std::cout << "annual_yield_pct: " << 100.0 * res.annual_yield << "\n"
              << "reprice         : " << bw::pricing::price(sched, res.yield_per_period) << "\n"
              << "iterations      : " << res.iterations << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}
