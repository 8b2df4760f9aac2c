#include <bw/market/bond.hpp>
#include <bw/market/rates.hpp>
#include <bw/cashflows/schedule.hpp>
#include <bw/pricing/bond_pricer.hpp>
#include <bw/risk/risk_metrics.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " FACE COUPON YEARS FREQ ANNUAL_YIELD [--bp N]...\n"
            << "  Sans --bp : grille -100,-50,-25,-10,0,10,25,50,100 bp.\n";
}

int main(int argc, char** argv) {
  if (argc < 6) { usage(argv[0]); return 1; }

  double face, coupon, years, annual; int freq;
  std::vector<double> bps;
  try {
    face   = std::stod(argv[1]);
    coupon = std::stod(argv[2]);
    years  = std::stod(argv[3]);
    freq   = bw::market::payments_per_year(bw::market::frequency_from_label(argv[4]));
    annual = std::stod(argv[5]);
    for (int i = 6; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--bp" && i + 1 < argc) bps.push_back(std::stod(argv[++i]));
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; usage(argv[0]); return 1;
  }
  if (bps.empty()) bps = {-100, -50, -25, -10, 0, 10, 25, 50, 100};

  try {
    const auto bond  = bw::market::make_bond(face, coupon, years, freq);
    const auto sched = bw::cashflows::build(bond);
    const double y   = bw::market::to_periodic(annual, bond.frequency);
    const double p0  = bw::pricing::price(sched, y);
    const auto rr    = bw::risk::compute_risk(sched, y, bond.frequency);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "price=" << p0 << " Dmod=" << rr.modified_duration
              << " Cann=" << rr.annualized_convexity << "\n";
    std::cout << "   bp   dur_eff%   conv_eff%   total%     est_price   full_price    error\n";
    std::cout << "-------------------------------------------------------------------------------\n";
    for (double bp : bps) {
      const double dy    = bp / 10000.0;
      const auto est     = bw::risk::estimate_price_change(p0, rr, dy);
      const double exact = bw::pricing::price_annual(sched, annual + dy, bond.frequency);
      std::cout << std::setw(5)  << std::setprecision(0) << bp << ' '
                << std::setprecision(6)
                << std::setw(10) << 100.0 * est.duration_effect  << ' '
                << std::setw(11) << 100.0 * est.convexity_effect << ' '
                << std::setw(9)  << 100.0 * est.total_effect     << ' '
                << std::setw(12) << est.new_price << ' '
                << std::setw(12) << exact << ' '
                << std::setw(9)  << est.new_price - exact << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}
