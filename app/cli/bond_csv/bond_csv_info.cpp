#include "bw/io/bond_csv.hpp"
#include "bw/market/rates.hpp"
#include "bw/pricing/bond_pricer.hpp"
#include "bw/pricing/yield_solver.hpp"
#include "bw/risk/risk_metrics.hpp"
#include "bw/core/errors.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cmath>

int main(int argc, char** argv) {
  std::string path;
  bool show_warnings = false;

  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if ((a=="-f" || a=="--file") && i+1<argc) { path = argv[++i]; }
    else if (a=="-w" || a=="--show-warnings") { show_warnings = true; }
    else if (a=="-h" || a=="--help") {
      std::cout << "Usage: bond_csv_info -f <bonds.csv> [-w]\n";
      return 0;
    } else if (path.empty()) { path = a; }
  }
  if (path.empty()) {
    std::cerr << "Please provide a CSV path (-f <bonds.csv>).\n";
    return 2;
  }

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  auto rows = bw::io::read_bond_csv(path, &ignored, &warnings);

  std::cout << "File: " << path << "\n";
  std::cout << "Valid rows: " << rows.size() << "\n";
  std::cout << "Ignored rows: " << ignored << "\n";

  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);
  std::cout << "id            yield%       price      Dmac      Dmod     Cann\n";

  int failed = 0;
  for (const auto& r : rows) {
    try {
      const auto sched = bw::cashflows::build(r.bond);
      double y = NAN;
      if (std::isfinite(r.market_price)) {
        y = bw::pricing::yield_to_maturity(sched, r.market_price, r.bond.frequency).yield_per_period;
      } else if (std::isfinite(r.annual_yield)) {
        y = bw::market::to_periodic(r.annual_yield, r.bond.frequency);
      } else {
        warnings.push_back(r.id + ": ni rendement ni prix");
        ++failed;
        continue;
      }
      const double px = bw::pricing::price(sched, y);
      const auto rr   = bw::risk::compute_risk(sched, y, r.bond.frequency);
      std::cout << std::left << std::setw(12) << r.id << std::right
                << std::setw(9)  << 100.0 * bw::market::to_annual(y, r.bond.frequency)
                << std::setw(13) << px
                << std::setw(10) << rr.macaulay_duration
                << std::setw(10) << rr.modified_duration
                << std::setw(10) << rr.annualized_convexity << "\n";
    } catch (const std::exception& e) {
      warnings.push_back(r.id + ": " + e.what());
      ++failed;
    }
  }
  if (failed) std::cout << "Failed rows: " << failed << "\n";

  if (show_warnings) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }
  return 0;
}
