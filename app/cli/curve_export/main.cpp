// app/cli/curve_export/main.cpp
#include "bw/market/bond.hpp"
#include "bw/cashflows/schedule.hpp"
#include "bw/curve/price_yield_curve.hpp"
#include "bw/io/bond_csv.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <cstddef>
#include <stdexcept>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " FACE COUPON YEARS FREQ [-o curve.csv] [-s schedule.csv] [--ymin a] [--ymax b] [--n N]\n"
    "Options:\n"
    "  -o / --out       CSV courbe prix-rendement (defaut: stdout)\n"
    "  -s / --schedule  CSV echeancier period,time_years,amount\n"
    "  --ymin           rendement annuel min (def: 0.01)\n"
    "  --ymax           rendement annuel max (def: 0.15)\n"
    "  --n              nb de points (def: 100)\n";
}

int main(int argc, char** argv) {
  if (argc < 5) { usage(argv[0]); return 1; }

  double face, coupon, years; int freq;
  std::string out_path, sched_path;
  double ymin = 0.01, ymax = 0.15;
  std::size_t n = 100;
  try {
    face   = std::stod(argv[1]);
    coupon = std::stod(argv[2]);
    years  = std::stod(argv[3]);
    freq   = bw::market::payments_per_year(bw::market::frequency_from_label(argv[4]));
    for (int i = 5; i < argc; ++i) {
      std::string a = argv[i];
      if      ((a=="-o" || a=="--out") && i+1<argc)      out_path   = argv[++i];
      else if ((a=="-s" || a=="--schedule") && i+1<argc) sched_path = argv[++i];
      else if (a=="--ymin" && i+1<argc) ymin = std::stod(argv[++i]);
      else if (a=="--ymax" && i+1<argc) ymax = std::stod(argv[++i]);
      else if (a=="--n"    && i+1<argc) n    = static_cast<std::size_t>(std::stoul(argv[++i]));
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; usage(argv[0]); return 1;
  }

  try {
    const auto bond  = bw::market::make_bond(face, coupon, years, freq);
    const auto sched = bw::cashflows::build(bond);
    const bw::curve::PriceYieldCurve curve(sched, bond.frequency, ymin, ymax, n);

    if (out_path.empty()) {
      bw::io::write_curve_csv(std::cout, curve);
    } else {
      std::ofstream f(out_path);
      if (!f) { std::cerr << "Impossible d'ecrire: " << out_path << "\n"; return 2; }
      bw::io::write_curve_csv(f, curve);
      std::cerr << "[info] courbe (" << curve.size() << " points) -> " << out_path << "\n";
    }

    if (!sched_path.empty()) {
      std::ofstream f(sched_path);
      if (!f) { std::cerr << "Impossible d'ecrire: " << sched_path << "\n"; return 2; }
      bw::io::write_schedule_csv(f, sched);
      std::cerr << "[info] echeancier (" << sched.size() << " flux) -> " << sched_path << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}
