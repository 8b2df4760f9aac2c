#pragma once
#include <iosfwd>
#include <limits>
#include <string>
#include <vector>

#include "bw/cashflows/schedule.hpp"
#include "bw/curve/price_yield_curve.hpp"
#include "bw/market/bond.hpp"

namespace bw::io {

struct BondRow {
  std::string id;
  bw::market::Bond bond;

  // optionnels : NaN si absents
  double annual_yield = std::numeric_limits<double>::quiet_NaN();
  double market_price = std::numeric_limits<double>::quiet_NaN();
};

// Lit un CSV d’obligations (colonnes typiques : id,face,coupon,years,frequency,yield,price).
// Synonymes acceptés dans l’en-tête ; frequency en entier (2) ou en libellé (Semi-annual).
// Les lignes qui ne forment pas une obligation valide sont ignorées.
// Retourne uniquement les lignes **valides**.
// num_ignored/warnings sont optionnels pour diagnostic.
std::vector<BondRow>
read_bond_csv(const std::string& path,
              std::size_t* num_ignored = nullptr,
              std::vector<std::string>* warnings = nullptr);

// Échéancier : period,time_years,amount
void write_schedule_csv(std::ostream& os, const bw::cashflows::CashFlowSchedule& schedule);

// Courbe prix-rendement : annual_yield,yield_per_period,price
void write_curve_csv(std::ostream& os, const bw::curve::PriceYieldCurve& curve);

} // namespace bw::io
