#include "bw/io/bond_csv.hpp"
#include "bw/core/errors.hpp"
#include <fstream>
#include <ostream>
#include <iomanip>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double tolérant (“” -> NaN)
static double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

// récupère index de colonne via map (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace

namespace bw::io {

std::vector<BondRow>
read_bond_csv(const std::string& path,
              std::size_t* num_ignored,
              std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<BondRow> out;

  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Impossible d'ouvrir le fichier: " + path);
    return out;
  }

  std::string line;
  std::unordered_map<std::string,int> idx;
  bool header_seen = false;
  std::size_t line_no = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      for (int i=0;i<(int)cells.size();++i) idx[lower(cells[i])] = i;
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    const int iId    = col(idx, {"id","name","isin"});
    const int iFace  = col(idx, {"face","face_value","nominal"});
    const int iCpn   = col(idx, {"coupon","coupon_rate"});
    const int iYears = col(idx, {"years","maturity","years_to_maturity"});
    const int iFreq  = col(idx, {"frequency","freq"});
    const int iYield = col(idx, {"yield","annual_yield","discount_rate"});
    const int iPrice = col(idx, {"price","market_price"});

    const std::string where = "ligne " + std::to_string(line_no);
    const std::string freq_txt = get(iFreq);

    // ---- Filtres ----
    std::string why;
    if (freq_txt.empty()) why = "frequence manquante";

    if (why.empty()) {
      try {
        BondRow row{get(iId),
                    bw::market::Bond(parse_double(get(iFace)),
                                     parse_double(get(iCpn)),
                                     parse_double(get(iYears)),
                                     bw::market::frequency_from_label(freq_txt)),
                    parse_double(get(iYield)),
                    parse_double(get(iPrice))};
        if (std::isfinite(row.market_price) && row.market_price <= 0.0) {
          why = "prix <= 0";
        } else {
          out.push_back(row);
          continue;
        }
      } catch (const bw::InvalidBondError& e) {
        why = e.what();
      }
    }

    if (num_ignored) (*num_ignored)++;
    if (warnings) warnings->push_back("Ligne ignorée (" + where + "): " + why);
  }

  return out;
}

void write_schedule_csv(std::ostream& os, const bw::cashflows::CashFlowSchedule& schedule) {
  os << "period,time_years,amount\n";
  os << std::setprecision(10);
  for (const auto& cf : schedule) {
    os << cf.period_index << ',' << cf.time_in_years << ',' << cf.amount << '\n';
  }
}

void write_curve_csv(std::ostream& os, const bw::curve::PriceYieldCurve& curve) {
  os << "annual_yield,yield_per_period,price\n";
  os << std::setprecision(10);
  for (const auto& p : curve) {
    os << p.annual_yield << ',' << p.yield_per_period << ',' << p.price << '\n';
  }
}

} // namespace bw::io
