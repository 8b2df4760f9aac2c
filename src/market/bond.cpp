#include <bw/market/bond.hpp>
#include <bw/core/errors.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace bw {
namespace market {

namespace {

std::string normalize(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// Borne haute du nombre de flux (1000 ans mensuels = 12000 flux)
constexpr double MAX_PERIODS = 12000.0;

// round() et non troncature : 0.99999 an * 12 doit donner 12 périodes
int count_periods(double years, Frequency f) noexcept {
  const double n = years * payments_per_year(f);
  if (n > MAX_PERIODS) return static_cast<int>(MAX_PERIODS) + 1;
  return static_cast<int>(std::lround(n));
}

} // namespace

Frequency frequency_from_int(int n) {
  switch (n) {
    case 1:  return Frequency::Annual;
    case 2:  return Frequency::SemiAnnual;
    case 4:  return Frequency::Quarterly;
    case 12: return Frequency::Monthly;
    default: break;
  }
  throw InvalidBondError("Bond: frequency must be one of 1, 2, 4, 12 (got " + std::to_string(n) + ")");
}

Frequency frequency_from_label(const std::string& label) {
  const std::string s = normalize(label);
  // entier écrit en texte ("2") : même validation que frequency_from_int
  if (!s.empty() && s.size() <= 3 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); })) {
    return frequency_from_int(std::stoi(s));
  }
  if (s == "annual"      || s == "a")  return Frequency::Annual;
  if (s == "semi-annual" || s == "semiannual" || s == "s")  return Frequency::SemiAnnual;
  if (s == "quarterly"   || s == "q")  return Frequency::Quarterly;
  if (s == "monthly"     || s == "m")  return Frequency::Monthly;
  throw InvalidBondError("Bond: unknown frequency label '" + label + "'");
}

std::string to_string(Frequency f) {
  switch (f) {
    case Frequency::Annual:     return "Annual";
    case Frequency::SemiAnnual: return "Semi-annual";
    case Frequency::Quarterly:  return "Quarterly";
    case Frequency::Monthly:    return "Monthly";
  }
  return "Unknown";
}

Bond::Bond(double face_value, double coupon_rate, double years_to_maturity, Frequency frequency)
    : face_value(face_value),
      coupon_rate(coupon_rate),
      years_to_maturity(years_to_maturity),
      frequency(frequency) {
  if (!std::isfinite(face_value) || face_value <= 0.0) {
    throw InvalidBondError("Bond: face_value must be > 0");
  }
  if (!std::isfinite(coupon_rate) || coupon_rate < 0.0) {
    throw InvalidBondError("Bond: coupon_rate must be >= 0");
  }
  if (!std::isfinite(years_to_maturity) || years_to_maturity <= 0.0) {
    throw InvalidBondError("Bond: years_to_maturity must be > 0");
  }
  // Vérifie aussi une enum forgée par cast
  (void)frequency_from_int(payments_per_year(frequency));
  if (count_periods(years_to_maturity, frequency) < 1) {
    throw InvalidBondError("Bond: schedule must cover at least one payment");
  }
  if (count_periods(years_to_maturity, frequency) > MAX_PERIODS) {
    throw InvalidBondError("Bond: too many periods (years_to_maturity * frequency > 12000)");
  }
}

double Bond::period_coupon() const noexcept {
  return face_value * coupon_rate / payments_per_year(frequency);
}

int Bond::num_periods() const noexcept {
  return count_periods(years_to_maturity, frequency);
}

Bond make_bond(double face_value, double coupon_rate, double years_to_maturity,
               int payments_per_year) {
  return Bond(face_value, coupon_rate, years_to_maturity, frequency_from_int(payments_per_year));
}

} // namespace market
} // namespace bw
