#pragma once
/**
 * @file rates.hpp
 * @brief Conventions de taux : passage annuel <-> périodique, fractions de coupon couru.
 *
 * # Règle
 * Le moteur de pricing travaille **toujours** en rendement périodique
 * (y_p = rendement par période de coupon). Les rendements annuels n’entrent
 * que par to_periodic() et ne sortent que par to_annual() : c’est le seul
 * endroit où l’on divise (ou multiplie) par la fréquence.
 *
 * # Day count
 * - Thirty360  : année de 360 jours, une période dure 360 / frequency jours.
 * - Actual365  : année de 365 jours, une période dure 365 / frequency jours.
 * Pas de calendrier ni d’ajustement de jours ouvrés.
 */

#include <bw/market/bond.hpp>

namespace bw {
namespace market {

/// @brief Convention de décompte des jours pour le coupon couru.
enum class DayCount {
  Thirty360, ///< Année de 360 jours.
  Actual365  ///< Année de 365 jours.
};

/// @brief Rendement annuel (composé à la fréquence f) -> rendement par période.
constexpr double to_periodic(double annual_yield, Frequency f) noexcept {
  return annual_yield / payments_per_year(f);
}

/// @brief Rendement par période -> rendement annuel (composé à la fréquence f).
constexpr double to_annual(double yield_per_period, Frequency f) noexcept {
  return yield_per_period * payments_per_year(f);
}

/// @return Nombre de jours dans une période de coupon pour la convention donnée.
double days_per_period(Frequency f, DayCount dc) noexcept;

/**
 * @brief Fraction de la période de coupon écoulée depuis le dernier paiement.
 * @param days_since_last_payment Jours écoulés (>= 0).
 * @return days / days_per_period(f, dc). Non bornée à 1 : accrued_interest()
 *         rejette une fraction >= 1.
 * @throws std::invalid_argument si days < 0 ou non fini.
 */
double accrual_fraction(double days_since_last_payment, Frequency f,
                        DayCount dc = DayCount::Thirty360);

} // namespace market
} // namespace bw
