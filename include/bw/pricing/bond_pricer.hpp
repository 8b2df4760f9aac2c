#pragma once
/**
 * @file bond_pricer.hpp
 * @brief Valeur actuelle d’un échéancier, coupon couru, décomposition clean/dirty.
 *
 * # Formule
 *   P(y) = Σ_i CF_i / (1 + y)^{k_i}
 * avec y le rendement **par période** et k_i l’indice de période du flux i.
 *
 * # Propriétés
 * - Strictement décroissante en y sur (-1, +∞) dès que les flux sont > 0.
 * - Obligation au pair : si y = coupon_rate / frequency alors P = nominal.
 *
 * # Clean / dirty
 *   dirty = P(y)                       (tous les flux futurs actualisés)
 *   accrued = coupon_périodique * fraction_écoulée
 *   clean = dirty - accrued
 *
 * # Erreurs
 * - bw::InvalidRateError si 1 + y <= 0 ou y non fini.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/market/bond.hpp>

namespace bw {
namespace pricing {

/// @brief Résultat de pricing d’une obligation.
struct PricingResult {
  double price;            ///< PV des flux futurs (= dirty_price).
  double clean_price;      ///< dirty - accrued.
  double dirty_price;      ///< Prix payé par l’acheteur.
  double accrued_interest; ///< Coupon couru.
};

/// @brief Vérifie que 1 + y > 0.
/// @throws bw::InvalidRateError
void check_yield(double yield_per_period);

/// @brief PV d’un échéancier au rendement périodique y.
/// @throws bw::InvalidRateError si 1 + y <= 0.
double price(const bw::cashflows::CashFlowSchedule& schedule, double yield_per_period);

/// @brief PV au rendement annuel ; convertit une seule fois via to_periodic().
double price_annual(const bw::cashflows::CashFlowSchedule& schedule, double annual_yield,
                    bw::market::Frequency frequency);

/// @brief dP/dy (par période), utilisé par le solveur Newton.
double price_derivative(const bw::cashflows::CashFlowSchedule& schedule, double yield_per_period);

/**
 * @brief Coupon couru = period_coupon * fraction_elapsed.
 * @param fraction_elapsed Fraction de la période écoulée, dans [0, 1).
 * @throws std::invalid_argument si fraction hors [0, 1).
 */
double accrued_interest(double period_coupon, double fraction_elapsed);

/// @brief Variante qui lit le coupon périodique sur l’obligation.
double accrued_interest(const bw::market::Bond& bond, double fraction_elapsed);

/// @brief Prix complet (PV, coupon couru, clean/dirty) au rendement périodique.
PricingResult price_bond(const bw::market::Bond& bond, double yield_per_period,
                         double fraction_elapsed = 0.0);

/// @brief Rendement courant = coupon annuel / prix.
/// @throws bw::InvalidPriceError si price <= 0.
double current_yield(const bw::market::Bond& bond, double price);

} // namespace pricing
} // namespace bw
