#pragma once
/**
 * @file risk_metrics.hpp
 * @brief Duration et convexité d’un échéancier à rendement fixé.
 *
 * # Notations
 * y = rendement par période, k_i = indice de période, t_i = k_i / f (années),
 * PV_i = CF_i / (1 + y)^{k_i}.
 *
 * # Formules
 * - Macaulay (années)   : D_mac = Σ t_i PV_i / Σ PV_i
 * - Modifiée (années)   : D_mod = D_mac / (1 + y)
 * - Convexité (périodes²) : C = Σ k_i (k_i + 1) PV_i / ((1 + y)² Σ PV_i)
 * - Convexité annualisée  : C_ann = C / f²  (à utiliser avec des chocs de taux annuels)
 *
 * # Approximation de variation de prix (choc Δy annuel)
 *   ΔP / P ≈ -D_mod Δy + ½ C_ann Δy²
 *
 * # Erreurs
 * - bw::InvalidRateError si 1 + y <= 0. Pas d’itération, pas d’autre échec.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/market/bond.hpp>

namespace bw {
namespace risk {

/// @brief Mesures de risque à rendement fixé.
struct RiskResult {
  double macaulay_duration;    ///< En années.
  double modified_duration;    ///< En années, D_mac / (1 + y).
  double convexity;            ///< En périodes² (formule périodique).
  double annualized_convexity; ///< convexity / f², en années².
};

/// @brief Décomposition de la variation de prix pour un choc de rendement annuel.
struct PriceChange {
  double duration_effect;  ///< -D_mod * Δy (relatif).
  double convexity_effect; ///< ½ C_ann Δy² (relatif).
  double total_effect;     ///< Somme des deux (relatif).
  double price_change;     ///< price * total_effect.
  double new_price;        ///< price * (1 + total_effect).
};

/// @return Duration de Macaulay en années.
[[nodiscard]] double macaulay_duration(const bw::cashflows::CashFlowSchedule& schedule,
                                       double yield_per_period);

/// @return D_mac / (1 + y). La fréquence est validée ; y est déjà périodique.
[[nodiscard]] double modified_duration(double macaulay_duration, double yield_per_period,
                                       bw::market::Frequency frequency);

/// @return Convexité périodique (périodes²).
[[nodiscard]] double convexity(const bw::cashflows::CashFlowSchedule& schedule,
                               double yield_per_period);

/// @return Convexité annualisée : convexity / f².
[[nodiscard]] double annualized_convexity(const bw::cashflows::CashFlowSchedule& schedule,
                                          double yield_per_period,
                                          bw::market::Frequency frequency);

/// @brief Calcule toutes les mesures en un seul passage sur les flux.
[[nodiscard]] RiskResult compute_risk(const bw::cashflows::CashFlowSchedule& schedule,
                                      double yield_per_period,
                                      bw::market::Frequency frequency);

/// @brief Approximation duration + convexité pour un choc annuel annual_shift (ex : 0.0001 = 1 bp).
[[nodiscard]] PriceChange estimate_price_change(double price, const RiskResult& risk,
                                                double annual_shift) noexcept;

} // namespace risk
} // namespace bw
