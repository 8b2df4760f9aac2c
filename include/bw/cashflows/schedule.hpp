#pragma once
/**
 * @file schedule.hpp
 * @brief Échéancier des flux d’une obligation à coupon fixe.
 *
 * # Construction
 * - n = round(years_to_maturity * frequency) périodes (n >= 1).
 * - Période i (1..n) : temps t_i = i / frequency années.
 * - Montant : coupon périodique, + nominal à la dernière période.
 *
 * # Remarques
 * - Fonction pure, déterministe, sans effet de bord.
 * - L’échéancier est un simple vecteur trié par period_index croissant,
 *   sérialisable ligne à ligne (period, time, amount).
 */

#include <vector>

#include <bw/market/bond.hpp>

namespace bw {
namespace cashflows {

/// @brief Un flux de l’échéancier.
struct CashFlow {
  int    period_index;  ///< Indice de période (1-indexé).
  double time_in_years; ///< period_index / frequency.
  double amount;        ///< Coupon (+ nominal pour le dernier flux).
};

using CashFlowSchedule = std::vector<CashFlow>;

/// @brief Construit l’échéancier d’une obligation.
/// @throws bw::InvalidBondError si l’obligation ne couvre aucune période.
CashFlowSchedule build(const bw::market::Bond& bond);

/// @return Somme non actualisée des flux (limite du prix quand y -> 0).
double total_cash(const CashFlowSchedule& schedule) noexcept;

} // namespace cashflows
} // namespace bw
