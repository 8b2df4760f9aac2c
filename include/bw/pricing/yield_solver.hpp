#pragma once
/**
 * @file yield_solver.hpp
 * @brief Inversion prix -> rendement actuariel (YTM).
 *
 * # Méthode
 * f(y) = P(y) - P_mkt est continue et strictement décroissante sur (-1, +∞).
 * - Bracketing [a, b] = [bracket_lo, bracket_hi] (rendements périodiques),
 *   b doublé tant que P(b) > P_mkt (au plus max_bracket_expansions fois).
 * - Newton sécurisé : pas de Newton accepté s’il reste dans ]a, b[ et réduit
 *   assez l’intervalle, sinon bisection. Le bracket est mis à jour à chaque
 *   évaluation, la convergence ne dépend donc pas du choix Newton/bisection.
 *
 * # Arrêt
 * - |f(y)| <= tolerance * max(1, P_mkt), ou |b - a| <= yield_tolerance.
 * - Sinon YieldNotFoundError après max_iterations.
 *
 * # Erreurs
 * - bw::InvalidPriceError  : P_mkt <= 0 ou non fini.
 * - bw::YieldNotFoundError : P_mkt au-delà de P(bracket_lo), pas de bracket
 *   après élargissement, ou pas de convergence dans le plafond d’itérations.
 * - std::invalid_argument  : configuration incohérente.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/config/solver_config.hpp>
#include <bw/market/bond.hpp>

namespace bw {
namespace pricing {

// Tout échec lève YieldNotFoundError : un YieldResult est toujours une solution.
struct YieldResult {
  double yield_per_period; // solution (rendement par période)
  double annual_yield;     // yield_per_period * frequency
  int    iterations;       // itérations effectuées (Newton + bisection)
};

// Prix de marché -> YTM. Le résultat porte les deux conventions (périodique et annuelle).
YieldResult yield_to_maturity(const bw::cashflows::CashFlowSchedule& schedule,
                              double market_price,
                              bw::market::Frequency frequency,
                              const bw::config::YieldSolverConfig& cfg = {});

// Variante qui construit l’échéancier depuis l’obligation.
YieldResult yield_to_maturity(const bw::market::Bond& bond,
                              double market_price,
                              const bw::config::YieldSolverConfig& cfg = {});

} // namespace pricing
} // namespace bw
