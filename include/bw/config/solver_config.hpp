#pragma once
/**
 * @file solver_config.hpp
 * @brief Configuration du solveur de rendement (prix -> YTM).
 *
 * # Contenu
 * - tolerance       : tolérance relative sur le prix, |P(y) - P_mkt| <= tolerance * max(1, P_mkt).
 * - yield_tolerance : arrêt si le bracket [a,b] devient plus étroit que ce seuil (en y périodique).
 * - max_iterations  : plafond d’itérations (Newton + bisection confondus).
 * - bracket_lo / bracket_hi : intervalle de recherche initial en rendement **périodique**.
 * - max_bracket_expansions  : nb de doublements autorisés de bracket_hi si P(hi) > P_mkt.
 *
 * # Domaine
 * - bracket_lo > -1 (facteur d’actualisation 1 + y > 0).
 * - bracket_lo < bracket_hi.
 *
 * # Remarques
 * - Les défauts conviennent à tout coupon raisonnable : y ∈ (-1 + 1e-9, 10] par période,
 *   soit jusqu’à 1000 % par période avant élargissement.
 */

#include <stdexcept> // std::invalid_argument

namespace bw {
namespace config {

/// @brief Paramètres d’inversion prix -> rendement.
struct YieldSolverConfig {
  double tolerance              = 1e-10;     ///< Tolérance relative sur le prix.
  double yield_tolerance        = 1e-14;     ///< Largeur minimale du bracket.
  int    max_iterations         = 100;       ///< Plafond d’itérations.
  double bracket_lo             = -1.0 + 1e-9; ///< Borne basse (y périodique, > -1).
  double bracket_hi             = 10.0;      ///< Borne haute initiale (y périodique).
  int    max_bracket_expansions = 10;        ///< Doublements max de bracket_hi.

  /// @brief Vérifie la cohérence des paramètres.
  /// @throws std::invalid_argument si un paramètre est hors domaine.
  void validate() const {
    if (!(tolerance > 0.0)) {
      throw std::invalid_argument("YieldSolverConfig: tolerance must be > 0");
    }
    if (!(yield_tolerance >= 0.0)) {
      throw std::invalid_argument("YieldSolverConfig: yield_tolerance must be >= 0");
    }
    if (max_iterations < 1) {
      throw std::invalid_argument("YieldSolverConfig: max_iterations must be >= 1");
    }
    if (!(bracket_lo > -1.0)) {
      throw std::invalid_argument("YieldSolverConfig: bracket_lo must be > -1");
    }
    if (!(bracket_hi > bracket_lo)) {
      throw std::invalid_argument("YieldSolverConfig: bracket_hi must be > bracket_lo");
    }
    if (max_bracket_expansions < 0) {
      throw std::invalid_argument("YieldSolverConfig: max_bracket_expansions must be >= 0");
    }
  }
};

} // namespace config
} // namespace bw
