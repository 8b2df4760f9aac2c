#pragma once
/**
 * @file errors.hpp
 * @brief Types d’erreurs levés par la lib (exceptions standard spécialisées).
 *
 * # Politique
 * - Levées de manière synchrone, à l’endroit du calcul fautif.
 * - Aucune reprise interne : l’appelant (CLI, UI) attrape et affiche.
 * - Les erreurs de validation dérivent de std::invalid_argument, l’échec
 *   d’inversion (pas de racine / pas de convergence) de std::runtime_error.
 */

#include <stdexcept> // std::invalid_argument, std::runtime_error
#include <string>

namespace bw {

/// @brief Obligation invalide (nominal/maturité <= 0, 0 période, fréquence non supportée).
class InvalidBondError : public std::invalid_argument {
public:
  explicit InvalidBondError(const std::string& what) : std::invalid_argument(what) {}
};

/// @brief Taux invalide : facteur d’actualisation 1 + y <= 0 (ou y non fini).
class InvalidRateError : public std::invalid_argument {
public:
  explicit InvalidRateError(const std::string& what) : std::invalid_argument(what) {}
};

/// @brief Prix de marché invalide (<= 0 ou non fini).
class InvalidPriceError : public std::invalid_argument {
public:
  explicit InvalidPriceError(const std::string& what) : std::invalid_argument(what) {}
};

/// @brief Le solveur de rendement n’a pas pu encadrer la racine ou converger.
class YieldNotFoundError : public std::runtime_error {
public:
  explicit YieldNotFoundError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace bw
