#pragma once
/**
 * @file bond.hpp
 * @brief Description d’une obligation à taux fixe (coupon constant, in fine).
 *
 * # Contenu
 * - Nominal (face value) > 0.
 * - Taux de coupon annuel (décimal, ex : 0.05 pour 5 %), >= 0.
 * - Maturité résiduelle en années fractionnelles (> 0).
 * - Fréquence de paiement : 1, 2, 4 ou 12 coupons par an.
 *
 * # Domaine valide
 * - round(years_to_maturity * frequency) >= 1 (au moins un flux).
 *
 * # Convention
 * - Le coupon périodique vaut face_value * coupon_rate / frequency.
 * - Pas de calendrier : la période i tombe à i / frequency années.
 */

#include <string>

namespace bw {
namespace market {

/// @brief Nombre de coupons par an.
enum class Frequency {
  Annual     = 1,  ///< Un coupon par an.
  SemiAnnual = 2,  ///< Semestriel.
  Quarterly  = 4,  ///< Trimestriel.
  Monthly    = 12  ///< Mensuel.
};

/// @return Nombre de paiements par an (1, 2, 4 ou 12).
constexpr int payments_per_year(Frequency f) noexcept { return static_cast<int>(f); }

/// @brief Convertit un nombre de coupons par an en Frequency.
/// @throws bw::InvalidBondError si n n’est pas dans {1,2,4,12}.
Frequency frequency_from_int(int n);

/// @brief Convertit un libellé ("Annual", "Semi-annual", "Quarterly", "Monthly")
///        ou un entier écrit en texte ("2") en Frequency. Insensible à la casse.
/// @throws bw::InvalidBondError si le libellé est inconnu.
Frequency frequency_from_label(const std::string& label);

/// @return Libellé lisible ("Annual", "Semi-annual", ...).
std::string to_string(Frequency f);

/// @brief Obligation à coupon fixe, immuable après construction.
/// @details Tous les invariants sont vérifiés dans le constructeur.
struct Bond {
public:
  const double    face_value;        ///< Nominal (> 0).
  const double    coupon_rate;       ///< Taux de coupon annuel (décimal, >= 0).
  const double    years_to_maturity; ///< Maturité en années (> 0).
  const Frequency frequency;         ///< Coupons par an.

  /// @brief Construit une obligation valide.
  /// @throws bw::InvalidBondError si un invariant est violé.
  Bond(double face_value, double coupon_rate, double years_to_maturity, Frequency frequency);

  /// @return Coupon versé à chaque période.
  double period_coupon() const noexcept;

  /// @return Nombre de périodes round(years * frequency) (>= 1 par construction).
  int num_periods() const noexcept;
};

/// @brief Fabrique validante à partir d’entrées "brutes" (formulaire, CSV, CLI).
/// @param payments_per_year 1, 2, 4 ou 12.
/// @throws bw::InvalidBondError
Bond make_bond(double face_value, double coupon_rate, double years_to_maturity,
               int payments_per_year);

} // namespace market
} // namespace bw
