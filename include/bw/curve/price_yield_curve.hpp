#pragma once
#include <cstddef>
#include <iterator>
#include <vector>

#include "bw/cashflows/schedule.hpp"
#include "bw/market/bond.hpp"

namespace bw::curve {

struct CurvePoint {
  double annual_yield{0.0};     // rendement annuel (axe x du graphe)
  double yield_per_period{0.0}; // annual_yield / f
  double price{0.0};            // P(yield_per_period)
};

/**
 * Courbe prix-rendement sur une grille linéaire de rendements annuels.
 * Séquence finie et paresseuse : chaque point est pricé au déréférencement,
 * on peut la parcourir plusieurs fois (begin() repart de zéro).
 * Point j : y_j = lo + j (hi - lo) / (n - 1) ; n == 1 → lo ; n == 0 → vide.
 * Un rendement invalide (1 + y/f <= 0) lève InvalidRateError au déréférencement.
 * La courbe garde une **copie** de l’échéancier (pas de référence pendante).
 */
class PriceYieldCurve {
public:
  class const_iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = CurvePoint;
    using difference_type   = std::ptrdiff_t;
    using pointer           = void;
    using reference         = CurvePoint;

    const_iterator() = default;
    const_iterator(const PriceYieldCurve* c, std::size_t j) : curve_(c), j_(j) {}

    CurvePoint operator*() const { return curve_->at(j_); }
    const_iterator& operator++() { ++j_; return *this; }
    const_iterator operator++(int) { auto tmp = *this; ++j_; return tmp; }

    bool operator==(const const_iterator& o) const { return curve_ == o.curve_ && j_ == o.j_; }
    bool operator!=(const const_iterator& o) const { return !(*this == o); }

  private:
    const PriceYieldCurve* curve_{nullptr};
    std::size_t j_{0};
  };

  PriceYieldCurve(bw::cashflows::CashFlowSchedule schedule,
                  bw::market::Frequency frequency,
                  double annual_lo, double annual_hi, std::size_t n_points);

  std::size_t size() const noexcept { return n_; }
  bool empty() const noexcept { return n_ == 0; }

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end()   const { return const_iterator(this, n_); }

  // Rendement annuel du point j (sans pricing).
  double yield_at(std::size_t j) const noexcept;

  // Point j pricé à la demande ; std::out_of_range si j >= size().
  CurvePoint at(std::size_t j) const;

  // Matérialise toute la courbe.
  std::vector<CurvePoint> sample() const;

private:
  bw::cashflows::CashFlowSchedule schedule_;
  bw::market::Frequency frequency_;
  double lo_, hi_;
  std::size_t n_;
};

// Grille par défaut de l’outil d’origine : 1 % → 15 % annuel, 100 points.
PriceYieldCurve default_curve(const bw::cashflows::CashFlowSchedule& schedule,
                              bw::market::Frequency frequency);

} // namespace bw::curve
