/*
 * <L-BFGS relaxation under a fixed atom-atom distance.>
 * Copyright (C) 2025 - 2026 The Saddle authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#pragma once

#include <memory>

#include <Eigen/Dense>

#include "src/capabilities/relaxation.h"
#include "src/core/diagnostics.h"
#include "src/core/global.h"

static const json ConstrainedRelaxerJson = {
    { "max_iter", 500 },
    { "grad_tol", 1e-4 }, // Eh/Angstrom, largest atomic gradient
    { "lbfgs_m", 6 },
    { "max_linesearch", 20 },
    { "min_step", 1e-20 },
    { "accept_unconverged", false }
};

namespace saddle {

/*! \brief Energy of a geometry with the constraint imposed, as function of the free coordinates
 *
 * The functor handed to LBFGSpp. Coordinates are ordered atom by atom (x, y, z).
 * The gradient is the chain rule through the constraint, on a geometry that
 * already fulfils the constraint it equals the projected gradient.
 * Non-finite energies are reported as +infinity so the line search backs off.
 */
class ConstrainedObjective {
public:
    ConstrainedObjective(const PotentialInterface& potential, const DistanceConstraint& constraint, int atoms);

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad);

    inline int Evaluations() const { return m_evaluations; }
    inline bool HasBest() const { return m_best.size() > 0; }

    /* lowest finite point evaluated so far */
    inline const Eigen::VectorXd& Best() const { return m_best; }

private:
    const PotentialInterface& m_potential;
    DistanceConstraint m_constraint;
    int m_atoms = 0;
    int m_evaluations = 0;
    double m_best_energy = 0.0;
    Eigen::VectorXd m_best;
};

/*! \brief L-BFGS relaxation with one atom pair held at a target distance
 *
 * The distance is imposed by moving both atoms symmetrically about their
 * midpoint. A relaxation only succeeds if the largest projected atomic
 * gradient of the final geometry is below grad_tol, or accept_unconverged is set.
 */
class ConstrainedRelaxer : public RelaxationInterface {
public:
    explicit ConstrainedRelaxer(std::shared_ptr<const PotentialInterface> potential,
        std::shared_ptr<const Diagnostics> diagnostics = Diagnostics::Shared());

    RelaxResult Relax(const Structure& structure, const DistanceConstraint& constraint, const json& settings) const override;

    static void ImposeDistance(Geometry& geometry, const DistanceConstraint& constraint);
    static void ProjectGradient(const Geometry& geometry, Geometry& gradient, const IntPair& pair);

private:
    std::shared_ptr<const PotentialInterface> m_potential;
    std::shared_ptr<const Diagnostics> m_diagnostics;
};

} // namespace saddle
