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

#include "src/capabilities/constrained_relaxer.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <LBFGS.h>

#include <fmt/core.h>

using Eigen::VectorXd;
using namespace LBFGSpp;

namespace saddle {

ConstrainedObjective::ConstrainedObjective(const PotentialInterface& potential, const DistanceConstraint& constraint, int atoms)
    : m_potential(potential)
    , m_constraint(constraint)
    , m_atoms(atoms)
{
}

double ConstrainedObjective::operator()(const VectorXd& x, VectorXd& grad)
{
    const Geometry unconstrained = Eigen::Map<const Geometry>(x.data(), m_atoms, 3);
    Geometry geometry = unconstrained;
    ConstrainedRelaxer::ImposeDistance(geometry, m_constraint);

    Geometry gradient;
    const double energy = m_potential.Calculate(geometry, gradient);
    ++m_evaluations;
    if (!std::isfinite(energy) || !gradient.allFinite()) {
        grad.setZero(x.size());
        return std::numeric_limits<double>::infinity();
    }

    // d(constrained)/d(free) for the pair: 1/2 of the common motion plus the
    // rotation of the bond vector scaled by target/current distance
    const int i = m_constraint.pair.first, j = m_constraint.pair.second;
    Position u = (unconstrained.row(i) - unconstrained.row(j)).transpose();
    const double r = u.norm();
    if (r > 1e-10) {
        u /= r;
        const Position gi = gradient.row(i).transpose(), gj = gradient.row(j).transpose();
        const Position common = 0.5 * (gi + gj);
        Position relative = gi - gj;
        relative -= u * u.dot(relative);
        relative *= 0.5 * m_constraint.distance / r;
        gradient.row(i) = (common + relative).transpose();
        gradient.row(j) = (common - relative).transpose();
    }

    grad = Eigen::Map<const VectorXd>(gradient.data(), gradient.size());
    if (!HasBest() || energy < m_best_energy) {
        m_best_energy = energy;
        m_best = x;
    }
    return energy;
}

ConstrainedRelaxer::ConstrainedRelaxer(std::shared_ptr<const PotentialInterface> potential, std::shared_ptr<const Diagnostics> diagnostics)
    : m_potential(std::move(potential))
    , m_diagnostics(std::move(diagnostics))
{
    if (!m_potential)
        throw InputError("constrained relaxation without a potential");
    if (!m_diagnostics)
        throw InputError("constrained relaxation without diagnostics");
}

void ConstrainedRelaxer::ImposeDistance(Geometry& geometry, const DistanceConstraint& constraint)
{
    const int i = constraint.pair.first, j = constraint.pair.second;
    Position ri = geometry.row(i).transpose(), rj = geometry.row(j).transpose();
    Position mid = 0.5 * (ri + rj);
    Position u = ri - rj;
    if (u.norm() < 1e-10)
        u = Position(1, 0, 0);
    u.normalize();
    geometry.row(i) = (mid + 0.5 * constraint.distance * u).transpose();
    geometry.row(j) = (mid - 0.5 * constraint.distance * u).transpose();
}

void ConstrainedRelaxer::ProjectGradient(const Geometry& geometry, Geometry& gradient, const IntPair& pair)
{
    const int i = pair.first, j = pair.second;
    Position u = (geometry.row(i) - geometry.row(j)).transpose();
    if (u.norm() < 1e-10)
        return;
    u.normalize();
    double stretch = 0.5 * (gradient.row(i) - gradient.row(j)).dot(u.transpose());
    gradient.row(i) -= stretch * u.transpose();
    gradient.row(j) += stretch * u.transpose();
}

RelaxResult ConstrainedRelaxer::Relax(const Structure& structure, const DistanceConstraint& constraint, const json& settings) const
{
    structure.CheckPair(constraint.pair);
    if (!(constraint.distance > 0))
        return RelaxResult::failed_result(fmt::format("invalid target distance {}", constraint.distance));

    json parameter = MergeJson(ConstrainedRelaxerJson, settings);
    const int max_iter = Json2KeyWord<int>(parameter, "max_iter");
    const double grad_tol = Json2KeyWord<double>(parameter, "grad_tol");
    const bool accept_unconverged = Json2KeyWord<bool>(parameter, "accept_unconverged");

    LBFGSParam<double> param;
    param.m = Json2KeyWord<int>(parameter, "lbfgs_m");
    // LBFGSpp stops on the norm of the full gradient
    param.epsilon = 0.5 * grad_tol;
    param.epsilon_rel = 0.0;
    param.max_iterations = max_iter;
    param.max_linesearch = Json2KeyWord<int>(parameter, "max_linesearch");
    param.min_step = Json2KeyWord<double>(parameter, "min_step");
    param.linesearch = LBFGS_LINESEARCH_BACKTRACKING_STRONG_WOLFE;
    try {
        param.check_param();
    } catch (const std::invalid_argument& error) {
        throw ConfigError(fmt::format("invalid relaxation settings: {}", error.what()));
    }
    if (max_iter < 1)
        throw ConfigError(fmt::format("max_iter must be positive, got {}", max_iter));

    const int atoms = static_cast<int>(structure.AtomCount());
    Geometry geometry = structure.getGeometry();
    ImposeDistance(geometry, constraint);

    Geometry gradient;
    double energy = m_potential->Calculate(geometry, gradient);
    if (!std::isfinite(energy))
        return RelaxResult::failed_result("non-finite energy at the starting geometry");

    ConstrainedObjective objective(*m_potential, constraint, atoms);
    VectorXd parameters = Eigen::Map<const VectorXd>(geometry.data(), geometry.size());
    double fx = energy;
    int iterations = 0;
    std::string stopped;

    LBFGSSolver<double, LineSearchBacktracking> solver(param);
    try {
        iterations = solver.minimize(objective, parameters, fx);
    } catch (const InputError&) {
        throw;
    } catch (const std::exception& error) {
        // the line search gave up, continue with the lowest point found
        stopped = error.what();
        iterations = objective.Evaluations();
        if (objective.HasBest())
            parameters = objective.Best();
    }

    geometry = Eigen::Map<const Geometry>(parameters.data(), atoms, 3);
    ImposeDistance(geometry, constraint);
    energy = m_potential->Calculate(geometry, gradient);
    if (!std::isfinite(energy))
        return RelaxResult::failed_result(fmt::format("non-finite energy after {} iterations", iterations));
    ProjectGradient(geometry, gradient, constraint.pair);

    const double largest = gradient.rowwise().norm().maxCoeff();
    if (largest >= grad_tol) {
        std::string reason = stopped.empty()
            ? fmt::format("no convergence within {} iterations", max_iter)
            : fmt::format("line search stopped ({})", stopped);
        reason += fmt::format(", largest gradient {:.2e} Eh/A", largest);
        if (!accept_unconverged)
            return RelaxResult::failed_result(reason);
        m_diagnostics->warn(fmt::format("Relaxation not converged: {}, keeping the last geometry", reason));
    }

    return RelaxResult::success_result(geometry, energy, iterations);
}

} // namespace saddle
