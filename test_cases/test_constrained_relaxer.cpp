/*
 * <Tests for the constrained relaxation and the Morse model potential.>
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
#include "src/capabilities/model_potential.h"
#include "src/core/elements.h"
#include "src/core/saddle_logger.h"

#include "test_cases/test_utils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

using namespace saddle;

namespace {

Structure StretchedWater()
{
    Structure water;
    water.addAtom(AtomDef(8, Position(0.0, 0.0, 0.0)));
    water.addAtom(AtomDef(1, Position(1.2, 0.0, 0.0)));
    water.addAtom(AtomDef(1, Position(-0.2, 1.1, 0.1)));
    water.addBond(0, 1);
    water.addBond(0, 2);
    return water;
}

class BrokenPotential : public PotentialInterface {
public:
    double Calculate(const Geometry& geometry, Geometry& gradient) const override
    {
        gradient = Geometry::Zero(geometry.rows(), 3);
        return std::numeric_limits<double>::quiet_NaN();
    }
};

/* |x| of the last atom, the gradient never vanishes */
class KinkedPotential : public PotentialInterface {
public:
    double Calculate(const Geometry& geometry, Geometry& gradient) const override
    {
        const int last = static_cast<int>(geometry.rows()) - 1;
        gradient = Geometry::Zero(geometry.rows(), 3);
        gradient(last, 0) = geometry(last, 0) >= 0 ? 1.0 : -1.0;
        return std::abs(geometry(last, 0));
    }
};

double Energy(const PotentialInterface& potential, const Geometry& geometry)
{
    Geometry gradient;
    return potential.Calculate(geometry, gradient);
}

}

void test_morse_potential(SaddleTest& tester)
{
    std::cout << "\n=== Testing Morse Bond Potential ===" << std::endl;

    Structure water = StretchedWater();
    MorseBondPotential potential(water, { { "repulsion", 0.0 } });

    Geometry geometry = water.getGeometry();
    Geometry gradient;
    potential.Calculate(geometry, gradient);

    // central differences
    const double h = 1e-5;
    double largest = 0.0;
    for (int i = 0; i < geometry.rows(); ++i) {
        for (int j = 0; j < 3; ++j) {
            Geometry plus = geometry, minus = geometry;
            plus(i, j) += h;
            minus(i, j) -= h;
            double numerical = (Energy(potential, plus) - Energy(potential, minus)) / (2 * h);
            largest = std::max(largest, std::abs(numerical - gradient(i, j)));
        }
    }
    tester.assert_equal(0.0, largest, 1e-7, "analytic gradient matches finite differences");

    Geometry minimum(2, 3);
    minimum << 0.0, 0.0, 0.0,
        Elements::CovalentRadius[8] + Elements::CovalentRadius[1], 0.0, 0.0;
    Structure hydroxyl;
    hydroxyl.addAtom(AtomDef(8, Position(0, 0, 0)));
    hydroxyl.addAtom(AtomDef(1, Position(1, 0, 0)));
    hydroxyl.addBond(0, 1);
    MorseBondPotential bond(hydroxyl);
    tester.assert_equal(0.0, Energy(bond, minimum), 1e-14, "zero energy at the covalent distance");

    MorseBondPotential repulsive(water);
    Geometry repulsion_gradient;
    repulsive.Calculate(geometry, repulsion_gradient);
    largest = 0.0;
    for (int i = 0; i < geometry.rows(); ++i) {
        for (int j = 0; j < 3; ++j) {
            Geometry plus = geometry, minus = geometry;
            plus(i, j) += h;
            minus(i, j) -= h;
            largest = std::max(largest, std::abs((Energy(repulsive, plus) - Energy(repulsive, minus)) / (2 * h) - repulsion_gradient(i, j)));
        }
    }
    tester.assert_equal(0.0, largest, 1e-7, "gradient with repulsion matches finite differences");

    tester.assert_throws<InputError>([&]() { Energy(repulsive, Geometry::Zero(2, 3)); }, "geometry of the wrong size");
}

void test_constraint_and_descent(SaddleTest& tester)
{
    std::cout << "\n=== Testing Constrained Relaxation ===" << std::endl;

    Structure water = StretchedWater();
    auto potential = std::make_shared<MorseBondPotential>(water, json{ { "repulsion", 0.0 } });
    ConstrainedRelaxer relaxer(potential);

    const double start_energy = Energy(*potential, water.getGeometry());
    RelaxResult result = relaxer.Relax(water, { { 0, 1 }, 1.2 }, json::object());

    tester.assert_true(result.success, "relaxation converged: " + result.error_message);
    tester.assert_true(result.energy < start_energy, "energy lowered");
    tester.assert_equal(1.2, (result.geometry.row(0) - result.geometry.row(1)).norm(), 1e-10, "constrained distance kept");
    tester.assert_equal(Elements::CovalentRadius[8] + Elements::CovalentRadius[1], (result.geometry.row(0) - result.geometry.row(2)).norm(), 1e-3, "free bond relaxed to its minimum");
    tester.assert_true(result.iterations > 0, "iterations counted");
    tester.assert_equal(1.2, water.CalculateDistance(0, 1), 1e-14, "input structure unchanged");
    tester.assert_equal(0.0, (water.getGeometry() - StretchedWater().getGeometry()).norm(), 1e-14, "input geometry unchanged");

    RelaxResult shorter = relaxer.Relax(water, { { 1, 0 }, 0.8 }, json::object());
    tester.assert_true(shorter.success, "relaxation at a new target");
    tester.assert_equal(0.8, (shorter.geometry.row(0) - shorter.geometry.row(1)).norm(), 1e-10, "new target distance imposed");
}

void test_repulsion_opens_angle(SaddleTest& tester)
{
    std::cout << "\n=== Testing Non-bonded Repulsion ===" << std::endl;

    Structure water = StretchedWater();
    ConstrainedRelaxer relaxer(std::make_shared<MorseBondPotential>(water));
    RelaxResult result = relaxer.Relax(water, { { 0, 1 }, 1.2 }, json{ { "accept_unconverged", true }, { "max_iter", 3000 } });

    auto angle = [](const Geometry& geometry) {
        Position a = (geometry.row(1) - geometry.row(0)).transpose();
        Position b = (geometry.row(2) - geometry.row(0)).transpose();
        return std::acos(a.normalized().dot(b.normalized()));
    };
    tester.assert_true(result.success, "relaxation with repulsion");
    tester.assert_true(angle(result.geometry) > angle(water.getGeometry()), "hydrogens pushed apart");
}

void test_projection(SaddleTest& tester)
{
    std::cout << "\n=== Testing Gradient Projection ===" << std::endl;

    Geometry geometry(2, 3);
    geometry << 0.0, 0.0, 0.0,
        1.0, 1.0, 0.0;
    Geometry gradient(2, 3);
    gradient << 0.3, -0.2, 0.1,
        -0.1, 0.4, 0.2;
    Geometry projected = gradient;
    ConstrainedRelaxer::ProjectGradient(geometry, projected, { 0, 1 });

    Position u = (geometry.row(0) - geometry.row(1)).transpose().normalized();
    tester.assert_equal(0.0, (projected.row(0) - projected.row(1)).dot(u.transpose()), 1e-14, "no relative force along the bond");
    tester.assert_equal(0.0, (projected.row(0) + projected.row(1) - gradient.row(0) - gradient.row(1)).norm(), 1e-14, "total force kept");

    ConstrainedRelaxer::ImposeDistance(geometry, { { 0, 1 }, 2.0 });
    tester.assert_equal(2.0, (geometry.row(0) - geometry.row(1)).norm(), 1e-14, "distance imposed");
    tester.assert_equal(0.0, (0.5 * (geometry.row(0) + geometry.row(1)) - Eigen::RowVector3d(0.5, 0.5, 0.0)).norm(), 1e-14, "midpoint kept");
}

void test_failures(SaddleTest& tester)
{
    std::cout << "\n=== Testing Failed Relaxations ===" << std::endl;

    Structure water = StretchedWater();
    ConstrainedRelaxer broken(std::make_shared<BrokenPotential>());
    RelaxResult nan = broken.Relax(water, { { 0, 1 }, 1.0 }, json::object());
    tester.assert_true(!nan.success && !nan.error_message.empty(), "non-finite energy is a failure");

    ConstrainedRelaxer relaxer(std::make_shared<MorseBondPotential>(water));
    RelaxResult short_run = relaxer.Relax(water, { { 0, 1 }, 1.2 }, json{ { "max_iter", 1 } });
    tester.assert_true(!short_run.success, "no convergence in one iteration");

    RelaxResult accepted = relaxer.Relax(water, { { 0, 1 }, 1.2 }, json{ { "max_iter", 1 }, { "accept_unconverged", true } });
    tester.assert_true(accepted.success && accepted.iterations >= 1, "unconverged geometry accepted on request");

    RelaxResult negative = relaxer.Relax(water, { { 0, 1 }, -1.0 }, json::object());
    tester.assert_true(!negative.success, "negative target distance");

    tester.assert_throws<InputError>([&]() { relaxer.Relax(water, { { 0, 5 }, 1.0 }, json::object()); }, "constraint outside the structure");
    tester.assert_throws<InputError>([]() { ConstrainedRelaxer without_potential(nullptr); }, "relaxer without potential");
    tester.assert_throws<ConfigError>([&]() { relaxer.Relax(water, { { 0, 1 }, 1.2 }, json{ { "lbfgs_m", 0 } }); }, "invalid history size");
}

void test_stalled_relaxation(SaddleTest& tester)
{
    std::cout << "\n=== Testing Stalled Relaxations ===" << std::endl;

    Structure water = StretchedWater();
    auto diagnostics = std::make_shared<RecordingDiagnostics>();
    ConstrainedRelaxer relaxer(std::make_shared<KinkedPotential>(), diagnostics);

    RelaxResult stalled = relaxer.Relax(water, { { 0, 1 }, 1.2 }, json{ { "max_iter", 200 } });
    tester.assert_true(!stalled.success, "no success while the gradient stays above grad_tol");
    tester.assert_true(stalled.error_message.find("largest gradient") != std::string::npos, "remaining gradient reported: " + stalled.error_message);
    tester.assert_true(diagnostics->warnings.empty(), "failure is returned, not logged");

    RelaxResult accepted = relaxer.Relax(water, { { 0, 1 }, 1.2 }, json{ { "max_iter", 200 }, { "accept_unconverged", true } });
    tester.assert_true(accepted.success, "stalled geometry accepted on request");
    tester.assert_equal(1, diagnostics->warnings.size(), 1e-10, "accepted stall reported to the given diagnostics");
    tester.assert_equal(1.2, (accepted.geometry.row(0) - accepted.geometry.row(1)).norm(), 1e-10, "constraint kept after a stall");
}

void test_objective_gradient(SaddleTest& tester)
{
    std::cout << "\n=== Testing the Constrained Objective ===" << std::endl;

    Structure water = StretchedWater();
    MorseBondPotential potential(water);
    // the O-H distance is 1.2, the objective pulls it to 0.9
    ConstrainedObjective objective(potential, { { 0, 1 }, 0.9 }, 3);

    Geometry geometry = water.getGeometry();
    Eigen::VectorXd x = Eigen::Map<const Eigen::VectorXd>(geometry.data(), geometry.size());
    Eigen::VectorXd grad(x.size());
    objective(x, grad);

    const double h = 1e-5;
    double largest = 0.0;
    Eigen::VectorXd scratch(x.size());
    for (int k = 0; k < x.size(); ++k) {
        Eigen::VectorXd plus = x, minus = x;
        plus(k) += h;
        minus(k) -= h;
        double numerical = (objective(plus, scratch) - objective(minus, scratch)) / (2 * h);
        largest = std::max(largest, std::abs(numerical - grad(k)));
    }
    tester.assert_equal(0.0, largest, 1e-6, "gradient through the constraint matches finite differences");
    tester.assert_equal(2 * x.size() + 1, objective.Evaluations(), 1e-10, "evaluations counted");

    Geometry constrained = geometry;
    ConstrainedRelaxer::ImposeDistance(constrained, { { 0, 1 }, 0.9 });
    Geometry gradient;
    tester.assert_equal(potential.Calculate(constrained, gradient), objective(x, scratch), 1e-12, "energy of the constrained geometry");
}

int main()
{
    SaddleLogger::initialize(0, true);

    std::cout << "=== Constrained Relaxation Test Suite ===" << std::endl;

    SaddleTest tester;
    test_morse_potential(tester);
    test_constraint_and_descent(tester);
    test_repulsion_opens_angle(tester);
    test_projection(tester);
    test_failures(tester);
    test_stalled_relaxation(tester);
    test_objective_gradient(tester);

    std::cout << "\n=== Test Summary ===" << std::endl;
    tester.print_summary();
    return tester.exit_code();
}
