/*
 * <Simple bonded model potential for scans without an external program.>
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

#include "src/capabilities/model_potential.h"
#include "src/core/elements.h"

#include <cmath>

#include <fmt/core.h>

namespace saddle {

MorseBondPotential::MorseBondPotential(const Structure& structure, const json& controller)
{
    json parameter = MergeJson(MorseBondPotentialJson, controller);
    m_de = Json2KeyWord<double>(parameter, "well_depth");
    m_a = Json2KeyWord<double>(parameter, "width");
    m_rep = Json2KeyWord<double>(parameter, "repulsion");
    m_b = Json2KeyWord<double>(parameter, "repulsion_decay");

    m_atoms = static_cast<int>(structure.AtomCount());
    const MolecularGraph& graph = structure.Graph();
    for (int i = 0; i < m_atoms; ++i) {
        for (int j = i + 1; j < m_atoms; ++j) {
            if (graph.HasBond(i, j))
                m_bonds.push_back({ i, j, Elements::CovalentRadius[structure.Element(i)] + Elements::CovalentRadius[structure.Element(j)] });
            else
                m_nonbonded.emplace_back(i, j);
        }
    }
}

double MorseBondPotential::Calculate(const Geometry& geometry, Geometry& gradient) const
{
    if (geometry.rows() != m_atoms || geometry.cols() != 3)
        throw InputError(fmt::format("geometry with {} rows passed to a potential for {} atoms", geometry.rows(), m_atoms));

    gradient = Geometry::Zero(m_atoms, 3);
    double energy = 0.0;

    for (const auto& bond : m_bonds) {
        Position rij = (geometry.row(bond.i) - geometry.row(bond.j)).transpose();
        double r = rij.norm();
        double e = std::exp(-m_a * (r - bond.r0));
        energy += m_de * (1 - e) * (1 - e);
        double dEdr = 2 * m_de * m_a * e * (1 - e);
        Position g = dEdr * rij / r;
        gradient.row(bond.i) += g.transpose();
        gradient.row(bond.j) -= g.transpose();
    }

    for (const auto& pair : m_nonbonded) {
        Position rij = (geometry.row(pair.first) - geometry.row(pair.second)).transpose();
        double r = rij.norm();
        double e = m_rep * std::exp(-m_b * r);
        energy += e;
        Position g = -m_b * e * rij / r;
        gradient.row(pair.first) += g.transpose();
        gradient.row(pair.second) -= g.transpose();
    }
    return energy;
}

} // namespace saddle
