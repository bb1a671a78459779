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

#pragma once

#include <vector>

#include "src/capabilities/relaxation.h"
#include "src/core/global.h"
#include "src/core/structure.h"

static const json MorseBondPotentialJson = {
    { "well_depth", 0.15 }, // Eh
    { "width", 1.8 }, // 1/Angstrom
    { "repulsion", 1.0 }, // Eh
    { "repulsion_decay", 3.0 } // 1/Angstrom
};

namespace saddle {

/*! \brief Morse term for every bond of the graph plus exp(-b r) repulsion between non-bonded pairs
 *
 * Equilibrium distances are the sums of the covalent radii. The topology is
 * taken from the structure at construction and does not change afterwards.
 */
class MorseBondPotential : public PotentialInterface {
public:
    explicit MorseBondPotential(const Structure& structure, const json& controller = json::object());

    double Calculate(const Geometry& geometry, Geometry& gradient) const override;

    inline int AtomCount() const { return m_atoms; }

private:
    struct Term {
        int i, j;
        double r0;
    };

    int m_atoms = 0;
    std::vector<Term> m_bonds;
    std::vector<IntPair> m_nonbonded;
    double m_de, m_a, m_rep, m_b;
};

} // namespace saddle
