/*
 * <Shared structures for the test executables.>
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

#include <cmath>
#include <vector>

#include "src/core/bond_rearrangement.h"
#include "src/core/global.h"
#include "src/core/structure.h"

namespace fixtures {

/*! \brief BrC(CC(C)C)C1CC1CC and a hydroxide ion, 32 atoms
 *
 *  0 Br, 1 - 10 C, 11 - 29 H, 30 O, 31 H
 *  C1 carries Br0; C6, C7, C8 form the cyclopropane ring; O30 is not bonded to the organic part.
 */
inline saddle::Structure ReactantComplex()
{
    const std::vector<IntPair> heavy_bonds = {
        { 0, 1 }, { 1, 2 }, { 2, 3 }, { 3, 4 }, { 3, 5 }, { 1, 6 }, { 6, 7 }, { 7, 8 }, { 6, 8 }, { 8, 9 }, { 9, 10 }
    };
    // parent heavy atom of hydrogens 11 .. 29
    const std::vector<int> parents = { 1, 2, 2, 3, 4, 4, 4, 5, 5, 5, 6, 7, 7, 8, 9, 9, 10, 10, 10 };

    const std::vector<Position> heavy = {
        Position(0.00, 0.00, 0.00), // Br0
        Position(1.95, 0.00, 0.00), // C1
        Position(2.60, 1.40, 0.00), // C2
        Position(4.10, 1.50, 0.00), // C3
        Position(4.70, 2.90, 0.00), // C4
        Position(4.80, 0.60, 1.00), // C5
        Position(2.60, -1.30, 0.30), // C6
        Position(2.10, -2.60, -0.30), // C7
        Position(3.50, -2.40, 0.10), // C8
        Position(4.30, -3.50, 0.70), // C9
        Position(5.80, -3.30, 0.80) // C10
    };

    saddle::Structure structure;
    for (int i = 0; i < static_cast<int>(heavy.size()); ++i)
        structure.addAtom(AtomDef(i == 0 ? 35 : 6, heavy[i]));

    for (int k = 0; k < static_cast<int>(parents.size()); ++k) {
        Position direction(std::cos(2.4 * k), std::sin(2.4 * k), 0.5 * std::cos(1.3 * k));
        structure.addAtom(AtomDef(1, heavy[parents[k]] + 1.09 * direction.normalized()));
    }
    structure.addAtom(AtomDef(8, Position(-0.30, 0.40, 3.00)));
    structure.addAtom(AtomDef(1, Position(-0.30, 1.30, 3.40)));

    for (const auto& bond : heavy_bonds)
        structure.addBond(bond.first, bond.second);
    for (int k = 0; k < static_cast<int>(parents.size()); ++k)
        structure.addBond(parents[k], 11 + k);
    structure.addBond(30, 31);

    structure.setName("sn2_complex");
    structure.setCharge(-1);
    return structure;
}

/* OH- attacks C1, bromide leaves */
inline saddle::BondRearrangement SN2Rearrangement()
{
    return saddle::BondRearrangement({ { 1, 30 } }, { { 0, 1 } });
}

inline std::vector<int> SN2ActiveAtoms()
{
    return { 0, 1, 30 };
}

}
