/*
 * <Reduction of a structure to its reactive core.>
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

#include "src/capabilities/fragment_stripper.h"
#include "src/core/elements.h"

#include <utility>

#include <fmt/core.h>

namespace saddle {

std::vector<IntPair> RemapPairs(const std::vector<IntPair>& pairs, const std::vector<int>& old_to_new)
{
    std::vector<IntPair> remapped;
    for (const auto& pair : pairs) {
        int i = old_to_new[pair.first], j = old_to_new[pair.second];
        if (i < 0 || j < 0)
            continue;
        remapped.emplace_back(i, j);
    }
    return remapped;
}

FragmentStripper::FragmentStripper(const json& controller, std::shared_ptr<const Diagnostics> diagnostics)
    : m_diagnostics(std::move(diagnostics))
{
    if (!m_diagnostics)
        throw InputError("fragment stripping without diagnostics");
    m_controller = MergeJson(FragmentStripperJson, controller);
    m_cap_hydrogens = Json2KeyWord<bool>(m_controller, "cap_hydrogens");
}

StripResult FragmentStripper::Strip(const Structure& structure, const std::optional<std::set<int>>& core_atoms, const BondRearrangement& bond_rearrangement) const
{
    bond_rearrangement.Validate(structure);

    const int atoms = static_cast<int>(structure.AtomCount());
    StripResult result;

    if (!core_atoms || static_cast<int>(core_atoms->size()) >= atoms) {
        if (core_atoms)
            for (int atom : *core_atoms)
                structure.CheckIndex(atom);
        m_diagnostics->info("Core covers the whole structure, nothing to strip");
        result.structure = structure;
        result.bond_rearrangement = bond_rearrangement;
        result.old_to_new.resize(atoms);
        for (int i = 0; i < atoms; ++i)
            result.old_to_new[i] = i;
        return result;
    }

    for (int atom : *core_atoms)
        structure.CheckIndex(atom);

    result.old_to_new.assign(atoms, -1);
    int index = 0;
    for (int atom : *core_atoms)
        result.old_to_new[atom] = index++;

    const MolecularGraph& graph = structure.Graph();
    Structure fragment;
    for (int atom : *core_atoms)
        fragment.addAtom(structure.Atom(atom));
    for (const auto& bond : RemapPairs(graph.Bonds(), result.old_to_new))
        fragment.addBond(bond.first, bond.second);

    if (m_cap_hydrogens) {
        for (int atom : *core_atoms) {
            for (int neighbour : graph.Neighbours(atom)) {
                if (result.old_to_new[neighbour] >= 0)
                    continue;
                Position parent = structure.getPosition(atom);
                Position direction = (structure.getPosition(neighbour) - parent).normalized();
                double length = Elements::CovalentRadius[structure.Element(atom)] + Elements::CovalentRadius[Elements::Hydrogen];
                int cap = fragment.addAtom(AtomDef(Elements::Hydrogen, parent + length * direction));
                fragment.addBond(result.old_to_new[atom], cap);
                result.capping_atoms++;
            }
        }
    }

    fragment.setPiBonds(RemapPairs(structure.PiBonds(), result.old_to_new));
    std::vector<int> active;
    for (int atom : structure.ActiveAtoms())
        if (result.old_to_new[atom] >= 0)
            active.push_back(result.old_to_new[atom]);
    fragment.setActiveAtoms(active);

    fragment.setName(structure.Name() + "_core");
    fragment.setCharge(structure.Charge());
    fragment.setMultiplicity(structure.Multiplicity());
    fragment.setFragment(true);

    result.structure = fragment;
    result.bond_rearrangement = BondRearrangement(RemapPairs(bond_rearrangement.FormingBonds(), result.old_to_new),
        RemapPairs(bond_rearrangement.BreakingBonds(), result.old_to_new));
    result.stripped = true;

    m_diagnostics->info(fmt::format("Stripped {} to {} core atoms and {} capping hydrogens", structure.Name(), core_atoms->size(), result.capping_atoms));
    return result;
}

} // namespace saddle
