/*
 * <Selection of the reactive core of a structure.>
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

#include "src/capabilities/core_selector.h"
#include "src/core/elements.h"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace saddle {

namespace CoreSelection {

std::set<int> ExpandShell(const MolecularGraph& graph, const std::vector<int>& active_atoms, int depth)
{
    return graph.BoundedShell(active_atoms, std::max(depth - 1, 0));
}

bool ClosePiBonds(std::set<int>& core, const std::vector<IntPair>& pi_bonds)
{
    bool changed = false;
    for (const auto& bond : pi_bonds) {
        bool first = core.count(bond.first), second = core.count(bond.second);
        if (first == second)
            continue;
        core.insert(first ? bond.second : bond.first);
        changed = true;
    }
    return changed;
}

bool CloseRings(std::set<int>& core, const std::vector<std::vector<int>>& rings)
{
    bool changed = false;
    for (const auto& ring : rings) {
        bool touched = std::any_of(ring.begin(), ring.end(), [&core](int atom) { return core.count(atom); });
        if (!touched)
            continue;
        for (int atom : ring)
            changed |= core.insert(atom).second;
    }
    return changed;
}

bool CloseHydrogens(std::set<int>& core, const MolecularGraph& graph, const std::vector<int>& elements)
{
    std::vector<int> hydrogens;
    for (int atom : core) {
        if (elements[atom] == Elements::Hydrogen)
            continue;
        for (int neighbour : graph.Neighbours(atom))
            if (elements[neighbour] == Elements::Hydrogen && !core.count(neighbour))
                hydrogens.push_back(neighbour);
    }
    core.insert(hydrogens.begin(), hydrogens.end());
    return !hydrogens.empty();
}

}

CoreAtomSelector::CoreAtomSelector(const json& controller, std::shared_ptr<const Diagnostics> diagnostics)
    : m_diagnostics(std::move(diagnostics))
{
    if (!m_diagnostics)
        throw InputError("core selection without diagnostics");
    m_controller = MergeJson(CoreSelectorJson, controller);
    m_depth = Json2KeyWord<int>(m_controller, "depth");
    m_keep_rings = Json2KeyWord<bool>(m_controller, "keep_rings");
    m_keep_hydrogens = Json2KeyWord<bool>(m_controller, "keep_hydrogens");
}

std::optional<std::set<int>> CoreAtomSelector::Select(const Structure& structure, int depth) const
{
    return Select(structure.Graph(), structure.Atoms(), structure.ActiveAtoms(), structure.PiBonds(), depth);
}

std::optional<std::set<int>> CoreAtomSelector::Select(const MolecularGraph& graph,
    const std::vector<int>& elements,
    const std::vector<int>& active_atoms,
    const std::vector<IntPair>& pi_bonds,
    int depth) const
{
    if (active_atoms.empty()) {
        m_diagnostics->error("No active atoms found, the reactive core is undefined");
        return std::nullopt;
    }
    if (!elements.empty() && static_cast<int>(elements.size()) != graph.NodeCount())
        throw InputError(fmt::format("{} elements given for a graph with {} atoms", elements.size(), graph.NodeCount()));
    for (const auto& bond : pi_bonds)
        if (bond.first < 0 || bond.second < 0 || bond.first >= graph.NodeCount() || bond.second >= graph.NodeCount())
            throw InputError(fmt::format("pi bond ({}, {}) outside of graph with {} atoms", bond.first, bond.second, graph.NodeCount()));

    std::set<int> core = CoreSelection::ExpandShell(graph, active_atoms, depth);

    std::vector<std::vector<int>> rings;
    if (m_keep_rings)
        rings = graph.Rings();

    // a ring can contain a pi partner and vice versa, iterate to the fixed point
    bool changed = true;
    while (changed) {
        changed = CoreSelection::ClosePiBonds(core, pi_bonds);
        if (m_keep_rings)
            changed |= CoreSelection::CloseRings(core, rings);
    }

    if (m_keep_hydrogens && !elements.empty())
        CoreSelection::CloseHydrogens(core, graph, elements);

    m_diagnostics->info(fmt::format("Reactive core at depth {}: {} of {} atoms", depth, core.size(), graph.NodeCount()));
    return core;
}

} // namespace saddle
