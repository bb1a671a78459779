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

#pragma once

#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "src/core/diagnostics.h"
#include "src/core/global.h"
#include "src/core/molecular_graph.h"
#include "src/core/structure.h"

static const json CoreSelectorJson = {
    { "depth", 3 },
    { "keep_rings", true },
    { "keep_hydrogens", true }
};

namespace saddle {

/* The single passes of the core selection; every closure returns true if it added atoms */
namespace CoreSelection {

/*! \brief Active atoms plus everything within depth - 1 bonds
 *
 * depth counts atom shells including the shell of the active atoms, so depth 0
 * and depth 1 both give the active atoms alone.
 */
std::set<int> ExpandShell(const MolecularGraph& graph, const std::vector<int>& active_atoms, int depth);

/*! \brief A pi bond is never split: if one partner is in the core, the other one is added */
bool ClosePiBonds(std::set<int>& core, const std::vector<IntPair>& pi_bonds);

/*! \brief A ring touched by the core is taken as a whole */
bool CloseRings(std::set<int>& core, const std::vector<std::vector<int>>& rings);

/*! \brief Hydrogens bonded to a retained heavy atom are retained */
bool CloseHydrogens(std::set<int>& core, const MolecularGraph& graph, const std::vector<int>& elements);

}

/*! \brief Computes the atoms to keep around the active atoms of a structure
 *
 * Configuration (CoreSelectorJson): depth, keep_rings, keep_hydrogens.
 * Select() returns std::nullopt if no active atoms are defined; active atoms
 * outside the structure raise InputError.
 */
class CoreAtomSelector {
public:
    explicit CoreAtomSelector(const json& controller = json::object(), std::shared_ptr<const Diagnostics> diagnostics = Diagnostics::Shared());

    std::optional<std::set<int>> Select(const Structure& structure) const { return Select(structure, m_depth); }
    std::optional<std::set<int>> Select(const Structure& structure, int depth) const;

    /*! \brief Graph level selection, elements may be empty to skip the hydrogen closure */
    std::optional<std::set<int>> Select(const MolecularGraph& graph,
        const std::vector<int>& elements,
        const std::vector<int>& active_atoms,
        const std::vector<IntPair>& pi_bonds,
        int depth) const;

    inline int Depth() const { return m_depth; }

private:
    json m_controller;
    int m_depth = 3;
    bool m_keep_rings = true, m_keep_hydrogens = true;
    std::shared_ptr<const Diagnostics> m_diagnostics;
};

} // namespace saddle
