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

#pragma once

#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "src/core/bond_rearrangement.h"
#include "src/core/diagnostics.h"
#include "src/core/global.h"
#include "src/core/structure.h"

static const json FragmentStripperJson = {
    { "cap_hydrogens", true }
};

namespace saddle {

/*! \brief Fragment and rearrangement in the reduced index space
 *
 * old_to_new has one entry per atom of the input structure, -1 for removed atoms.
 * Capping hydrogens are appended after the core atoms and are counted in capping_atoms.
 */
struct StripResult {
    Structure structure;
    BondRearrangement bond_rearrangement;
    std::vector<int> old_to_new;
    int capping_atoms = 0;
    bool stripped = false;

    inline int NewIndex(int old_index) const { return old_to_new.at(old_index); }
};

class FragmentStripper {
public:
    explicit FragmentStripper(const json& controller = json::object(), std::shared_ptr<const Diagnostics> diagnostics = Diagnostics::Shared());

    /*! \brief Keep the core atoms, renumber everything referring to them
     *
     * Without a core, or with a core covering every atom, the inputs are returned
     * unchanged and stripped is false.
     * \throws InputError if the rearrangement or the core refer to atoms outside the structure
     */
    StripResult Strip(const Structure& structure, const std::optional<std::set<int>>& core_atoms, const BondRearrangement& bond_rearrangement) const;

private:
    json m_controller;
    bool m_cap_hydrogens = true;
    std::shared_ptr<const Diagnostics> m_diagnostics;
};

/* Remap a list of pairs, pairs with a removed endpoint are dropped */
std::vector<IntPair> RemapPairs(const std::vector<IntPair>& pairs, const std::vector<int>& old_to_new);

} // namespace saddle
