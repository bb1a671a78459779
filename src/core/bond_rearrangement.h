/*
 * <Forming and breaking bonds of a reaction.>
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

#include <string>
#include <vector>

#include "src/core/global.h"

namespace saddle {

class Structure;

/*! \brief Topological signature of a reaction
 *
 * Both bond lists use the index space of the structure the rearrangement is
 * paired with. Pairs are unordered: (1, 30) and (30, 1) describe the same bond.
 */
class BondRearrangement {
public:
    BondRearrangement() = default;
    BondRearrangement(const std::vector<IntPair>& forming_bonds, const std::vector<IntPair>& breaking_bonds)
        : m_forming(forming_bonds)
        , m_breaking(breaking_bonds)
    {
    }

    inline const std::vector<IntPair>& FormingBonds() const { return m_forming; }
    inline const std::vector<IntPair>& BreakingBonds() const { return m_breaking; }

    inline std::size_t FormingCount() const { return m_forming.size(); }
    inline std::size_t BreakingCount() const { return m_breaking.size(); }
    inline bool Empty() const { return m_forming.empty() && m_breaking.empty(); }

    /*! \brief Sorted, unique endpoints of all forming and breaking bonds */
    std::vector<int> ActiveAtoms() const;

    /*! \brief Throws InputError if any pair is not a valid atom pair of the structure */
    void Validate(const Structure& structure) const;

    std::string toString() const;

    /* Unordered pair comparison, the order of the lists matters */
    bool operator==(const BondRearrangement& other) const;
    bool operator!=(const BondRearrangement& other) const { return !(*this == other); }

private:
    std::vector<IntPair> m_forming, m_breaking;
};

} // namespace saddle
