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

#include "src/core/bond_rearrangement.h"
#include "src/core/structure.h"

#include <algorithm>
#include <set>

#include <fmt/core.h>

namespace saddle {

std::vector<int> BondRearrangement::ActiveAtoms() const
{
    std::set<int> atoms;
    for (const auto& bond : m_forming) {
        atoms.insert(bond.first);
        atoms.insert(bond.second);
    }
    for (const auto& bond : m_breaking) {
        atoms.insert(bond.first);
        atoms.insert(bond.second);
    }
    return std::vector<int>(atoms.begin(), atoms.end());
}

void BondRearrangement::Validate(const Structure& structure) const
{
    for (const auto& bond : m_forming)
        structure.CheckPair(bond);
    for (const auto& bond : m_breaking)
        structure.CheckPair(bond);
}

std::string BondRearrangement::toString() const
{
    auto pairs = [](const std::vector<IntPair>& bonds) {
        std::string result;
        for (const auto& bond : bonds)
            result += fmt::format("{}({}, {})", result.empty() ? "" : " ", bond.first, bond.second);
        return result.empty() ? std::string("none") : result;
    };
    return fmt::format("forming: {} | breaking: {}", pairs(m_forming), pairs(m_breaking));
}

bool BondRearrangement::operator==(const BondRearrangement& other) const
{
    auto equal = [](const std::vector<IntPair>& a, const std::vector<IntPair>& b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), SamePair);
    };
    return equal(m_forming, other.m_forming) && equal(m_breaking, other.m_breaking);
}

} // namespace saddle
