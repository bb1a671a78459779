/*
 * <Bond graph over atom indices.>
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

#include <set>
#include <vector>

#include "src/core/global.h"

namespace saddle {

/*! \brief Undirected simple graph, nodes are atom indices 0 .. n-1
 *
 * Neighbour lists are kept sorted, so every traversal below visits atoms
 * in a deterministic order.
 */
class MolecularGraph {
public:
    MolecularGraph() = default;
    explicit MolecularGraph(int nodes);
    MolecularGraph(int nodes, const std::vector<IntPair>& bonds);

    inline int NodeCount() const { return static_cast<int>(m_adjacency.size()); }
    int EdgeCount() const;

    /*! \brief Append an isolated node, returns its index */
    int AddNode();

    /*! \brief Add the bond i-j
     * \return false if the bond was already present
     * \throws InputError for self bonds or indices outside the graph
     */
    bool AddBond(int i, int j);
    bool RemoveBond(int i, int j);
    bool HasBond(int i, int j) const;

    const std::vector<int>& Neighbours(int i) const;
    inline int Degree(int i) const { return static_cast<int>(Neighbours(i).size()); }

    /*! \brief All bonds as (i, j) with i < j, sorted */
    std::vector<IntPair> Bonds() const;

    /*! \brief Number of bonds on the shortest path from source, -1 if unreachable */
    std::vector<int> Distances(int source) const;

    /*! \brief Union of all nodes at most hops bonds away from any source
     *
     * hops = 0 yields the sources themselves.
     */
    std::set<int> BoundedShell(const std::vector<int>& sources, int hops) const;

    /*! \brief Smallest ring through every ring bond, without duplicates
     *
     * Each ring is returned as a sorted list of atom indices; the list of rings is
     * ordered by size, then lexicographically.
     */
    std::vector<std::vector<int>> Rings() const;

    bool operator==(const MolecularGraph& other) const { return m_adjacency == other.m_adjacency; }
    bool operator!=(const MolecularGraph& other) const { return !(*this == other); }

private:
    void CheckIndex(int i) const;
    std::vector<int> ShortestPath(int source, int target, const IntPair& skip) const;

    std::vector<std::vector<int>> m_adjacency;
};

} // namespace saddle
