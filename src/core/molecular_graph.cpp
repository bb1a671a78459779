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

#include "src/core/molecular_graph.h"

#include <algorithm>
#include <deque>

#include <fmt/core.h>

namespace saddle {

MolecularGraph::MolecularGraph(int nodes)
{
    if (nodes < 0)
        throw InputError(fmt::format("negative node count {}", nodes));
    m_adjacency.resize(nodes);
}

MolecularGraph::MolecularGraph(int nodes, const std::vector<IntPair>& bonds)
    : MolecularGraph(nodes)
{
    for (const auto& bond : bonds)
        AddBond(bond.first, bond.second);
}

int MolecularGraph::EdgeCount() const
{
    int count = 0;
    for (const auto& neighbours : m_adjacency)
        count += neighbours.size();
    return count / 2;
}

int MolecularGraph::AddNode()
{
    m_adjacency.emplace_back();
    return NodeCount() - 1;
}

void MolecularGraph::CheckIndex(int i) const
{
    if (i < 0 || i >= NodeCount())
        throw InputError(fmt::format("atom index {} outside of graph with {} atoms", i, NodeCount()));
}

bool MolecularGraph::AddBond(int i, int j)
{
    CheckIndex(i);
    CheckIndex(j);
    if (i == j)
        throw InputError(fmt::format("atom {} can not be bonded to itself", i));
    if (HasBond(i, j))
        return false;

    auto insert_sorted = [](std::vector<int>& list, int value) {
        list.insert(std::upper_bound(list.begin(), list.end(), value), value);
    };
    insert_sorted(m_adjacency[i], j);
    insert_sorted(m_adjacency[j], i);
    return true;
}

bool MolecularGraph::RemoveBond(int i, int j)
{
    if (!HasBond(i, j))
        return false;
    auto& a = m_adjacency[i];
    auto& b = m_adjacency[j];
    a.erase(std::lower_bound(a.begin(), a.end(), j));
    b.erase(std::lower_bound(b.begin(), b.end(), i));
    return true;
}

bool MolecularGraph::HasBond(int i, int j) const
{
    CheckIndex(i);
    CheckIndex(j);
    return std::binary_search(m_adjacency[i].begin(), m_adjacency[i].end(), j);
}

const std::vector<int>& MolecularGraph::Neighbours(int i) const
{
    CheckIndex(i);
    return m_adjacency[i];
}

std::vector<IntPair> MolecularGraph::Bonds() const
{
    std::vector<IntPair> bonds;
    for (int i = 0; i < NodeCount(); ++i)
        for (int j : m_adjacency[i])
            if (i < j)
                bonds.emplace_back(i, j);
    return bonds;
}

std::vector<int> MolecularGraph::Distances(int source) const
{
    CheckIndex(source);
    std::vector<int> dist(NodeCount(), -1);
    std::deque<int> queue;
    dist[source] = 0;
    queue.push_back(source);

    while (!queue.empty()) {
        int u = queue.front();
        queue.pop_front();
        for (int v : m_adjacency[u]) {
            if (dist[v] == -1) {
                dist[v] = dist[u] + 1;
                queue.push_back(v);
            }
        }
    }
    return dist;
}

std::set<int> MolecularGraph::BoundedShell(const std::vector<int>& sources, int hops) const
{
    std::set<int> shell;
    if (hops < 0)
        hops = 0;

    std::vector<int> dist(NodeCount(), -1);
    std::deque<int> queue;
    for (int source : sources) {
        CheckIndex(source);
        if (dist[source] == 0)
            continue;
        dist[source] = 0;
        queue.push_back(source);
    }

    while (!queue.empty()) {
        int u = queue.front();
        queue.pop_front();
        shell.insert(u);
        if (dist[u] == hops)
            continue;
        for (int v : m_adjacency[u]) {
            if (dist[v] == -1) {
                dist[v] = dist[u] + 1;
                queue.push_back(v);
            }
        }
    }
    return shell;
}

std::vector<int> MolecularGraph::ShortestPath(int source, int target, const IntPair& skip) const
{
    std::vector<int> previous(NodeCount(), -1);
    std::vector<bool> visited(NodeCount(), false);
    std::deque<int> queue;
    visited[source] = true;
    queue.push_back(source);

    while (!queue.empty()) {
        int u = queue.front();
        queue.pop_front();
        if (u == target)
            break;
        for (int v : m_adjacency[u]) {
            if (visited[v] || SamePair({ u, v }, skip))
                continue;
            visited[v] = true;
            previous[v] = u;
            queue.push_back(v);
        }
    }

    std::vector<int> path;
    if (!visited[target])
        return path;
    for (int node = target; node != -1; node = previous[node])
        path.push_back(node);
    return path;
}

std::vector<std::vector<int>> MolecularGraph::Rings() const
{
    std::set<std::vector<int>> unique;
    for (const auto& bond : Bonds()) {
        // a bond is part of a ring if its atoms stay connected without it
        std::vector<int> ring = ShortestPath(bond.first, bond.second, bond);
        if (ring.empty())
            continue;
        std::sort(ring.begin(), ring.end());
        unique.insert(ring);
    }

    std::vector<std::vector<int>> rings(unique.begin(), unique.end());
    std::stable_sort(rings.begin(), rings.end(), [](const std::vector<int>& a, const std::vector<int>& b) {
        return a.size() < b.size();
    });
    return rings;
}

} // namespace saddle
