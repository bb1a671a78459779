/*
 * <Atoms, coordinates and bond graph of a chemical structure.>
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

#include "src/core/structure.h"
#include "src/core/elements.h"
#include "src/core/saddle_logger.h"

#include <fstream>
#include <map>

#include <fmt/core.h>

namespace saddle {

Structure::Structure(const std::vector<int>& elements, const Geometry& geometry, const std::vector<IntPair>& bonds)
{
    if (geometry.rows() != static_cast<Eigen::Index>(elements.size()) || (geometry.rows() > 0 && geometry.cols() != 3))
        throw InputError(fmt::format("geometry of shape {}x{} does not fit {} atoms", geometry.rows(), geometry.cols(), elements.size()));

    for (int element : elements)
        if (!Elements::KnownElement(element))
            throw InputError(fmt::format("unknown element number {}", element));

    m_atoms = elements;
    m_geometry = geometry;
    m_graph = MolecularGraph(static_cast<int>(elements.size()), bonds);
}

Structure Structure::FromGeometry(const std::vector<int>& elements, const Geometry& geometry, double scaling)
{
    Structure structure(elements, geometry, {});
    structure.DetectBonds(scaling);
    return structure;
}

int Structure::addAtom(const AtomDef& atom)
{
    if (!Elements::KnownElement(atom.first))
        throw InputError(fmt::format("unknown element number {}", atom.first));

    m_geometry.conservativeResize(m_geometry.rows() + 1, 3);
    m_geometry.row(m_geometry.rows() - 1) = atom.second;
    m_atoms.push_back(atom.first);
    return m_graph.AddNode();
}

void Structure::DetectBonds(double scaling)
{
    m_graph = MolecularGraph(static_cast<int>(AtomCount()));
    for (int i = 0; i < static_cast<int>(AtomCount()); ++i) {
        for (int j = i + 1; j < static_cast<int>(AtomCount()); ++j) {
            double threshold = (Elements::CovalentRadius[m_atoms[i]] + Elements::CovalentRadius[m_atoms[j]]) * scaling;
            if (CalculateDistance(i, j) < threshold)
                m_graph.AddBond(i, j);
        }
    }
}

int Structure::CheckIndex(int i) const
{
    if (i < 0 || i >= static_cast<int>(AtomCount()))
        throw InputError(fmt::format("atom index {} outside of structure with {} atoms", i, AtomCount()));
    return i;
}

void Structure::CheckPair(const IntPair& pair) const
{
    CheckIndex(pair.first);
    CheckIndex(pair.second);
    if (pair.first == pair.second)
        throw InputError(fmt::format("atom pair ({}, {}) refers to a single atom", pair.first, pair.second));
}

AtomDef Structure::Atom(int i) const
{
    return AtomDef(Element(i), getPosition(i));
}

Position Structure::getPosition(int i) const
{
    CheckIndex(i);
    return Position(m_geometry(i, 0), m_geometry(i, 1), m_geometry(i, 2));
}

bool Structure::setGeometry(const Geometry& geometry)
{
    if (geometry.rows() != m_geometry.rows() || geometry.cols() != m_geometry.cols())
        return false;
    m_geometry = geometry;
    return true;
}

double Structure::CalculateDistance(int i, int j) const
{
    return (getPosition(i) - getPosition(j)).norm();
}

void Structure::setPiBonds(const std::vector<IntPair>& pi_bonds)
{
    for (const auto& bond : pi_bonds)
        CheckPair(bond);
    m_pi_bonds = pi_bonds;
}

void Structure::setActiveAtoms(const std::vector<int>& active_atoms)
{
    for (int atom : active_atoms)
        CheckIndex(atom);
    m_active_atoms = active_atoms;
}

std::string Structure::Formula() const
{
    // Hill order: C, H, then alphabetical
    std::map<std::string, int> counts;
    for (int atom : m_atoms)
        counts[Elements::ElementAbbr[atom]]++;

    std::string formula;
    auto append = [&formula](const std::string& symbol, int count) {
        formula += symbol;
        if (count > 1)
            formula += std::to_string(count);
    };
    if (counts.count("C")) {
        append("C", counts["C"]);
        counts.erase("C");
        if (counts.count("H")) {
            append("H", counts["H"]);
            counts.erase("H");
        }
    }
    for (const auto& entry : counts)
        append(entry.first, entry.second);
    return formula;
}

std::string Structure::Header() const
{
    return fmt::format("{} ** Energy = {:.10f} Eh ** Charge = {} ** Multiplicity = {}{}\n", m_name, m_energy, m_charge, m_mult, m_is_fragment ? " ** fragment" : "");
}

std::string Structure::Atom2String(int i) const
{
    return fmt::format("{:<3}  {:14.8f}  {:14.8f}  {:14.8f}\n", Elements::ElementAbbr[Element(i)], m_geometry(i, 0), m_geometry(i, 1), m_geometry(i, 2));
}

std::string Structure::XYZString() const
{
    std::string output;
    output += fmt::format("{}\n", AtomCount());
    output += Header();
    for (int i = 0; i < static_cast<int>(AtomCount()); ++i)
        output += Atom2String(i);
    return output;
}

void Structure::writeXYZFile(const std::string& filename) const
{
    std::ofstream output(filename, std::ios::out);
    if (!output)
        throw FileError("can not write " + filename);
    output << XYZString();
}

void Structure::appendXYZFile(const std::string& filename) const
{
    std::ofstream output(filename, std::ios::app);
    if (!output)
        throw FileError("can not write " + filename);
    output << XYZString();
}

void Structure::print_geom() const
{
    SaddleLogger::info_fmt("Structure {} ({}), {} atoms, {} bonds", m_name, Formula(), AtomCount(), m_graph.EdgeCount());
    for (int i = 0; i < static_cast<int>(AtomCount()); ++i)
        SaddleLogger::info(fmt::format("{:4d} ", i) + Atom2String(i).substr(0, Atom2String(i).size() - 1));
}

bool Structure::operator==(const Structure& other) const
{
    if (m_atoms != other.m_atoms || m_graph != other.m_graph)
        return false;
    if (m_geometry.rows() != other.m_geometry.rows() || m_geometry.cols() != other.m_geometry.cols())
        return m_atoms.empty();
    return m_geometry == other.m_geometry;
}

} // namespace saddle
