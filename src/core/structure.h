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

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "src/core/global.h"
#include "src/core/molecular_graph.h"

typedef std::pair<int, Position> AtomDef;

namespace saddle {

/*! \brief Molecular structure: elements, Nx3 coordinates in Angstrom and the bond graph
 *
 * The graph always has one node per atom. Pi bonds and active atoms are optional
 * annotations in the same index space; they are validated when set.
 *
 * \note Use the empty constructor + addAtom()/addBond() for programmatic construction,
 *       FromGeometry() to detect bonds from covalent radii.
 */
class Structure {
public:
    Structure() = default;

    /*! \brief Structure with an explicit bond list
     * \throws InputError on inconsistent sizes or invalid bond indices
     */
    Structure(const std::vector<int>& elements, const Geometry& geometry, const std::vector<IntPair>& bonds);

    /*! \brief Bonds from distances: d(i,j) < scaling * (r_cov(i) + r_cov(j)) */
    static Structure FromGeometry(const std::vector<int>& elements, const Geometry& geometry, double scaling = 1.3);

    /*! \brief Append an atom, returns its index */
    int addAtom(const AtomDef& atom);
    bool addBond(int i, int j) { return m_graph.AddBond(i, j); }

    /*! \brief Replace the bond graph by one detected from the current coordinates */
    void DetectBonds(double scaling = 1.3);

    inline std::size_t AtomCount() const { return m_atoms.size(); }
    inline int Element(int i) const { return m_atoms[CheckIndex(i)]; }
    std::vector<int> Atoms() const { return m_atoms; }
    AtomDef Atom(int i) const;
    Position getPosition(int i) const;

    Geometry getGeometry() const { return m_geometry; }

    /*! \brief Replace all coordinates
     * \return false if the shape does not match AtomCount() x 3, the structure is left unchanged
     */
    bool setGeometry(const Geometry& geometry);

    double CalculateDistance(int i, int j) const;
    inline double BondDistance(const IntPair& bond) const { return CalculateDistance(bond.first, bond.second); }

    const MolecularGraph& Graph() const { return m_graph; }
    std::vector<IntPair> Bonds() const { return m_graph.Bonds(); }

    void setPiBonds(const std::vector<IntPair>& pi_bonds);
    const std::vector<IntPair>& PiBonds() const { return m_pi_bonds; }

    void setActiveAtoms(const std::vector<int>& active_atoms);
    const std::vector<int>& ActiveAtoms() const { return m_active_atoms; }

    inline void setName(const std::string& name) { m_name = name; }
    inline std::string Name() const { return m_name; }

    inline void setCharge(int charge) { m_charge = charge; }
    inline int Charge() const { return m_charge; }

    inline void setMultiplicity(int mult) { m_mult = mult; }
    inline int Multiplicity() const { return m_mult; }

    inline void setEnergy(double energy) { m_energy = energy; }
    inline double Energy() const { return m_energy; }

    inline void setFragment(bool fragment) { m_is_fragment = fragment; }
    inline bool IsFragment() const { return m_is_fragment; }

    std::string Formula() const;

    /*! \brief Atom index check
     * \return i if valid
     * \throws InputError otherwise
     */
    int CheckIndex(int i) const;
    void CheckPair(const IntPair& pair) const;

    std::string Header() const;
    std::string Atom2String(int i) const;
    std::string XYZString() const;
    void writeXYZFile(const std::string& filename) const;
    void appendXYZFile(const std::string& filename) const;

    void print_geom() const;

    /* Elements, coordinates and bonds; names and annotations are not compared */
    bool operator==(const Structure& other) const;
    bool operator!=(const Structure& other) const { return !(*this == other); }

private:
    std::vector<int> m_atoms;
    Geometry m_geometry;
    MolecularGraph m_graph;

    std::vector<IntPair> m_pi_bonds;
    std::vector<int> m_active_atoms;

    std::string m_name = "structure";
    int m_charge = 0, m_mult = 1;
    double m_energy = 0;
    bool m_is_fragment = false;
};

} // namespace saddle
