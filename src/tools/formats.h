/*
 * <Reading of chemical structure files.>
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

#include <Eigen/Dense>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "src/core/elements.h"
#include "src/core/global.h"
#include "src/core/structure.h"

namespace Files {

inline StringList SplitString(const std::string& string)
{
    StringList elements;
    std::istringstream stream(string);
    for (std::string element; stream >> element;)
        elements.push_back(element);
    return elements;
}

/* File name without directory and extension */
inline std::string Basename(const std::string& filename)
{
    std::string name = filename.substr(filename.find_last_of("/\\") + 1);
    return name.substr(0, name.find_last_of('.'));
}

inline AtomDef Line2Atom(const std::string& line)
{
    StringList elements = SplitString(line);
    if (elements.size() < 4)
        throw saddle::InputError(fmt::format("xyz line '{}' needs an element and three coordinates", line));

    int element = Elements::String2Element(elements[0]);
    if (element == 0)
        throw saddle::InputError(fmt::format("unknown element '{}'", elements[0]));

    try {
        return AtomDef(element, Position(std::stod(elements[1]), std::stod(elements[2]), std::stod(elements[3])));
    } catch (const std::logic_error&) {
        throw saddle::InputError(fmt::format("can not read coordinates from xyz line '{}'", line));
    }
}

/*! \brief First structure of an xyz block, bonds are detected from covalent radii */
inline saddle::Structure XYZString2Structure(const std::string& coord)
{
    std::istringstream stream(coord);
    std::string line;
    if (!std::getline(stream, line))
        throw saddle::InputError("empty xyz input");

    int atoms = 0;
    try {
        atoms = std::stoi(line);
    } catch (const std::logic_error&) {
        throw saddle::InputError(fmt::format("first xyz line '{}' is not an atom count", line));
    }
    if (atoms < 0)
        throw saddle::InputError(fmt::format("negative atom count {} in xyz input", atoms));

    std::string comment;
    std::getline(stream, comment);

    std::vector<int> elements;
    std::vector<Position> positions;
    for (int i = 0; i < atoms; ++i) {
        if (!std::getline(stream, line))
            throw saddle::InputError(fmt::format("xyz input ends after {} of {} atoms", i, atoms));
        auto atom = Line2Atom(line);
        elements.push_back(atom.first);
        positions.push_back(atom.second);
    }

    Geometry geometry(atoms, 3);
    for (int i = 0; i < atoms; ++i)
        geometry.row(i) = positions[i].transpose();

    return saddle::Structure::FromGeometry(elements, geometry);
}

inline saddle::Structure XYZ2Structure(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file)
        throw saddle::FileError("can not open " + filename);
    std::stringstream buffer;
    buffer << file.rdbuf();
    saddle::Structure structure = XYZString2Structure(buffer.str());
    structure.setName(Basename(filename));
    return structure;
}

inline saddle::Structure LoadStructure(const std::string& filename)
{
    if (filename.find(".xyz") != std::string::npos || filename.find(".trj") != std::string::npos)
        return XYZ2Structure(filename);
    throw saddle::FileError(fmt::format("I dont understand the file type of {}. Please use xyz (trj) files as input.", filename));
}

} // namespace Files
