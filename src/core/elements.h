/*
 * <Element symbols and covalent radii.>
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

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace Elements {

constexpr int Hydrogen = 1;

/* index 0 is a placeholder, so that ElementAbbr[Z] is the symbol of element Z */
static const std::vector<std::string> ElementAbbr = {
    "X",
    "H", "He",
    "Li", "Be", "B", "C", "N", "O", "F", "Ne",
    "Na", "Mg", "Al", "Si", "P", "S", "Cl", "Ar",
    "K", "Ca", "Sc", "Ti", "V", "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn", "Ga", "Ge", "As", "Se", "Br", "Kr",
    "Rb", "Sr", "Y", "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd", "In", "Sn", "Sb", "Te", "I", "Xe"
};

/* single bond covalent radii in Angstrom, P. Pyykkö, M. Atsumi, Chem. Eur. J. 2009, 15, 186-197 */
static const std::vector<double> CovalentRadius = {
    -1,
    0.32, 0.46,
    1.33, 1.02, 0.85, 0.75, 0.71, 0.63, 0.64, 0.67,
    1.55, 1.39, 1.26, 1.16, 1.11, 1.03, 0.99, 0.96,
    1.96, 1.71, 1.48, 1.36, 1.34, 1.22, 1.19, 1.16, 1.11, 1.10, 1.12, 1.18, 1.24, 1.21, 1.21, 1.16, 1.14, 1.17,
    2.10, 1.85, 1.63, 1.54, 1.47, 1.38, 1.28, 1.25, 1.25, 1.20, 1.28, 1.36, 1.42, 1.40, 1.40, 1.36, 1.33, 1.31
};

inline int MaxElement() { return static_cast<int>(ElementAbbr.size()) - 1; }

inline bool KnownElement(int element) { return element > 0 && element <= MaxElement(); }

/* Case-insensitive symbol lookup, returns 0 for unknown symbols */
inline int String2Element(std::string string)
{
    std::transform(string.begin(), string.end(), string.begin(), ::tolower);
    for (int i = 1; i < static_cast<int>(ElementAbbr.size()); ++i) {
        std::string symbol = ElementAbbr[i];
        std::transform(symbol.begin(), symbol.end(), symbol.begin(), ::tolower);
        if (string == symbol)
            return i;
    }
    return 0;
}

}
