/*
 * <Unit conversions and physical constants for saddle>
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

#include <cmath>
#include <string>

#include <fmt/core.h>

namespace SaddleUnit {

// Reference: CODATA-2018 recommended values
namespace Energy {
    constexpr double HARTREE_TO_KJMOL = 2625.4996394798;
    constexpr double HARTREE_TO_KCALMOL = 627.5094740631;
    constexpr double HARTREE_TO_EV = 27.211386245988;

    inline constexpr double hartree_to_kjmol(double eh) { return eh * HARTREE_TO_KJMOL; }
    inline constexpr double hartree_to_kcalmol(double eh) { return eh * HARTREE_TO_KCALMOL; }
    inline constexpr double hartree_to_ev(double eh) { return eh * HARTREE_TO_EV; }
}

namespace Format {
    /* Picks a readable unit for an energy difference given in Hartree */
    inline std::string format_energy_relative(double hartree_diff)
    {
        double abs_diff = std::abs(hartree_diff);
        if (abs_diff > 0.01)
            return fmt::format("{:.2f} kcal/mol", Energy::hartree_to_kcalmol(hartree_diff));
        else if (abs_diff > 1e-6)
            return fmt::format("{:.3f} kJ/mol", Energy::hartree_to_kjmol(hartree_diff));
        return fmt::format("{:.1f} meV", Energy::hartree_to_ev(hartree_diff) * 1000.0);
    }
}

} // namespace SaddleUnit
