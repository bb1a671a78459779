/*
 * <Highest interior maximum of a scan profile.>
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

#include <optional>
#include <vector>

#include "src/capabilities/relaxed_scan.h"
#include "src/core/diagnostics.h"
#include "src/core/global.h"

namespace saddle {

/*! \brief Receives a profile for display, distances in Angstrom and energies in kcal/mol relative to the minimum */
class ProfilePlotter {
public:
    virtual ~ProfilePlotter() = default;

    virtual void Plot(const std::vector<double>& distances, const std::vector<double>& energies) const = 0;
};

struct ScanPeak {
    Geometry geometry;
    double energy = 0.0; // Eh
    double distance = 0.0; // Angstrom
    int index = -1; // position in the scan
    double barrier = 0.0; // Eh above the lowest point of the profile
};

/*! \brief Strict local maximum of the successful points with the highest energy
 *
 * Failed points are skipped, the neighbours of a point are the adjacent
 * successful points. The first and last successful point are never a peak.
 * Returns std::nullopt with a warning if there is no maximum. A plotter that
 * throws is reported as a warning and does not change the result.
 */
std::optional<ScanPeak> FindPeak(const std::vector<ScanPoint>& points,
    const ProfilePlotter* plotter = nullptr,
    const Diagnostics& diagnostics = Diagnostics::Default());

} // namespace saddle
