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

#include "src/capabilities/peak_finder.h"
#include "src/core/units.h"

#include <algorithm>
#include <exception>

#include <fmt/core.h>

namespace saddle {

std::optional<ScanPeak> FindPeak(const std::vector<ScanPoint>& points, const ProfilePlotter* plotter, const Diagnostics& diagnostics)
{
    std::vector<int> valid;
    for (int i = 0; i < static_cast<int>(points.size()); ++i)
        if (points[i].Success())
            valid.push_back(i);

    if (valid.size() < 3) {
        diagnostics.warn(fmt::format("Only {} successful scan points, no peak can be located", valid.size()));
        return std::nullopt;
    }

    double min_energy = points[valid.front()].Energy();
    for (int i : valid)
        min_energy = std::min(min_energy, points[i].Energy());

    if (plotter) {
        std::vector<double> distances, energies;
        for (int i : valid) {
            distances.push_back(points[i].Distance());
            energies.push_back(SaddleUnit::Energy::hartree_to_kcalmol(points[i].Energy() - min_energy));
        }
        try {
            plotter->Plot(distances, energies);
        } catch (const std::exception& error) {
            diagnostics.warn(fmt::format("Scan profile could not be written: {}", error.what()));
        }
    }

    double peak_energy = min_energy;
    int peak = -1;
    for (std::size_t k = 1; k + 1 < valid.size(); ++k) {
        double energy = points[valid[k]].Energy();
        if (energy > peak_energy && points[valid[k - 1]].Energy() < energy && points[valid[k + 1]].Energy() < energy) {
            peak_energy = energy;
            peak = valid[k];
        }
    }

    if (peak < 0) {
        diagnostics.warn("Couldn't find a peak in the scan profile");
        return std::nullopt;
    }

    ScanPeak result;
    result.geometry = points[peak].getGeometry();
    result.energy = peak_energy;
    result.distance = points[peak].Distance();
    result.index = peak;
    result.barrier = peak_energy - min_energy;
    diagnostics.info(fmt::format("Energy at peak in scan: {:.2f} kcal/mol above the minimum at r = {:.4f} A",
        SaddleUnit::Energy::hartree_to_kcalmol(result.barrier), result.distance));
    return result;
}

} // namespace saddle
