/*
 * <Transition state guesses from one-dimensional relaxed scans.>
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

#include "src/capabilities/ts_guess.h"
#include "src/capabilities/relaxed_scan.h"

#include <fmt/core.h>

namespace saddle {

std::optional<TSGuess> AssembleTSGuess(const Structure& structure_template,
    const std::optional<Geometry>& peak_geometry,
    const IntPair& scanned_pair,
    const std::vector<IntPair>& extra_pairs,
    const std::string& name,
    const std::string& reaction_class,
    const Diagnostics& diagnostics)
{
    if (!peak_geometry) {
        diagnostics.warn(fmt::format("No peak geometry for {}, no transition state guess", name));
        return std::nullopt;
    }

    TSGuess guess;
    guess.name = name;
    guess.reaction_class = reaction_class;
    guess.structure = structure_template;
    if (!guess.structure.setGeometry(*peak_geometry))
        throw InputError(fmt::format("peak geometry with {} rows does not fit {} atoms", peak_geometry->rows(), structure_template.AtomCount()));
    guess.structure.setName(name);

    guess.active_bonds.push_back(scanned_pair);
    guess.active_bonds.insert(guess.active_bonds.end(), extra_pairs.begin(), extra_pairs.end());
    return guess;
}

std::optional<TSGuess> Get1DScanTSGuess(const Structure& structure,
    const IntPair& scanned_pair,
    int n_steps,
    const std::string& name,
    const std::string& reaction_class,
    const RelaxationInterface& relaxer,
    const json& settings,
    double delta_dist,
    const std::vector<IntPair>& extra_pairs,
    const ProfilePlotter* plotter,
    const Diagnostics& diagnostics)
{
    structure.CheckPair(scanned_pair);
    for (const auto& pair : extra_pairs)
        structure.CheckPair(pair);

    const double current = structure.BondDistance(scanned_pair);
    diagnostics.info(fmt::format("Scanning r({}, {}) from {:.4f} to {:.4f} A in {} steps", scanned_pair.first, scanned_pair.second, current, current + delta_dist, n_steps));

    const auto points = RunRelaxedScan(structure, scanned_pair, current, current + delta_dist, n_steps, relaxer, settings, diagnostics);
    const auto peak = FindPeak(points, plotter, diagnostics);

    std::optional<Geometry> peak_geometry;
    if (peak)
        peak_geometry = peak->geometry;

    auto guess = AssembleTSGuess(structure, peak_geometry, scanned_pair, extra_pairs, name, reaction_class, diagnostics);
    if (guess && peak)
        guess->structure.setEnergy(peak->energy);
    return guess;
}

} // namespace saddle
