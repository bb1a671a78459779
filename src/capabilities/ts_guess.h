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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "src/capabilities/peak_finder.h"
#include "src/capabilities/relaxation.h"
#include "src/core/diagnostics.h"
#include "src/core/global.h"
#include "src/core/structure.h"

static const json TSGuessScanJson = {
    { "steps", 10 },
    { "delta", 1.5 }, // Angstrom added to the current bond length
    { "reaction_class", "" }
};

namespace saddle {

/*! \brief Starting point for a transition state search */
struct TSGuess {
    std::string name;
    std::string reaction_class;
    Structure structure;
    std::vector<IntPair> active_bonds; // scanned bond first
};

/*! \brief Template structure with the peak geometry and the active bonds
 *
 * Returns std::nullopt and warns once if there is no peak geometry.
 */
std::optional<TSGuess> AssembleTSGuess(const Structure& structure_template,
    const std::optional<Geometry>& peak_geometry,
    const IntPair& scanned_pair,
    const std::vector<IntPair>& extra_pairs,
    const std::string& name,
    const std::string& reaction_class,
    const Diagnostics& diagnostics = Diagnostics::Default());

/*! \brief Scan pair from its current length to current + delta_dist and assemble a guess at the maximum
 *
 * settings are handed to the relaxer unchanged.
 */
std::optional<TSGuess> Get1DScanTSGuess(const Structure& structure,
    const IntPair& scanned_pair,
    int n_steps,
    const std::string& name,
    const std::string& reaction_class,
    const RelaxationInterface& relaxer,
    const json& settings,
    double delta_dist = 1.5,
    const std::vector<IntPair>& extra_pairs = {},
    const ProfilePlotter* plotter = nullptr,
    const Diagnostics& diagnostics = Diagnostics::Default());

} // namespace saddle
