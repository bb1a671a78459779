/*
 * <Relaxed scan along one atom-atom distance.>
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

#include <vector>

#include "src/capabilities/relaxation.h"
#include "src/core/diagnostics.h"
#include "src/core/global.h"
#include "src/core/structure.h"

namespace saddle {

/*! \brief One step of a scan: target distance and the relaxation outcome */
class ScanPoint {
public:
    ScanPoint(double distance, const RelaxResult& outcome)
        : m_distance(distance)
        , m_outcome(outcome)
    {
    }

    inline double Distance() const { return m_distance; }
    inline bool Success() const { return m_outcome.success; }
    inline double Energy() const { return m_outcome.energy; }
    inline const Geometry& getGeometry() const { return m_outcome.geometry; }
    inline const std::string& ErrorMessage() const { return m_outcome.error_message; }

private:
    double m_distance;
    RelaxResult m_outcome;
};

/* n evenly spaced values, both ends included */
std::vector<double> LinearSpacing(double start, double end, int n);

/*! \brief Relax the structure at n_steps distances of pair between start and end
 *
 * Every step starts from the last successful geometry, the first one from the
 * geometry of the structure. Failing steps are kept as failure points and do
 * not stop the scan, a std::runtime_error from the relaxer counts as a failing step.
 * \throws InputError for n_steps < 2, an invalid pair or an InputError raised by the relaxer
 */
std::vector<ScanPoint> RunRelaxedScan(const Structure& structure,
    const IntPair& pair,
    double start,
    double end,
    int n_steps,
    const RelaxationInterface& relaxer,
    const json& settings,
    const Diagnostics& diagnostics = Diagnostics::Default());

} // namespace saddle
