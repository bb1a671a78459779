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

#include "src/capabilities/relaxed_scan.h"

#include <stdexcept>

#include <fmt/core.h>

namespace saddle {

std::vector<double> LinearSpacing(double start, double end, int n)
{
    std::vector<double> values;
    if (n < 1)
        return values;
    if (n == 1)
        return { start };
    double increment = (end - start) / (n - 1);
    for (int i = 0; i < n - 1; ++i)
        values.push_back(start + i * increment);
    values.push_back(end);
    return values;
}

std::vector<ScanPoint> RunRelaxedScan(const Structure& structure,
    const IntPair& pair,
    double start,
    double end,
    int n_steps,
    const RelaxationInterface& relaxer,
    const json& settings,
    const Diagnostics& diagnostics)
{
    if (n_steps < 2)
        throw InputError(fmt::format("a scan needs at least 2 steps, got {}", n_steps));
    structure.CheckPair(pair);

    Structure current = structure;
    std::vector<ScanPoint> points;
    int failures = 0;

    const std::vector<double> distances = LinearSpacing(start, end, n_steps);
    for (int step = 0; step < n_steps; ++step) {
        DistanceConstraint constraint{ pair, distances[step] };
        RelaxResult outcome;
        try {
            outcome = relaxer.Relax(current, constraint, settings);
        } catch (const InputError&) {
            throw;
        } catch (const std::runtime_error& error) {
            outcome = RelaxResult::failed_result(error.what());
        }

        if (outcome.success && !current.setGeometry(outcome.geometry))
            outcome = RelaxResult::failed_result("relaxation returned a geometry of the wrong shape");

        if (outcome.success) {
            diagnostics.info(fmt::format("Scan step {:3d}/{}: r({}, {}) = {:.4f} A, E = {:.8f} Eh", step + 1, n_steps, pair.first, pair.second, distances[step], outcome.energy));
        } else {
            ++failures;
            diagnostics.warn(fmt::format("Scan step {:3d}/{} at r = {:.4f} A failed: {}", step + 1, n_steps, distances[step], outcome.error_message));
        }
        points.emplace_back(distances[step], outcome);
    }

    if (failures)
        diagnostics.warn(fmt::format("{} of {} scan steps failed", failures, n_steps));
    return points;
}

} // namespace saddle
