/*
 * <Scan profile output as data file and log table.>
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

#include "src/tools/scan_profile_writer.h"
#include "src/core/saddle_logger.h"

#include <fstream>

#include <fmt/core.h>

namespace saddle {

void ScanProfileWriter::Plot(const std::vector<double>& distances, const std::vector<double>& energies) const
{
    if (distances.size() != energies.size())
        throw InputError(fmt::format("profile with {} distances and {} energies", distances.size(), energies.size()));

    std::ofstream output(Filename());
    if (!output)
        throw FileError("can not write " + Filename());

    output << "# r [A]        dE [kcal/mol]\n";
    SaddleLogger::info_fmt("{:>10}  {:>14}", "r [A]", "dE [kcal/mol]");
    for (std::size_t i = 0; i < distances.size(); ++i) {
        output << fmt::format("{:10.4f}  {:14.4f}\n", distances[i], energies[i]);
        SaddleLogger::info_fmt("{:10.4f}  {:14.4f}", distances[i], energies[i]);
    }
    SaddleLogger::success_fmt("Scan profile written to {}", Filename());
}

} // namespace saddle
