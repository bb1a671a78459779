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

#pragma once

#include <string>
#include <vector>

#include "src/capabilities/peak_finder.h"

namespace saddle {

/*! \brief Writes "distance  dE" columns to <basename>.dat and logs them as a table */
class ScanProfileWriter : public ProfilePlotter {
public:
    explicit ScanProfileWriter(const std::string& basename)
        : m_basename(basename)
    {
    }

    void Plot(const std::vector<double>& distances, const std::vector<double>& energies) const override;

    inline std::string Filename() const { return m_basename + ".dat"; }

private:
    std::string m_basename;
};

} // namespace saddle
