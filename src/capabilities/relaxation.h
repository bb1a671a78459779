/*
 * <Interfaces for constrained geometry relaxations.>
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

#include "src/core/global.h"
#include "src/core/structure.h"

namespace saddle {

/*! \brief Fixed distance between two atoms in Angstrom */
struct DistanceConstraint {
    IntPair pair;
    double distance = 0.0;
};

struct RelaxResult {
    bool success = false;
    std::string error_message;

    Geometry geometry;
    double energy = 0.0;
    int iterations = 0;

    static RelaxResult success_result(const Geometry& geometry, double energy, int iterations)
    {
        RelaxResult result;
        result.success = true;
        result.geometry = geometry;
        result.energy = energy;
        result.iterations = iterations;
        return result;
    }

    static RelaxResult failed_result(const std::string& error)
    {
        RelaxResult result;
        result.error_message = error;
        return result;
    }
};

/*! \brief Constrained relaxation of a structure
 *
 * Implementations leave the input structure untouched and report problems
 * through RelaxResult; a thrown std::runtime_error is treated as a failed
 * relaxation by the callers, an InputError is passed on to the caller.
 */
class RelaxationInterface {
public:
    virtual ~RelaxationInterface() = default;

    virtual RelaxResult Relax(const Structure& structure, const DistanceConstraint& constraint, const json& settings) const = 0;
};

/*! \brief Energy in Hartree and gradient in Eh/Angstrom for a geometry in Angstrom */
class PotentialInterface {
public:
    virtual ~PotentialInterface() = default;

    virtual double Calculate(const Geometry& geometry, Geometry& gradient) const = 0;
};

} // namespace saddle
