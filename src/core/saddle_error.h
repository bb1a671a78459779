/*
 * <Exception types used throughout saddle.>
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

#include <stdexcept>
#include <string>

namespace saddle {

/*! \brief Invalid caller input: atom indices outside a structure, bad scan parameters ...
 *
 * Raised at the entry of a component, never converted into an empty result.
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

/*! \brief Missing or malformed configuration entry */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

/*! \brief Unreadable or malformed structure file */
class FileError : public std::runtime_error {
public:
    explicit FileError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

} // namespace saddle
