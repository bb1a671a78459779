/*
 * <Diagnostics sink handed to the scan and core extraction components.>
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

#include <memory>
#include <string>

#include "src/core/saddle_logger.h"

namespace saddle {

/*! \brief Informational and warning output of a component
 *
 * Implementations must not throw; emitting a message never changes the
 * outcome of the calling algorithm.
 */
class Diagnostics {
public:
    virtual ~Diagnostics() = default;

    virtual void info(const std::string& msg) const = 0;
    virtual void warn(const std::string& msg) const = 0;
    virtual void error(const std::string& msg) const = 0;

    /*! \brief Shared instance forwarding to SaddleLogger */
    static const Diagnostics& Default();

    /* Default() for components that keep their diagnostics */
    static std::shared_ptr<const Diagnostics> Shared();
};

class LoggerDiagnostics : public Diagnostics {
public:
    void info(const std::string& msg) const override { SaddleLogger::info(msg); }
    void warn(const std::string& msg) const override { SaddleLogger::warn(msg); }
    void error(const std::string& msg) const override { SaddleLogger::error(msg); }
};

inline std::shared_ptr<const Diagnostics> Diagnostics::Shared()
{
    static const std::shared_ptr<const Diagnostics> diagnostics = std::make_shared<const LoggerDiagnostics>();
    return diagnostics;
}

inline const Diagnostics& Diagnostics::Default()
{
    return *Shared();
}

} // namespace saddle
