/*
 * <Saddle Logging System>
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
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * @brief Verbosity controlled terminal logger
 *
 * Verbosity levels: 0 = silent (errors only), 1 = results and warnings,
 * 2 = normal (info, parameters), 3 = informative.
 */
class SaddleLogger {
public:
    // Initialize logger with environment detection
    static void initialize(int verbosity = 2, bool auto_detect_colors = true);

    static void error(const std::string& msg);
    static void warn(const std::string& msg);
    static void success(const std::string& msg);
    static void info(const std::string& msg);

    static void param(const std::string& key, const std::string& value);
    static void param(const std::string& key, int value);

    static void param_table(const json& parameters, const std::string& title = "Parameters");

    static void result_raw(const std::string& data);
    static void header(const std::string& title);

    // Unit-aware output, values in Hartree
    static void energy_rel(double value_eh, const std::string& label);
    static void energy_abs(double value_eh, const std::string& label);

    template <typename... Args>
    static void error_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        error(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        warn(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void success_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        success(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        info(fmt::format(format_str, std::forward<Args>(args)...));
    }

private:
    static void log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_plain = false);
    static void log_plain(const std::string& msg);
    static std::string format_json_value(const json& value);

    static int m_verbosity;
    static bool m_use_colors;
};
