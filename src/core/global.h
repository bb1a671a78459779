/*
 * <Some global definitions for chemical structures.>
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

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <nlohmann/json.hpp>

#include "src/core/saddle_error.h"

// for convenience
using json = nlohmann::json;

typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Geometry;
typedef Eigen::Vector3d Position;

typedef std::pair<int, int> IntPair;
typedef std::vector<std::string> StringList;

/* Unordered comparison of two atom index pairs */
inline bool SamePair(const IntPair& a, const IntPair& b)
{
    return (a.first == b.first && a.second == b.second) || (a.first == b.second && a.second == b.first);
}

/* Name of a command given as "-name", empty if the argument is not a command */
inline std::string CommandKeyword(const std::string& argument)
{
    if (argument.size() < 2 || argument[0] != '-')
        return std::string();
    return argument.substr(1);
}

inline json CLI2Json(int argc, char** argv)
{
    json controller;
    json key;
    if (argc < 2)
        return controller;

    std::string keyword = CommandKeyword(argv[1]);
    if (keyword.empty())
        return controller;

    for (int i = 2; i < argc; ++i) {
        std::string current = argv[i];
        std::string sub = current.substr(0, 1);

        if (sub != "-") {
            // first positional argument is the input file
            if (!key.contains("file"))
                key["file"] = current;
            continue;
        }
        current.erase(0, 1);
        if ((i + 1) >= argc || argv[i + 1][0] == '-' || argv[i + 1] == std::string("true") || argv[i + 1] == std::string("+")) {
            key[current] = true;
            if ((i + 1) < argc && argv[i + 1][0] != '-')
                ++i;
        } else if (argv[i + 1] == std::string("false")) {
            key[current] = false;
            ++i;
        } else {
            std::string next = argv[i + 1];
            bool isVector = next.find(",") != std::string::npos || next.find(":") != std::string::npos || next.find(";") != std::string::npos;
            bool isNumber = !isVector;
            if (isNumber) {
                try {
                    std::size_t consumed = 0;
                    std::stod(next, &consumed);
                    isNumber = consumed == next.size();
                } catch (const std::invalid_argument&) {
                    isNumber = false;
                } catch (const std::out_of_range&) {
                    isNumber = false;
                }
            }
            if (isNumber) {
                if (next.find_first_of(".eE") == std::string::npos)
                    key[current] = std::stoi(next);
                else
                    key[current] = std::stod(next);
            } else
                key[current] = next;
            ++i;
        }
    }

    controller[keyword] = key;
    return controller;
}

template <class T>
inline T Json2KeyWord(const json& controller, std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    for (const auto& el : controller.items()) {
        std::string key = el.key();
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        if (key.compare(name) == 0)
            return el.value().get<T>();
    }
    throw saddle::ConfigError("missing keyword '" + name + "'");
}

inline json MergeJson(const json& reference, const json& patch)
{
    json result = reference;
    for (const auto& object : patch.items()) {
        bool found = false;
        std::string outer = object.key();
        std::transform(outer.begin(), outer.end(), outer.begin(), ::tolower);
        for (const auto& local : reference.items()) {
            std::string inner = local.key();
            std::transform(inner.begin(), inner.end(), inner.begin(), ::tolower);
            if (outer.compare(inner) == 0) {
                result[local.key()] = object.value();
                found = true;
            }
        }
        if (!found) {
            result[outer] = object.value();
        }
    }
    return result;
}
