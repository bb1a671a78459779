/*
 * <General helper for command line input and timing.>
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
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "src/core/global.h"

class RunTimer {
public:
    RunTimer(bool print = false)
        : m_print(print)
    {
        m_start = std::chrono::system_clock::now();
        if (m_print) {
            std::time_t start_time = std::chrono::system_clock::to_time_t(m_start);
            std::cout << "Started computation at " << std::ctime(&start_time) << std::endl;
        }
    }

    ~RunTimer()
    {
        if (m_print) {
            std::cout << "\n\nFinished after " << Elapsed() / 1000.0 << " seconds!" << std::endl;
            std::time_t end_time = std::chrono::system_clock::to_time_t(m_end);
            std::cout << "Finished computation at " << std::ctime(&end_time) << std::endl;
        }
    }

    inline int Elapsed()
    {
        m_end = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(m_end - m_start).count();
    }

private:
    std::chrono::time_point<std::chrono::system_clock> m_start, m_end;
    bool m_print;
};

namespace Tools {

/* Split at any of the characters in delim, empty fields are dropped */
inline StringList SplitString(const std::string& string, const char* delim)
{
    StringList elements;
    std::string element;
    for (const char& c : string) {
        if (std::strchr(delim, c) == nullptr)
            element.push_back(c);
        else {
            if (element.size())
                elements.push_back(element);
            element.clear();
        }
    }
    if (element.size())
        elements.push_back(element);
    return elements;
}

inline bool isInt(const std::string& input)
{
    return !input.empty() && std::all_of(input.begin(), input.end(), ::isdigit);
}

inline std::string Vector2String(const std::vector<int>& vector, const std::string& delim = "|")
{
    std::string result;
    for (auto i : vector)
        result += std::to_string(i) + delim;
    if (!result.empty())
        result.erase(result.size() - delim.size());
    return result;
}

inline std::string Pairs2String(const std::vector<IntPair>& pairs)
{
    std::string result;
    for (const auto& pair : pairs)
        result += fmt::format("{}({}, {})", result.empty() ? "" : " ", pair.first, pair.second);
    return result;
}

/*! \brief Atom indices from a single number or a list like "0,1,30"
 * \throws saddle::InputError for anything that is not a non-negative integer
 */
inline std::vector<int> CreateIndexList(const json& input)
{
    std::vector<int> result;
    if (input.is_number_integer()) {
        result.push_back(input.get<int>());
        return result;
    }
    if (!input.is_string())
        throw saddle::InputError("atom list must be a number or a comma separated string");

    for (const std::string& single : SplitString(input.get<std::string>(), ",; ")) {
        if (!isInt(single))
            throw saddle::InputError(fmt::format("'{}' is not an atom index", single));
        result.push_back(std::stoi(single));
    }
    return result;
}

/*! \brief Atom pairs from a list like "1:30" or "1:30,0:1"
 * \throws saddle::InputError for malformed pairs
 */
inline std::vector<IntPair> CreatePairList(const json& input)
{
    std::vector<IntPair> result;
    if (!input.is_string())
        throw saddle::InputError("atom pairs must be given as i:j");

    for (const std::string& single : SplitString(input.get<std::string>(), ",; ")) {
        auto sub = SplitString(single, ":");
        if (sub.size() != 2 || !isInt(sub[0]) || !isInt(sub[1]))
            throw saddle::InputError(fmt::format("'{}' is not an atom pair i:j", single));
        result.emplace_back(std::stoi(sub[0]), std::stoi(sub[1]));
    }
    return result;
}
}
