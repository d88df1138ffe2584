/*
 * Copyright (C) 2026 Emeric Poupon
 *
 * This file is part of MRS.
 *
 * MRS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MRS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MRS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ParameterParsing.hpp"

namespace mrs::rest
{
    std::string parameterMapToDebugString(const Wt::Http::ParameterMap& parameterMap)
    {
        std::string res;

        bool firstParameter{ true };
        for (const auto& [name, values] : parameterMap)
        {
            if (!firstParameter)
                res += ", ";
            firstParameter = false;

            res += "{" + name + "=";
            if (values.size() == 1)
            {
                res += values.front();
            }
            else
            {
                res += "{";
                bool firstValue{ true };
                for (const std::string& value : values)
                {
                    if (!firstValue)
                        res += ",";
                    firstValue = false;
                    res += value;
                }
                res += "}";
            }
            res += "}";
        }

        return res;
    }
} // namespace mrs::rest
