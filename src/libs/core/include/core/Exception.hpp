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

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace mrs::core
{
    class MrsException : public std::runtime_error
    {
    public:
        MrsException(const std::string& error = "")
            : std::runtime_error{ error } {}
    };

    class SystemException : public MrsException
    {
    public:
        SystemException(int err, const std::string& errMsg)
            : MrsException{ errMsg + ": " + std::error_code{ err, std::generic_category() }.message() }
        {
        }

        SystemException(std::error_code ec, const std::string& errMsg)
            : MrsException{ errMsg + ": " + ec.message() }
        {
        }
    };
} // namespace mrs::core
