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

#include <string>
#include <string_view>

#include "core/Exception.hpp"

namespace mrs::rest
{
    // Errors reported to the client, with the HTTP status to use
    class Error : public core::MrsException
    {
    public:
        Error(int httpStatus, const std::string& message)
            : core::MrsException{ message }
            , _httpStatus{ httpStatus }
        {
        }

        int getHttpStatus() const { return _httpStatus; }

    private:
        int _httpStatus;
    };

    class BadRequestError : public Error
    {
    public:
        BadRequestError(const std::string& message)
            : Error{ 400, message } {}
    };

    class RequiredParameterMissingError : public BadRequestError
    {
    public:
        RequiredParameterMissingError(std::string_view param)
            : BadRequestError{ "Required parameter '" + std::string{ param } + "' is missing" } {}
    };

    class BadParameterError : public BadRequestError
    {
    public:
        BadParameterError(std::string_view param, std::string_view reason)
            : BadRequestError{ "Parameter '" + std::string{ param } + "': " + std::string{ reason } } {}
    };

    class NotFoundError : public Error
    {
    public:
        NotFoundError()
            : Error{ 404, "Not found" } {}
    };

    class MethodNotAllowedError : public Error
    {
    public:
        MethodNotAllowedError()
            : Error{ 405, "Method not allowed" } {}
    };
} // namespace mrs::rest
