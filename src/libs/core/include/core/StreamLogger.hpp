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

#include <iosfwd>
#include <mutex>

#include "core/ILogger.hpp"

namespace mrs::core::logging
{
    // Writes everything up to minSeverity into a single stream, without timestamps
    class StreamLogger final : public ILogger
    {
    public:
        StreamLogger(std::ostream& os, Severity minSeverity = defaultMinSeverity);

        bool isSeverityActive(Severity severity) const override;
        void processLog(const Log& log) override;
        void processLog(Module module, Severity severity, std::string_view message) override;

    private:
        std::mutex _mutex;
        std::ostream& _os;
        const Severity _minSeverity;
    };
} // namespace mrs::core::logging
