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

#include "services/recommendation/Types.hpp"

namespace mrs::recommendation
{
    std::string_view getAlgorithmName(Algorithm algorithm)
    {
        switch (algorithm)
        {
        case Algorithm::Collaborative:
            return "collaborative";
        case Algorithm::Content:
            return "content";
        case Algorithm::Hybrid:
            return "hybrid";
        }

        return "";
    }

    std::optional<Algorithm> parseAlgorithm(std::string_view str)
    {
        for (Algorithm algorithm : { Algorithm::Collaborative, Algorithm::Content, Algorithm::Hybrid })
        {
            if (str == getAlgorithmName(algorithm))
                return algorithm;
        }

        return std::nullopt;
    }
} // namespace mrs::recommendation
