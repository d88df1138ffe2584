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

#include <sstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/StreamLogger.hpp"

namespace mrs::core::logging::tests
{
    TEST(Logger, noLoggerRegistered)
    {
        ASSERT_FALSE(Service<ILogger>::exists());

        bool evaluated{};
        auto sideEffect{ [&] {
            evaluated = true;
            return "msg";
        } };

        MRS_LOG(MAIN, INFO, sideEffect());
        EXPECT_FALSE(evaluated);
    }

    TEST(Logger, streamLogger)
    {
        std::ostringstream oss;
        {
            Service<ILogger> logger{ std::make_unique<StreamLogger>(oss, Severity::INFO) };

            MRS_LOG(RECOMMENDATION, INFO, "value = " << 42);
            MRS_LOG(DATASET, DEBUG, "filtered out");
            MRS_LOG(REST, ERROR, "failure");
            MRS_LOG_IF(MAIN, WARNING, false, "not logged");
            MRS_LOG_IF(MAIN, WARNING, true, "logged");
        }

        EXPECT_EQ(oss.str(), "[info] [RECOMMENDATION] value = 42\n"
                             "[error] [REST] failure\n"
                             "[warning] [MAIN] logged\n");
    }

    TEST(Logger, severityFiltering)
    {
        std::ostringstream oss;
        StreamLogger logger{ oss, Severity::WARNING };

        EXPECT_TRUE(logger.isSeverityActive(Severity::FATAL));
        EXPECT_TRUE(logger.isSeverityActive(Severity::ERROR));
        EXPECT_TRUE(logger.isSeverityActive(Severity::WARNING));
        EXPECT_FALSE(logger.isSeverityActive(Severity::INFO));
        EXPECT_FALSE(logger.isSeverityActive(Severity::DEBUG));
    }

    TEST(Logger, parseSeverity)
    {
        EXPECT_EQ(parseSeverity("debug"), Severity::DEBUG);
        EXPECT_EQ(parseSeverity("info"), Severity::INFO);
        EXPECT_EQ(parseSeverity("warning"), Severity::WARNING);
        EXPECT_EQ(parseSeverity("error"), Severity::ERROR);
        EXPECT_EQ(parseSeverity("fatal"), Severity::FATAL);
        EXPECT_THROW(parseSeverity("verbose"), MrsException);
    }

    TEST(Logger, names)
    {
        EXPECT_STREQ(getSeverityName(Severity::WARNING), "warning");
        EXPECT_STREQ(getModuleName(Module::DATASET), "DATASET");
    }
} // namespace mrs::core::logging::tests
