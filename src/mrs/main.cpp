/*
 * Copyright (C) 2013 Emeric Poupon
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

#include <algorithm>
#include <cassert>
#include <fstream>
#include <iostream>
#include <thread>

#include <unistd.h>

#include <Wt/WLogSink.h>
#include <Wt/WServer.h>
#include <boost/property_tree/xml_parser.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "dataset/IDataSource.hpp"
#include "dataset/ISnapshotRefresher.hpp"
#include "rest/ApiResource.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Snapshot.hpp"

namespace mrs
{
    namespace
    {
        std::size_t getThreadCount()
        {
            const unsigned long configHttpServerThreadCount{ core::Service<core::IConfig>::get()->getULong("http-server-thread-count", 0) };

            return configHttpServerThreadCount ? configHttpServerThreadCount : std::max<unsigned long>(2, std::thread::hardware_concurrency());
        }

        std::vector<std::string> generateWtConfig(std::string execPath)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            std::vector<std::string> args;

            const std::filesystem::path workingDir{ config.getPath("working-dir", "/var/mrs") };
            const std::filesystem::path wtConfigPath{ workingDir / "wt_config.xml" };

            args.push_back(execPath);
            args.push_back("--config=" + wtConfigPath.string());
            args.push_back("--docroot=" + std::string{ config.getString("docroot", workingDir.string()) });
            args.push_back("--http-port=" + std::to_string(config.getULong("listen-port", 5000)));
            args.push_back("--http-address=" + std::string{ config.getString("listen-addr", "0.0.0.0") });
            args.push_back("--threads=" + std::to_string(getThreadCount()));

            // Generate the wt_config.xml file
            boost::property_tree::ptree pt;

            pt.put("server.application-settings.<xmlattr>.location", "*");

            // Reverse proxy
            if (config.getBool("behind-reverse-proxy", false))
            {
                pt.put("server.application-settings.trusted-proxy-config.original-ip-header", config.getString("original-ip-header", "X-Forwarded-For"));
                config.visitStrings("trusted-proxies", [&](std::string_view trustedProxy) {
                    pt.add("server.application-settings.trusted-proxy-config.trusted-proxies.proxy", std::string{ trustedProxy });
                },
                    { "127.0.0.1", "::1" });
            }

            {
                std::ofstream oss{ wtConfigPath, std::ios::out };
                if (!oss)
                    throw core::MrsException{ "Can't open '" + wtConfigPath.string() + "' for writing!" };

                boost::property_tree::xml_parser::write_xml(oss, pt);

                if (!oss)
                    throw core::MrsException{ "Can't write in file '" + wtConfigPath.string() + "', no space left?" };
            }

            return args;
        }

        std::unique_ptr<dataset::IDataSource> createDataSource(core::IConfig& config)
        {
            const std::string source{ core::stringUtils::stringToLower(config.getString("dataset-source", "json")) };
            if (source == "json")
                return dataset::createJsonFileDataSource(config.getPath("dataset-ratings-file", "/var/mrs/ratings.json"), config.getPath("dataset-items-file", "/var/mrs/movies.json"));
            if (source == "mock")
                return dataset::createMockDataSource();

            throw core::MrsException{ "Invalid config value for 'dataset-source'" };
        }

        class MrsLogSink : public Wt::WLogSink
        {
        public:
            MrsLogSink(core::logging::ILogger& logger)
                : _logger{ logger }
            {
            }

        private:
            void log(const std::string& type, const std::string& scope, const std::string& message) const noexcept override
            {
                // Some wt code path may go here without testing logging()
                if (logging(type, scope))
                {
                    const core::logging::Severity severity{ getSeverity(type, scope) };
                    _logger.processLog(core::logging::Module::WT, severity, message);
                }
            }

            bool logging(const std::string& type, const std::string& scope) const noexcept override
            {
                const core::logging::Severity severity{ getSeverity(type, scope) };
                return _logger.isSeverityActive(severity);
            }

            static core::logging::Severity getSeverity(const std::string& type, const std::string& scope)
            {
                return adjustSeverity(getSeverityFromString(type), scope);
            }

            static core::logging::Severity adjustSeverity(core::logging::Severity initialSeverity, std::string_view scope)
            {
                if (initialSeverity == core::logging::Severity::INFO && (scope == "WebRequest" || scope == "wthttp"))
                    return core::logging::Severity::DEBUG;

                return initialSeverity;
            }

            static core::logging::Severity getSeverityFromString(std::string_view type)
            {
                if (type == "debug")
                    return core::logging::Severity::DEBUG;
                if (type == "info")
                    return core::logging::Severity::INFO;
                if (type == "warning")
                    return core::logging::Severity::WARNING;
                if (type == "error")
                    return core::logging::Severity::ERROR;
                if (type == "fatal")
                    return core::logging::Severity::FATAL;

                return core::logging::Severity::INFO;
            }

            core::logging::ILogger& _logger;
        };
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ "/etc/mrs.conf" };
        int res{ EXIT_FAILURE };

        assert(argc > 0);
        assert(argv[0] != NULL);

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the MRS configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            close(STDIN_FILENO);

            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(core::logging::parseSeverity(config->getString("log-min-severity", "info")), config->getPath("log-file", "")) };

            // Make sure the working directory exists
            std::filesystem::create_directories(config->getPath("working-dir", "/var/mrs"));

            // Construct WT configuration and get the argc/argv back
            const std::vector<std::string> wtServerArgs{ generateWtConfig(argv[0]) };

            std::vector<const char*> wtArgv(wtServerArgs.size());
            for (std::size_t i = 0; i < wtServerArgs.size(); ++i)
            {
                MRS_LOG(MAIN, DEBUG, "Wt arg = " << wtServerArgs[i]);
                wtArgv[i] = wtServerArgs[i].c_str();
            }

            MrsLogSink mrsLogSink{ *logger };
            Wt::WServer server{ argv[0] };
            server.setCustomLogger(mrsLogSink);
            server.setServerConfiguration(wtServerArgs.size(), const_cast<char**>(&wtArgv[0]));

            // Service initialization order is important (reverse-order for deinit)
            recommendation::SnapshotStore snapshotStore;

            std::unique_ptr<dataset::IDataSource> dataSource{ createDataSource(*config) };
            std::unique_ptr<dataset::IDataSource> fallbackDataSource;
            if (config->getBool("dataset-mock-fallback", true))
                fallbackDataSource = dataset::createMockDataSource();

            const std::chrono::seconds refreshPeriod{ config->getULong("dataset-refresh-period", 300) };
            std::unique_ptr<dataset::ISnapshotRefresher> snapshotRefresher{ dataset::createSnapshotRefresher(snapshotStore, *dataSource, refreshPeriod, fallbackDataSource.get()) };

            core::Service<recommendation::IRecommendationService> recommendationService{ recommendation::createRecommendationService(snapshotStore, recommendation::readRecommendationSettings(*config)) };

            // bind API resource
            std::unique_ptr<Wt::WResource> apiResource{ rest::createApiResource(*config, snapshotStore, *recommendationService) };
            const std::string apiPath{ config->getString("api-path", "/api") };
            server.addResource(apiResource.get(), apiPath);

            MRS_LOG(MAIN, INFO, "Starting web server, API deployed at '" << apiPath << "'...");
            server.start();

            MRS_LOG(MAIN, INFO, "Now running...");
            Wt::WServer::waitForShutdown();

            MRS_LOG(MAIN, INFO, "Stopping server...");
            server.stop();

            MRS_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const Wt::WServer::Exception& e)
        {
            MRS_LOG(MAIN, FATAL, "Caught WServer::Exception: " << e.what());
            std::cerr << "Caught a WServer::Exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }
        catch (const std::exception& e)
        {
            MRS_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace mrs

int main(int argc, char* argv[])
{
    return mrs::main(argc, argv);
}
