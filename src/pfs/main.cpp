/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of PFS.
 *
 * PFS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PFS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PFS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <thread>

#include <Wt/WLogSink.h>
#include <Wt/WServer.h>
#include <boost/asio/io_context.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "core/Exception.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "stream/ITailFollowStream.hpp"

#include "ProgressiveStreamResource.hpp"

namespace pfs
{
    namespace
    {
        std::size_t getThreadCount()
        {
            const unsigned long configHttpServerThreadCount{ core::Service<core::IConfig>::get()->getULong("http-server-thread-count", 0) };

            // Reserve at least 2 threads: reads from the transcoded files may block
            return configHttpServerThreadCount ? configHttpServerThreadCount : std::max<unsigned long>(2, std::thread::hardware_concurrency());
        }

        stream::TailFollowParameters getStreamParameters()
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            stream::TailFollowParameters parameters;
            parameters.timeout = std::chrono::milliseconds{ config.getULong("progressive-stream-timeout-ms", parameters.timeout.count()) };
            parameters.pollInterval = std::chrono::milliseconds{ config.getULong("progressive-stream-poll-interval-ms", parameters.pollInterval.count()) };
            if (parameters.pollInterval.count() == 0)
                throw core::PfsException{ "Invalid config value for 'progressive-stream-poll-interval-ms'" };

            return parameters;
        }

        std::vector<std::string> generateWtConfig(std::string execPath)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            std::vector<std::string> args;

            const std::filesystem::path wtConfigPath{ config.getPath("working-dir", "/var/pfs") / "wt_config.xml" };

            args.push_back(execPath);
            args.push_back("--config=" + wtConfigPath.string());
            args.push_back("--docroot=" + std::string{ config.getString("docroot", "/usr/share/pfs/docroot") });
            args.push_back("--http-port=" + std::to_string(config.getULong("listen-port", 5090)));
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
                    throw core::PfsException{ "Can't open '" + wtConfigPath.string() + "' for writing!" };

                boost::property_tree::xml_parser::write_xml(oss, pt);

                if (!oss)
                    throw core::PfsException{ "Can't write in file '" + wtConfigPath.string() + "', no space left?" };
            }

            return args;
        }

        core::logging::Severity getLogMinSeverity()
        {
            std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::PfsException{ "Invalid config value for 'log-min-severity'" };
        }

        class PfsLogSink : public Wt::WLogSink
        {
        public:
            PfsLogSink(core::logging::ILogger& logger)
                : _logger{ logger }
            {
            }

        private:
            void log(const std::string& type, const std::string& scope, const std::string& message) const noexcept override
            {
                // Some wt code path may go here without testing logging()
                if (logging(type, scope))
                    _logger.processLog(core::logging::Module::WT, getSeverity(type, scope), message);
            }

            bool logging(const std::string& type, const std::string& scope) const noexcept override
            {
                return _logger.isSeverityActive(getSeverity(type, scope));
            }

            static core::logging::Severity getSeverity(const std::string& type, std::string_view scope)
            {
                const core::logging::Severity severity{ getSeverityFromString(type) };

                // one line per served chunk otherwise
                if (severity == core::logging::Severity::INFO && (scope == "WebRequest" || scope == "wthttp"))
                    return core::logging::Severity::DEBUG;

                return severity;
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
        std::filesystem::path configFilePath{ "/etc/pfs.conf" };
        int res{ EXIT_FAILURE };

        assert(argc > 0);
        assert(argv[0] != NULL);

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the PFS configuration file (defaults to " << configFilePath << ")\n\n";
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
            // ffmpeg must not read from our stdin
            close(STDIN_FILENO);

            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            const std::filesystem::path workingDirectory{ config->getPath("working-dir", "/var/pfs") };
            const std::filesystem::path transcodeDirectory{ workingDirectory / "transcodes" };
            std::filesystem::create_directories(workingDirectory);
            std::filesystem::create_directories(transcodeDirectory);

            const std::filesystem::path mediaDirectory{ std::filesystem::canonical(config->getPath("media-dir", "/var/pfs/media")) };
            PFS_LOG(MAIN, INFO, "Serving files from " << mediaDirectory);

            const stream::TailFollowParameters streamParameters{ getStreamParameters() };
            PFS_LOG(MAIN, INFO, "Stream timeout = " << streamParameters.timeout.count() << " ms, poll interval = " << streamParameters.pollInterval.count() << " ms");

            // Construct WT configuration and get the argc/argv back
            const std::vector<std::string> wtServerArgs{ generateWtConfig(argv[0]) };

            std::vector<const char*> wtArgv(wtServerArgs.size());
            for (std::size_t i = 0; i < wtServerArgs.size(); ++i)
            {
                PFS_LOG(MAIN, DEBUG, "Wt arg = " << wtServerArgs[i]);
                wtArgv[i] = wtServerArgs[i].c_str();
            }

            PfsLogSink pfsLogSink{ *logger };
            Wt::WServer server{ argv[0] };
            server.setCustomLogger(pfsLogSink);
            server.setServerConfiguration(wtServerArgs.size(), const_cast<char**>(&wtArgv[0]));

            boost::asio::io_context ioContext; // ioContext used to dispatch all the services that are out of the Wt event loop
            core::IOContextRunner ioContextRunner{ ioContext, getThreadCount(), "Stream" };

            // Service initialization order is important (reverse-order for deinit)
            core::Service<core::IChildProcessManager> childProcessManagerService{ core::createChildProcessManager(ioContext) };

            ProgressiveStreamResource streamResource{ ioContext, mediaDirectory, transcodeDirectory, streamParameters };
            server.addResource(&streamResource, "/stream");

            PFS_LOG(MAIN, INFO, "Starting web server...");
            server.start();

            PFS_LOG(MAIN, INFO, "Now running...");
            Wt::WServer::waitForShutdown();

            PFS_LOG(MAIN, INFO, "Stopping server...");
            server.stop();

            PFS_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const Wt::WServer::Exception& e)
        {
            PFS_LOG(MAIN, FATAL, "Caught WServer::Exception: " << e.what());
            std::cerr << "Caught a WServer::Exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }
        catch (const std::exception& e)
        {
            PFS_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace pfs

int main(int argc, char* argv[])
{
    return pfs::main(argc, argv);
}
