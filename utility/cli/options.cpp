// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "options.h"
#include <boost/filesystem.hpp>
#include <fstream>
#include <map>

using namespace std;

namespace wasmir
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
        const char* CONFIG_FILE_PATH = "config_file";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_PATH = "log_path";
        const char* LOG_ERROR = "error";
        const char* LOG_WARNING = "warning";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
        // compiler
        const char* INPUT = "input";
        const char* OUTPUT = "output";
        const char* OUTPUT_FULL = "output,o";
        const char* INFO_OUTPUT = "info";
        const char* MODULE_NAME = "module_name";
        const char* NO_VERIFY = "no_verify";
    }

    pair<po::options_description, po::options_description> createOptionsDescription(int flags, const std::string& configFile)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list all available options")
            (cli::VERSION_FULL, "print project version")
            (cli::LOG_LEVEL, po::value<string>(), "set log level [error|warning|info(default)|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "set file log level [error|warning|info|debug|verbose], file log is disabled if absent")
            (cli::LOG_PATH, po::value<string>()->default_value("logs"), "directory for the log files")
            (cli::CONFIG_FILE_PATH, po::value<string>()->default_value(configFile), "path to the config file");

        po::options_description compiler_options("Compiler options");
        compiler_options.add_options()
            (cli::INPUT, po::value<string>(), "wasm module to compile")
            (cli::OUTPUT_FULL, po::value<string>(), "file for the textual IR, stdout if absent")
            (cli::INFO_OUTPUT, po::value<string>(), "file for the module metadata (json)")
            (cli::MODULE_NAME, po::value<string>()->default_value("wasm"), "name of the produced IR module")
            (cli::NO_VERIFY, po::bool_switch()->default_value(false), "don't run the IR verifier on the compiled functions");

        po::options_description options{ "Allowed options" };
        po::options_description visible_options{ "Allowed options" };
        if (flags & GENERAL_OPTIONS)
        {
            options.add(general_options);
            visible_options.add(general_options);
        }
        if (flags & COMPILER_OPTIONS)
        {
            options.add(compiler_options);
            visible_options.add(compiler_options);
        }

        return { options, visible_options };
    }

    boost::optional<std::string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc, const char* szFile)
    {
        const auto fullPath = boost::filesystem::system_complete(szFile).string();
        std::ifstream cfg(fullPath);
        if (!cfg)
            return boost::none;

        po::store(po::parse_config_file(cfg, desc), vm);
        return fullPath;
    }

    po::variables_map getOptions(int argc, char* argv[], const po::options_description& options)
    {
        po::variables_map vm;
        po::positional_options_description positional;
        positional.add(cli::INPUT, 1);

        po::command_line_parser parser(argc, argv);
        parser.options(options);
        parser.style(po::command_line_style::default_style ^ po::command_line_style::allow_guessing);
        parser.positional(positional);
        po::store(parser.run(), vm); // value stored first is preferred

        if (vm.count(cli::CONFIG_FILE_PATH))
            ReadCfgFromFile(vm, options, vm[cli::CONFIG_FILE_PATH].as<std::string>().c_str());

        return vm;
    }

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<std::string, int> logLevels
        {
            { cli::LOG_ERROR, LOG_LEVEL_ERROR },
            { cli::LOG_WARNING, LOG_LEVEL_WARNING },
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }
}
