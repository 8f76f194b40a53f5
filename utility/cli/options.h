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

#pragma once

#include <boost/program_options.hpp>
#include <boost/optional.hpp>
#include "utility/logger.h"

namespace wasmir
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
        extern const char* CONFIG_FILE_PATH;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_PATH;
        extern const char* LOG_ERROR;
        extern const char* LOG_WARNING;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
        // compiler
        extern const char* INPUT;
        extern const char* OUTPUT;
        extern const char* OUTPUT_FULL;
        extern const char* INFO_OUTPUT;
        extern const char* MODULE_NAME;
        extern const char* NO_VERIFY;
    }

    enum OptionsFlag : int
    {
        GENERAL_OPTIONS  = 1 << 0,
        COMPILER_OPTIONS = 1 << 1,

        ALL_OPTIONS      = GENERAL_OPTIONS | COMPILER_OPTIONS
    };

    // returns all options and the visible subset (for help)
    std::pair<po::options_description, po::options_description> createOptionsDescription(int flags, const std::string& configFile);

    po::variables_map getOptions(int argc, char* argv[], const po::options_description& options);

    boost::optional<std::string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc, const char* szFile);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_INFO);
}
