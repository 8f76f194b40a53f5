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

#include "compiler/module.h"
#include "utility/cli/options.h"
#include "utility/logger.h"
#include "utility/common.h"

#include <boost/filesystem.hpp>
#include <fstream>

using namespace std;
using namespace wasmir;

#ifndef PROJECT_VERSION
#	define PROJECT_VERSION "0.0.0"
#endif

namespace
{
	void printHelp(const po::options_description& options)
	{
		cout << "Usage: wasmir-cli [options] <file.wasm>" << endl;
		cout << options << std::endl;
	}

	int Run(const po::variables_map& vm)
	{
		if (!vm.count(cli::INPUT))
		{
			LOG_ERROR() << "no input file";
			return -1;
		}

		auto sInput = vm[cli::INPUT].as<string>();

		ByteBuffer buf;
		if (!ReadFile(buf, sInput.c_str()))
		{
			LOG_ERROR() << "can't read " << sInput;
			return -1;
		}

		LOG_INFO() << "compiling " << sInput << ", size=" << buf.size();

		Wasm::Options opt;
		opt.m_Verify = !vm[cli::NO_VERIFY].as<bool>();
		opt.m_sModuleName = vm[cli::MODULE_NAME].as<string>();

		Wasm::Module m;
		m.Compile(buf, opt);

		if (vm.count(cli::OUTPUT))
		{
			auto sOutput = vm[cli::OUTPUT].as<string>();

			std::ofstream fs(sOutput, std::ios_base::trunc);
			if (!fs)
			{
				LOG_ERROR() << "can't write " << sOutput;
				return -1;
			}

			m.PrintIR(fs);
			LOG_INFO() << "IR written to " << sOutput;
		}
		else
			m.PrintIR(cout);

		if (vm.count(cli::INFO_OUTPUT))
		{
			auto sInfo = vm[cli::INFO_OUTPUT].as<string>();
			auto sJson = m.get_Info().ToJson(4);

			if (!WriteFile(Blob(sJson.data(), static_cast<uint32_t>(sJson.size())), sInfo.c_str()))
			{
				LOG_ERROR() << "can't write " << sInfo;
				return -1;
			}

			LOG_INFO() << "module info written to " << sInfo;
		}

		return 0;
	}
}

int main_impl(int argc, char* argv[])
{
	try
	{
		auto [options, visibleOptions] = createOptionsDescription(ALL_OPTIONS, "wasmir-cli.cfg");

		po::variables_map vm;
		try
		{
			vm = getOptions(argc, argv, options);
		}
		catch (const po::error& e)
		{
			cout << e.what() << std::endl;
			printHelp(visibleOptions);

			return -1;
		}

		if (vm.count(cli::HELP))
		{
			printHelp(visibleOptions);
			return 0;
		}

		if (vm.count(cli::VERSION))
		{
			cout << PROJECT_VERSION << endl;
			return 0;
		}

		// the IR goes to stdout by default, keep the console for the errors then
		int logLevel = getLogLevel(cli::LOG_LEVEL, vm, vm.count(cli::OUTPUT) ? LOG_LEVEL_INFO : LOG_LEVEL_ERROR);
		int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED);

#if LOG_VERBOSE_ENABLED
		logLevel = LOG_LEVEL_VERBOSE;
#endif

		const auto path = boost::filesystem::system_complete(vm[cli::LOG_PATH].as<string>());
		auto logger = Logger::create(LOG_LEVEL_WARNING, logLevel, fileLogLevel, "wasmir_", path.string());

		try
		{
			po::notify(vm);
			return Run(vm);
		}
		catch (const Exc& e)
		{
			LOG_ERROR() << Wasm::Error::get_Name(e.m_Type) << ": " << e.what();
		}
		catch (const po::error& e)
		{
			LOG_ERROR() << e.what();
			printHelp(visibleOptions);
		}
	}
	catch (const std::exception& e)
	{
		std::cerr << e.what() << std::endl;
	}

	return -1;
}

int main(int argc, char* argv[])
{
	return main_impl(argc, argv);
}
