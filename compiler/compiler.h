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
#include "module_info.h"
#include "intrinsics.h"

#include <llvm/IR/Function.h>
#include <llvm/IR/Module.h>

namespace wasmir {
namespace Wasm {

	struct Options
	{
		bool m_Verify = true; // run the IR verifier on each compiled function
		std::string m_sModuleName = "wasm";
	};

	// Parses the wasm module, and lowers each function body into the llvm module
	struct Compiler
	{
		struct Context;

		ModuleInfo& m_Info;
		llvm::Module& m_Module;
		IntrinsicCache& m_Intrinsics;
		const Options& m_Options;
		NativeTypes m_Types;

		uint32_t m_nBodies = 0;
		uint32_t m_nLocalFuncsDeclared = 0; // by the function section

		Compiler(ModuleInfo&, llvm::Module&, IntrinsicCache&, const Options&);

		void Parse(const Blob&);

		llvm::Function* CompileFunc(uint32_t iBody, const Reader& body);

		static std::string get_FuncName(uint32_t iBody);

		static const uint32_t s_MaxLocals = 50000;
	};

} // namespace Wasm
} // namespace wasmir
