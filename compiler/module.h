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
#include "compiler.h"

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include <memory>

namespace wasmir {
namespace Wasm {

	// Compiled wasm module: the IR and the module description
	class Module
	{
	public:
		// on failure throws Exc, the object remains unchanged
		void Compile(const Blob& wasm, const Options& = Options());

		bool IsCompiled() const { return !!m_pIR; }

		const ModuleInfo& get_Info() const { return m_Info; }
		llvm::Module& get_IR() const;

		// null for the imported functions
		llvm::Function* get_Function(uint32_t iFunc) const;

		size_t get_IntrinsicsCount() const { return m_nIntrinsics; }

		void PrintIR(std::ostream&) const;

	private:
		// the context must outlive the module
		std::unique_ptr<llvm::LLVMContext> m_pContext;
		std::unique_ptr<llvm::Module> m_pIR;
		ModuleInfo m_Info;
		size_t m_nIntrinsics = 0;
	};

	// Host objects provided for the module imports
	class Imports
	{
	public:
		struct Binding
		{
			ExternalKind m_Kind;
			uint64_t m_Value; // opaque handle of the host object
		};

		void Add(const std::string& sModule, const std::string& sName, ExternalKind, uint64_t nValue);
		const Binding* Find(const std::string& sModule, const std::string& sName) const;

		size_t get_Count() const { return m_Map.size(); }

	private:
		std::map<std::pair<std::string, std::string>, Binding> m_Map;
	};

	// The module with all its imports resolved
	class Instance
	{
	public:
		// throws UnresolvedImport if an import is missing, or is provided with a different kind
		Instance(const Module&, const Imports&);

		const Module& get_Module() const { return m_Module; }

		// iImport is the index within the imports of this kind
		uint64_t get_Binding(ExternalKind, uint32_t iImport) const;

		const ModuleInfo::Export* FindExport(const std::string&) const;

		// null if there's no such export, or it's not a function defined by the module
		llvm::Function* get_ExportedFunction(const std::string&) const;

	private:
		const Module& m_Module;
		std::vector<uint64_t> m_vBindings[s_ExternalKinds];
	};

} // namespace Wasm
} // namespace wasmir
