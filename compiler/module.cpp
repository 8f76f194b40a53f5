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

#include "module.h"
#include "../utility/logger.h"

#include <llvm/Support/raw_os_ostream.h>

namespace wasmir {
namespace Wasm {

	void Module::Compile(const Blob& wasm, const Options& opt)
	{
		auto pContext = std::make_unique<llvm::LLVMContext>();
		auto pIR = std::make_unique<llvm::Module>(opt.m_sModuleName, *pContext);

		ModuleInfo info;
		IntrinsicCache ic(*pIR);

		Compiler c(info, *pIR, ic, opt);
		c.Parse(wasm);

		LOG_INFO() << "module " << opt.m_sModuleName << " compiled: functions=" << info.m_vFunctions.size()
			<< ", imported=" << info.get_ImportedFuncCount()
			<< ", exports=" << info.m_Exports.size()
			<< ", intrinsics=" << ic.get_Count();

		// release the old module before its context
		m_pIR = std::move(pIR);
		m_pContext = std::move(pContext);
		m_Info = std::move(info);
		m_nIntrinsics = ic.get_Count();
	}

	llvm::Module& Module::get_IR() const
	{
		if (!m_pIR)
			Fail(Error::Internal, "module not compiled");
		return *m_pIR;
	}

	llvm::Function* Module::get_Function(uint32_t iFunc) const
	{
		Test(iFunc < m_Info.m_vFunctions.size());

		uint32_t nImported = m_Info.get_ImportedFuncCount();
		if (iFunc < nImported)
			return nullptr;

		return get_IR().getFunction(Compiler::get_FuncName(iFunc - nImported));
	}

	void Module::PrintIR(std::ostream& os) const
	{
		llvm::raw_os_ostream osLlvm(os);
		get_IR().print(osLlvm, nullptr);
	}

	/////////////////////////////////////////////
	// Imports

	void Imports::Add(const std::string& sModule, const std::string& sName, ExternalKind eKind, uint64_t nValue)
	{
		auto& x = m_Map[std::make_pair(sModule, sName)];
		x.m_Kind = eKind;
		x.m_Value = nValue;
	}

	const Imports::Binding* Imports::Find(const std::string& sModule, const std::string& sName) const
	{
		auto it = m_Map.find(std::make_pair(sModule, sName));
		return (m_Map.end() == it) ? nullptr : &it->second;
	}

	/////////////////////////////////////////////
	// Instance

	Instance::Instance(const Module& m, const Imports& imp)
		:m_Module(m)
	{
		Exc::CheckpointTxt cp("wasm/instantiate");

		const auto& info = m.get_Info();

		for (uint32_t iKind = 0; iKind < s_ExternalKinds; iKind++)
		{
			auto eKind = static_cast<ExternalKind>(iKind);
			const auto& vImports = info.get_Imports(eKind);

			auto& vBindings = m_vBindings[iKind];
			vBindings.reserve(vImports.size());

			for (const auto& x : vImports)
			{
				const auto* pBinding = imp.Find(x.m_sModule, x.m_sName);
				if (!pBinding || (pBinding->m_Kind != eKind))
				{
					std::string sMsg = std::string(pBinding ? "kind mismatch for " : "missing ") + get_KindName(eKind) + " import " + x.m_sModule + "." + x.m_sName;
					Fail(Error::UnresolvedImport, sMsg.c_str());
				}

				vBindings.push_back(pBinding->m_Value);
			}
		}

		LOG_DEBUG() << "instance created, imports resolved: " << info.get_ImportedFuncCount() << " functions";
	}

	uint64_t Instance::get_Binding(ExternalKind eKind, uint32_t iImport) const
	{
		const auto& v = m_vBindings[static_cast<uint32_t>(eKind)];
		Test(iImport < v.size());
		return v[iImport];
	}

	const ModuleInfo::Export* Instance::FindExport(const std::string& sName) const
	{
		return m_Module.get_Info().FindExport(sName);
	}

	llvm::Function* Instance::get_ExportedFunction(const std::string& sName) const
	{
		const auto* pExp = FindExport(sName);
		if (!pExp || (ExternalKind::Func != pExp->m_Kind))
			return nullptr;

		return m_Module.get_Function(pExp->m_Index);
	}

} // namespace Wasm
} // namespace wasmir
