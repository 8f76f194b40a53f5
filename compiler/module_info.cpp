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

#include "module_info.h"
#include "../utility/helpers.h"
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace wasmir {
namespace Wasm {

	const char* get_KindName(ExternalKind k)
	{
		switch (k)
		{
		case ExternalKind::Func: return "func";
		case ExternalKind::Table: return "table";
		case ExternalKind::Memory: return "memory";
		case ExternalKind::Global: return "global";
		}
		return "?";
	}

	void ModuleInfo::AddType(FuncType&& tp)
	{
		m_vTypes.push_back(std::move(tp));
	}

	void ModuleInfo::AddImport(ImportDesc&& d)
	{
		// imports must precede the local entries of their kind
		Test(get_Count(d.m_Kind) == get_Imports(d.m_Kind).size());

		Import imp;
		imp.m_sModule = std::move(d.m_sModule);
		imp.m_sName = std::move(d.m_sName);
		imp.m_Index = get_Count(d.m_Kind);

		switch (d.m_Kind)
		{
		case ExternalKind::Func:
			Test(d.m_TypeIdx < m_vTypes.size());
			m_vFunctions.emplace_back().m_TypeIdx = d.m_TypeIdx;
			break;

		case ExternalKind::Table:
			m_vTables.push_back(d.m_Table);
			break;

		case ExternalKind::Memory:
			if (d.m_Memory.m_Is64)
				Fail(Error::UnsupportedMemory64, "imported memory64");
			m_vMemories.push_back(d.m_Memory);
			break;

		case ExternalKind::Global:
			m_vGlobals.emplace_back().m_Type = d.m_Global;
			break;
		}

		get_ImportsMutable(d.m_Kind).push_back(std::move(imp));
	}

	void ModuleInfo::AddFunction(uint32_t iType)
	{
		Test(iType < m_vTypes.size());
		m_vFunctions.emplace_back().m_TypeIdx = iType;
	}

	void ModuleInfo::AddTable(const TableType& x)
	{
		m_vTables.push_back(x);
	}

	void ModuleInfo::AddMemory(const Limits& x)
	{
		if (x.m_Is64)
			Fail(Error::UnsupportedMemory64, "memory64");
		m_vMemories.push_back(x);
	}

	void ModuleInfo::AddGlobal(const GlobalType& tp, const ConstExpr& init)
	{
		auto& g = m_vGlobals.emplace_back();
		g.m_Type = tp;
		g.m_Init = init;
	}

	void ModuleInfo::AddExport(const std::string& sName, ExternalKind k, uint32_t iIdx)
	{
		Test(iIdx < get_Count(k));

		// duplicates are overwritten
		auto& x = m_Exports[sName];
		x.m_Kind = k;
		x.m_Index = iIdx;
	}

	void ModuleInfo::AddElement(Element&& x)
	{
		m_vElements.push_back(std::move(x));
	}

	void ModuleInfo::AddData(Data&& x)
	{
		m_vData.push_back(std::move(x));
	}

	void ModuleInfo::SetStart(uint32_t iFunc)
	{
		Test(iFunc < m_vFunctions.size());
		m_Start = iFunc;
	}

	void ModuleInfo::SetDataCount(uint32_t n)
	{
		m_DataCount = n;
	}

	void ModuleInfo::SetFunctionName(uint32_t iFunc, const std::string& sName)
	{
		Test(iFunc < m_vFunctions.size());
		m_vFunctions[iFunc].m_sName = sName;
	}

	const FuncType& ModuleInfo::get_FuncType(uint32_t iFunc) const
	{
		Test(iFunc < m_vFunctions.size());
		return m_vTypes[m_vFunctions[iFunc].m_TypeIdx];
	}

	uint32_t ModuleInfo::get_Count(ExternalKind k) const
	{
		switch (k)
		{
		case ExternalKind::Func: return static_cast<uint32_t>(m_vFunctions.size());
		case ExternalKind::Table: return static_cast<uint32_t>(m_vTables.size());
		case ExternalKind::Memory: return static_cast<uint32_t>(m_vMemories.size());
		case ExternalKind::Global: return static_cast<uint32_t>(m_vGlobals.size());
		}
		return 0;
	}

	const ModuleInfo::Export* ModuleInfo::FindExport(const std::string& sName) const
	{
		auto it = m_Exports.find(sName);
		return (m_Exports.end() == it) ? nullptr : &it->second;
	}

	/////////////////////////////////////////////
	// json dump

	namespace
	{
		json TypesToJson(const ValueTypeVec& v)
		{
			json jArr = json::array();
			for (auto t : v)
				jArr.push_back(ValueTypes::get_Name(t));
			return jArr;
		}

		json LimitsToJson(const Limits& x)
		{
			json j = json::object();
			j["min"] = x.m_Min;
			if (x.m_HasMax)
				j["max"] = x.m_Max;
			if (x.m_Shared)
				j["shared"] = true;
			return j;
		}

		json ExprToJson(const ConstExpr& x)
		{
			if (!x.m_Opcode)
				return nullptr;

			return json{
				{ "opcode", x.m_Opcode },
				{ "value", x.m_Value }
			};
		}

		const char* ModeToStr(ModuleInfo::SegmentMode m)
		{
			switch (m)
			{
			case ModuleInfo::SegmentMode::Active: return "active";
			case ModuleInfo::SegmentMode::Passive: return "passive";
			case ModuleInfo::SegmentMode::Declarative: return "declarative";
			}
			return "?";
		}
	}

	std::string ModuleInfo::ToJson(int nIndent) const
	{
		json jRoot = json::object();

		json jTypes = json::array();
		for (const auto& tp : m_vTypes)
		{
			jTypes.push_back(json{
				{ "params", TypesToJson(tp.m_vArgs) },
				{ "results", TypesToJson(tp.m_vRets) }
			});
		}
		jRoot["types"] = std::move(jTypes);

		json jImports = json::object();
		for (uint32_t iKind = 0; iKind < s_ExternalKinds; iKind++)
		{
			json jArr = json::array();
			for (const auto& imp : m_vImports[iKind])
			{
				jArr.push_back(json{
					{ "module", imp.m_sModule },
					{ "name", imp.m_sName },
					{ "index", imp.m_Index }
				});
			}
			jImports[get_KindName(static_cast<ExternalKind>(iKind))] = std::move(jArr);
		}
		jRoot["imports"] = std::move(jImports);

		json jFuncs = json::array();
		for (uint32_t iFunc = 0; iFunc < m_vFunctions.size(); iFunc++)
		{
			const auto& f = m_vFunctions[iFunc];
			json jEntry = json{
				{ "index", iFunc },
				{ "type", f.m_TypeIdx },
				{ "imported", iFunc < get_ImportedFuncCount() }
			};
			if (!f.m_sName.empty())
				jEntry["name"] = f.m_sName;
			jFuncs.push_back(std::move(jEntry));
		}
		jRoot["functions"] = std::move(jFuncs);

		json jTables = json::array();
		for (const auto& t : m_vTables)
		{
			json jEntry = LimitsToJson(t.m_Limits);
			jEntry["elem"] = ValueTypes::get_Name(t.m_ElemType);
			jTables.push_back(std::move(jEntry));
		}
		jRoot["tables"] = std::move(jTables);

		json jMems = json::array();
		for (const auto& m : m_vMemories)
			jMems.push_back(LimitsToJson(m));
		jRoot["memories"] = std::move(jMems);

		json jGlobals = json::array();
		for (const auto& g : m_vGlobals)
		{
			jGlobals.push_back(json{
				{ "type", ValueTypes::get_Name(g.m_Type.m_Type) },
				{ "mutable", g.m_Type.m_Mutable },
				{ "init", ExprToJson(g.m_Init) }
			});
		}
		jRoot["globals"] = std::move(jGlobals);

		json jExports = json::object();
		for (const auto& [sName, x] : m_Exports)
		{
			jExports[sName] = json{
				{ "kind", get_KindName(x.m_Kind) },
				{ "index", x.m_Index }
			};
		}
		jRoot["exports"] = std::move(jExports);

		json jElems = json::array();
		for (const auto& e : m_vElements)
		{
			json jItems = json::array();
			for (const auto& x : e.m_vItems)
				jItems.push_back(ExprToJson(x));

			jElems.push_back(json{
				{ "mode", ModeToStr(e.m_Mode) },
				{ "table", e.m_iTable },
				{ "offset", ExprToJson(e.m_Offset) },
				{ "type", ValueTypes::get_Name(e.m_Type) },
				{ "items", std::move(jItems) }
			});
		}
		jRoot["elements"] = std::move(jElems);

		json jData = json::array();
		for (const auto& d : m_vData)
		{
			jData.push_back(json{
				{ "mode", ModeToStr(d.m_Mode) },
				{ "memory", d.m_iMemory },
				{ "offset", ExprToJson(d.m_Offset) },
				{ "bytes", to_hex(d.m_Bytes.data(), d.m_Bytes.size()) }
			});
		}
		jRoot["data"] = std::move(jData);

		jRoot["start"] = m_Start ? json(*m_Start) : json(nullptr);
		jRoot["data_count"] = m_DataCount ? json(*m_DataCount) : json(nullptr);

		return jRoot.dump(nIndent);
	}

} // namespace Wasm
} // namespace wasmir
