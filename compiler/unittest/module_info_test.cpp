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

#include "../module_info.h"

#include <nlohmann/json.hpp>
#include <functional>
#include <stdio.h>

using namespace wasmir;
using namespace wasmir::Wasm;

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
	fflush(stdout);
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

#define fail_test(msg) TestFailed(msg, __LINE__)

namespace
{
	uint32_t get_Error(const std::function<void()>& fn)
	{
		try
		{
			fn();
		}
		catch (const Exc& e)
		{
			return e.m_Type;
		}
		return Error::None;
	}

	ModuleInfo::ImportDesc MakeImport(const char* szMod, const char* szName, ExternalKind eKind)
	{
		ModuleInfo::ImportDesc d;
		d.m_sModule = szMod;
		d.m_sName = szName;
		d.m_Kind = eKind;
		return d;
	}

	void AddTypes(ModuleInfo& mi)
	{
		FuncType tp;
		mi.AddType(std::move(tp)); // () -> ()

		tp.m_vArgs = { ValueType::I32 };
		tp.m_vRets = { ValueType::I64 };
		mi.AddType(std::move(tp));
	}

	void TestIndexSpaces()
	{
		ModuleInfo mi;
		AddTypes(mi);

		mi.AddImport(MakeImport("env", "f0", ExternalKind::Func));

		auto d = MakeImport("env", "f1", ExternalKind::Func);
		d.m_TypeIdx = 1;
		mi.AddImport(std::move(d));

		mi.AddImport(MakeImport("env", "g0", ExternalKind::Global));

		mi.AddFunction(1);
		mi.AddFunction(0);

		verify_test(2 == mi.get_ImportedFuncCount());
		verify_test(2 == mi.get_LocalFuncCount());
		verify_test(4 == mi.get_Count(ExternalKind::Func));
		verify_test(1 == mi.get_Count(ExternalKind::Global));
		verify_test(!mi.get_Count(ExternalKind::Memory));

		// bodies are numbered after the imports
		verify_test(2 == mi.get_BodyFuncIndex(0));
		verify_test(3 == mi.get_BodyFuncIndex(1));

		verify_test(1 == mi.get_FuncType(1).m_vArgs.size());
		verify_test(mi.get_FuncType(2) == mi.m_vTypes[1]);
		verify_test(mi.get_FuncType(3).m_vArgs.empty());

		const auto& vImp = mi.get_ImportedFuncs();
		verify_test(vImp[1].m_sName == "f1");
		verify_test(1 == vImp[1].m_Index);
		verify_test(0 == mi.get_Imports(ExternalKind::Global)[0].m_Index);

		verify_test(Error::Malformed == get_Error([&] { mi.get_FuncType(4); }));
		verify_test(Error::Malformed == get_Error([&] { mi.AddFunction(2); })); // no such type

		// imports after the local entries of the same kind
		verify_test(Error::Malformed == get_Error([&] { mi.AddImport(MakeImport("env", "late", ExternalKind::Func)); }));

		// other kinds are unaffected
		mi.AddImport(MakeImport("env", "g1", ExternalKind::Global));
		verify_test(2 == mi.get_Count(ExternalKind::Global));
	}

	void TestMemory64()
	{
		ModuleInfo mi;

		Limits lim;
		lim.m_Min = 1;
		mi.AddMemory(lim);
		verify_test(1 == mi.m_vMemories.size());

		lim.m_Is64 = true;
		verify_test(Error::UnsupportedMemory64 == get_Error([&] { mi.AddMemory(lim); }));

		ModuleInfo mi2;
		auto d = MakeImport("env", "mem", ExternalKind::Memory);
		d.m_Memory.m_Is64 = true;
		verify_test(Error::UnsupportedMemory64 == get_Error([&] { mi2.AddImport(std::move(d)); }));
		verify_test(mi2.m_vMemories.empty());
	}

	void TestExports()
	{
		ModuleInfo mi;
		AddTypes(mi);
		mi.AddFunction(0);
		mi.AddFunction(1);

		Limits lim;
		mi.AddMemory(lim);

		mi.AddExport("run", ExternalKind::Func, 0);
		mi.AddExport("mem", ExternalKind::Memory, 0);
		mi.AddExport("run", ExternalKind::Func, 1); // the last one wins

		verify_test(2 == mi.m_Exports.size());

		const auto* pExp = mi.FindExport("run");
		verify_test(pExp && (ExternalKind::Func == pExp->m_Kind) && (1 == pExp->m_Index));

		pExp = mi.FindExport("mem");
		verify_test(pExp && (ExternalKind::Memory == pExp->m_Kind));

		verify_test(!mi.FindExport("missing"));

		verify_test(Error::Malformed == get_Error([&] { mi.AddExport("bad", ExternalKind::Func, 2); }));
		verify_test(Error::Malformed == get_Error([&] { mi.AddExport("bad", ExternalKind::Table, 0); }));

		verify_test(Error::Malformed == get_Error([&] { mi.SetStart(5); }));
		mi.SetStart(1);
		verify_test(mi.m_Start && (1 == *mi.m_Start));

		verify_test(Error::Malformed == get_Error([&] { mi.SetFunctionName(2, "x"); }));
		mi.SetFunctionName(1, "main");
		verify_test(mi.m_vFunctions[1].m_sName == "main");
	}

	void TestJson()
	{
		ModuleInfo mi;
		AddTypes(mi);
		mi.AddImport(MakeImport("env", "print", ExternalKind::Func));
		mi.AddFunction(1);
		mi.SetFunctionName(1, "main");
		mi.AddExport("main", ExternalKind::Func, 1);

		GlobalType gt;
		gt.m_Mutable = true;
		ConstExpr ce;
		ce.m_Opcode = 0x41;
		ce.m_Value = 42;
		mi.AddGlobal(gt, ce);

		ModuleInfo::Data d;
		d.m_Offset = ce;
		d.m_Bytes = { 0xDE, 0xAD };
		mi.AddData(std::move(d));

		ModuleInfo::Element e;
		e.m_Mode = ModuleInfo::SegmentMode::Passive;
		mi.AddElement(std::move(e));

		mi.SetDataCount(1);

		auto j = nlohmann::json::parse(mi.ToJson());

		verify_test(2 == j["types"].size());
		verify_test(j["types"][1]["params"][0] == "i32");
		verify_test(j["types"][1]["results"][0] == "i64");

		verify_test(1 == j["imports"]["func"].size());
		verify_test(j["imports"]["func"][0]["module"] == "env");
		verify_test(j["imports"]["memory"].empty());

		verify_test(2 == j["functions"].size());
		verify_test(j["functions"][0]["imported"] == true);
		verify_test(j["functions"][1]["imported"] == false);
		verify_test(j["functions"][1]["name"] == "main");
		verify_test(!j["functions"][0].contains("name"));

		verify_test(j["globals"][0]["mutable"] == true);
		verify_test(j["globals"][0]["init"]["value"] == 42);

		verify_test(j["exports"]["main"]["kind"] == "func");
		verify_test(j["exports"]["main"]["index"] == 1);

		verify_test(j["data"][0]["bytes"] == "dead");
		verify_test(j["data"][0]["mode"] == "active");
		verify_test(j["elements"][0]["mode"] == "passive");
		verify_test(j["elements"][0]["offset"].is_null());

		verify_test(j["start"].is_null());
		verify_test(j["data_count"] == 1);

		// indented output is the same document
		verify_test(nlohmann::json::parse(mi.ToJson(4)) == j);
	}
}

int main()
{
	TestIndexSpaces();
	TestMemory64();
	TestExports();
	TestJson();

	return g_TestsFailed ? -1 : 0;
}
