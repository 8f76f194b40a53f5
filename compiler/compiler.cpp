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

#include "compiler.h"
#include "instructions.h"
#include "../utility/logger.h"
#include <cstdio>
#include <string.h>

namespace wasmir {
namespace Wasm {

	Compiler::Compiler(ModuleInfo& info, llvm::Module& m, IntrinsicCache& ic, const Options& opt)
		:m_Info(info)
		,m_Module(m)
		,m_Intrinsics(ic)
		,m_Options(opt)
		,m_Types(m.getContext(), m.getDataLayout())
	{
	}

	namespace
	{
		// data count goes between the element and the code sections
		uint32_t get_SectionOrder(uint8_t nSection)
		{
			return (12 == nSection) ? 19 : (nSection * 2u);
		}
	}

	std::string Compiler::get_FuncName(uint32_t iBody)
	{
		return "func_" + std::to_string(iBody);
	}

	struct CompilerPlus
		:public Compiler
	{
#define WasmParserSections(macro) \
		macro(0, Custom) \
		macro(1, Type) \
		macro(2, Import) \
		macro(3, Funcs) \
		macro(4, Table) \
		macro(5, Memory) \
		macro(6, Global) \
		macro(7, Export) \
		macro(8, Start) \
		macro(9, Element) \
		macro(10, Code) \
		macro(11, Data) \
		macro(12, DataCount) \

#define THE_MACRO(id, name) void OnSection_##name(Reader&);
		WasmParserSections(THE_MACRO)
#undef THE_MACRO

		void ParsePlus(Reader);

		static ValueType ReadValueType(Reader& inp)
		{
			return ValueTypes::From(inp.Read1());
		}

		static void ReadValueTypes(Reader& inp, ValueTypeVec& v)
		{
			auto nCount = inp.Read<uint32_t>();
			Test(nCount <= inp.get_Remaining()); // at least 1 byte per type

			v.resize(nCount);
			for (uint32_t i = 0; i < nCount; i++)
				v[i] = ReadValueType(inp);
		}

		static Limits ReadLimits(Reader& inp, bool bMemory)
		{
			Limits x;
			auto nFlags = inp.Read1();
			Test(nFlags < (bMemory ? 8 : 2));

			x.m_HasMax = !!(1 & nFlags);
			x.m_Shared = !!(2 & nFlags);
			x.m_Is64 = !!(4 & nFlags);

			if (x.m_Is64)
			{
				x.m_Min = inp.Read<uint64_t>();
				if (x.m_HasMax)
					x.m_Max = inp.Read<uint64_t>();
			}
			else
			{
				x.m_Min = inp.Read<uint32_t>();
				if (x.m_HasMax)
					x.m_Max = inp.Read<uint32_t>();
			}

			if (x.m_HasMax)
				Test(x.m_Min <= x.m_Max);

			return x;
		}

		static TableType ReadTableType(Reader& inp)
		{
			TableType x;
			x.m_ElemType = ReadValueType(inp);
			Test(ValueTypes::IsRef(x.m_ElemType));
			x.m_Limits = ReadLimits(inp, false);
			return x;
		}

		static GlobalType ReadGlobalType(Reader& inp)
		{
			GlobalType x;
			x.m_Type = ReadValueType(inp);

			auto nMut = inp.Read1();
			Test(nMut <= 1);
			x.m_Mutable = !!nMut;
			return x;
		}

		static ConstExpr ReadConstExpr(Reader& inp)
		{
			ConstExpr x;
			x.m_Opcode = inp.Read1();

			switch (x.m_Opcode)
			{
			case Instruction::i32_const:
				x.m_Value = static_cast<uint32_t>(inp.Read<int32_t>());
				break;

			case Instruction::i64_const:
				x.m_Value = static_cast<uint64_t>(inp.Read<int64_t>());
				break;

			case Instruction::f32_const:
				x.m_Value = inp.ReadRaw<uint32_t>();
				break;

			case Instruction::f64_const:
				x.m_Value = inp.ReadRaw<uint64_t>();
				break;

			case Instruction::global_get:
			case Instruction::ref_func:
				x.m_Value = inp.Read<uint32_t>();
				break;

			case Instruction::ref_null:
				x.m_Value = inp.Read1(); // heap type
				break;

			default:
				Fail(Error::UnsupportedInstruction, "initializer expression");
			}

			Test(Instruction::end_block == inp.Read1());
			return x;
		}
	};

	void Compiler::Parse(const Blob& blob)
	{
		auto& c = Cast::Up<CompilerPlus>(*this);
		static_assert(sizeof(c) == sizeof(*this));
		c.ParsePlus(blob);
	}

	void CompilerPlus::ParsePlus(Reader inp)
	{
		Exc::CheckpointTxt cp("wasm/parse");

		static const uint8_t pMagic[] = { 0, 'a', 's', 'm' };
		Test(!memcmp(pMagic, inp.Consume(sizeof(pMagic)), sizeof(pMagic)));

		static const uint8_t pVer[] = { 1, 0, 0, 0 };
		Test(!memcmp(pVer, inp.Consume(sizeof(pVer)), sizeof(pVer)));

		for (uint32_t nPrevOrder = 0; !inp.IsEnd(); )
		{
			auto nSection = inp.Read1();
			if (nSection)
			{
				// custom sections may appear anywhere
				auto nOrder = get_SectionOrder(nSection);
				Test(nOrder > nPrevOrder);
				nPrevOrder = nOrder;
			}

			Reader inpSection = inp.ReadSub();
			LOG_DEBUG() << "section " << static_cast<uint32_t>(nSection) << ", size=" << inpSection.get_Remaining();

			switch (nSection)
			{
#define THE_MACRO(id, name) \
			case id: { \
				Exc::CheckpointTxt cpSection("section " #name); \
				OnSection_##name(inpSection); \
				Test(inpSection.IsEnd()); \
			} break;

			WasmParserSections(THE_MACRO)
#undef THE_MACRO

			default:
				{
					std::string s = "section " + std::to_string(nSection);
					Fail(Error::UnsupportedSection, s.c_str());
				}
			}
		}

		// a module with functions must have the code section
		Test(m_nBodies == m_nLocalFuncsDeclared);
	}

	void CompilerPlus::OnSection_Custom(Reader& inp)
	{
		auto sName = inp.ReadName();

		if ("name" == sName)
		{
			while (!inp.IsEnd())
			{
				auto nType = inp.Read1();
				Reader r = inp.ReadSub();

				if (1 != nType)
					continue; // only function names are used

				auto nCount = r.Read<uint32_t>();
				for (uint32_t i = 0; i < nCount; i++)
				{
					auto iFunc = r.Read<uint32_t>();
					auto sFunc = r.ReadName();

					if (iFunc < m_Info.m_vFunctions.size())
						m_Info.SetFunctionName(iFunc, sFunc);
					else
						LOG_WARNING() << "name section: function " << iFunc << " is out of range";
				}
			}
		}

		inp.m_p0 = inp.m_p1; // skip the rest
	}

	void CompilerPlus::OnSection_Type(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
		{
			auto nForm = inp.Read1();
			if (0x60 != nForm)
			{
				char sz[0x40];
				snprintf(sz, sizeof(sz), "type form 0x%02x", nForm);
				Fail(Error::UnsupportedTypeSectionEntry, sz);
			}

			FuncType tp;
			ReadValueTypes(inp, tp.m_vArgs);
			ReadValueTypes(inp, tp.m_vRets);

			m_Info.AddType(std::move(tp));
		}

		LOG_DEBUG() << "types: " << nCount;
	}

	void CompilerPlus::OnSection_Import(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
		{
			ModuleInfo::ImportDesc d;
			d.m_sModule = inp.ReadName();
			d.m_sName = inp.ReadName();

			uint8_t nKind = inp.Read1();
			switch (nKind)
			{
			case 0:
				d.m_Kind = ExternalKind::Func;
				d.m_TypeIdx = inp.Read<uint32_t>();
				break;

			case 1:
				d.m_Kind = ExternalKind::Table;
				d.m_Table = ReadTableType(inp);
				break;

			case 2:
				d.m_Kind = ExternalKind::Memory;
				d.m_Memory = ReadLimits(inp, true);
				break;

			case 3:
				d.m_Kind = ExternalKind::Global;
				d.m_Global = ReadGlobalType(inp);
				break;

			default:
				{
					char sz[0x40];
					snprintf(sz, sizeof(sz), "import kind %u", nKind);
					Fail(Error::UnsupportedImportSectionEntry, sz);
				}
			}

			LOG_VERBOSE() << "import " << d.m_sModule << "." << d.m_sName << " kind=" << get_KindName(d.m_Kind);
			m_Info.AddImport(std::move(d));
		}
	}

	void CompilerPlus::OnSection_Funcs(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
			m_Info.AddFunction(inp.Read<uint32_t>());

		m_nLocalFuncsDeclared = nCount;
		LOG_DEBUG() << "functions: " << nCount << ", imported: " << m_Info.get_ImportedFuncCount();
	}

	void CompilerPlus::OnSection_Table(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
			m_Info.AddTable(ReadTableType(inp));
	}

	void CompilerPlus::OnSection_Memory(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
			m_Info.AddMemory(ReadLimits(inp, true));
	}

	void CompilerPlus::OnSection_Global(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
		{
			auto tp = ReadGlobalType(inp);
			m_Info.AddGlobal(tp, ReadConstExpr(inp));
		}
	}

	void CompilerPlus::OnSection_Export(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
		{
			auto sName = inp.ReadName();
			auto nKind = inp.Read1();

			if (nKind >= s_ExternalKinds)
			{
				char sz[0x40];
				snprintf(sz, sizeof(sz), "export kind %u", nKind);
				Fail(Error::UnsupportedExportSectionEntry, sz);
			}

			m_Info.AddExport(sName, static_cast<ExternalKind>(nKind), inp.Read<uint32_t>());
		}

		LOG_DEBUG() << "exports: " << nCount;
	}

	void CompilerPlus::OnSection_Start(Reader& inp)
	{
		m_Info.SetStart(inp.Read<uint32_t>());
	}

	void CompilerPlus::OnSection_Element(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();

		for (uint32_t i = 0; i < nCount; i++)
		{
			// bit 0: passive or declarative, bit 1: explicit table index (or declarative), bit 2: expressions instead of indices
			auto nFlags = inp.Read<uint32_t>();
			Test(nFlags < 8);

			ModuleInfo::Element e;

			if (1 & nFlags)
				e.m_Mode = (2 & nFlags) ? ModuleInfo::SegmentMode::Declarative : ModuleInfo::SegmentMode::Passive;
			else
			{
				e.m_Mode = ModuleInfo::SegmentMode::Active;
				if (2 & nFlags)
					e.m_iTable = inp.Read<uint32_t>();
				e.m_Offset = ReadConstExpr(inp);
			}

			if (3 & nFlags)
			{
				if (4 & nFlags)
				{
					e.m_Type = ReadValueType(inp);
					Test(ValueTypes::IsRef(e.m_Type));
				}
				else
					Test(!inp.Read1()); // elemkind: funcref
			}

			auto nItems = inp.Read<uint32_t>();
			Test(nItems <= inp.get_Remaining());
			e.m_vItems.reserve(nItems);

			for (uint32_t iItem = 0; iItem < nItems; iItem++)
			{
				if (4 & nFlags)
					e.m_vItems.push_back(ReadConstExpr(inp));
				else
				{
					auto& x = e.m_vItems.emplace_back();
					x.m_Opcode = Instruction::ref_func;
					x.m_Value = inp.Read<uint32_t>();
					Test(x.m_Value < m_Info.m_vFunctions.size());
				}
			}

			m_Info.AddElement(std::move(e));
		}
	}

	void CompilerPlus::OnSection_Code(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();
		Test(nCount == m_nLocalFuncsDeclared);

		for (uint32_t i = 0; i < nCount; i++)
		{
			Reader inpFunc = inp.ReadSub();
			CompileFunc(i, inpFunc);
		}

		m_nBodies = nCount;
		LOG_DEBUG() << "compiled bodies: " << nCount << ", intrinsics: " << m_Intrinsics.get_Count();
	}

	void CompilerPlus::OnSection_Data(Reader& inp)
	{
		auto nCount = inp.Read<uint32_t>();
		if (m_Info.m_DataCount)
			Test(*m_Info.m_DataCount == nCount);

		for (uint32_t i = 0; i < nCount; i++)
		{
			auto nFlags = inp.Read<uint32_t>();
			Test(nFlags < 3);

			ModuleInfo::Data d;

			if (1 == nFlags)
				d.m_Mode = ModuleInfo::SegmentMode::Passive;
			else
			{
				if (2 == nFlags)
					d.m_iMemory = inp.Read<uint32_t>();
				d.m_Offset = ReadConstExpr(inp);
			}

			auto nSize = inp.Read<uint32_t>();
			const uint8_t* p = inp.Consume(nSize);
			d.m_Bytes.assign(p, p + nSize);

			m_Info.AddData(std::move(d));
		}
	}

	void CompilerPlus::OnSection_DataCount(Reader& inp)
	{
		m_Info.SetDataCount(inp.Read<uint32_t>());
	}

} // namespace Wasm
} // namespace wasmir
