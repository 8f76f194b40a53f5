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
#include "types.h"

#include <map>
#include <optional>
#include <string>

namespace wasmir {
namespace Wasm {

	enum struct ExternalKind : uint8_t
	{
		Func = 0,
		Table = 1,
		Memory = 2,
		Global = 3,
	};

	static const uint32_t s_ExternalKinds = 4;

	const char* get_KindName(ExternalKind);

	struct Limits
	{
		uint64_t m_Min = 0;
		uint64_t m_Max = 0;
		bool m_HasMax = false;
		bool m_Shared = false;
		bool m_Is64 = false;
	};

	struct TableType
	{
		ValueType m_ElemType = ValueType::FuncRef;
		Limits m_Limits;
	};

	struct GlobalType
	{
		ValueType m_Type = ValueType::I32;
		bool m_Mutable = false;
	};

	// Constant initializer: a single instruction followed by 'end'
	struct ConstExpr
	{
		uint8_t m_Opcode = 0; // 0 if absent
		uint64_t m_Value = 0; // const bits, global or function index, or the heap type for ref.null
	};

	// The module-level description, built while the sections are parsed, read-only afterwards
	class ModuleInfo
	{
	public:

		struct Import
		{
			std::string m_sModule;
			std::string m_sName;
			uint32_t m_Index = 0; // within its kind space
		};

		// the import section entry, before it's placed
		struct ImportDesc
		{
			std::string m_sModule;
			std::string m_sName;
			ExternalKind m_Kind = ExternalKind::Func;

			uint32_t m_TypeIdx = 0;  // Func
			TableType m_Table;       // Table
			Limits m_Memory;         // Memory
			GlobalType m_Global;     // Global
		};

		struct Function
		{
			uint32_t m_TypeIdx = 0;
			std::string m_sName; // debug name, if available
		};

		struct Global
		{
			GlobalType m_Type;
			ConstExpr m_Init; // absent for imported
		};

		enum struct SegmentMode : uint8_t
		{
			Active,
			Passive,
			Declarative,
		};

		struct Element
		{
			SegmentMode m_Mode = SegmentMode::Active;
			uint32_t m_iTable = 0;
			ConstExpr m_Offset;
			ValueType m_Type = ValueType::FuncRef;
			std::vector<ConstExpr> m_vItems; // ref.func for the index-encoded segments
		};

		struct Data
		{
			SegmentMode m_Mode = SegmentMode::Active;
			uint32_t m_iMemory = 0;
			ConstExpr m_Offset;
			ByteBuffer m_Bytes;
		};

		struct Export
		{
			ExternalKind m_Kind = ExternalKind::Func;
			uint32_t m_Index = 0;
		};

		std::vector<FuncType> m_vTypes;

		std::vector<Import> m_vImports[s_ExternalKinds]; // by ExternalKind

		std::vector<Function> m_vFunctions;
		std::vector<TableType> m_vTables;
		std::vector<Limits> m_vMemories;
		std::vector<Global> m_vGlobals;

		std::vector<Element> m_vElements;
		std::vector<Data> m_vData;

		std::map<std::string, Export> m_Exports;

		std::optional<uint32_t> m_Start;
		std::optional<uint32_t> m_DataCount;

		void AddType(FuncType&&);
		void AddImport(ImportDesc&&);
		void AddFunction(uint32_t iType);
		void AddTable(const TableType&);
		void AddMemory(const Limits&);
		void AddGlobal(const GlobalType&, const ConstExpr&);
		void AddExport(const std::string& sName, ExternalKind, uint32_t iIdx);
		void AddElement(Element&&);
		void AddData(Data&&);
		void SetStart(uint32_t iFunc);
		void SetDataCount(uint32_t);
		void SetFunctionName(uint32_t iFunc, const std::string&);

		const std::vector<Import>& get_Imports(ExternalKind k) const { return m_vImports[static_cast<uint32_t>(k)]; }
		const std::vector<Import>& get_ImportedFuncs() const { return get_Imports(ExternalKind::Func); }

		uint32_t get_ImportedFuncCount() const { return static_cast<uint32_t>(get_ImportedFuncs().size()); }
		uint32_t get_LocalFuncCount() const { return static_cast<uint32_t>(m_vFunctions.size()) - get_ImportedFuncCount(); }

		uint32_t get_BodyFuncIndex(uint32_t iBody) const { return get_ImportedFuncCount() + iBody; }
		const FuncType& get_FuncType(uint32_t iFunc) const;

		uint32_t get_Count(ExternalKind) const;

		const Export* FindExport(const std::string&) const;

		std::string ToJson(int nIndent = -1) const;

	private:
		std::vector<Import>& get_ImportsMutable(ExternalKind k) { return m_vImports[static_cast<uint32_t>(k)]; }
	};

} // namespace Wasm
} // namespace wasmir
