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
#include "../module.h"
#include "../instructions.h"

#include <optional>
#include <string.h>

// Assembles wasm binaries for the tests
namespace wasmir {
namespace Wasm {
namespace test {

	struct Writer
	{
		ByteBuffer m_Buf;

		Writer& Byte(uint8_t x) {
			m_Buf.push_back(x);
			return *this;
		}

		Writer& Op(uint8_t x) {
			return Byte(x);
		}

		Writer& Type(ValueType t) {
			return Byte(static_cast<uint8_t>(t));
		}

		Writer& U(uint64_t x)
		{
			while (true)
			{
				uint8_t n = static_cast<uint8_t>(x) & 0x7F;
				x >>= 7;

				if (!x)
					return Byte(n);

				Byte(n | 0x80);
			}
		}

		Writer& S(int64_t x)
		{
			while (true)
			{
				uint8_t n = static_cast<uint8_t>(x) & 0x7F;
				x >>= 7; // sign bit is propagated

				if ((!x && !(n & 0x40)) || ((-1 == x) && (n & 0x40)))
					return Byte(n);

				Byte(n | 0x80);
			}
		}

		Writer& Raw32(uint32_t x)
		{
			for (uint32_t i = 0; i < 4; i++, x >>= 8)
				Byte(static_cast<uint8_t>(x));
			return *this;
		}

		Writer& Raw64(uint64_t x)
		{
			for (uint32_t i = 0; i < 8; i++, x >>= 8)
				Byte(static_cast<uint8_t>(x));
			return *this;
		}

		Writer& F32(float f)
		{
			uint32_t x;
			memcpy(&x, &f, sizeof(x));
			return Raw32(x);
		}

		Writer& F64(double f)
		{
			uint64_t x;
			memcpy(&x, &f, sizeof(x));
			return Raw64(x);
		}

		Writer& Name(const std::string& s)
		{
			U(s.size());
			m_Buf.insert(m_Buf.end(), s.begin(), s.end());
			return *this;
		}

		Writer& Bytes(const ByteBuffer& buf)
		{
			m_Buf.insert(m_Buf.end(), buf.begin(), buf.end());
			return *this;
		}

		// size-prefixed
		Writer& Sub(const Writer& w)
		{
			U(w.m_Buf.size());
			return Bytes(w.m_Buf);
		}
	};

	// function body, starts with the locals declaration
	struct Code
		:public Writer
	{
		Code() {
			U(0);
		}

		Code(std::initializer_list<std::pair<uint32_t, ValueType> > lst)
		{
			U(lst.size());
			for (const auto& x : lst)
				U(x.first).Type(x.second);
		}
	};

	struct ModuleBuilder
	{
		struct Section
		{
			uint32_t m_nCount = 0;
			Writer m_Data;

			Writer& Add() {
				m_nCount++;
				return m_Data;
			}
		};

		Section m_Types;
		Section m_Imports;
		Section m_Funcs;
		Section m_Tables;
		Section m_Memory;
		Section m_Globals;
		Section m_Exports;
		Section m_Elements;
		Section m_Code;
		Section m_Data;
		std::optional<uint32_t> m_Start;
		std::optional<uint32_t> m_DataCount;

		std::vector<std::pair<uint8_t, ByteBuffer> > m_vTail; // raw sections, appended as-is

		uint32_t AddType(const ValueTypeVec& vArgs, const ValueTypeVec& vRets)
		{
			auto& w = m_Types.Add();
			w.Byte(0x60);
			w.U(vArgs.size());
			for (auto t : vArgs)
				w.Type(t);
			w.U(vRets.size());
			for (auto t : vRets)
				w.Type(t);

			return m_Types.m_nCount - 1;
		}

		void ImportFunc(const char* szMod, const char* szName, uint32_t iType) {
			m_Imports.Add().Name(szMod).Name(szName).Byte(0).U(iType);
		}

		void ImportMemory(const char* szMod, const char* szName, uint8_t nFlags, uint32_t nMin) {
			m_Imports.Add().Name(szMod).Name(szName).Byte(2).Byte(nFlags).U(nMin);
		}

		void ImportGlobal(const char* szMod, const char* szName, ValueType t, bool bMutable) {
			m_Imports.Add().Name(szMod).Name(szName).Byte(3).Type(t).Byte(bMutable ? 1 : 0);
		}

		void AddFunc(uint32_t iType, const Code& code)
		{
			m_Funcs.Add().U(iType);
			m_Code.Add().Sub(code);
		}

		void AddTable(uint32_t nMin) {
			m_Tables.Add().Type(ValueType::FuncRef).Byte(0).U(nMin);
		}

		void AddMemory(uint32_t nMin, uint32_t nMax) {
			m_Memory.Add().Byte(1).U(nMin).U(nMax);
		}

		void AddGlobal(bool bMutable, int32_t nInit) {
			m_Globals.Add().Type(ValueType::I32).Byte(bMutable ? 1 : 0).Op(Instruction::i32_const).S(nInit).Op(Instruction::end_block);
		}

		void AddExport(const char* szName, ExternalKind eKind, uint32_t iIdx) {
			m_Exports.Add().Name(szName).Byte(static_cast<uint8_t>(eKind)).U(iIdx);
		}

		// active, table 0, function indices
		void AddElement(int32_t nOffset, const std::vector<uint32_t>& vFuncs)
		{
			auto& w = m_Elements.Add();
			w.U(0).Op(Instruction::i32_const).S(nOffset).Op(Instruction::end_block);
			w.U(vFuncs.size());
			for (auto iFunc : vFuncs)
				w.U(iFunc);
		}

		void AddData(int32_t nOffset, const ByteBuffer& buf)
		{
			auto& w = m_Data.Add();
			w.U(0).Op(Instruction::i32_const).S(nOffset).Op(Instruction::end_block);
			w.U(buf.size()).Bytes(buf);
		}

		void AddFunctionNames(const std::vector<std::pair<uint32_t, std::string> >& v)
		{
			Writer wNames;
			wNames.U(v.size());
			for (const auto& x : v)
				wNames.U(x.first).Name(x.second);

			Writer w;
			w.Name("name").Byte(1).Sub(wNames);
			m_vTail.emplace_back(0, w.m_Buf);
		}

		static void WriteSection(Writer& w, uint8_t nId, const Section& s)
		{
			if (!s.m_nCount)
				return;

			Writer wContent;
			wContent.U(s.m_nCount).Bytes(s.m_Data.m_Buf);

			w.Byte(nId).Sub(wContent);
		}

		ByteBuffer Build() const
		{
			Writer w;
			w.Byte(0).Byte('a').Byte('s').Byte('m');
			w.Raw32(1);

			WriteSection(w, 1, m_Types);
			WriteSection(w, 2, m_Imports);
			WriteSection(w, 3, m_Funcs);
			WriteSection(w, 4, m_Tables);
			WriteSection(w, 5, m_Memory);
			WriteSection(w, 6, m_Globals);
			WriteSection(w, 7, m_Exports);

			if (m_Start)
			{
				Writer wStart;
				wStart.U(*m_Start);
				w.Byte(8).Sub(wStart);
			}

			WriteSection(w, 9, m_Elements);

			if (m_DataCount)
			{
				Writer wCount;
				wCount.U(*m_DataCount);
				w.Byte(12).Sub(wCount);
			}

			WriteSection(w, 10, m_Code);
			WriteSection(w, 11, m_Data);

			for (const auto& x : m_vTail)
			{
				Writer wContent;
				wContent.Bytes(x.second);
				w.Byte(x.first).Sub(wContent);
			}

			return w.m_Buf;
		}
	};

	// returns the error kind, or Error::None if compiled
	inline uint32_t get_CompileError(const ByteBuffer& buf, const Options& opt = Options())
	{
		try
		{
			Module m;
			m.Compile(buf, opt);
		}
		catch (const Exc& e)
		{
			return e.m_Type;
		}

		return Error::None;
	}

} // namespace test
} // namespace Wasm
} // namespace wasmir
