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
#include "../utility/common.h"

#include <limits>
#include <string>

namespace wasmir {
namespace Wasm {

#define WasmIrErrors(macro) \
	macro(Malformed) \
	macro(UnsupportedSection) \
	macro(UnsupportedTypeSectionEntry) \
	macro(UnsupportedImportSectionEntry) \
	macro(UnsupportedExportSectionEntry) \
	macro(UnsupportedValueType) \
	macro(UnsupportedMemory64) \
	macro(UnsupportedInstruction) \
	macro(UnresolvedImport) \
	macro(Internal) \

	struct Error
	{
		enum Enum : uint32_t
		{
			None = 0,
#define THE_MACRO(name) name,
			WasmIrErrors(THE_MACRO)
#undef THE_MACRO
		};

		static const char* get_Name(uint32_t);
	};

	// every compilation error goes through here. Exc::m_Type is set to the error kind
	[[noreturn]] void Fail(Error::Enum, const char* sz);
	[[noreturn]] void Fail(); // Malformed
	void Test(bool); // Malformed if false

	// backend objects are never expected to be missing
	template <typename T>
	T* Ensure(T* p)
	{
		if (!p)
			Fail(Error::Internal, "backend returned null");
		return p;
	}

	class Reader
	{
		template <typename T, bool bSigned>
		T ReadInternal();
	public:

		const uint8_t* m_p0 = nullptr;
		const uint8_t* m_p1 = nullptr;

		Reader() = default;
		Reader(const Blob& b)
			:m_p0(reinterpret_cast<const uint8_t*>(b.p))
			,m_p1(m_p0 + b.n)
		{
		}

		bool IsEnd() const { return m_p0 == m_p1; }
		uint32_t get_Remaining() const { return static_cast<uint32_t>(m_p1 - m_p0); }

		void Ensure(uint32_t n);
		const uint8_t* Consume(uint32_t n);

		uint8_t Read1() { return *Consume(1); }
		uint8_t Peek1();

		// LEB128, signedness by the type
		template <typename T>
		T Read();

		template <typename T>
		void Read(T& x) {
			x = Read<T>();
		}

		// fixed-width little-endian
		template <typename T>
		T ReadRaw()
		{
			static_assert(std::numeric_limits<T>::is_integer && !std::numeric_limits<T>::is_signed);
			const uint8_t* p = Consume(sizeof(T));

			T ret = 0;
			for (uint32_t i = sizeof(T); i--; )
				ret = (ret << 8) | p[i];
			return ret;
		}

		// size-prefixed sub-range (section, function body)
		Reader ReadSub();
		std::string ReadName();
	};

} // namespace Wasm
} // namespace wasmir
