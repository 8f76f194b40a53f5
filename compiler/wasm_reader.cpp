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

#include "wasm_reader.h"
#include <type_traits>

namespace wasmir {
namespace Wasm {

	const char* Error::get_Name(uint32_t n)
	{
		switch (n)
		{
		case None: return "None";
#define THE_MACRO(name) case name: return #name;
			WasmIrErrors(THE_MACRO)
#undef THE_MACRO
		}
		return "Unknown";
	}

	void Fail(Error::Enum eType, const char* sz)
	{
		Exc::Fail(eType, sz);
	}

	void Fail()
	{
		Fail(Error::Malformed, "Malformed");
	}

	void Test(bool b)
	{
		if (!b)
			Fail();
	}

	/////////////////////////////////////////////
	// Reader

	void Reader::Ensure(uint32_t n)
	{
		Test(static_cast<size_t>(m_p1 - m_p0) >= n);
	}

	const uint8_t* Reader::Consume(uint32_t n)
	{
		Ensure(n);

		const uint8_t* pRet = m_p0;
		m_p0 += n;

		return pRet;
	}

	uint8_t Reader::Peek1()
	{
		Ensure(1);
		return *m_p0;
	}

	template <typename T, bool bSigned>
	T Reader::ReadInternal()
	{
		static_assert(!std::numeric_limits<T>::is_signed); // the sign flag must be specified separately

		T ret = 0;
		constexpr unsigned int nBitsMax = sizeof(ret) * 8;

		for (unsigned int nShift = 0; ; )
		{
			uint8_t n = Read1();
			bool bEnd = !(0x80 & n);
			n &= ~0x80;

			if (nShift + 7 > nBitsMax)
			{
				// last possible byte. The bits that don't fit must only extend the value
				Test(bEnd);
				unsigned int nFit = nBitsMax - nShift;

				if constexpr (bSigned)
				{
					uint8_t nHi = n >> (nFit - 1);
					Test(!nHi || (nHi == (0x7F >> (nFit - 1))));
				}
				else
					Test(!(n >> nFit));
			}

			ret |= T(n) << nShift;
			nShift += 7;

			if (bEnd)
			{
				if constexpr (bSigned)
				{
					if ((0x40 & n) && (nShift < nBitsMax))
						ret |= (~static_cast<T>(0) << nShift);
				}
				break;
			}
		}

		return ret;
	}

	template <typename T>
	T Reader::Read()
	{
		typedef typename std::make_unsigned<T>::type TU;
		return static_cast<T>(ReadInternal<TU, std::numeric_limits<T>::is_signed>());
	}

	template uint8_t Reader::Read<uint8_t>();
	template uint32_t Reader::Read<uint32_t>();
	template int32_t Reader::Read<int32_t>();
	template uint64_t Reader::Read<uint64_t>();
	template int64_t Reader::Read<int64_t>();

	Reader Reader::ReadSub()
	{
		auto nLen = Read<uint32_t>();

		Reader ret;
		ret.m_p0 = Consume(nLen);
		ret.m_p1 = ret.m_p0 + nLen;
		return ret;
	}

	std::string Reader::ReadName()
	{
		auto nLen = Read<uint32_t>();
		const char* p = reinterpret_cast<const char*>(Consume(nLen));
		return std::string(p, nLen);
	}

} // namespace Wasm
} // namespace wasmir
