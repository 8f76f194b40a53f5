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

#include "../wasm_reader.h"

#include <stdio.h>
#include <string.h>

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
	// the whole buffer must be consumed
	template <typename T>
	bool ReadLeb(const ByteBuffer& buf, T& res)
	{
		try
		{
			Blob b(buf);
			Reader inp(b);
			res = inp.Read<T>();
			return inp.IsEnd();
		}
		catch (const Exc& e)
		{
			verify_test(Error::Malformed == e.m_Type);
		}
		return false;
	}

	void TestUnsigned()
	{
		uint32_t n = 0;
		verify_test(ReadLeb<uint32_t>({ 0x00 }, n) && !n);
		verify_test(ReadLeb<uint32_t>({ 0x7F }, n) && (0x7F == n));
		verify_test(ReadLeb<uint32_t>({ 0xE5, 0x8E, 0x26 }, n) && (624485 == n));
		verify_test(ReadLeb<uint32_t>({ 0x80, 0x00 }, n) && !n); // redundant padding is fine
		verify_test(ReadLeb<uint32_t>({ 0xFF, 0xFF, 0xFF, 0xFF, 0x0F }, n) && (0xFFFFFFFF == n));

		verify_test(!ReadLeb<uint32_t>({ 0xFF, 0xFF, 0xFF, 0xFF, 0x1F }, n)); // bits above 32
		verify_test(!ReadLeb<uint32_t>({ 0x80, 0x80, 0x80, 0x80, 0x80, 0x00 }, n)); // too long
		verify_test(!ReadLeb<uint32_t>({ 0x80 }, n)); // truncated
		verify_test(!ReadLeb<uint32_t>({ }, n));

		uint8_t n8 = 0;
		verify_test(ReadLeb<uint8_t>({ 0x81, 0x01 }, n8) && (0x81 == n8));
		verify_test(!ReadLeb<uint8_t>({ 0x80, 0x02 }, n8));

		uint64_t n64 = 0;
		verify_test(ReadLeb<uint64_t>({ 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01 }, n64) && (static_cast<uint64_t>(-1) == n64));
		verify_test(!ReadLeb<uint64_t>({ 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x03 }, n64));
	}

	void TestSigned()
	{
		int32_t n = 0;
		verify_test(ReadLeb<int32_t>({ 0x7F }, n) && (-1 == n));
		verify_test(ReadLeb<int32_t>({ 0x3F }, n) && (63 == n));
		verify_test(ReadLeb<int32_t>({ 0x40 }, n) && (-64 == n));
		verify_test(ReadLeb<int32_t>({ 0x80, 0x7F }, n) && (-128 == n));
		verify_test(ReadLeb<int32_t>({ 0xC0, 0xBB, 0x78 }, n) && (-123456 == n));
		verify_test(ReadLeb<int32_t>({ 0xFF, 0xFF, 0xFF, 0xFF, 0x07 }, n) && (std::numeric_limits<int32_t>::max() == n));
		verify_test(ReadLeb<int32_t>({ 0x80, 0x80, 0x80, 0x80, 0x78 }, n) && (std::numeric_limits<int32_t>::min() == n));

		// the unused bits of the last byte must replicate the sign
		verify_test(!ReadLeb<int32_t>({ 0x80, 0x80, 0x80, 0x80, 0x70 }, n));
		verify_test(!ReadLeb<int32_t>({ 0xFF, 0xFF, 0xFF, 0xFF, 0x0F }, n));

		int64_t n64 = 0;
		verify_test(ReadLeb<int64_t>({ 0x7F }, n64) && (-1 == n64));
		verify_test(ReadLeb<int64_t>({ 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00 }, n64) && (std::numeric_limits<int64_t>::max() == n64));
		verify_test(ReadLeb<int64_t>({ 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x7F }, n64) && (std::numeric_limits<int64_t>::min() == n64));
		verify_test(!ReadLeb<int64_t>({ 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x01 }, n64));

		// s33 block type index
		verify_test(ReadLeb<int64_t>({ 0x05 }, n64) && (5 == n64));
		verify_test(ReadLeb<int64_t>({ 0x80, 0x01 }, n64) && (128 == n64));
	}

	void TestRaw()
	{
		ByteBuffer buf = { 0x78, 0x56, 0x34, 0x12, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 };
		Blob b(buf);
		Reader inp(b);

		verify_test(0x12345678 == inp.ReadRaw<uint32_t>());
		verify_test(0x0807060504030201ULL == inp.ReadRaw<uint64_t>());
		verify_test(inp.IsEnd());

		try
		{
			inp.ReadRaw<uint32_t>();
			fail_test("read past the end");
		}
		catch (const Exc& e)
		{
			verify_test(Error::Malformed == e.m_Type);
		}
	}

	void TestSub()
	{
		ByteBuffer buf = { 0x03, 0xAA, 0xBB, 0xCC, 0xDD, 0x02, 'h', 'i', 0x05, 0x00 };
		Blob b(buf);
		Reader inp(b);

		Reader sub = inp.ReadSub();
		verify_test(3 == sub.get_Remaining());
		verify_test(0xAA == sub.Peek1());
		verify_test(0xAA == sub.Read1());
		verify_test(2 == sub.get_Remaining());

		verify_test(0xDD == inp.Read1());
		verify_test(inp.ReadName() == "hi");

		try
		{
			inp.ReadSub(); // 5 bytes declared, 1 left
			fail_test("sub-range past the end");
		}
		catch (const Exc& e)
		{
			verify_test(Error::Malformed == e.m_Type);
		}
	}

	void TestErrorNames()
	{
		verify_test(!strcmp(Error::get_Name(Error::None), "None"));
		verify_test(!strcmp(Error::get_Name(Error::Malformed), "Malformed"));
		verify_test(!strcmp(Error::get_Name(Error::UnsupportedMemory64), "UnsupportedMemory64"));
		verify_test(!strcmp(Error::get_Name(Error::Internal), "Internal"));
		verify_test(!strcmp(Error::get_Name(1000), "Unknown"));

		try
		{
			Fail(Error::UnresolvedImport, "test");
		}
		catch (const Exc& e)
		{
			verify_test(Error::UnresolvedImport == e.m_Type);
		}

		try
		{
			Test(false);
		}
		catch (const Exc& e)
		{
			verify_test(Error::Malformed == e.m_Type);
		}

		try
		{
			int* p = nullptr;
			Wasm::Ensure(p);
		}
		catch (const Exc& e)
		{
			verify_test(Error::Internal == e.m_Type);
		}
	}
}

int main()
{
	TestUnsigned();
	TestSigned();
	TestRaw();
	TestSub();
	TestErrorNames();

	return g_TestsFailed ? -1 : 0;
}
