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

#include <vector>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace Cast
{
	template <typename TT, typename T> inline TT& Up(T& x)
	{
		TT& ret = (TT&) x;
		[[maybe_unused]] T& unused = ret;
		return ret;
	}

} // namespace Cast

namespace wasmir
{
	typedef std::vector<uint8_t> ByteBuffer;

	struct Blob
	{
		const void* p = nullptr;
		uint32_t n = 0;

		Blob(const void* p_, uint32_t n_) :p(p_), n(n_) {}
		Blob(const ByteBuffer& bb); // throws if it doesn't fit
	};

	// All the compilation errors. m_Type classifies the failure, the message carries the context
	struct Exc
		:public std::runtime_error
	{
		uint32_t m_Type = 0;

		Exc(const std::string& s) :std::runtime_error(s) {}

		// Context chain, dumped into the message of the exception thrown while it's alive
		struct Checkpoint
		{
			Checkpoint();
			virtual ~Checkpoint();

			virtual void Dump(std::ostream&) = 0;

			static void DumpAll(std::ostream&);

		private:
			Checkpoint* m_pNext;
			static thread_local Checkpoint* s_pTop;
		};

		struct CheckpointTxt
			:public Checkpoint
		{
			const char* m_sz;
			CheckpointTxt(const char* sz) :m_sz(sz) {}
			void Dump(std::ostream&) override;
		};

		[[noreturn]] static void Fail(uint32_t nType, const char*);
	};

	// reads the whole file. Returns false if it can't be opened, or is too large for a Blob
	bool ReadFile(ByteBuffer&, const char* szPath);
	bool WriteFile(const Blob&, const char* szPath);
}

namespace std
{
	template <typename TDst, typename TSrc>
	inline void setmin(TDst& a, TSrc b) {
		if (a > b)
			a = b;
	}
}
