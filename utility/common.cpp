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

#include "common.h"
#include <fstream>
#include <limits>
#include <sstream>

namespace wasmir
{
	Blob::Blob(const ByteBuffer& bb)
	{
		if (bb.size() > std::numeric_limits<uint32_t>::max())
			throw std::length_error("blob too large");

		if ((n = static_cast<uint32_t>(bb.size())) != 0)
			p = &bb.at(0);
	}

	///////////////////////
	// Checkpoint

	thread_local Exc::Checkpoint* Exc::Checkpoint::s_pTop = nullptr;

	Exc::Checkpoint::Checkpoint()
	{
		m_pNext = s_pTop;
		s_pTop = this;
	}

	Exc::Checkpoint::~Checkpoint()
	{
		s_pTop = m_pNext;
	}

	void Exc::Checkpoint::DumpAll(std::ostream& os)
	{
		for (Checkpoint* p = s_pTop; p; p = p->m_pNext)
		{
			os << " <- ";
			p->Dump(os);
		}
	}

	void Exc::CheckpointTxt::Dump(std::ostream& os) {
		os << m_sz;
	}

	void Exc::Fail(uint32_t nType, const char* sz)
	{
		std::ostringstream os;
		os << sz << ":";

		Checkpoint::DumpAll(os);

		Exc exc(os.str());
		exc.m_Type = nType;

		throw exc;
	}

	bool ReadFile(ByteBuffer& buf, const char* szPath)
	{
		std::ifstream fs(szPath, std::ios_base::binary | std::ios_base::ate);
		if (!fs)
			return false;

		auto nSize = fs.tellg();
		if ((nSize < 0) || (static_cast<uint64_t>(nSize) > std::numeric_limits<uint32_t>::max()))
			return false;

		buf.resize(static_cast<size_t>(nSize));
		fs.seekg(0);

		if (!buf.empty())
			fs.read(reinterpret_cast<char*>(&buf.front()), buf.size());

		return !fs.fail();
	}

	bool WriteFile(const Blob& blob, const char* szPath)
	{
		std::ofstream fs(szPath, std::ios_base::binary | std::ios_base::trunc);
		if (!fs)
			return false;

		if (blob.n)
			fs.write(reinterpret_cast<const char*>(blob.p), blob.n);

		return !fs.fail();
	}

} // namespace wasmir
