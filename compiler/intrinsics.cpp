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

#include "intrinsics.h"
#include "wasm_reader.h"
#include "../utility/logger.h"

namespace wasmir {
namespace Wasm {

	namespace
	{
		llvm::Intrinsic::ID get_Id(IntrinsicCache::Kind eKind)
		{
			switch (eKind)
			{
#define THE_MACRO(id, name) case IntrinsicCache::id: return llvm::Intrinsic::id;
				WasmIrIntrinsics(THE_MACRO)
#undef THE_MACRO
			}
			Fail(Error::Internal, "intrinsic");
		}

		void AppendTypeName(std::string& s, llvm::Type* pType)
		{
			if (pType->isFloatTy())
				s += "f32";
			else if (pType->isDoubleTy())
				s += "f64";
			else if (pType->isIntegerTy())
			{
				s += 'i';
				s += std::to_string(pType->getIntegerBitWidth());
			}
			else
				Fail(Error::Internal, "intrinsic overload type");
		}
	}

	IntrinsicCache::IntrinsicCache(llvm::Module& m)
		:m_Module(m)
	{
	}

	std::string IntrinsicCache::get_Name(Kind eKind, llvm::ArrayRef<llvm::Type*> vTypes)
	{
		std::string s = "llvm.";

		switch (eKind)
		{
#define THE_MACRO(id, name) case id: s += name; break;
			WasmIrIntrinsics(THE_MACRO)
#undef THE_MACRO
		}

		for (auto* pType : vTypes)
		{
			s += '.';
			AppendTypeName(s, pType);
		}

		return s;
	}

	llvm::Function* IntrinsicCache::Get(Kind eKind, llvm::ArrayRef<llvm::Type*> vTypes)
	{
		auto sName = get_Name(eKind, vTypes);

		auto it = m_Map.find(sName);
		if (m_Map.end() != it)
			return it->second;

		auto* pFunc = Ensure(llvm::Intrinsic::getDeclaration(&m_Module, get_Id(eKind), vTypes));
		LOG_VERBOSE() << "declared " << sName;

		m_Map[sName] = pFunc;
		return pFunc;
	}

} // namespace Wasm
} // namespace wasmir
