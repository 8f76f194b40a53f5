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
#include <llvm/ADT/ArrayRef.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/Module.h>

#include <map>
#include <string>

namespace wasmir {
namespace Wasm {

	// id, name (without the overload suffixes)
#define WasmIrIntrinsics(macro) \
	macro(ctlz, "ctlz") \
	macro(cttz, "cttz") \
	macro(ctpop, "ctpop") \
	macro(fshl, "fshl") \
	macro(fshr, "fshr") \
	macro(fabs, "fabs") \
	macro(ceil, "ceil") \
	macro(floor, "floor") \
	macro(trunc, "trunc") \
	macro(roundeven, "roundeven") \
	macro(sqrt, "sqrt") \
	macro(minimum, "minimum") \
	macro(maximum, "maximum") \
	macro(copysign, "copysign") \
	macro(fptosi_sat, "fptosi.sat") \
	macro(fptoui_sat, "fptoui.sat") \
	macro(trap, "trap") \

	// Declares each intrinsic overload once per module
	class IntrinsicCache
	{
	public:
		enum Kind
		{
#define THE_MACRO(id, name) id,
			WasmIrIntrinsics(THE_MACRO)
#undef THE_MACRO
		};

		explicit IntrinsicCache(llvm::Module&);

		// vTypes are the overloaded types in the mangling order. For the saturating conversions it's the result, then the source
		llvm::Function* Get(Kind, llvm::ArrayRef<llvm::Type*> vTypes = llvm::None);

		size_t get_Count() const { return m_Map.size(); }

		static std::string get_Name(Kind, llvm::ArrayRef<llvm::Type*> vTypes);

	private:
		llvm::Module& m_Module;
		std::map<std::string, llvm::Function*> m_Map;
	};

} // namespace Wasm
} // namespace wasmir
