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
#include "wasm_reader.h"

#include <llvm/IR/Constants.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/LLVMContext.h>

namespace wasmir {
namespace Wasm {

#define WasmValueTypes(macro) \
	macro(0x7F, I32, i32) \
	macro(0x7E, I64, i64) \
	macro(0x7D, F32, f32) \
	macro(0x7C, F64, f64) \
	macro(0x7B, V128, v128) \
	macro(0x70, FuncRef, funcref) \
	macro(0x6F, ExternRef, externref) \

	enum struct ValueType : uint8_t
	{
#define THE_MACRO(code, name, txt) name = code,
		WasmValueTypes(THE_MACRO)
#undef THE_MACRO
	};

	struct ValueTypes
	{
		static bool IsKnown(uint8_t);
		static ValueType From(uint8_t); // UnsupportedValueType for unknown codes

		static bool IsNum(ValueType);
		static bool IsVec(ValueType);
		static bool IsRef(ValueType);

		static const char* get_Name(ValueType);
	};

	std::ostream& operator << (std::ostream&, ValueType);

	typedef std::vector<ValueType> ValueTypeVec;

	struct FuncType
	{
		ValueTypeVec m_vArgs;
		ValueTypeVec m_vRets;

		bool operator == (const FuncType& x) const {
			return (m_vArgs == x.m_vArgs) && (m_vRets == x.m_vRets);
		}
	};

	// Maps wasm types onto the native ones.
	// Vectors and references have no native counterpart yet, they're represented by integers of the appropriate width
	class NativeTypes
	{
		llvm::LLVMContext& m_Ctx;
		unsigned int m_nPtrBits;

	public:
		NativeTypes(llvm::LLVMContext&, const llvm::DataLayout&);

		llvm::LLVMContext& get_Context() const { return m_Ctx; }

		llvm::Type* get(ValueType) const;

		// void for no results, the type itself for a single one, packed struct otherwise
		llvm::Type* get_Result(const ValueTypeVec&) const;
		llvm::StructType* get_Packed(const ValueTypeVec&) const;

		llvm::FunctionType* get_Func(const FuncType&) const;

		llvm::Constant* get_Zero(ValueType) const;
	};

} // namespace Wasm
} // namespace wasmir
