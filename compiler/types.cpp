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

#include "types.h"
#include <cstdio>

namespace wasmir {
namespace Wasm {

	bool ValueTypes::IsKnown(uint8_t n)
	{
		switch (n)
		{
#define THE_MACRO(code, name, txt) case code:
			WasmValueTypes(THE_MACRO)
#undef THE_MACRO
			return true;
		}
		return false;
	}

	ValueType ValueTypes::From(uint8_t n)
	{
		if (!IsKnown(n))
		{
			char sz[0x40];
			snprintf(sz, sizeof(sz), "value type 0x%02x", n);
			Fail(Error::UnsupportedValueType, sz);
		}

		return static_cast<ValueType>(n);
	}

	bool ValueTypes::IsNum(ValueType t)
	{
		switch (t)
		{
		case ValueType::I32:
		case ValueType::I64:
		case ValueType::F32:
		case ValueType::F64:
			return true;
		default:
			return false;
		}
	}

	bool ValueTypes::IsVec(ValueType t)
	{
		return ValueType::V128 == t;
	}

	bool ValueTypes::IsRef(ValueType t)
	{
		return (ValueType::FuncRef == t) || (ValueType::ExternRef == t);
	}

	const char* ValueTypes::get_Name(ValueType t)
	{
		switch (t)
		{
#define THE_MACRO(code, name, txt) case ValueType::name: return #txt;
			WasmValueTypes(THE_MACRO)
#undef THE_MACRO
		}
		return "?";
	}

	std::ostream& operator << (std::ostream& os, ValueType t)
	{
		os << ValueTypes::get_Name(t);
		return os;
	}

	/////////////////////////////////////////////
	// NativeTypes

	NativeTypes::NativeTypes(llvm::LLVMContext& ctx, const llvm::DataLayout& dl)
		:m_Ctx(ctx)
		,m_nPtrBits(dl.getPointerSizeInBits())
	{
	}

	llvm::Type* NativeTypes::get(ValueType t) const
	{
		switch (t)
		{
		case ValueType::I32: return llvm::Type::getInt32Ty(m_Ctx);
		case ValueType::I64: return llvm::Type::getInt64Ty(m_Ctx);
		case ValueType::F32: return llvm::Type::getFloatTy(m_Ctx);
		case ValueType::F64: return llvm::Type::getDoubleTy(m_Ctx);
		case ValueType::V128: return llvm::Type::getInt128Ty(m_Ctx);

		case ValueType::FuncRef:
		case ValueType::ExternRef:
			return llvm::Type::getIntNTy(m_Ctx, m_nPtrBits);
		}

		Fail(Error::UnsupportedValueType, "value type");
	}

	llvm::StructType* NativeTypes::get_Packed(const ValueTypeVec& v) const
	{
		std::vector<llvm::Type*> vTypes;
		vTypes.reserve(v.size());

		for (auto t : v)
			vTypes.push_back(get(t));

		return Ensure(llvm::StructType::get(m_Ctx, vTypes, true));
	}

	llvm::Type* NativeTypes::get_Result(const ValueTypeVec& v) const
	{
		switch (v.size())
		{
		case 0:
			return llvm::Type::getVoidTy(m_Ctx);
		case 1:
			return get(v.front());
		}

		return get_Packed(v);
	}

	llvm::FunctionType* NativeTypes::get_Func(const FuncType& tp) const
	{
		std::vector<llvm::Type*> vArgs;
		vArgs.reserve(tp.m_vArgs.size());

		for (auto t : tp.m_vArgs)
			vArgs.push_back(get(t));

		return Ensure(llvm::FunctionType::get(get_Result(tp.m_vRets), vArgs, false));
	}

	llvm::Constant* NativeTypes::get_Zero(ValueType t) const
	{
		return Ensure(llvm::Constant::getNullValue(get(t)));
	}

} // namespace Wasm
} // namespace wasmir
