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
#include <stdint.h>

namespace wasmir {
namespace Wasm {

	// opcode, name
#define WasmInstructions_Control(macro) \
	macro(0x00, unreachable) \
	macro(0x01, nop) \
	macro(0x02, block) \
	macro(0x03, loop) \
	macro(0x04, if_block) \
	macro(0x05, else_block) \
	macro(0x0B, end_block) \
	macro(0x0C, br) \
	macro(0x0F, ret) \

#define WasmInstructions_Parametric(macro) \
	macro(0x1A, drop) \
	macro(0x1B, select) \
	macro(0x1C, select_t) \
	macro(0x20, local_get) \
	macro(0x21, local_set) \
	macro(0x22, local_tee) \
	macro(0x41, i32_const) \
	macro(0x42, i64_const) \
	macro(0x43, f32_const) \
	macro(0x44, f64_const) \
	macro(0x8C, f32_neg) \
	macro(0x9A, f64_neg) \

	// name, i32 opcode, i64 opcode, predicate
#define WasmInstructions_CmpInt(macro) \
	macro(eq  , 0x46, 0x51, ICMP_EQ) \
	macro(ne  , 0x47, 0x52, ICMP_NE) \
	macro(lt_s, 0x48, 0x53, ICMP_SLT) \
	macro(lt_u, 0x49, 0x54, ICMP_ULT) \
	macro(gt_s, 0x4A, 0x55, ICMP_SGT) \
	macro(gt_u, 0x4B, 0x56, ICMP_UGT) \
	macro(le_s, 0x4C, 0x57, ICMP_SLE) \
	macro(le_u, 0x4D, 0x58, ICMP_ULE) \
	macro(ge_s, 0x4E, 0x59, ICMP_SGE) \
	macro(ge_u, 0x4F, 0x5A, ICMP_UGE) \

	// name, f32 opcode, f64 opcode, predicate
#define WasmInstructions_CmpFloat(macro) \
	macro(eq, 0x5B, 0x61, FCMP_OEQ) \
	macro(ne, 0x5C, 0x62, FCMP_UNE) \
	macro(lt, 0x5D, 0x63, FCMP_OLT) \
	macro(gt, 0x5E, 0x64, FCMP_OGT) \
	macro(le, 0x5F, 0x65, FCMP_OLE) \
	macro(ge, 0x60, 0x66, FCMP_OGE) \

	// name, i32 opcode, i64 opcode, intrinsic
#define WasmInstructions_UnopInt(macro) \
	macro(clz   , 0x67, 0x79, ctlz) \
	macro(ctz   , 0x68, 0x7A, cttz) \
	macro(popcnt, 0x69, 0x7B, ctpop) \

	// name, i32 opcode, i64 opcode, native op
#define WasmInstructions_BinopInt(macro) \
	macro(add  , 0x6A, 0x7C, Add) \
	macro(sub  , 0x6B, 0x7D, Sub) \
	macro(mul  , 0x6C, 0x7E, Mul) \
	macro(div_s, 0x6D, 0x7F, SDiv) \
	macro(div_u, 0x6E, 0x80, UDiv) \
	macro(rem_s, 0x6F, 0x81, SRem) \
	macro(rem_u, 0x70, 0x82, URem) \
	macro(and  , 0x71, 0x83, And) \
	macro(or   , 0x72, 0x84, Or) \
	macro(xor  , 0x73, 0x85, Xor) \

#define WasmInstructions_ShiftInt(macro) \
	macro(shl  , 0x74, 0x86, Shl) \
	macro(shr_s, 0x75, 0x87, AShr) \
	macro(shr_u, 0x76, 0x88, LShr) \

	// name, i32 opcode, i64 opcode, intrinsic
#define WasmInstructions_RotInt(macro) \
	macro(rotl, 0x77, 0x89, fshl) \
	macro(rotr, 0x78, 0x8A, fshr) \

	// name, f32 opcode, f64 opcode, intrinsic
#define WasmInstructions_UnopFloat(macro) \
	macro(abs    , 0x8B, 0x99, fabs) \
	macro(ceil   , 0x8D, 0x9B, ceil) \
	macro(floor  , 0x8E, 0x9C, floor) \
	macro(trunc  , 0x8F, 0x9D, trunc) \
	macro(nearest, 0x90, 0x9E, roundeven) \
	macro(sqrt   , 0x91, 0x9F, sqrt) \

	// name, f32 opcode, f64 opcode, native op
#define WasmInstructions_BinopFloat(macro) \
	macro(add, 0x92, 0xA0, FAdd) \
	macro(sub, 0x93, 0xA1, FSub) \
	macro(mul, 0x94, 0xA2, FMul) \
	macro(div, 0x95, 0xA3, FDiv) \

	// name, f32 opcode, f64 opcode, intrinsic
#define WasmInstructions_BinopFloatIntrinsic(macro) \
	macro(min     , 0x96, 0xA4, minimum) \
	macro(max     , 0x97, 0xA5, maximum) \
	macro(copysign, 0x98, 0xA6, copysign) \

	// opcode, name, source, target, conversion
#define WasmInstructions_Convert(macro) \
	macro(0xA7, i32_wrap_i64       , I64, I32, Wrap) \
	macro(0xA8, i32_trunc_f32_s    , F32, I32, TruncS) \
	macro(0xA9, i32_trunc_f32_u    , F32, I32, TruncU) \
	macro(0xAA, i32_trunc_f64_s    , F64, I32, TruncS) \
	macro(0xAB, i32_trunc_f64_u    , F64, I32, TruncU) \
	macro(0xAC, i64_extend_i32_s   , I32, I64, ExtendS) \
	macro(0xAD, i64_extend_i32_u   , I32, I64, ExtendU) \
	macro(0xAE, i64_trunc_f32_s    , F32, I64, TruncS) \
	macro(0xAF, i64_trunc_f32_u    , F32, I64, TruncU) \
	macro(0xB0, i64_trunc_f64_s    , F64, I64, TruncS) \
	macro(0xB1, i64_trunc_f64_u    , F64, I64, TruncU) \
	macro(0xB2, f32_convert_i32_s  , I32, F32, ConvertS) \
	macro(0xB3, f32_convert_i32_u  , I32, F32, ConvertU) \
	macro(0xB4, f32_convert_i64_s  , I64, F32, ConvertS) \
	macro(0xB5, f32_convert_i64_u  , I64, F32, ConvertU) \
	macro(0xB6, f32_demote_f64     , F64, F32, Demote) \
	macro(0xB7, f64_convert_i32_s  , I32, F64, ConvertS) \
	macro(0xB8, f64_convert_i32_u  , I32, F64, ConvertU) \
	macro(0xB9, f64_convert_i64_s  , I64, F64, ConvertS) \
	macro(0xBA, f64_convert_i64_u  , I64, F64, ConvertU) \
	macro(0xBB, f64_promote_f32    , F32, F64, Promote) \
	macro(0xBC, i32_reinterpret_f32, F32, I32, Reinterpret) \
	macro(0xBD, i64_reinterpret_f64, F64, I64, Reinterpret) \
	macro(0xBE, f32_reinterpret_i32, I32, F32, Reinterpret) \
	macro(0xBF, f64_reinterpret_i64, I64, F64, Reinterpret) \

	// opcode, name, type, source bits
#define WasmInstructions_SignExt(macro) \
	macro(0xC0, i32_extend8_s , I32, 8) \
	macro(0xC1, i32_extend16_s, I32, 16) \
	macro(0xC2, i64_extend8_s , I64, 8) \
	macro(0xC3, i64_extend16_s, I64, 16) \
	macro(0xC4, i64_extend32_s, I64, 32) \

	// 0xFC-prefixed. sub-opcode, name, source, target, signed
#define WasmInstructions_TruncSat(macro) \
	macro(0, i32_trunc_sat_f32_s, F32, I32, true) \
	macro(1, i32_trunc_sat_f32_u, F32, I32, false) \
	macro(2, i32_trunc_sat_f64_s, F64, I32, true) \
	macro(3, i32_trunc_sat_f64_u, F64, I32, false) \
	macro(4, i64_trunc_sat_f32_s, F32, I64, true) \
	macro(5, i64_trunc_sat_f32_u, F32, I64, false) \
	macro(6, i64_trunc_sat_f64_s, F64, I64, true) \
	macro(7, i64_trunc_sat_f64_u, F64, I64, false) \

	// Recognized, but not lowered
#define WasmInstructions_Unsupported(macro) \
	macro(0x06, try_block) \
	macro(0x07, catch_block) \
	macro(0x08, throw_exc) \
	macro(0x09, rethrow) \
	macro(0x0A, throw_ref) \
	macro(0x0D, br_if) \
	macro(0x0E, br_table) \
	macro(0x10, call) \
	macro(0x11, call_indirect) \
	macro(0x12, return_call) \
	macro(0x13, return_call_indirect) \
	macro(0x14, call_ref) \
	macro(0x15, return_call_ref) \
	macro(0x18, delegate) \
	macro(0x19, catch_all) \
	macro(0x1F, try_table) \
	macro(0x23, global_get) \
	macro(0x24, global_set) \
	macro(0x25, table_get) \
	macro(0x26, table_set) \
	macro(0x28, i32_load) \
	macro(0x29, i64_load) \
	macro(0x2A, f32_load) \
	macro(0x2B, f64_load) \
	macro(0x2C, i32_load8_s) \
	macro(0x2D, i32_load8_u) \
	macro(0x2E, i32_load16_s) \
	macro(0x2F, i32_load16_u) \
	macro(0x30, i64_load8_s) \
	macro(0x31, i64_load8_u) \
	macro(0x32, i64_load16_s) \
	macro(0x33, i64_load16_u) \
	macro(0x34, i64_load32_s) \
	macro(0x35, i64_load32_u) \
	macro(0x36, i32_store) \
	macro(0x37, i64_store) \
	macro(0x38, f32_store) \
	macro(0x39, f64_store) \
	macro(0x3A, i32_store8) \
	macro(0x3B, i32_store16) \
	macro(0x3C, i64_store8) \
	macro(0x3D, i64_store16) \
	macro(0x3E, i64_store32) \
	macro(0x3F, memory_size) \
	macro(0x40, memory_grow) \
	macro(0xD0, ref_null) \
	macro(0xD1, ref_is_null) \
	macro(0xD2, ref_func) \
	macro(0xD3, ref_eq) \
	macro(0xD4, ref_as_non_null) \
	macro(0xD5, br_on_null) \
	macro(0xD6, br_on_non_null) \
	macro(0xFB, prefix_gc) \
	macro(0xFD, prefix_simd) \
	macro(0xFE, prefix_atomic) \

	enum Instruction : uint8_t
	{
#define THE_MACRO(id, name) name = id,
		WasmInstructions_Control(THE_MACRO)
		WasmInstructions_Parametric(THE_MACRO)
		WasmInstructions_Unsupported(THE_MACRO)
#undef THE_MACRO

		i32_eqz = 0x45,
		i64_eqz = 0x50,

#define THE_MACRO(name, id32, id64, op) \
		i32_##name = id32, \
		i64_##name = id64,

		WasmInstructions_CmpInt(THE_MACRO)
		WasmInstructions_UnopInt(THE_MACRO)
		WasmInstructions_BinopInt(THE_MACRO)
		WasmInstructions_ShiftInt(THE_MACRO)
		WasmInstructions_RotInt(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
		f32_##name = id32, \
		f64_##name = id64,

		WasmInstructions_CmpFloat(THE_MACRO)
		WasmInstructions_UnopFloat(THE_MACRO)
		WasmInstructions_BinopFloat(THE_MACRO)
		WasmInstructions_BinopFloatIntrinsic(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(id, name, src, dst, kind) name = id,
		WasmInstructions_Convert(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(id, name, type, bits) name = id,
		WasmInstructions_SignExt(THE_MACRO)
#undef THE_MACRO

		prefix_misc = 0xFC,
	};

	enum struct MiscInstruction : uint32_t
	{
#define THE_MACRO(id, name, src, dst, bSigned) name = id,
		WasmInstructions_TruncSat(THE_MACRO)
#undef THE_MACRO
	};

	// bulk memory and table ops, 0xFC 8..17
	static const uint32_t s_MiscBulkMin = 8;
	static const uint32_t s_MiscBulkMax = 17;

} // namespace Wasm
} // namespace wasmir
