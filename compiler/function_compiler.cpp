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

#include "compiler.h"
#include "instructions.h"
#include "../utility/logger.h"

#include <llvm/ADT/APFloat.h>
#include <llvm/ADT/APInt.h>
#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include <cmath>
#include <cstdio>

namespace wasmir {
namespace Wasm {

	namespace
	{
		const char* get_UnsupportedName(uint8_t n)
		{
			switch (n)
			{
#define THE_MACRO(id, name) case id: return #name;
				WasmInstructions_Unsupported(THE_MACRO)
#undef THE_MACRO
			}
			return nullptr;
		}
	}

	struct Compiler::Context
	{
		Compiler& m_This;
		uint32_t m_iFunc;
		const FuncType& m_Type;
		llvm::Function* m_pFunc;
		llvm::LLVMContext& m_Ctx;
		llvm::IRBuilder<> m_Builder;
		llvm::BasicBlock* m_pEntry = nullptr;
		Reader m_Code;

		struct Local
		{
			llvm::Type* m_pType;
			llvm::AllocaInst* m_pSlot;
		};

		std::vector<Local> m_vLocals; // args first

		struct Control
		{
			enum struct Kind { Block, Loop, If };
			Kind m_Kind = Kind::Block;

			llvm::BasicBlock* m_pBegin = nullptr; // loop
			llvm::BasicBlock* m_pElse = nullptr; // if, until placed
			llvm::BasicBlock* m_pEnd = nullptr;

			std::vector<llvm::PHINode*> m_vResults; // at m_pEnd
			std::vector<llvm::Value*> m_vParams; // if: pushed again for the else arm

			size_t m_nStack0 = 0; // operand stack height at entry, params excluded
		};

		std::vector<Control> m_vControls;
		std::vector<llvm::Value*> m_vStack;

		bool m_Unreachable = false;
		uint32_t m_nDeadDepth = 0; // constructs opened while unreachable
		bool m_Done = false;

		Context(Compiler& x, uint32_t iFunc, llvm::Function* pFunc)
			:m_This(x)
			,m_iFunc(iFunc)
			,m_Type(x.m_Info.get_FuncType(iFunc))
			,m_pFunc(pFunc)
			,m_Ctx(pFunc->getContext())
			,m_Builder(pFunc->getContext())
		{
			m_pEntry = Ensure(llvm::BasicBlock::Create(m_Ctx, "entry", m_pFunc));
			m_Builder.SetInsertPoint(m_pEntry);
		}

		void CompileFunc();

		/////////////////////////////////////////////
		// operand stack

		size_t get_StackBase() const
		{
			return m_vControls.empty() ? 0 : m_vControls.back().m_nStack0;
		}

		void Push(llvm::Value* p)
		{
			m_vStack.push_back(p);
		}

		llvm::Value* Pop()
		{
			Test(m_vStack.size() > get_StackBase());
			auto* pRet = m_vStack.back();
			m_vStack.pop_back();
			return pRet;
		}

		void TruncateStack(size_t n)
		{
			Test(m_vStack.size() >= n);
			m_vStack.resize(n);
		}

		void EnterUnreachable()
		{
			TruncateStack(get_StackBase());
			m_Unreachable = true;
		}

		llvm::Value* ToBool(llvm::Value* p)
		{
			return m_Builder.CreateICmpNE(p, llvm::ConstantInt::get(p->getType(), 0));
		}

		llvm::Value* FromBool(llvm::Value* p)
		{
			return m_Builder.CreateZExt(p, m_Builder.getInt32Ty());
		}

		/////////////////////////////////////////////
		// locals

		llvm::AllocaInst* AddLocal(ValueType t)
		{
			auto& x = m_vLocals.emplace_back();
			x.m_pType = m_This.m_Types.get(t);
			x.m_pSlot = m_Builder.CreateAlloca(x.m_pType, nullptr, "local" + std::to_string(m_vLocals.size() - 1));
			return x.m_pSlot;
		}

		void AllocLocals()
		{
			const auto& vArgs = m_Type.m_vArgs;
			for (uint32_t i = 0; i < vArgs.size(); i++)
			{
				auto* pArg = m_pFunc->getArg(i);
				pArg->setName("arg" + std::to_string(i));
				m_Builder.CreateStore(pArg, AddLocal(vArgs[i]));
			}

			auto nRuns = m_Code.Read<uint32_t>();
			uint32_t nDeclared = 0;

			for (uint32_t iRun = 0; iRun < nRuns; iRun++)
			{
				auto nCount = m_Code.Read<uint32_t>();
				auto t = ValueTypes::From(m_Code.Read1());

				Test(nCount <= s_MaxLocals - nDeclared);
				nDeclared += nCount;

				auto* pZero = m_This.m_Types.get_Zero(t);
				while (nCount--)
					m_Builder.CreateStore(pZero, AddLocal(t));
			}
		}

		const Local& ReadLocal()
		{
			auto iLocal = m_Code.Read<uint32_t>();
			Test(iLocal < m_vLocals.size());
			return m_vLocals[iLocal];
		}

		void On_local_get()
		{
			const auto& x = ReadLocal();
			if (m_Unreachable)
				return;

			// never leave the slot itself on the stack
			Push(m_Builder.CreateLoad(x.m_pType, x.m_pSlot));
		}

		void On_local_set()
		{
			const auto& x = ReadLocal();
			if (m_Unreachable)
				return;

			m_Builder.CreateStore(Pop(), x.m_pSlot);
		}

		void On_local_tee()
		{
			const auto& x = ReadLocal();
			if (m_Unreachable)
				return;

			Test(m_vStack.size() > get_StackBase());
			m_Builder.CreateStore(m_vStack.back(), x.m_pSlot);
		}

		/////////////////////////////////////////////
		// blocks

		llvm::BasicBlock* CreateBlock(const char* szName)
		{
			// created detached from the control flow, positioned once placed
			return Ensure(llvm::BasicBlock::Create(m_Ctx, szName, m_pFunc));
		}

		void Place(llvm::BasicBlock* p)
		{
			p->moveAfter(m_Builder.GetInsertBlock());
			m_Builder.SetInsertPoint(p);
		}

		void ReadBlockType(ValueTypeVec& vParams, ValueTypeVec& vResults)
		{
			auto n = m_Code.Peek1();
			if (0x40 == n)
			{
				m_Code.Read1();
				return;
			}

			if ((0x40 & n) && !(0x80 & n))
			{
				// single-byte negative, a value type
				vResults.push_back(ValueTypes::From(m_Code.Read1()));
				return;
			}

			auto iType = m_Code.Read<int64_t>(); // s33
			Test((iType >= 0) && (static_cast<uint64_t>(iType) < m_This.m_Info.m_vTypes.size()));

			const auto& tp = m_This.m_Info.m_vTypes[static_cast<size_t>(iType)];
			vParams = tp.m_vArgs;
			vResults = tp.m_vRets;
		}

		Control& PushControl(Control::Kind eKind, const char* szEnd, const ValueTypeVec& vParams, const ValueTypeVec& vResults)
		{
			Test(m_vStack.size() - get_StackBase() >= vParams.size());
			size_t nStack0 = m_vStack.size() - vParams.size();

			auto& c = m_vControls.emplace_back();
			c.m_Kind = eKind;
			c.m_nStack0 = nStack0;
			c.m_pEnd = CreateBlock(szEnd);

			c.m_vResults.reserve(vResults.size());
			for (auto t : vResults)
				c.m_vResults.push_back(Ensure(llvm::PHINode::Create(m_This.m_Types.get(t), 2, "", c.m_pEnd)));

			return c;
		}

		// the top values go to the target's phis, the current block is the predecessor
		void RouteResults(const std::vector<llvm::PHINode*>& vPhis)
		{
			Test(m_vStack.size() - get_StackBase() >= vPhis.size());

			auto* pBlock = m_Builder.GetInsertBlock();
			size_t n0 = m_vStack.size() - vPhis.size();

			for (size_t i = 0; i < vPhis.size(); i++)
				vPhis[i]->addIncoming(m_vStack[n0 + i], pBlock);
		}

		void ExitTo(const Control& c)
		{
			if (Control::Kind::Loop == c.m_Kind)
				m_Builder.CreateBr(c.m_pBegin);
			else
			{
				RouteResults(c.m_vResults);
				m_Builder.CreateBr(c.m_pEnd);
			}
		}

		void On_block()
		{
			ValueTypeVec vParams, vResults;
			ReadBlockType(vParams, vResults);

			if (m_Unreachable)
			{
				m_nDeadDepth++;
				return;
			}

			PushControl(Control::Kind::Block, "block_end", vParams, vResults);
		}

		void On_loop()
		{
			ValueTypeVec vParams, vResults;
			ReadBlockType(vParams, vResults);

			if (!vParams.empty())
				Fail(Error::UnsupportedInstruction, "loop with params");

			if (m_Unreachable)
			{
				m_nDeadDepth++;
				return;
			}

			auto* pBegin = CreateBlock("loop_begin");
			m_Builder.CreateBr(pBegin);
			Place(pBegin);

			PushControl(Control::Kind::Loop, "loop_end", vParams, vResults).m_pBegin = pBegin;
		}

		void On_if_block()
		{
			ValueTypeVec vParams, vResults;
			ReadBlockType(vParams, vResults);

			if (m_Unreachable)
			{
				m_nDeadDepth++;
				return;
			}

			auto* pCond = ToBool(Pop());

			auto* pThen = CreateBlock("if_then");
			auto* pElse = CreateBlock("if_else");
			m_Builder.CreateCondBr(pCond, pThen, pElse);

			auto& c = PushControl(Control::Kind::If, "if_end", vParams, vResults);
			c.m_pElse = pElse;
			c.m_vParams.assign(m_vStack.begin() + c.m_nStack0, m_vStack.end());

			Place(pThen);
		}

		void On_else_block()
		{
			if (m_nDeadDepth)
				return;

			Test(!m_vControls.empty());
			auto& c = m_vControls.back();
			Test((Control::Kind::If == c.m_Kind) && c.m_pElse);

			if (!m_Unreachable)
			{
				Test(m_vStack.size() == c.m_nStack0 + c.m_vResults.size());
				ExitTo(c);
			}

			TruncateStack(c.m_nStack0);
			m_vStack.insert(m_vStack.end(), c.m_vParams.begin(), c.m_vParams.end());

			Place(c.m_pElse);
			c.m_pElse = nullptr;
			m_Unreachable = false;
		}

		void On_end_block()
		{
			if (m_nDeadDepth)
			{
				m_nDeadDepth--;
				return;
			}

			if (m_vControls.empty())
			{
				OnFuncEnd();
				return;
			}

			auto& c = m_vControls.back();

			if (!m_Unreachable)
			{
				// for loops it's the back-edge
				if (Control::Kind::Loop != c.m_Kind)
					Test(m_vStack.size() == c.m_nStack0 + c.m_vResults.size());
				ExitTo(c);
			}

			if (c.m_pElse)
			{
				// no else arm, the params are passed through
				TruncateStack(c.m_nStack0);
				m_vStack.insert(m_vStack.end(), c.m_vParams.begin(), c.m_vParams.end());

				Place(c.m_pElse);
				c.m_pElse = nullptr;
				ExitTo(c);
			}

			TruncateStack(c.m_nStack0);
			Place(c.m_pEnd);

			for (auto* pPhi : c.m_vResults)
			{
				if (pPhi->getNumIncomingValues())
					Push(pPhi);
				else
				{
					// end is unreachable
					Push(llvm::Constant::getNullValue(pPhi->getType()));
					pPhi->eraseFromParent();
				}
			}

			m_vControls.pop_back();
			m_Unreachable = false;
		}

		void On_br()
		{
			auto nDepth = m_Code.Read<uint32_t>();
			if (m_Unreachable)
				return;

			Test(nDepth <= m_vControls.size());

			if (m_vControls.size() == nDepth)
			{
				// the function level
				MaterializeReturn();
				return;
			}

			ExitTo(m_vControls[m_vControls.size() - 1 - nDepth]);
			EnterUnreachable();
		}

		void On_ret()
		{
			if (!m_Unreachable)
				MaterializeReturn();
		}

		void On_unreachable()
		{
			if (m_Unreachable)
				return;

			m_Builder.CreateUnreachable();
			EnterUnreachable();
		}

		void On_nop()
		{
			if (m_Unreachable)
				return;

			// explicit instruction, the builder would fold it otherwise
			auto* pZero = m_Builder.getInt32(0);
			m_Builder.Insert(llvm::BinaryOperator::CreateAdd(pZero, pZero), "nop");
		}

		void OnFuncEnd()
		{
			if (!m_Unreachable)
			{
				Test(m_vStack.size() == m_Type.m_vRets.size());
				MaterializeReturn();
			}

			m_Done = true;
		}

		/////////////////////////////////////////////
		// return

		void MaterializeReturn()
		{
			const auto& vRets = m_Type.m_vRets;
			Test(m_vStack.size() - get_StackBase() >= vRets.size());

			auto it = m_vStack.end() - vRets.size();

			switch (vRets.size())
			{
			case 0:
				m_Builder.CreateRetVoid();
				break;

			case 1:
				m_Builder.CreateRet(*it);
				break;

			default:
				{
					// single return value, the results are packed
					auto* pType = m_This.m_Types.get_Packed(vRets);

					llvm::IRBuilder<> bEntry(m_pEntry, m_pEntry->begin());
					auto* pSlot = bEntry.CreateAlloca(pType, nullptr, "ret");

					for (uint32_t i = 0; i < vRets.size(); i++, it++)
						m_Builder.CreateStore(*it, m_Builder.CreateStructGEP(pType, pSlot, i));

					m_Builder.CreateRet(m_Builder.CreateLoad(pType, pSlot));
				}
			}

			EnterUnreachable();
		}

		/////////////////////////////////////////////
		// parametric

		void On_drop()
		{
			if (!m_Unreachable)
				Pop();
		}

		void On_select()
		{
			if (m_Unreachable)
				return;

			auto* pCond = ToBool(Pop());
			auto* pB = Pop();
			auto* pA = Pop();
			Push(m_Builder.CreateSelect(pCond, pA, pB));
		}

		void On_select_t()
		{
			auto nCount = m_Code.Read<uint32_t>();
			Test(1 == nCount);
			ValueTypes::From(m_Code.Read1());

			On_select();
		}

		/////////////////////////////////////////////
		// const

		void On_i32_const()
		{
			auto val = m_Code.Read<int32_t>();
			if (!m_Unreachable)
				Push(m_Builder.getInt32(static_cast<uint32_t>(val)));
		}

		void On_i64_const()
		{
			auto val = m_Code.Read<int64_t>();
			if (!m_Unreachable)
				Push(m_Builder.getInt64(static_cast<uint64_t>(val)));
		}

		void On_f32_const()
		{
			auto nBits = m_Code.ReadRaw<uint32_t>();
			if (!m_Unreachable)
				Push(llvm::ConstantFP::get(m_Ctx, llvm::APFloat(llvm::APFloat::IEEEsingle(), llvm::APInt(32, nBits))));
		}

		void On_f64_const()
		{
			auto nBits = m_Code.ReadRaw<uint64_t>();
			if (!m_Unreachable)
				Push(llvm::ConstantFP::get(m_Ctx, llvm::APFloat(llvm::APFloat::IEEEdouble(), llvm::APInt(64, nBits))));
		}

		/////////////////////////////////////////////
		// numeric

		llvm::Function* get_Intrinsic(IntrinsicCache::Kind eKind, llvm::Value* pArg)
		{
			return m_This.m_Intrinsics.Get(eKind, { pArg->getType() });
		}

		void OnEqz()
		{
			if (m_Unreachable)
				return;

			auto* pA = Pop();
			Push(FromBool(m_Builder.CreateICmpEQ(pA, llvm::ConstantInt::get(pA->getType(), 0))));
		}

		void OnCmpInt(llvm::CmpInst::Predicate eOp)
		{
			if (m_Unreachable)
				return;

			auto* pB = Pop();
			auto* pA = Pop();
			Push(FromBool(m_Builder.CreateICmp(eOp, pA, pB)));
		}

		void OnCmpFloat(llvm::CmpInst::Predicate eOp)
		{
			if (m_Unreachable)
				return;

			auto* pB = Pop();
			auto* pA = Pop();
			Push(FromBool(m_Builder.CreateFCmp(eOp, pA, pB)));
		}

		void OnBinop(llvm::Instruction::BinaryOps eOp)
		{
			if (m_Unreachable)
				return;

			auto* pB = Pop();
			auto* pA = Pop();
			Push(m_Builder.CreateBinOp(eOp, pA, pB));
		}

		void OnShift(llvm::Instruction::BinaryOps eOp)
		{
			if (m_Unreachable)
				return;

			auto* pB = Pop();
			auto* pA = Pop();

			// the count is taken modulo the width
			uint32_t nBits = pA->getType()->getIntegerBitWidth();
			pB = m_Builder.CreateAnd(pB, llvm::ConstantInt::get(pB->getType(), nBits - 1));

			Push(m_Builder.CreateBinOp(eOp, pA, pB));
		}

		void OnUnopInt(IntrinsicCache::Kind eKind)
		{
			if (m_Unreachable)
				return;

			auto* pA = Pop();
			auto* pFunc = get_Intrinsic(eKind, pA);

			if (IntrinsicCache::ctpop == eKind)
				Push(m_Builder.CreateCall(pFunc, { pA }));
			else
				Push(m_Builder.CreateCall(pFunc, { pA, m_Builder.getFalse() })); // zero input is defined
		}

		void OnRotate(IntrinsicCache::Kind eKind)
		{
			if (m_Unreachable)
				return;

			auto* pB = Pop();
			auto* pA = Pop();
			Push(m_Builder.CreateCall(get_Intrinsic(eKind, pA), { pA, pA, pB }));
		}

		void OnUnopIntrinsic(IntrinsicCache::Kind eKind)
		{
			if (m_Unreachable)
				return;

			auto* pA = Pop();
			Push(m_Builder.CreateCall(get_Intrinsic(eKind, pA), { pA }));
		}

		void OnBinopIntrinsic(IntrinsicCache::Kind eKind)
		{
			if (m_Unreachable)
				return;

			auto* pB = Pop();
			auto* pA = Pop();
			Push(m_Builder.CreateCall(get_Intrinsic(eKind, pA), { pA, pB }));
		}

		void OnNeg()
		{
			if (!m_Unreachable)
				Push(m_Builder.CreateFNeg(Pop()));
		}

		void On_f32_neg() { OnNeg(); }
		void On_f64_neg() { OnNeg(); }

		/////////////////////////////////////////////
		// conversions

		enum struct Conversion
		{
			Wrap,
			ExtendS,
			ExtendU,
			TruncS,
			TruncU,
			ConvertS,
			ConvertU,
			Demote,
			Promote,
			Reinterpret,
		};

		void OnConvert(Conversion eConv, ValueType tDst)
		{
			if (m_Unreachable)
				return;

			auto* pA = Pop();
			auto* pDst = m_This.m_Types.get(tDst);

			switch (eConv)
			{
			case Conversion::Wrap: Push(m_Builder.CreateTrunc(pA, pDst)); break;
			case Conversion::ExtendS: Push(m_Builder.CreateSExt(pA, pDst)); break;
			case Conversion::ExtendU: Push(m_Builder.CreateZExt(pA, pDst)); break;
			case Conversion::TruncS: OnTruncChecked(pA, pDst, true); break;
			case Conversion::TruncU: OnTruncChecked(pA, pDst, false); break;
			case Conversion::ConvertS: Push(m_Builder.CreateSIToFP(pA, pDst)); break;
			case Conversion::ConvertU: Push(m_Builder.CreateUIToFP(pA, pDst)); break;
			case Conversion::Demote: Push(m_Builder.CreateFPTrunc(pA, pDst)); break;
			case Conversion::Promote: Push(m_Builder.CreateFPExt(pA, pDst)); break;
			case Conversion::Reinterpret: Push(m_Builder.CreateBitCast(pA, pDst)); break;
			}
		}

		// traps on NaN and on values out of the target range
		void OnTruncChecked(llvm::Value* pA, llvm::Type* pDst, bool bSigned)
		{
			uint32_t nBits = pDst->getIntegerBitWidth();

			// valid range: (lo, hi), or [lo, hi) if bLoIncl
			double lo, hi;
			bool bLoIncl;

			if (bSigned)
			{
				hi = std::ldexp(1.0, nBits - 1);
				if ((32 == nBits) && pA->getType()->isDoubleTy())
				{
					lo = -hi - 1.0;
					bLoIncl = false;
				}
				else
				{
					lo = -hi;
					bLoIncl = true;
				}
			}
			else
			{
				hi = std::ldexp(1.0, nBits);
				lo = -1.0;
				bLoIncl = false;
			}

			auto* pLo = llvm::ConstantFP::get(pA->getType(), lo);
			auto* pHi = llvm::ConstantFP::get(pA->getType(), hi);

			auto* pOk = m_Builder.CreateAnd(
				bLoIncl ? m_Builder.CreateFCmpOGE(pA, pLo) : m_Builder.CreateFCmpOGT(pA, pLo),
				m_Builder.CreateFCmpOLT(pA, pHi));

			auto* pTrap = CreateBlock("trunc_trap");
			auto* pCont = CreateBlock("trunc_ok");
			m_Builder.CreateCondBr(pOk, pCont, pTrap);

			Place(pTrap);
			m_Builder.CreateCall(m_This.m_Intrinsics.Get(IntrinsicCache::trap));
			m_Builder.CreateUnreachable();

			Place(pCont);
			Push(bSigned ? m_Builder.CreateFPToSI(pA, pDst) : m_Builder.CreateFPToUI(pA, pDst));
		}

		void OnSignExt(uint32_t nBits)
		{
			if (m_Unreachable)
				return;

			auto* pA = Pop();
			Push(m_Builder.CreateSExt(m_Builder.CreateTrunc(pA, m_Builder.getIntNTy(nBits)), pA->getType()));
		}

		void OnTruncSat(bool bSigned, ValueType tDst)
		{
			if (m_Unreachable)
				return;

			auto* pA = Pop();
			auto* pDst = m_This.m_Types.get(tDst);
			auto* pFunc = m_This.m_Intrinsics.Get(bSigned ? IntrinsicCache::fptosi_sat : IntrinsicCache::fptoui_sat, { pDst, pA->getType() });

			Push(m_Builder.CreateCall(pFunc, { pA }));
		}

		void On_prefix_misc()
		{
			auto nSub = m_Code.Read<uint32_t>();

			switch (nSub)
			{
#define THE_MACRO(id, name, src, dst, bSigned) \
			case static_cast<uint32_t>(MiscInstruction::name): \
				OnTruncSat(bSigned, ValueType::dst); \
				break;

			WasmInstructions_TruncSat(THE_MACRO)
#undef THE_MACRO

			default:
				{
					char sz[0x40];
					snprintf(sz, sizeof(sz), "%s 0xFC %u", ((nSub >= s_MiscBulkMin) && (nSub <= s_MiscBulkMax)) ? "bulk memory" : "unknown", nSub);
					Fail(Error::UnsupportedInstruction, sz);
				}
			}
		}

		void OnUnsupported(uint8_t nOpcode)
		{
			char sz[0x40];

			const char* szName = get_UnsupportedName(nOpcode);
			if (szName)
				snprintf(sz, sizeof(sz), "instruction %s", szName);
			else
				snprintf(sz, sizeof(sz), "opcode 0x%02x", nOpcode);

			Fail(Error::UnsupportedInstruction, sz);
		}
	};

	void Compiler::Context::CompileFunc()
	{
		struct MyCheckpoint :public Exc::Checkpoint {
			uint32_t m_iFunc;
			uint32_t m_iOp = 0;
			uint8_t m_nOpcode = 0;
			virtual void Dump(std::ostream& os) override {
				os << "iFunc=" << m_iFunc << ", Op=" << m_iOp << ", Opcode=" << static_cast<uint32_t>(m_nOpcode);
			}

		} cp;
		cp.m_iFunc = m_iFunc;

		AllocLocals();

		typedef Instruction I;

		for ( ; !m_Done; cp.m_iOp++)
		{
			I nInstruction = (I) m_Code.Read1();
			cp.m_nOpcode = nInstruction;

			switch (nInstruction)
			{
#define THE_MACRO(id, name) \
			case I::name: \
				On_##name(); \
				break;

			WasmInstructions_Control(THE_MACRO)
			WasmInstructions_Parametric(THE_MACRO)
#undef THE_MACRO

			case I::prefix_misc:
				On_prefix_misc();
				break;

			case I::i32_eqz:
			case I::i64_eqz:
				OnEqz();
				break;

#define THE_MACRO(name, id32, id64, op) \
			case I::i32_##name: \
			case I::i64_##name: \
				OnCmpInt(llvm::CmpInst::op); \
				break;

			WasmInstructions_CmpInt(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::f32_##name: \
			case I::f64_##name: \
				OnCmpFloat(llvm::CmpInst::op); \
				break;

			WasmInstructions_CmpFloat(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::i32_##name: \
			case I::i64_##name: \
				OnUnopInt(IntrinsicCache::op); \
				break;

			WasmInstructions_UnopInt(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::i32_##name: \
			case I::i64_##name: \
				OnBinop(llvm::Instruction::op); \
				break;

			WasmInstructions_BinopInt(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::i32_##name: \
			case I::i64_##name: \
				OnShift(llvm::Instruction::op); \
				break;

			WasmInstructions_ShiftInt(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::i32_##name: \
			case I::i64_##name: \
				OnRotate(IntrinsicCache::op); \
				break;

			WasmInstructions_RotInt(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::f32_##name: \
			case I::f64_##name: \
				OnUnopIntrinsic(IntrinsicCache::op); \
				break;

			WasmInstructions_UnopFloat(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::f32_##name: \
			case I::f64_##name: \
				OnBinop(llvm::Instruction::op); \
				break;

			WasmInstructions_BinopFloat(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(name, id32, id64, op) \
			case I::f32_##name: \
			case I::f64_##name: \
				OnBinopIntrinsic(IntrinsicCache::op); \
				break;

			WasmInstructions_BinopFloatIntrinsic(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(id, name, src, dst, kind) \
			case I::name: \
				OnConvert(Conversion::kind, ValueType::dst); \
				break;

			WasmInstructions_Convert(THE_MACRO)
#undef THE_MACRO

#define THE_MACRO(id, name, type, bits) \
			case I::name: \
				OnSignExt(bits); \
				break;

			WasmInstructions_SignExt(THE_MACRO)
#undef THE_MACRO

			default:
				OnUnsupported(nInstruction);
			}
		}

		Test(m_Code.IsEnd());
	}

	llvm::Function* Compiler::CompileFunc(uint32_t iBody, const Reader& body)
	{
		uint32_t iFunc = m_Info.get_BodyFuncIndex(iBody);
		const auto& tp = m_Info.get_FuncType(iFunc);

		auto sName = get_FuncName(iBody);
		auto* pFunc = Ensure(llvm::Function::Create(m_Types.get_Func(tp), llvm::GlobalValue::ExternalLinkage, sName, m_Module));

		Context ctx(*this, iFunc, pFunc);
		ctx.m_Code = body;
		ctx.CompileFunc();

		if (m_Options.m_Verify)
		{
			std::string sErr;
			llvm::raw_string_ostream os(sErr);

			if (llvm::verifyFunction(*pFunc, &os))
			{
				std::string sMsg = sName + " is broken: " + os.str();
				Fail(Error::Internal, sMsg.c_str());
			}
		}

		LOG_VERBOSE() << sName << ": blocks=" << pFunc->size() << ", locals=" << ctx.m_vLocals.size();
		return pFunc;
	}

} // namespace Wasm
} // namespace wasmir
