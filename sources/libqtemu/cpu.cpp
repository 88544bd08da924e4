#include "program.h"

#include <vector>

namespace qtemu
{
	namespace
	{
		struct DataState
		{
			std::vector<uint32> rom_ = std::vector<uint32>(AddressSpace, 0);
			std::vector<uint16> cache_ = std::vector<uint16>(AddressSpace, 0);
			std::vector<uint16> stack_ = std::vector<uint16>(AddressSpace, 0);
			std::vector<uint16> addressStack_ = std::vector<uint16>(AddressSpace, 0);
			std::vector<uint16> ports_ = std::vector<uint16>(AddressSpace, 0);
			CpuRegisters regs;
			uint64 stepIndex_ = 0;
			sint32 exitCode_ = 0;
			bool running = false;
			const CpuCreateConfig *createConfig = nullptr;

			bool flag(uint16 f) const
			{
				return (regs.flags & f) != 0;
			}

			void flag(uint16 f, bool value)
			{
				if (value)
					regs.flags |= f;
				else
					regs.flags &= (uint16)~f;
			}

			void stop(sint32 code)
			{
				running = false;
				exitCode_ = code;
			}

			void refreshFlags()
			{
				uint32 p = regs.accumulator;
				p ^= p >> 8;
				p ^= p >> 4;
				p ^= p >> 2;
				p ^= p >> 1;
				flag(flags::Parity, (p & 1) != 0);
				flag(flags::Zero, regs.accumulator == 0);
				flag(flags::Sign, (regs.accumulator & 0x8000) != 0);
			}
		};

		using Handler = void (*)(DataState &s, uint16 bus);

		void trap(DataState &s, uint16)
		{
			s.stop(s.createConfig->invalidInstructionExitCode);
		}

		void halt(DataState &s, uint16)
		{
			s.stop(exitCodes::Halt);
		}

		void load(DataState &s, uint16 bus)
		{
			s.regs.accumulator = bus;
		}

		void store(DataState &s, uint16 bus)
		{
			s.cache_[bus] = s.regs.accumulator;
		}

		void loadp(DataState &s, uint16)
		{
			s.regs.accumulator = s.cache_[s.regs.accumulator];
		}

		void loadpr(DataState &s, uint16 bus)
		{
			s.regs.pointer = bus;
		}

		void storep(DataState &s, uint16)
		{
			s.cache_[s.regs.pointer] = s.regs.accumulator;
		}

		void tapr(DataState &s, uint16)
		{
			s.regs.pointer = s.regs.accumulator;
		}

		void push(DataState &s, uint16)
		{
			s.stack_[s.regs.stackPointer++] = s.regs.accumulator;
		}

		void pop(DataState &s, uint16)
		{
			s.regs.accumulator = s.stack_[--s.regs.stackPointer];
		}

		// the program counter is advanced after every instruction, therefore all jumps target one instruction earlier

		void jump(DataState &s, uint16 bus)
		{
			s.regs.programCounter = (uint16)(bus - 1);
		}

		void jumpc(DataState &s, uint16 bus)
		{
			if ((s.regs.flags & bus & flags::All) != 0)
				s.regs.programCounter = (uint16)(s.regs.pointer - 1);
		}

		void call(DataState &s, uint16 bus)
		{
			s.addressStack_[s.regs.addressStackPointer++] = s.regs.programCounter;
			s.regs.programCounter = (uint16)(bus - 1);
		}

		void return_(DataState &s, uint16)
		{
			s.regs.programCounter = s.addressStack_[--s.regs.addressStackPointer];
		}

		void clf(DataState &s, uint16)
		{
			s.regs.flags = 0;
		}

		void and_(DataState &s, uint16 bus)
		{
			s.regs.accumulator &= bus;
		}

		void or_(DataState &s, uint16 bus)
		{
			s.regs.accumulator |= bus;
		}

		void xor_(DataState &s, uint16 bus)
		{
			s.regs.accumulator ^= bus;
		}

		void lsl(DataState &s, uint16 bus)
		{
			s.flag(flags::Overflow, (s.regs.accumulator & 0x8000) != 0);
			s.regs.accumulator = bus >= 16 ? 0 : (uint16)(s.regs.accumulator << bus);
		}

		void lsr(DataState &s, uint16 bus)
		{
			s.flag(flags::Underflow, (s.regs.accumulator & 1) != 0);
			s.regs.accumulator = bus >= 16 ? 0 : (uint16)(s.regs.accumulator >> bus);
		}

		void rol(DataState &s, uint16 bus)
		{
			const uint32 n = bus % 16;
			const uint32 a = s.regs.accumulator;
			if (n)
				s.regs.accumulator = (uint16)((a << n) | (a >> (16 - n)));
		}

		void ror(DataState &s, uint16 bus)
		{
			const uint32 n = bus % 16;
			const uint32 a = s.regs.accumulator;
			if (n)
				s.regs.accumulator = (uint16)((a >> n) | (a << (16 - n)));
		}

		void comp(DataState &s, uint16 bus)
		{
			const uint16 a = s.regs.accumulator;
			s.regs.accumulator = a < bus ? 0xFFFF : (a == bus ? 0 : 1);
		}

		void add(DataState &s, uint16 bus)
		{
			const uint32 r = (uint32)s.regs.accumulator + bus;
			s.flag(flags::Carry, r > 0xFFFF);
			s.regs.accumulator = (uint16)r;
		}

		void sub(DataState &s, uint16 bus)
		{
			const uint32 a = s.regs.accumulator;
			s.flag(flags::Carry, a < bus);
			s.regs.accumulator = (uint16)(a - bus);
		}

		void addc(DataState &s, uint16 bus)
		{
			const uint32 r = (uint32)s.regs.accumulator + bus + (s.flag(flags::Carry) ? 1 : 0);
			s.flag(flags::Carry, r > 0xFFFF);
			s.regs.accumulator = (uint16)r;
		}

		void subc(DataState &s, uint16 bus)
		{
			const uint32 a = s.regs.accumulator;
			const uint32 b = (uint32)bus + (s.flag(flags::Carry) ? 1 : 0);
			s.flag(flags::Carry, a < b);
			s.regs.accumulator = (uint16)(a - b);
		}

		void inc(DataState &s, uint16)
		{
			s.flag(flags::Carry, s.regs.accumulator == 0xFFFF);
			s.regs.accumulator = (uint16)(s.regs.accumulator + 1);
		}

		void dec(DataState &s, uint16)
		{
			s.flag(flags::Carry, s.regs.accumulator == 0);
			s.regs.accumulator = (uint16)(s.regs.accumulator - 1);
		}

		void mul(DataState &s, uint16 bus)
		{
			const uint32 r = (uint32)s.regs.accumulator * bus;
			s.flag(flags::Overflow, r > 0xFFFF);
			s.regs.accumulator = (uint16)r;
		}

		void div(DataState &s, uint16 bus)
		{
			if (bus == 0)
				return s.stop(s.createConfig->divisionByZeroExitCode);
			s.regs.accumulator = s.regs.accumulator / bus;
		}

		void mod(DataState &s, uint16 bus)
		{
			if (bus == 0)
				return s.stop(s.createConfig->divisionByZeroExitCode);
			s.regs.accumulator = s.regs.accumulator % bus;
		}

		void portw(DataState &s, uint16 bus)
		{
			s.ports_[bus] = s.regs.accumulator;
		}

		void portr(DataState &s, uint16 bus)
		{
			s.regs.accumulator = s.ports_[bus];
		}

		void int_(DataState &s, uint16 bus)
		{
			s.stop(bus);
		}

		struct DispatchTable
		{
			Handler handlers[OpcodesCount];

			void set(InstructionEnum opcode, Handler handler)
			{
				CAGE_ASSERT((uint32)opcode < OpcodesCount);
				handlers[(uint32)opcode] = handler;
			}

			DispatchTable()
			{
				for (Handler &h : handlers)
					h = &trap;
				set(InstructionEnum::halt, &halt);
				set(InstructionEnum::load, &load);
				set(InstructionEnum::store, &store);
				set(InstructionEnum::loadp, &loadp);
				set(InstructionEnum::loadpr, &loadpr);
				set(InstructionEnum::storep, &storep);
				set(InstructionEnum::tapr, &tapr);
				set(InstructionEnum::push, &push);
				set(InstructionEnum::pop, &pop);
				set(InstructionEnum::jump, &jump);
				set(InstructionEnum::jumpc, &jumpc);
				set(InstructionEnum::call, &call);
				set(InstructionEnum::return_, &return_);
				set(InstructionEnum::clf, &clf);
				set(InstructionEnum::and_, &and_);
				set(InstructionEnum::or_, &or_);
				set(InstructionEnum::xor_, &xor_);
				set(InstructionEnum::lsl, &lsl);
				set(InstructionEnum::lsr, &lsr);
				set(InstructionEnum::rol, &rol);
				set(InstructionEnum::ror, &ror);
				set(InstructionEnum::comp, &comp);
				set(InstructionEnum::add, &add);
				set(InstructionEnum::sub, &sub);
				set(InstructionEnum::addc, &addc);
				set(InstructionEnum::subc, &subc);
				set(InstructionEnum::inc, &inc);
				set(InstructionEnum::dec, &dec);
				set(InstructionEnum::mul, &mul);
				set(InstructionEnum::div, &div);
				set(InstructionEnum::mod, &mod);
				set(InstructionEnum::portw, &portw);
				set(InstructionEnum::portr, &portr);
				set(InstructionEnum::int_, &int_);
			}
		};
	}

	struct CpuImpl : public Cpu, public DataState
	{
		CpuCreateConfig config;
		DispatchTable table;

		CpuStateEnum state = CpuStateEnum::None;

		CpuImpl(const CpuCreateConfig &config) : config(config)
		{
			validateCpuConfig(config);
		}

		void init()
		{
			state = CpuStateEnum::Terminated;
			(DataState &) *this = DataState();
			createConfig = &config;
			state = CpuStateEnum::Initialized;
		}

		void importInstructions(PointerRange<const Instruction> instructions)
		{
			CAGE_ASSERT(state == CpuStateEnum::Initialized);
			if (instructions.size() > AddressSpace)
			{
				CAGE_LOG_THROW(stringizer() + "instructions: " + instructions.size());
				CAGE_THROW_ERROR(Exception, "program does not fit into rom");
			}
			uint32 index = 0;
			for (const Instruction &ins : instructions)
				rom_[index++] = encodeWord(ins.memory & 1, ins.value, ins.opcode);
		}

		void step()
		{
			CAGE_ASSERT(state == CpuStateEnum::Running);
			const Word w = decodeWord(rom_[regs.programCounter]);
			const uint16 bus = w.memory ? cache_[w.value] : w.value;
			table.handlers[w.opcode](*this, bus);
			stepIndex_++;
			refreshFlags();
			regs.programCounter++;
			if (!running)
			{
				switch (exitCode_)
				{
				case exitCodes::Halt:
					state = CpuStateEnum::Finished;
					break;
				case exitCodes::Module:
					state = CpuStateEnum::Interrupted;
					break;
				default:
					state = CpuStateEnum::Terminated;
					break;
				}
			}
		}

		void resume()
		{
			switch (state)
			{
			case CpuStateEnum::Initialized:
			case CpuStateEnum::Running:
			case CpuStateEnum::Interrupted:
				break;
			default:
				CAGE_LOG_THROW(stringizer() + "cpu state: " + (uint32)state);
				CAGE_THROW_ERROR(Exception, "cpu cannot continue, it was not initialized or has already stopped");
			}
			state = CpuStateEnum::Running;
			running = true;
		}
	};

	Holder<Cpu> newCpu(const CpuCreateConfig &config)
	{
		return detail::systemArena().createImpl<Cpu, CpuImpl>(config);
	}

	void Cpu::initializeMemory()
	{
		CpuImpl *impl = (CpuImpl *)this;
		impl->init();
	}

	void Cpu::importCode(PointerRange<const Instruction> instructions)
	{
		CpuImpl *impl = (CpuImpl *)this;
		impl->importInstructions(instructions);
	}

	void Cpu::program(const Program *program)
	{
		CpuImpl *impl = (CpuImpl *)this;
		if (program)
		{
			impl->init();
			impl->importInstructions(program->instructions());
		}
		else
			impl->state = CpuStateEnum::None;
	}

	void Cpu::run()
	{
		CpuImpl *impl = (CpuImpl *)this;
		impl->resume();
		while (impl->state == CpuStateEnum::Running)
			impl->step();
	}

	void Cpu::step()
	{
		CpuImpl *impl = (CpuImpl *)this;
		impl->resume();
		impl->step();
	}

	void Cpu::terminate()
	{
		CpuImpl *impl = (CpuImpl *)this;
		CAGE_ASSERT(impl->state != CpuStateEnum::None);
		impl->running = false;
		impl->state = CpuStateEnum::Terminated;
	}

	CpuStateEnum Cpu::state() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->state;
	}

	sint32 Cpu::exitCode() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->exitCode_;
	}

	uint64 Cpu::stepIndex() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->stepIndex_;
	}

	string executionSummary(const Cpu *cpu)
	{
		return stringizer() + "executed " + cpu->stepIndex() + " instructions";
	}

	CpuRegisters Cpu::registers() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->regs;
	}

	void Cpu::registers(const CpuRegisters &data)
	{
		CpuImpl *impl = (CpuImpl *)this;
		CAGE_ASSERT(impl->state == CpuStateEnum::Initialized);
		impl->regs = data;
	}

	PointerRange<const uint32> Cpu::rom() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->rom_;
	}

	PointerRange<const uint16> Cpu::cache() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->cache_;
	}

	void Cpu::cache(PointerRange<const uint16> data)
	{
		CpuImpl *impl = (CpuImpl *)this;
		CAGE_ASSERT(impl->state == CpuStateEnum::Initialized);
		CAGE_ASSERT(data.size() <= AddressSpace);
		detail::memcpy(impl->cache_.data(), data.data(), data.size() * sizeof(uint16));
	}

	PointerRange<const uint16> Cpu::stack() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->stack_;
	}

	PointerRange<const uint16> Cpu::addressStack() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->addressStack_;
	}

	PointerRange<const uint16> Cpu::ports() const
	{
		const CpuImpl *impl = (const CpuImpl *)this;
		return impl->ports_;
	}
}
