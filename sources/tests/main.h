#include <cage-core/core.h>

#include "../libqtemu/program.h"

#include <vector>

using namespace qtemu;

struct CageTestCase
{
	static uint32 counter;

	explicit CageTestCase(const char *name)
	{
		CAGE_LOG(SeverityEnum::Info, "test", stringizer() + "testcase " + counter++ + ": " + name);
	}
};

#define QTEMU_JOIN_(A, B) A##B
#define QTEMU_JOIN(A, B) QTEMU_JOIN_(A, B)
#define CAGE_TESTCASE(NAME) CageTestCase QTEMU_JOIN(cageTestCase_, __LINE__)(NAME);

using I = InstructionEnum;

inline Instruction instr(InstructionEnum opcode, uint16 value = 0)
{
	Instruction i;
	i.opcode = (uint8)opcode;
	i.value = value;
	return i;
}

// bus value is read from cache at the address
inline Instruction indirect(InstructionEnum opcode, uint16 address)
{
	Instruction i = instr(opcode, address);
	i.memory = 1;
	return i;
}

inline Holder<Cpu> newTestCpu(const std::vector<Instruction> &code, const CpuCreateConfig &config = {})
{
	Holder<Cpu> cpu = newCpu(config);
	CAGE_TEST(cpu->state() == CpuStateEnum::None);
	cpu->initializeMemory();
	CAGE_TEST(cpu->state() == CpuStateEnum::Initialized);
	cpu->importCode(code);
	return cpu;
}

inline Holder<Cpu> runTestCpu(const std::vector<Instruction> &code, const CpuCreateConfig &config = {})
{
	Holder<Cpu> cpu = newTestCpu(code, config);
	cpu->run();
	return cpu;
}
