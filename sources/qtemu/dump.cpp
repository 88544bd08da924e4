#include <cage-core/files.h>

#include "dump.h"

namespace
{
	constexpr uint32 ValuesPerLine = 16;

	void dumpRange(File *file, const char *name, PointerRange<const uint16> data)
	{
		file->writeLine(stringizer() + "[" + name + "]");
		for (uint32 row = 0; row < data.size(); row += ValuesPerLine)
		{
			bool empty = true;
			for (uint32 i = 0; i < ValuesPerLine; i++)
				empty = empty && data[row + i] == 0;
			if (empty)
				continue;
			string line = stringizer() + row + ":";
			for (uint32 i = 0; i < ValuesPerLine; i++)
				line = stringizer() + line + " " + data[row + i];
			file->writeLine(line);
		}
	}
}

void dumpMemory(const Cpu *cpu, const string &path)
{
	CAGE_LOG(SeverityEnum::Info, "qtemu", stringizer() + "dumping memory into: '" + path + "'");
	Holder<File> file = writeFile(path);
	{
		const CpuRegisters regs = cpu->registers();
		file->writeLine("[registers]");
		file->writeLine(stringizer() + "accumulator: " + regs.accumulator);
		file->writeLine(stringizer() + "pointer: " + regs.pointer);
		file->writeLine(stringizer() + "program counter: " + regs.programCounter);
		file->writeLine(stringizer() + "flags: " + regs.flags);
		file->writeLine(stringizer() + "stack pointer: " + regs.stackPointer);
		file->writeLine(stringizer() + "address stack pointer: " + regs.addressStackPointer);
		file->writeLine(stringizer() + "exit code: " + cpu->exitCode());
		file->writeLine(stringizer() + "instructions: " + cpu->stepIndex());
	}
	dumpRange(+file, "cache", cpu->cache());
	dumpRange(+file, "stack", cpu->stack());
	dumpRange(+file, "address stack", cpu->addressStack());
	dumpRange(+file, "ports", cpu->ports());
	file->close();
}
