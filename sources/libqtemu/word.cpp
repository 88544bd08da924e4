#include <qtemu/qtemu.h>

namespace qtemu
{
	uint32 encodeWord(uint32 memory, uint32 value, uint32 opcode)
	{
		return (memory << 23) | (value << 7) | opcode;
	}

	Word decodeWord(uint32 word)
	{
		Word w;
		w.memory = ((word >> 23) & 1) != 0;
		w.value = (word >> 7) & 0xFFFF;
		w.opcode = word & 0x7F;
		return w;
	}
}
