#include <qtemu/qtemu.h>

namespace qtemu
{
	enum class InstructionEnum : uint8
	{
		halt = 0,    //

		// registers and memory
		load = 1,    // ACC <- bus
		store = 2,   // cache[bus] <- ACC
		loadp = 3,   // ACC <- cache[ACC]
		loadpr = 4,  // PR <- bus
		storep = 5,  // cache[PR] <- ACC
		tapr = 6,    // PR <- ACC

		// stack
		push = 8,    // stack[SP++] <- ACC
		pop = 9,     // ACC <- stack[--SP]

		// flow
		jump = 16,   // PC <- bus
		jumpc = 17,  // PC <- PR if any flag in bus is set
		call = 18,   // astack[ASP++] <- PC, PC <- bus
		return_ = 19,// PC <- astack[--ASP]

		// flags
		clf = 24,    //

		// logic
		and_ = 32,   // ACC <- ACC & bus
		or_ = 33,    // ACC <- ACC | bus
		xor_ = 34,   // ACC <- ACC ^ bus
		lsl = 35,    // overflow
		lsr = 36,    // underflow
		rol = 37,    //
		ror = 38,    //
		comp = 39,   // ACC <- -1, 0, 1

		// arithmetic
		add = 40,    // carry
		sub = 41,    // carry
		addc = 42,   // carry
		subc = 43,   // carry
		inc = 44,    // carry
		dec = 45,    // carry
		mul = 46,    // overflow
		div = 47,    //
		mod = 48,    //

		// ports
		portw = 56,  // ports[bus] <- ACC
		portr = 57,  // ACC <- ports[bus]

		// interrupts
		int_ = 112,  // exit code <- bus
	};

	constexpr uint32 OpcodesCount = 128;
	constexpr uint32 AddressSpace = 65536;

	void validateCpuConfig(const CpuCreateConfig &config);

	struct ProgramImpl : public Program
	{
		Holder<PointerRange<Instruction>> instructions;
		NamespaceEnum namespaceTag = NamespaceEnum::QT;
	};
}
