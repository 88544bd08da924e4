#ifndef qtemu_h_g4e8r7t1d2
#define qtemu_h_g4e8r7t1d2

#include "cage-core/core.h"

namespace qtemu
{
	using namespace cage;

	// M VVVV`VVVV`VVVV`VVVV OOO`OOOO
	struct Word
	{
		uint16 value = 0;
		uint8 opcode = 0;
		bool memory = false;
	};

	uint32 encodeWord(uint32 memory, uint32 value, uint32 opcode); // no masking, the caller is responsible for the ranges
	Word decodeWord(uint32 word);

	struct Instruction
	{
		uint16 value = 0;
		uint8 opcode = 0;
		uint8 memory = 0;
	};

	enum class NamespaceEnum : uint8
	{
		QT,
		QM,
	};

	NamespaceEnum namespaceFromString(const string &name);
	const char *namespaceToString(NamespaceEnum ns);

	struct Program : private Immovable
	{
		NamespaceEnum namespaceTag() const;
		uint32 instructionsCount() const;
		Instruction instruction(uint32 index) const;
		PointerRange<const Instruction> instructions() const;
	};

	struct LoaderCreateConfig
	{
		NamespaceEnum expected = NamespaceEnum::QT;
	};

	struct Loader : private Immovable
	{
		Holder<Program> load(PointerRange<const char> image);
	};

	Holder<Loader> newLoader(const LoaderCreateConfig &config = {});

	enum class CpuStateEnum
	{
		None,
		Initialized,
		Running,
		Finished,
		Interrupted,
		Terminated,
	};

	namespace flags
	{
		constexpr uint16 Carry = 1 << 0;
		constexpr uint16 Parity = 1 << 1;
		constexpr uint16 Zero = 1 << 2;
		constexpr uint16 Sign = 1 << 3;
		constexpr uint16 Overflow = 1 << 4;
		constexpr uint16 Underflow = 1 << 5;
		constexpr uint16 All = Carry | Parity | Zero | Sign | Overflow | Underflow;
	}

	namespace exitCodes
	{
		constexpr sint32 Halt = 0;
		constexpr sint32 Module = 0x80;
	}

	struct CpuRegisters
	{
		uint16 accumulator = 0;
		uint16 pointer = 0;
		uint16 programCounter = 0;
		uint16 flags = 0;
		uint16 stackPointer = 0;
		uint16 addressStackPointer = 0;
	};

	struct Cpu : private Immovable
	{
		void initializeMemory();
		void importCode(PointerRange<const Instruction> instructions); // valid in Initialized state only
		void program(const Program *program); // initializes memory and imports the code, the program may be released afterwards
		void run(); // throws if the cpu has finished or terminated
		void step();
		void terminate();

		CpuStateEnum state() const;
		sint32 exitCode() const;
		uint64 stepIndex() const; // number of executed instructions

		CpuRegisters registers() const;
		void registers(const CpuRegisters &data); // valid in Initialized state only
		PointerRange<const uint32> rom() const;
		PointerRange<const uint16> cache() const;
		void cache(PointerRange<const uint16> data); // valid in Initialized state only
		PointerRange<const uint16> stack() const;
		PointerRange<const uint16> addressStack() const;
		PointerRange<const uint16> ports() const;
	};

	struct CpuCreateConfig
	{
		sint32 invalidInstructionExitCode = -1;
		sint32 divisionByZeroExitCode = -2;
	};

	Holder<Cpu> newCpu(const CpuCreateConfig &config = {}); // throws if a trap exit code is 0 or 0x80

	string executionSummary(const Cpu *cpu);

	enum class ScreenColorsEnum : uint16
	{
		None = 0,
		Monochrome = 1,
		Grayscale = 8,
		Rgb565 = 16,
		Rgb888 = 24,
	};

	namespace modules
	{
		constexpr uint16 Screen = 1;
	}

	struct Screen : private Immovable
	{
		void service(const Cpu *cpu); // the first call configures the screen, all following calls render a frame

		bool configured() const;
		uint32 width() const;
		uint32 height() const;
		ScreenColorsEnum colors() const;
		uint32 framesCount() const;
		const Image *frame() const; // last rendered frame, or nullptr
	};

	struct ScreenCreateConfig
	{
		string exportPath; // frames are saved as <exportPath><index>.png, empty disables it
		uint32 exportLimit = m;
	};

	Holder<Screen> newScreen(const ScreenCreateConfig &config = {});

	CpuCreateConfig cpuConfigFromIni(Ini *ini, const CpuCreateConfig &defaults = {});
	void cpuConfigToIni(const CpuCreateConfig &config, Ini *ini);
	ScreenCreateConfig screenConfigFromIni(Ini *ini, const ScreenCreateConfig &defaults = {});
	void screenConfigToIni(const ScreenCreateConfig &config, Ini *ini);
}

#endif // qtemu_h_g4e8r7t1d2
