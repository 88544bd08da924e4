#include <cage-core/ini.h>

#include "program.h"

namespace qtemu
{
	namespace
	{
		void validateTrapExitCode(sint32 code)
		{
			if (code == exitCodes::Halt || code == exitCodes::Module)
			{
				CAGE_LOG_THROW(stringizer() + "exit code: " + code);
				CAGE_THROW_ERROR(Exception, "trap exit code collides with halt or module interrupt");
			}
		}
	}

	void validateCpuConfig(const CpuCreateConfig &config)
	{
		validateTrapExitCode(config.invalidInstructionExitCode);
		validateTrapExitCode(config.divisionByZeroExitCode);
	}

	CpuCreateConfig cpuConfigFromIni(Ini *ini, const CpuCreateConfig &defaults)
	{
		CpuCreateConfig config = defaults;
		config.invalidInstructionExitCode = ini->getSint32("cpu", "invalidInstructionExitCode", config.invalidInstructionExitCode);
		config.divisionByZeroExitCode = ini->getSint32("cpu", "divisionByZeroExitCode", config.divisionByZeroExitCode);
		validateCpuConfig(config);
		return config;
	}

	void cpuConfigToIni(const CpuCreateConfig &config, Ini *ini)
	{
		ini->setSint32("cpu", "invalidInstructionExitCode", config.invalidInstructionExitCode);
		ini->setSint32("cpu", "divisionByZeroExitCode", config.divisionByZeroExitCode);
	}

	ScreenCreateConfig screenConfigFromIni(Ini *ini, const ScreenCreateConfig &defaults)
	{
		ScreenCreateConfig config = defaults;
		config.exportPath = ini->getString("screen", "exportPath", config.exportPath);
		config.exportLimit = ini->getUint32("screen", "exportLimit", config.exportLimit);
		return config;
	}

	void screenConfigToIni(const ScreenCreateConfig &config, Ini *ini)
	{
		ini->setString("screen", "exportPath", config.exportPath);
		ini->setUint32("screen", "exportLimit", config.exportLimit);
	}
}
