#include <cage-core/logger.h>
#include <cage-core/ini.h>
#include <cage-core/config.h>
#include <cage-core/files.h>

#include <qtemu/qtemu.h>

#include "dump.h"

#include <iostream>

using namespace qtemu;

namespace
{
	void serviceModule(Cpu *cpu, Screen *screen)
	{
		const uint16 module = cpu->ports()[0];
		switch (module)
		{
		case modules::Screen:
			screen->service(cpu);
			break;
		default:
			CAGE_LOG_THROW(stringizer() + "module: " + module);
			CAGE_THROW_ERROR(Exception, "unknown module requested by interrupt");
		}
	}
}

int main(int argc, const char *args[])
{
	try
	{
		Holder<Logger> logger = newLogger();
		logger->format.bind<logFormatConsole>();
		logger->output.bind<logOutputStdOut>();

		ConfigString inputPath("qtemu/path/input");
		ConfigString codeNamespace("qtemu/namespace", "QT");
		ConfigString dumpPath("qtemu/path/dump");
		ConfigString configPath("qtemu/path/config");
		ConfigBool suppressConsoleLog("qtemu/log/suppressConsole");

		{
			Holder<Ini> ini = newIni();
			ini->parseCmd(argc, args);
			inputPath = ini->cmdString('i', "input", inputPath);
			codeNamespace = ini->cmdString('n', "namespace", codeNamespace);
			dumpPath = ini->cmdString('d', "dump", dumpPath);
			configPath = ini->cmdString('c', "config", configPath);
			suppressConsoleLog = ini->cmdBool('f', "filter", suppressConsoleLog);
			ini->checkUnusedWithHelp();
		}

		if (suppressConsoleLog)
			logger.clear();

		if (string(inputPath).empty())
			CAGE_THROW_ERROR(Exception, "no input path");

		CpuCreateConfig cpuConfig;
		ScreenCreateConfig screenConfig;
		if (!string(configPath).empty())
		{
			CAGE_LOG(SeverityEnum::Info, "qtemu", stringizer() + "loading configuration at path: '" + string(configPath) + "'");
			Holder<Ini> ini = newIni();
			ini->importFile(configPath);
			cpuConfig = cpuConfigFromIni(+ini, cpuConfig);
			screenConfig = screenConfigFromIni(+ini, screenConfig);
		}

		Holder<Program> program;
		{
			CAGE_LOG(SeverityEnum::Info, "qtemu", stringizer() + "loading binary at path: '" + string(inputPath) + "'");
			LoaderCreateConfig cfg;
			cfg.expected = namespaceFromString(codeNamespace);
			Holder<File> file = readFile(inputPath);
			Holder<Loader> loader = newLoader(cfg);
			program = loader->load(file->readAll());
			CAGE_LOG(SeverityEnum::Info, "qtemu", stringizer() + "program has: " + program->instructionsCount() + " instructions");
		}

		Holder<Cpu> cpu = newCpu(cpuConfig);
		cpu->program(+program);
		Holder<Screen> screen = newScreen(screenConfig);

		try
		{
			while (true)
			{
				cpu->run();
				if (cpu->state() != CpuStateEnum::Interrupted)
					break;
				serviceModule(+cpu, +screen);
			}
		}
		catch (...)
		{
			CAGE_LOG(SeverityEnum::Note, "qtemu", stringizer() + "program counter: " + cpu->registers().programCounter);
			CAGE_LOG(SeverityEnum::Note, "qtemu", stringizer() + "step: " + cpu->stepIndex());
			throw;
		}

		// printed even when the console log is suppressed
		std::cout << executionSummary(+cpu).c_str() << std::endl;

		if (!string(dumpPath).empty())
			dumpMemory(+cpu, dumpPath);

		if (cpu->state() == CpuStateEnum::Terminated)
		{
			CAGE_LOG_THROW(stringizer() + "exit code: " + cpu->exitCode());
			CAGE_THROW_ERROR(Exception, "program terminated");
		}

		return 0;
	}
	catch (...)
	{
		detail::logCurrentCaughtException();
	}
	return 1;
}
