#include <cage-core/image.h>

#include "main.h"

namespace
{
	// configures the screen and then renders frames from the given cache offset
	Holder<Cpu> screenCpu(uint16 width, uint16 height, ScreenColorsEnum colors, uint16 offset, const std::vector<uint16> &data)
	{
		Holder<Cpu> cpu = newTestCpu({
			instr(I::load, modules::Screen),
			instr(I::portw, 0),
			instr(I::load, (uint16)((width << 8) | height)),
			instr(I::portw, 1),
			instr(I::load, (uint16)colors),
			instr(I::portw, 2),
			instr(I::int_, exitCodes::Module),
			instr(I::load, offset),
			instr(I::portw, 1),
			instr(I::int_, exitCodes::Module),
		});
		cpu->cache(data);
		return cpu;
	}

	Holder<Screen> renderOnce(Cpu *cpu, const ScreenCreateConfig &config = {})
	{
		Holder<Screen> screen = newScreen(config);
		CAGE_TEST(!screen->configured());
		CAGE_TEST(screen->frame() == nullptr);
		cpu->run();
		CAGE_TEST(cpu->state() == CpuStateEnum::Interrupted);
		screen->service(cpu);
		CAGE_TEST(screen->configured());
		CAGE_TEST(screen->framesCount() == 0);
		CAGE_TEST(screen->frame() == nullptr);
		cpu->run();
		CAGE_TEST(cpu->state() == CpuStateEnum::Interrupted);
		screen->service(cpu);
		CAGE_TEST(screen->framesCount() == 1);
		CAGE_TEST(screen->frame() != nullptr);
		return screen;
	}
}

void testScreen()
{
	CAGE_TESTCASE("screen");

	{
		CAGE_TESTCASE("grayscale");
		std::vector<uint16> data(104);
		data[100] = 0;
		data[101] = 64;
		data[102] = 0x1280; // high byte is ignored
		data[103] = 255;
		Holder<Cpu> cpu = screenCpu(2, 2, ScreenColorsEnum::Grayscale, 100, data);
		Holder<Screen> screen = renderOnce(+cpu);
		CAGE_TEST(screen->width() == 2);
		CAGE_TEST(screen->height() == 2);
		CAGE_TEST(screen->colors() == ScreenColorsEnum::Grayscale);
		const Image *img = screen->frame();
		CAGE_TEST(img->width() == 2);
		CAGE_TEST(img->height() == 2);
		CAGE_TEST(img->channels() == 1);
		const auto raw = img->rawViewU8();
		CAGE_TEST(raw.size() == 4);
		CAGE_TEST(raw[0] == 0);
		CAGE_TEST(raw[1] == 64);
		CAGE_TEST(raw[2] == 0x80);
		CAGE_TEST(raw[3] == 255);
	}

	{
		CAGE_TESTCASE("rgb565");
		std::vector<uint16> data = { 0xF800, 0x07E0, 0x001F, 0xFFFF };
		Holder<Cpu> cpu = screenCpu(4, 1, ScreenColorsEnum::Rgb565, 0, data);
		Holder<Screen> screen = renderOnce(+cpu);
		const Image *img = screen->frame();
		CAGE_TEST(img->channels() == 3);
		const auto raw = img->rawViewU8();
		CAGE_TEST(raw.size() == 12);
		const uint8 expected[12] = { 255, 0, 0, 0, 255, 0, 0, 0, 255, 255, 255, 255 };
		for (uint32 i = 0; i < 12; i++)
			CAGE_TEST(raw[i] == expected[i]);
	}

	{
		CAGE_TESTCASE("rgb888");
		std::vector<uint16> data = { 0x1020, 0x0030, 0xFF00, 0x00FF };
		Holder<Cpu> cpu = screenCpu(2, 1, ScreenColorsEnum::Rgb888, 0, data);
		Holder<Screen> screen = renderOnce(+cpu);
		const auto raw = screen->frame()->rawViewU8();
		CAGE_TEST(raw.size() == 6);
		CAGE_TEST(raw[0] == 0x10);
		CAGE_TEST(raw[1] == 0x20);
		CAGE_TEST(raw[2] == 0x30);
		CAGE_TEST(raw[3] == 0xFF);
		CAGE_TEST(raw[4] == 0x00);
		CAGE_TEST(raw[5] == 0xFF);
	}

	{
		CAGE_TESTCASE("monochrome");
		std::vector<uint16> data = { 0x8001 };
		Holder<Cpu> cpu = screenCpu(16, 1, ScreenColorsEnum::Monochrome, 0, data);
		Holder<Screen> screen = renderOnce(+cpu);
		const Image *img = screen->frame();
		CAGE_TEST(img->channels() == 1);
		const auto raw = img->rawViewU8();
		CAGE_TEST(raw.size() == 16);
		CAGE_TEST(raw[0] == 255);
		for (uint32 i = 1; i < 15; i++)
			CAGE_TEST(raw[i] == 0);
		CAGE_TEST(raw[15] == 255);
	}

	{
		CAGE_TESTCASE("framebuffer wraps around the cache");
		std::vector<uint16> data(AddressSpace);
		data[65535] = 11;
		data[0] = 22;
		Holder<Cpu> cpu = screenCpu(2, 1, ScreenColorsEnum::Grayscale, 65535, data);
		Holder<Screen> screen = renderOnce(+cpu);
		const auto raw = screen->frame()->rawViewU8();
		CAGE_TEST(raw[0] == 11);
		CAGE_TEST(raw[1] == 22);
	}

	{
		CAGE_TESTCASE("invalid color mode");
		Holder<Cpu> cpu = screenCpu(2, 2, (ScreenColorsEnum)3, 0, {});
		Holder<Screen> screen = newScreen();
		cpu->run();
		CAGE_TEST_THROWN(screen->service(+cpu));
		CAGE_TEST(!screen->configured());
	}

	{
		CAGE_TESTCASE("invalid resolution");
		Holder<Cpu> cpu = screenCpu(0, 2, ScreenColorsEnum::Grayscale, 0, {});
		Holder<Screen> screen = newScreen();
		cpu->run();
		CAGE_TEST_THROWN(screen->service(+cpu));
		CAGE_TEST(!screen->configured());
	}
}
