#include <cage-core/image.h>

#include "program.h"

#include <vector>

namespace qtemu
{
	namespace
	{
		uint8 expand5(uint32 v)
		{
			return (uint8)((v << 3) | (v >> 2));
		}

		uint8 expand6(uint32 v)
		{
			return (uint8)((v << 2) | (v >> 4));
		}

		uint32 channelsCount(ScreenColorsEnum colors)
		{
			switch (colors)
			{
			case ScreenColorsEnum::Monochrome:
			case ScreenColorsEnum::Grayscale:
				return 1;
			case ScreenColorsEnum::Rgb565:
			case ScreenColorsEnum::Rgb888:
				return 3;
			default:
				return 0;
			}
		}
	}

	struct ScreenImpl : public Screen
	{
		ScreenCreateConfig config;
		Holder<Image> image;
		std::vector<uint8> pixels;
		uint32 width_ = 0;
		uint32 height_ = 0;
		ScreenColorsEnum colors_ = ScreenColorsEnum::None;
		uint32 framesCount_ = 0;

		ScreenImpl(const ScreenCreateConfig &config) : config(config)
		{}

		void configure(uint16 geometry, uint16 mode)
		{
			const uint32 w = geometry >> 8;
			const uint32 h = geometry & 0xFF;
			if (w == 0 || h == 0)
			{
				CAGE_LOG_THROW(stringizer() + "resolution: " + w + "x" + h);
				CAGE_THROW_ERROR(Exception, "invalid screen resolution");
			}
			switch ((ScreenColorsEnum)mode)
			{
			case ScreenColorsEnum::Monochrome:
			case ScreenColorsEnum::Grayscale:
			case ScreenColorsEnum::Rgb565:
			case ScreenColorsEnum::Rgb888:
				break;
			default:
				CAGE_LOG_THROW(stringizer() + "color mode: " + mode);
				CAGE_THROW_ERROR(Exception, "invalid screen color mode");
			}
			width_ = w;
			height_ = h;
			colors_ = (ScreenColorsEnum)mode;
			CAGE_LOG(SeverityEnum::Info, "screen", stringizer() + "resolution: " + width_ + "x" + height_ + ", color mode: " + mode);
		}

		void render(PointerRange<const uint16> cache, uint16 offset)
		{
			CAGE_ASSERT(cache.size() == AddressSpace);
			const uint32 count = width_ * height_;
			const uint32 channels = channelsCount(colors_);
			pixels.resize(count * channels);
			// cache addresses wrap around
			const auto at = [&](uint32 index) -> uint16 {
				return cache[(uint16)(offset + index)];
			};
			switch (colors_)
			{
			case ScreenColorsEnum::Monochrome:
				for (uint32 i = 0; i < count; i++)
				{
					const uint16 cell = at(i / 16);
					pixels[i] = ((cell >> (15 - i % 16)) & 1) ? 255 : 0;
				}
				break;
			case ScreenColorsEnum::Grayscale:
				for (uint32 i = 0; i < count; i++)
					pixels[i] = (uint8)(at(i) & 0xFF);
				break;
			case ScreenColorsEnum::Rgb565:
				for (uint32 i = 0; i < count; i++)
				{
					const uint16 c = at(i);
					pixels[i * 3 + 0] = expand5((c >> 11) & 0x1F);
					pixels[i * 3 + 1] = expand6((c >> 5) & 0x3F);
					pixels[i * 3 + 2] = expand5(c & 0x1F);
				}
				break;
			case ScreenColorsEnum::Rgb888:
				for (uint32 i = 0; i < count; i++)
				{
					const uint16 rg = at(i * 2 + 0);
					const uint16 b = at(i * 2 + 1);
					pixels[i * 3 + 0] = (uint8)(rg >> 8);
					pixels[i * 3 + 1] = (uint8)(rg & 0xFF);
					pixels[i * 3 + 2] = (uint8)(b & 0xFF);
				}
				break;
			default:
				CAGE_THROW_ERROR(Exception, "screen is not configured");
			}

			if (!image)
				image = newImage();
			image->importRaw({ (const char *)pixels.data(), (const char *)(pixels.data() + pixels.size()) }, width_, height_, channels, ImageFormatEnum::U8);
			framesCount_++;

			if (!config.exportPath.empty() && framesCount_ <= config.exportLimit)
			{
				const string path = stringizer() + config.exportPath + (framesCount_ - 1) + ".png";
				CAGE_LOG(SeverityEnum::Info, "screen", stringizer() + "saving frame at path: '" + path + "'");
				image->exportFile(path);
			}
		}

		void service(const Cpu *cpu)
		{
			CAGE_ASSERT(cpu);
			CAGE_ASSERT(cpu->state() != CpuStateEnum::None);
			const auto ports = cpu->ports();
			// port 1 holds the resolution on the first call and the framebuffer offset afterwards
			if (colors_ == ScreenColorsEnum::None)
				configure(ports[1], ports[2]);
			else
				render(cpu->cache(), ports[1]);
		}
	};

	Holder<Screen> newScreen(const ScreenCreateConfig &config)
	{
		return detail::systemArena().createImpl<Screen, ScreenImpl>(config);
	}

	void Screen::service(const Cpu *cpu)
	{
		ScreenImpl *impl = (ScreenImpl *)this;
		impl->service(cpu);
	}

	bool Screen::configured() const
	{
		const ScreenImpl *impl = (const ScreenImpl *)this;
		return impl->colors_ != ScreenColorsEnum::None;
	}

	uint32 Screen::width() const
	{
		const ScreenImpl *impl = (const ScreenImpl *)this;
		return impl->width_;
	}

	uint32 Screen::height() const
	{
		const ScreenImpl *impl = (const ScreenImpl *)this;
		return impl->height_;
	}

	ScreenColorsEnum Screen::colors() const
	{
		const ScreenImpl *impl = (const ScreenImpl *)this;
		return impl->colors_;
	}

	uint32 Screen::framesCount() const
	{
		const ScreenImpl *impl = (const ScreenImpl *)this;
		return impl->framesCount_;
	}

	const Image *Screen::frame() const
	{
		const ScreenImpl *impl = (const ScreenImpl *)this;
		return +impl->image;
	}
}
