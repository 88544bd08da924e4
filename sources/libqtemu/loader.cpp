#include <cage-core/pointerRangeHolder.h>

#include "program.h"

namespace qtemu
{
	namespace
	{
		constexpr uint32 RecordSize = 4;
		constexpr uint32 MaxTagLength = 16;

		Instruction decodeRecord(const char *record)
		{
			// byte 0 bit 0 = memory flag, bytes 1-2 = big endian value, byte 3 = opcode
			Instruction ins;
			ins.memory = (uint8)record[0] & 1;
			ins.value = (uint16)(((uint8)record[1] << 8) | (uint8)record[2]);
			ins.opcode = (uint8)record[3];
			return ins;
		}
	}

	struct LoaderImpl : public Loader
	{
		LoaderCreateConfig config;

		LoaderImpl(const LoaderCreateConfig &config) : config(config)
		{}

		NamespaceEnum readNamespace(PointerRange<const char> image, uintPtr &position)
		{
			const uintPtr start = position;
			while (true)
			{
				if (position >= image.size())
					CAGE_THROW_ERROR(Exception, "missing namespace tag terminator");
				if (image[position] == 0)
					break;
				if (position - start >= MaxTagLength)
					CAGE_THROW_ERROR(Exception, "namespace tag too long");
				position++;
			}
			const string tag = string(image.data() + start, numeric_cast<uint32>(position - start));
			position++; // terminator
			return namespaceFromString(tag);
		}

		Holder<Program> load(PointerRange<const char> image)
		{
			uintPtr position = 0;
			const NamespaceEnum ns = readNamespace(image, position);
			if (ns != config.expected)
			{
				CAGE_LOG_THROW(stringizer() + "expected namespace: " + namespaceToString(config.expected));
				CAGE_LOG_THROW(stringizer() + "image namespace: " + namespaceToString(ns));
				CAGE_THROW_ERROR(Exception, "code namespace mismatch");
			}
			if (ns == NamespaceEnum::QM)
				CAGE_THROW_ERROR(NotImplemented, "QM namespace is not supported");

			const uintPtr remaining = image.size() - position;
			if (remaining % RecordSize != 0)
			{
				CAGE_LOG_THROW(stringizer() + "byte offset: " + (position + remaining - remaining % RecordSize));
				CAGE_LOG_THROW(stringizer() + "trailing bytes: " + (remaining % RecordSize));
				CAGE_THROW_ERROR(Exception, "truncated instruction record");
			}

			PointerRangeHolder<Instruction> instructions;
			instructions.reserve(remaining / RecordSize);
			for (; position < image.size(); position += RecordSize)
				instructions.push_back(decodeRecord(image.data() + position));

			Holder<ProgramImpl> p = detail::systemArena().createHolder<ProgramImpl>();
			p->namespaceTag = ns;
			p->instructions = instructions;
			return templates::move(p).cast<Program>();
		}
	};

	Holder<Loader> newLoader(const LoaderCreateConfig &config)
	{
		return detail::systemArena().createImpl<Loader, LoaderImpl>(config);
	}

	Holder<Program> Loader::load(PointerRange<const char> image)
	{
		LoaderImpl *impl = (LoaderImpl *)this;
		return impl->load(image);
	}
}
