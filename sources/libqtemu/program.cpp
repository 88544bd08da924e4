#include "program.h"

namespace qtemu
{
	NamespaceEnum namespaceFromString(const string &name)
	{
		if (name == "QT")
			return NamespaceEnum::QT;
		if (name == "QM")
			return NamespaceEnum::QM;
		CAGE_LOG_THROW(stringizer() + "namespace: '" + name + "'");
		CAGE_THROW_ERROR(Exception, "unknown code namespace");
	}

	const char *namespaceToString(NamespaceEnum ns)
	{
		switch (ns)
		{
		case NamespaceEnum::QT: return "QT";
		case NamespaceEnum::QM: return "QM";
		default: return "";
		}
	}

	NamespaceEnum Program::namespaceTag() const
	{
		const ProgramImpl *impl = (const ProgramImpl *)this;
		return impl->namespaceTag;
	}

	uint32 Program::instructionsCount() const
	{
		const ProgramImpl *impl = (const ProgramImpl *)this;
		return numeric_cast<uint32>(impl->instructions.size());
	}

	Instruction Program::instruction(uint32 index) const
	{
		const ProgramImpl *impl = (const ProgramImpl *)this;
		if (index >= impl->instructions.size())
			CAGE_THROW_ERROR(Exception, "program instruction index out of range");
		return impl->instructions[index];
	}

	PointerRange<const Instruction> Program::instructions() const
	{
		const ProgramImpl *impl = (const ProgramImpl *)this;
		PointerRange<Instruction> r = impl->instructions;
		return r;
	}
}
