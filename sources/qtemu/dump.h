#ifndef dump_h_k3s9w1q7
#define dump_h_k3s9w1q7

#include <qtemu/qtemu.h>

using namespace qtemu;

void dumpMemory(const Cpu *cpu, const string &path);

#endif // dump_h_k3s9w1q7
