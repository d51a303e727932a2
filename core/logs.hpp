#pragma once

namespace switchyard
{
class Options;

namespace logs
{
// Console sink for the time before options are known
void preinit();
void init(const Options& opt);
}
}
