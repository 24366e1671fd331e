#pragma once

namespace twig
{
class Options;

namespace logs
{
// Console sink used until the options are known.
void preinit();
void init(const Options& opt);
}
}
