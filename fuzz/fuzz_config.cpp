#include <string>
#include <cstddef>
#include <cstdint>

#include "config.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return 0;
    }

    const std::string input(reinterpret_cast<const char*>(data), size);
    const auto cfg = sockspipe::parse_config_text(input);
    if (cfg)
    {
        const auto dumped = sockspipe::dump_config(*cfg);
        (void)dumped;
    }
    return 0;
}
