#include <cstddef>
#include <cstdint>

#include "protocol.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    socks5_method_reply method;
    (void)socks_codec::decode_method_reply(data, size, method);

    socks5_connect_reply reply;
    if (socks_codec::decode_connect_reply(data, size, reply))
    {
        const auto tail = socks_codec::connect_reply_tail_len(reply);
        (void)tail;
        (void)socks_codec::reply_message(reply.rep);
    }
    return 0;
}
