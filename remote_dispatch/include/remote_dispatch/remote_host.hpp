#pragma once

#include <string>

namespace RemoteDispatch
{
    struct RemoteHost
    {
        std::string host{};
        int port = 22;

        std::string toString() const
        {
            return host + ":" + std::to_string(port);
        }
    };
}
