#pragma once

#include "pcloud/http/Request.hpp"
#include "pcloud/http/Response.hpp"

namespace pcloud::http {

// Executes one HTTP exchange. Implementations must be safe to call from several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Throws errors::TransportError when no HTTP response could be obtained.
    virtual Response perform(const Request& req) = 0;
};

}
