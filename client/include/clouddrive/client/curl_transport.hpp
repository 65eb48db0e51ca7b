#pragma once

#include <chrono>

#include "clouddrive/client/http.hpp"
#include "clouddrive/client/logger.hpp"

namespace clouddrive::client
{

    // HttpTransport on top of the libcurl easy interface.
    class CurlTransport : public HttpTransport
    {
    public:
        CurlTransport(std::chrono::milliseconds timeout, Logger logger);

        HttpResponse perform(HttpRequest &request) override;

    private:
        std::chrono::milliseconds timeout_;
        Logger logger_;
    };

} // namespace clouddrive::client
