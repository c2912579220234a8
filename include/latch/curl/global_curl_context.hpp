#pragma once

#include <curl/curl.h>

namespace Latch::Curl
{
    /**
     * @brief This class calls curl_global_init and curl_global_cleanup. Create one in main before using the
     * percent coding functions from multiple threads.
     */
    class GlobalCurlContext
    {
      public:
        explicit GlobalCurlContext(long curlGlobalFlags = CURL_GLOBAL_DEFAULT);
        ~GlobalCurlContext();

        GlobalCurlContext(GlobalCurlContext const&) = delete;
        GlobalCurlContext& operator=(GlobalCurlContext const&) = delete;
    };
}
