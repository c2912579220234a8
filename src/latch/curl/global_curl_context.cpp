#include <latch/curl/global_curl_context.hpp>

#include <stdexcept>

namespace Latch::Curl
{
    GlobalCurlContext::GlobalCurlContext(long curlGlobalFlags)
    {
        if (curl_global_init(curlGlobalFlags) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed.");
    }
    GlobalCurlContext::~GlobalCurlContext()
    {
        curl_global_cleanup();
    }
}
