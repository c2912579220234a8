#include <latch/url/encode.hpp>

#include <latch/curl/instance.hpp>

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace Latch
{
    std::string urlEncode(const std::string& source)
    {
        // Curl crashes on empty input.
        if (source.empty())
            return {};

        Curl::Instance temporaryInstance;
        std::string encoded;
        auto* escaped = curl_easy_escape(temporaryInstance, source.c_str(), static_cast<int>(source.length()));
        if (escaped == nullptr)
            throw std::runtime_error("Could not encode url.");

        encoded = escaped;
        curl_free(escaped);
        return encoded;
    }

    std::string urlDecode(const std::string& source)
    {
        if (source.empty())
            return {};

        Curl::Instance temporaryInstance;
        int actual = 0;
        auto* decoded =
            curl_easy_unescape(temporaryInstance, source.c_str(), static_cast<int>(source.length()), &actual);
        if (decoded == nullptr)
            throw std::runtime_error("Could not decode url.");

        std::string result{decoded, decoded + actual};
        curl_free(decoded);
        return result;
    }
} // namespace Latch
