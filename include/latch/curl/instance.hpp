#pragma once

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

namespace Latch::Curl
{
    /**
     * @brief Owns a curl easy handle. Needed for the escape functions of libcurl.
     */
    class Instance
    {
      public:
        Instance()
            : instance_{curl_easy_init(), &curl_easy_cleanup}
        {
            if (instance_ == nullptr)
                throw std::runtime_error("initializing a curl instance failed.");
        }
        operator CURL*() const
        {
            return instance_.get();
        }

      private:
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> instance_;
    };
}
