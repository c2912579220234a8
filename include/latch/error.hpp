#pragma once

#include <stdexcept>
#include <string>

namespace Latch
{
    /**
     * @brief Thrown when credential material violates its encoding contract. For instance a "Basic" authorization
     * header that is not base64 or lacks the ':' separator.
     *
     * This is never used for the "there are no credentials" case, which is an empty optional instead.
     */
    class MalformedCredentials : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };
}
