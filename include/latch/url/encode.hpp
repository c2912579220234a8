#pragma once

#include <string>

namespace Latch
{
    /**
     * @brief Percent-encodes everything but the unreserved characters (ALPHA / DIGIT / "-" / "." / "_" / "~").
     */
    std::string urlEncode(std::string const& source);

    /**
     * @brief Reverses percent-encoding. Malformed escapes are kept as they are.
     */
    std::string urlDecode(std::string const& source);
} // namespace Latch
