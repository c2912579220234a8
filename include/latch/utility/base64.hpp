#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Latch
{
    /**
     * @brief Encode string in base64 (standard alphabet, with padding).
     *
     * @param str
     * @return std::string
     */
    std::string base64Encode(std::string_view str);

    /**
     * @brief Decode base64 to string. The input must be canonical standard base64 with padding, anything else
     * is rejected.
     *
     * @param base64String
     * @return std::optional<std::string> The decoded bytes or nullopt if the input is not valid base64.
     */
    std::optional<std::string> base64Decode(std::string_view base64String);
}
