#pragma once

#include <boost/leaf.hpp>

#include <string>
#include <string_view>
#include <unordered_map>

namespace Latch
{
    struct NetrcEntry
    {
        std::string login{};
        std::string password{};
        std::string account{};
    };

    /**
     * @brief A parsed netrc table. The "default" entry, if present, is stored under the key "default".
     */
    struct Netrc
    {
        std::unordered_map<std::string, NetrcEntry> hosts;

        /**
         * @brief Parses the contents of a netrc file.
         *
         * Tokens are separated by whitespace or enclosed in double quotes. "macdef" bodies are skipped and
         * "#" starts a comment. When a machine is listed twice, the first entry is kept.
         *
         * @param text The file contents.
         * @return boost::leaf::result<Netrc> The table or an error string.
         */
        static boost::leaf::result<Netrc> fromString(std::string_view text);
    };
}
