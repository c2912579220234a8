#pragma once

#include <boost/locale/utf.hpp>

#include <string_view>

namespace Latch
{
    /**
     * @brief Returns true if the bytes form well formed UTF-8.
     */
    inline bool isValidUtf8(std::string_view text)
    {
        using traits = boost::locale::utf::utf_traits<char>;

        auto iter = text.begin();
        const auto end = text.end();
        while (iter != end)
        {
            const auto codePoint = traits::decode(iter, end);
            if (codePoint == boost::locale::utf::illegal || codePoint == boost::locale::utf::incomplete)
                return false;
        }
        return true;
    }
}
