#include <latch/utility/base64.hpp>

#include <boost/beast/core/detail/base64.hpp>

using namespace boost::beast::detail;

namespace Latch
{
    namespace
    {
        /// Position in the standard alphabet or -1.
        int base64Value(char c)
        {
            if (c >= 'A' && c <= 'Z')
                return c - 'A';
            if (c >= 'a' && c <= 'z')
                return c - 'a' + 26;
            if (c >= '0' && c <= '9')
                return c - '0' + 52;
            if (c == '+')
                return 62;
            if (c == '/')
                return 63;
            return -1;
        }

        bool isCanonicalBase64(std::string_view base64View)
        {
            if (base64View.size() % 4 != 0)
                return false;

            std::size_t padding = 0;
            while (padding < 2 && padding < base64View.size() && base64View[base64View.size() - padding - 1] == '=')
                ++padding;

            const auto data = base64View.substr(0, base64View.size() - padding);
            for (auto c : data)
            {
                if (base64Value(c) == -1)
                    return false;
            }

            // The bits below the last full byte must be zero, otherwise two different strings decode the same.
            if (padding == 1)
                return (base64Value(data.back()) & 0x03) == 0;
            if (padding == 2)
                return (base64Value(data.back()) & 0x0f) == 0;
            return true;
        }
    } // namespace

    std::string base64Encode(std::string_view str)
    {
        std::string result(base64::encoded_size(str.size()), '\0');
        const auto size = base64::encode(result.data(), str.data(), str.size());
        result.resize(size);
        return result;
    }

    std::optional<std::string> base64Decode(std::string_view base64View)
    {
        if (!isCanonicalBase64(base64View))
            return std::nullopt;

        auto decodedSize = base64::decoded_size(base64View.size());
        if (decodedSize == 0)
            return std::string{};
        std::string result(decodedSize, '\0');
        const auto [writtenOut, readIn] = base64::decode(result.data(), base64View.data(), base64View.size());
        result.resize(writtenOut);
        return result;
    }
}
