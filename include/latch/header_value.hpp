#pragma once

#include <iomanip>
#include <string>
#include <string_view>
#include <utility>

namespace Latch
{
    /**
     * @brief A header value that knows whether it carries secret material. Sensitive values are never rendered
     * in cleartext by the stream operators of this library.
     */
    class HeaderValue
    {
      public:
        explicit HeaderValue(std::string value, bool sensitive = false)
            : value_{std::move(value)}
            , sensitive_{sensitive}
        {}

        std::string const& value() const
        {
            return value_;
        }

        bool sensitive() const
        {
            return sensitive_;
        }

        HeaderValue& sensitive(bool enable)
        {
            sensitive_ = enable;
            return *this;
        }

        bool operator==(HeaderValue const&) const = default;

      private:
        std::string value_;
        bool sensitive_;
    };

    template <typename StreamT>
    StreamT& operator<<(StreamT& stream, HeaderValue const& value)
    {
        if (value.sensitive())
            stream << "Sensitive";
        else
            stream << std::quoted(value.value());
        return stream;
    }
}
