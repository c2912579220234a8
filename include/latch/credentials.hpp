#pragma once

#include <latch/header_value.hpp>
#include <latch/netrc.hpp>
#include <latch/request.hpp>
#include <latch/url/url.hpp>

#include <boost/beast/http/field.hpp>

#include <iomanip>
#include <optional>
#include <string>
#include <string_view>

namespace Latch
{
    /**
     * @brief Username and password for HTTP Basic Authentication.
     *
     * An empty username is the same as no username, the constructor normalizes it. An empty password on the
     * other hand is a valid password and is kept.
     */
    class Credentials
    {
      public:
        Credentials(std::optional<std::string> username, std::optional<std::string> password);

        std::optional<std::string> const& username() const
        {
            return username_;
        }

        std::optional<std::string> const& password() const
        {
            return password_;
        }

        /**
         * @brief True if neither username nor password are set.
         */
        bool isEmpty() const
        {
            return !username_ && !password_;
        }

        /**
         * @brief Looks up the credentials for the host of the url in a netrc table. Falls back to the "default"
         * entry.
         *
         * @param netrc A parsed netrc table.
         * @param url Only the host of this url is used.
         * @param username If set, the login of the netrc entry must match or nullopt is returned.
         */
        static std::optional<Credentials>
        fromNetrc(Netrc const& netrc, Url const& url, std::optional<std::string_view> username = std::nullopt);

        /**
         * @brief Returns the decoded userinfo of the url, nullopt if there is neither a username nor a password.
         *
         * @throws MalformedCredentials if the decoded userinfo is not valid UTF-8.
         */
        static std::optional<Credentials> fromUrl(Url const& url);

        /**
         * @brief Returns the credentials of the request url, or if there are none, of the Authorization header.
         *
         * @throws MalformedCredentials see fromUrl and fromHeaderValue.
         */
        template <typename BodyT>
        static std::optional<Credentials> fromRequest(Request<BodyT> const& request)
        {
            if (auto credentials = fromUrl(request.url()); credentials)
                return credentials;

            auto header = request.header(boost::beast::http::field::authorization);
            if (!header)
                return std::nullopt;
            return fromHeaderValue(*header);
        }

        /**
         * @brief Parses an Authorization header value. Only the "Basic" scheme is supported, nullopt is returned
         * for all other schemes.
         *
         * Unlike the other sources, an empty password is treated as no password here: "user:" yields no
         * password and ":pass" yields no username.
         *
         * @throws MalformedCredentials if the value is not base64 or the decoded text has no ':' separator.
         */
        static std::optional<Credentials> fromHeaderValue(std::string_view header);
        static std::optional<Credentials> fromHeaderValue(HeaderValue const& header);

        /**
         * @brief Creates a sensitive "Basic" Authorization header value.
         */
        HeaderValue toHeaderValue() const;

        /**
         * @brief Sets the Authorization header of the request, any previous value is replaced.
         */
        template <typename BodyT>
        Request<BodyT>& authenticate(Request<BodyT>& request) const
        {
            return request.setHeader(boost::beast::http::field::authorization, toHeaderValue());
        }

        bool operator==(Credentials const&) const = default;

      private:
        std::optional<std::string> username_;
        std::optional<std::string> password_;
    };

    /**
     * @brief Prints the username, but never the password.
     */
    template <typename StreamT>
    StreamT& operator<<(StreamT& stream, Credentials const& credentials)
    {
        stream << "Credentials{username: ";
        if (credentials.username())
            stream << std::quoted(*credentials.username());
        else
            stream << "None";
        stream << ", password: " << (credentials.password() ? "Sensitive" : "None") << "}";
        return stream;
    }
}
