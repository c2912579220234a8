#pragma once

#include <boost/leaf.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Latch
{
    struct Url
    {
        /**
         * @brief The userinfo part of the authority. Both members are stored percent-encoded, exactly as they
         * would appear in the url string.
         */
        struct UserInfo
        {
            std::string user{};
            std::optional<std::string> password{};
        };

        struct Authority
        {
            struct Remote
            {
                std::string host{};
                std::optional<unsigned short> port{};
            };
            std::optional<Url::UserInfo> userInfo{std::nullopt};
            Remote remote{};
        };

        std::string scheme;
        Authority authority;
        std::vector<std::string> path;
        std::unordered_map<std::string, std::string> query;
        std::string fragment;

        /**
         * @brief Converts the url to a string containing all parts: https://u:p@bla.com:80/path?k=v
         *
         * @param includeFragment The fragment part will not be added when false.
         * @return std::string the url
         */
        std::string toString(bool includeFragment = true) const;

        /**
         * @brief Will only create the path as a string with a leading slash: "/path/to/resource".
         *
         * @return std::string the percent-encoded path part of the url.
         */
        std::string pathAsString() const;

        /**
         * @brief The request target for an HTTP request line: path and query, "/" at least.
         */
        std::string target() const;

        /**
         * @brief Returns the host part of the url as a string. Does not include the port! IPv6 addresses
         * are enclosed in square brackets. Empty if the url has no authority.
         *
         * @return std::string The domain/ip of the url.
         */
        std::string hostAsString() const;

        /**
         * @brief Converts the entire authority part to string: "user:password@domain.com:770".
         */
        std::string getAuthority() const;

        /**
         * @brief The percent-encoded user name, or an empty string if there is none.
         */
        std::string username() const;

        /**
         * @brief The percent-encoded password, if any.
         */
        std::optional<std::string> password() const;

        /**
         * @brief Sets the user name. The argument is plain text and will be percent-encoded.
         */
        Url& setUsername(std::string const& username);

        /**
         * @brief Sets or removes the password. The argument is plain text and will be percent-encoded.
         */
        Url& setPassword(std::optional<std::string> const& password);

        /**
         * @brief Parses a string that is a url.
         *
         * @param url A url string.
         * @return boost::leaf::result<Url> A url or an error string.
         */
        static boost::leaf::result<Url> fromString(std::string_view url);
    };
} // namespace Latch
