#include <latch/credentials.hpp>

#include <latch/error.hpp>
#include <latch/url/encode.hpp>
#include <latch/utility/base64.hpp>
#include <latch/utility/utf8.hpp>

#include <utility>

namespace Latch
{
    namespace
    {
        constexpr std::string_view basicPrefix = "Basic ";

        std::string decodeUserInfo(std::string const& encoded)
        {
            auto decoded = urlDecode(encoded);
            if (!isValidUtf8(decoded))
                throw MalformedCredentials("Percent-encoded url credentials do not decode to UTF-8.");
            return decoded;
        }

        std::optional<std::string> nonEmpty(std::string_view text)
        {
            if (text.empty())
                return std::nullopt;
            return std::string{text};
        }
    }

    //##################################################################################################################
    Credentials::Credentials(std::optional<std::string> username, std::optional<std::string> password)
        : username_{std::move(username)}
        , password_{std::move(password)}
    {
        if (username_ && username_->empty())
            username_ = std::nullopt;
    }
    //------------------------------------------------------------------------------------------------------------------
    std::optional<Credentials>
    Credentials::fromNetrc(Netrc const& netrc, Url const& url, std::optional<std::string_view> username)
    {
        const auto host = url.hostAsString();
        if (host.empty())
            return std::nullopt;

        auto iter = netrc.hosts.find(host);
        if (iter == std::end(netrc.hosts))
            iter = netrc.hosts.find("default");
        if (iter == std::end(netrc.hosts))
            return std::nullopt;

        auto const& entry = iter->second;
        if (username && *username != entry.login)
            return std::nullopt;

        return Credentials{entry.login, entry.password};
    }
    //------------------------------------------------------------------------------------------------------------------
    std::optional<Credentials> Credentials::fromUrl(Url const& url)
    {
        const auto username = url.username();
        const auto password = url.password();
        if (username.empty() && !password)
            return std::nullopt;

        return Credentials{
            username.empty() ? std::nullopt : std::optional<std::string>{decodeUserInfo(username)},
            password ? std::optional<std::string>{decodeUserInfo(*password)} : std::nullopt,
        };
    }
    //------------------------------------------------------------------------------------------------------------------
    std::optional<Credentials> Credentials::fromHeaderValue(HeaderValue const& header)
    {
        return fromHeaderValue(std::string_view{header.value()});
    }
    //------------------------------------------------------------------------------------------------------------------
    std::optional<Credentials> Credentials::fromHeaderValue(std::string_view header)
    {
        if (header.substr(0, basicPrefix.size()) != basicPrefix)
            return std::nullopt;

        const auto decoded = base64Decode(header.substr(basicPrefix.size()));
        if (!decoded || !isValidUtf8(*decoded))
            throw MalformedCredentials("HTTP Basic Authentication should be base64 encoded.");

        const auto colon = decoded->find(':');
        if (colon == std::string::npos)
            throw MalformedCredentials("HTTP Basic Authentication should include a `:` separator.");

        const auto plain = std::string_view{*decoded};
        return Credentials{nonEmpty(plain.substr(0, colon)), nonEmpty(plain.substr(colon + 1))};
    }
    //------------------------------------------------------------------------------------------------------------------
    HeaderValue Credentials::toHeaderValue() const
    {
        const auto plain = username_.value_or("") + ":" + password_.value_or("");
        return HeaderValue{std::string{basicPrefix} + base64Encode(plain), true};
    }
    //##################################################################################################################
}
