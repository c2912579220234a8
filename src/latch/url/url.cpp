#include <latch/url/url.hpp>

#include <latch/url/encode.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/fusion/include/at_c.hpp>
#include <boost/spirit/home/x3.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace Latch
{
    namespace Parser
    {
        namespace x3 = boost::spirit::x3;
        namespace ascii = boost::spirit::x3::ascii;

        using ascii::char_;
        using x3::alnum;
        using x3::alpha;
        using x3::xdigit;
        using x3::ushort_;
        using x3::eoi;
        using x3::uint_parser;
        using boost::fusion::at_c;

        struct UrlTag;
        const x3::rule<UrlTag, Url> url = "url";

        // Path: (https://en.wikipedia.org/wiki/Percent-encoding)
        struct UnreservedTag;
        const auto unreserved = x3::rule<UnreservedTag, char>{"unreserved"} = alnum | char_("-._~");

        struct GenDelimsTag;
        const auto genDelims = x3::rule<GenDelimsTag, char>{"gen-delims"} = char_(":/?#[]@");

        struct SubDelimsTag;
        const auto subDelims = x3::rule<SubDelimsTag, char>{"sub-delims"} = char_("!$&'()*+,;=");

        struct Leniency;
        const auto leniency = x3::rule<Leniency, char>("leniency") = char_("\"<> ");

        struct ReservedTag;
        const auto reserved = x3::rule<ReservedTag, char>{"reserved"} = genDelims | subDelims;

        struct PercentEncodedTag;
        const auto percentEncoded = x3::rule<PercentEncodedTag, char>{"percentEncoded"} =
            '%' >> uint_parser<unsigned char, 16, 2, 2>{}[([](auto& ctx) {
                _val(ctx) = static_cast<char>(_attr(ctx));
            })];

        struct PathCharacterTag;
        const auto pathCharacter = x3::rule<PathCharacterTag, char>{"pathCharacter"} =
            (percentEncoded | leniency | unreserved | reserved | char_(":@")) - char_("#?/");

        struct PathTag;
        const auto path = x3::rule<PathTag, std::vector<std::string>>{"path"} =
            ((*pathCharacter) % '/')[([](auto& ctx) {
                // first path segment must not be empty, because that may be mistaken with a // of the
                // authority part.
                if (!_attr(ctx).empty())
                    _pass(ctx) = !_attr(ctx).front().empty();
                _val(ctx) = _attr(ctx);
            })];

        // Scheme:
        struct SchemeAllowedCharacterTag;
        const auto schemeAllowedChar = x3::rule<SchemeAllowedCharacterTag, char>{"schemeAllowedChar"} =
            alnum | char_('+') | char_('.') | char_('-');

        struct SchemeTag;
        const auto scheme = x3::rule<SchemeTag, std::string>{"scheme"} = alpha[([](auto& ctx) {
                                                                             _val(ctx).push_back(_attr(ctx));
                                                                         })] >>
            *(schemeAllowedChar - char_(':'))[([](auto& ctx) {
                                                                             _val(ctx).push_back(_attr(ctx));
                                                                         })];

        // Authority:
        // Userinfo is not decoded here, the url keeps it in its encoded form.
        struct UserInfoCharacterTag;
        const auto userInfoCharacter = x3::rule<UserInfoCharacterTag>{"userInfoCharacter"} =
            ('%' >> xdigit >> xdigit) | unreserved | subDelims;

        struct UserInfoTag;
        const auto userInfo = x3::rule<UserInfoTag, Url::UserInfo>{"userInfo"} =
            x3::raw[*userInfoCharacter][([](auto& ctx) {
                _val(ctx).user = std::string{std::begin(_attr(ctx)), std::end(_attr(ctx))};
            })] >>
            -(':' >> x3::raw[*(userInfoCharacter | ':')][([](auto& ctx) {
                  _val(ctx).password = std::string{std::begin(_attr(ctx)), std::end(_attr(ctx))};
              })]);

        struct DomainCharacterTag;
        const auto domainCharacter = x3::rule<DomainCharacterTag, char>("domainCharacter") = alnum | char_("-.");

        // Is less strict than the RFC. Length limitations are ignored and ip literals are not validated.
        struct HostTag;
        const auto host = x3::rule<HostTag, std::string>{"host"} =
            x3::raw['[' >> +(xdigit | char_(":.")) >> ']'][([](auto& ctx) {
                _val(ctx) = boost::algorithm::to_lower_copy(std::string{std::begin(_attr(ctx)), std::end(_attr(ctx))});
            })] |
            (+domainCharacter)[([](auto& ctx) {
                _val(ctx) = boost::algorithm::to_lower_copy(_attr(ctx));
            })];

        struct RemoteTag;
        const auto remote = x3::rule<RemoteTag, Url::Authority::Remote>{"remote"} = host[([](auto& ctx) {
                                                                                        _val(ctx).host = _attr(ctx);
                                                                                    })] >>
            -(char_(':') >> ushort_[([](auto& ctx) {
                                                                                        _val(ctx).port = _attr(ctx);
                                                                                    })]);

        struct AuthorityTag;
        const auto authority = x3::rule<AuthorityTag, Url::Authority>{"authority"} = -(userInfo >> "@")[([](auto& ctx) {
            _val(ctx).userInfo = _attr(ctx);
        })] >>
            remote[([](auto& ctx) {
                _val(ctx).remote = _attr(ctx);
            })];

        // Query:
        struct QueryCharacterTag;
        const auto queryCharacter = x3::rule<QueryCharacterTag, char>{"queryCharacter"} = pathCharacter | char_("/?");

        struct QueryKeyTag;
        const auto queryKey = x3::rule<QueryKeyTag, std::string>{"queryKey"} =
            +(queryCharacter - char_("=&;"))[([](auto& ctx) {
                _val(ctx).push_back(_attr(ctx));
            })];

        struct QueryValueTag;
        const auto queryValue = x3::rule<QueryValueTag, std::string>{"queryValue"} =
            *(queryCharacter - char_("&;#"))[([](auto& ctx) {
                _val(ctx).push_back(_attr(ctx));
            })];

        struct QueryTag;
        const auto query = x3::rule<QueryTag, std::unordered_map<std::string, std::string>>{"query"} =
            ((queryKey > "=" > queryValue)[([](auto& ctx) {
                 _val(ctx).insert(std::make_pair(at_c<0>(_attr(ctx)), at_c<1>(_attr(ctx))));
             })] %
             char_("&;"));

        struct FragmentTag;
        const auto fragment = x3::rule<FragmentTag, std::string>{"fragment"} =
            *(unreserved | reserved | percentEncoded | char_(":@"));

        // Finally URL:
        const auto url_def = scheme[([](auto& ctx) {
            _val(ctx).scheme = _attr(ctx);
        })] > ':' >
            -("//" > authority[([](auto& ctx) {
                  _val(ctx).authority = _attr(ctx);
              })]) >
            -('/' > -path[([](auto& ctx) {
                  _val(ctx).path = _attr(ctx);
              })]) >
            -('?' > query[([](auto& ctx) {
                  _val(ctx).query = _attr(ctx);
              })]) >
            -('#' > fragment[([](auto& ctx) {
                  _val(ctx).fragment = _attr(ctx);
              })]) >
            eoi;

        BOOST_SPIRIT_DEFINE(url);
    } // namespace Parser

    //##################################################################################################################
    std::string Url::pathAsString() const
    {
        std::stringstream result;
        for (auto const& pathPart : path)
            result << "/" << urlEncode(pathPart);
        return result.str();
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string Url::target() const
    {
        std::stringstream result;
        if (path.empty())
            result << "/";
        else
            result << pathAsString();
        if (!query.empty())
        {
            result.put('?');
            for (auto iter = std::begin(query), end = std::end(query); iter != end; ++iter)
            {
                result << urlEncode(iter->first) << '=' << urlEncode(iter->second);
                if (std::next(iter) != end)
                    result << '&';
            }
        }
        return result.str();
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string Url::toString(bool includeFragment) const
    {
        std::stringstream result;
        result << scheme << "://" << getAuthority();
        if (!path.empty() || !query.empty())
            result << target();
        if (includeFragment && !fragment.empty())
            result << '#' << fragment;
        return result.str();
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string Url::hostAsString() const
    {
        return authority.remote.host;
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string Url::getAuthority() const
    {
        std::stringstream result;
        if (authority.userInfo)
        {
            result << authority.userInfo->user;
            if (authority.userInfo->password)
                result << ':' << *authority.userInfo->password;
            result << '@';
        }
        result << hostAsString();
        if (authority.remote.port)
            result << ':' << std::dec << *authority.remote.port;
        return result.str();
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string Url::username() const
    {
        if (authority.userInfo)
            return authority.userInfo->user;
        return {};
    }
    //------------------------------------------------------------------------------------------------------------------
    std::optional<std::string> Url::password() const
    {
        if (authority.userInfo)
            return authority.userInfo->password;
        return std::nullopt;
    }
    //------------------------------------------------------------------------------------------------------------------
    Url& Url::setUsername(std::string const& username)
    {
        if (!authority.userInfo)
            authority.userInfo = UserInfo{};
        authority.userInfo->user = urlEncode(username);
        if (authority.userInfo->user.empty() && !authority.userInfo->password)
            authority.userInfo = std::nullopt;
        return *this;
    }
    //------------------------------------------------------------------------------------------------------------------
    Url& Url::setPassword(std::optional<std::string> const& password)
    {
        if (!authority.userInfo)
            authority.userInfo = UserInfo{};
        if (password)
            authority.userInfo->password = urlEncode(*password);
        else
            authority.userInfo->password = std::nullopt;
        if (authority.userInfo->user.empty() && !authority.userInfo->password)
            authority.userInfo = std::nullopt;
        return *this;
    }
    //------------------------------------------------------------------------------------------------------------------
    boost::leaf::result<Url> Url::fromString(std::string_view urlString)
    {
        using namespace std::string_literals;
        auto iter = urlString.data();
        const auto end = urlString.data() + urlString.size();
        Url result;

        try
        {
            bool r = boost::spirit::x3::parse(iter, end, Parser::url, result);
            if (!r)
                return boost::leaf::new_error(std::string("Could not parse url."));
        }
        catch (boost::spirit::x3::expectation_failure<char const*> const& exc)
        {
            return boost::leaf::new_error(std::string{
                "Could not parse url, error at: "s + exc.which() + "(" +
                std::string{exc.where(), exc.where() + std::min<std::ptrdiff_t>(10, end - exc.where())} + ")"});
        }
        return result;
    }
    //##################################################################################################################
} // namespace Latch
