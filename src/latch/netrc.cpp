#include <latch/netrc.hpp>

#include <boost/spirit/home/x3.hpp>

#include <algorithm>
#include <string>

namespace Latch
{
    namespace Parser
    {
        namespace x3 = boost::spirit::x3;

        using x3::standard::char_;
        using x3::standard::space;
        using x3::standard::blank;
        using x3::eol;

        struct MachineEntry
        {
            std::string name{};
            NetrcEntry entry{};
        };

        const auto skipper = space | ('#' >> *(char_ - eol));

        inline auto keyword(char const* word)
        {
            return x3::lexeme[x3::lit(word) >> !(char_ - space)];
        }

        struct TokenTag;
        const auto token = x3::rule<TokenTag, std::string>{"token"} =
            x3::lexeme['"' >> *(('\\' >> char_) | (char_ - '"')) >> '"'] | x3::lexeme[+(char_ - space)];

        struct MachineTag;
        const auto machine = x3::rule<MachineTag, MachineEntry>{"machine"} =
            ((keyword("machine") > token[([](auto& ctx) {
                  _val(ctx).name = _attr(ctx);
              })]) |
             keyword("default")[([](auto& ctx) {
                 _val(ctx).name = "default";
             })]) >>
            *((keyword("login") > token[([](auto& ctx) {
                   _val(ctx).entry.login = _attr(ctx);
               })]) |
              (keyword("password") > token[([](auto& ctx) {
                   _val(ctx).entry.password = _attr(ctx);
               })]) |
              (keyword("account") > token[([](auto& ctx) {
                   _val(ctx).entry.account = _attr(ctx);
               })]) |
              (keyword("port") > x3::omit[token]));

        // The macro body runs until the next empty line.
        struct MacdefTag;
        const auto macdef = x3::rule<MacdefTag>{"macdef"} =
            keyword("macdef") > x3::omit[token] >> x3::no_skip[x3::omit[*(char_ - (eol >> *blank >> eol))]];

        struct NetrcTag;
        const auto netrc = x3::rule<NetrcTag, Netrc>{"netrc"} = *(machine[([](auto& ctx) {
                                                                      auto& machine = _attr(ctx);
                                                                      _val(ctx).hosts.emplace(
                                                                          std::move(machine.name),
                                                                          std::move(machine.entry));
                                                                  })] |
                                                                  macdef) > x3::eoi;
    } // namespace Parser

    boost::leaf::result<Netrc> Netrc::fromString(std::string_view text)
    {
        using namespace std::string_literals;
        auto iter = text.data();
        const auto end = text.data() + text.size();
        Netrc result;

        try
        {
            bool r = boost::spirit::x3::phrase_parse(iter, end, Parser::netrc, Parser::skipper, result);
            if (!r)
                return boost::leaf::new_error(std::string{"Could not parse netrc."});
        }
        catch (boost::spirit::x3::expectation_failure<char const*> const& exc)
        {
            const auto line = std::count(text.data(), exc.where(), '\n') + 1;
            return boost::leaf::new_error(
                "Could not parse netrc, expected "s + exc.which() + " in line " + std::to_string(line) + ".");
        }
        return result;
    }
}
