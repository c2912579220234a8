#include <latch/credentials.hpp>
#include <latch/curl/global_curl_context.hpp>
#include <latch/error.hpp>
#include <latch/netrc.hpp>
#include <latch/request.hpp>
#include <latch/url/url.hpp>

#include <boost/beast/http/verb.hpp>

#include <iostream>

// Usage: authenticate <url> [netrc contents]
int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <url> [netrc contents]\n";
        return 1;
    }

    Latch::Curl::GlobalCurlContext curlContext;

    auto url = Latch::Url::fromString(argv[1]);
    if (!url)
    {
        std::cerr << "Not a valid url: " << argv[1] << "\n";
        return 1;
    }

    Latch::EmptyBodyRequest request{boost::beast::http::verb::get, url.value()};

    try
    {
        auto credentials = Latch::Credentials::fromRequest(request);
        if (!credentials && argc > 2)
        {
            auto netrc = Latch::Netrc::fromString(argv[2]);
            if (!netrc)
            {
                std::cerr << "Could not parse the netrc contents.\n";
                return 1;
            }
            credentials = Latch::Credentials::fromNetrc(netrc.value(), url.value());
        }

        if (!credentials)
        {
            std::cout << "No credentials found.\n";
            return 0;
        }

        std::cout << *credentials << "\n";
        credentials->authenticate(request);
        std::cout << request;
    }
    catch (Latch::MalformedCredentials const& exc)
    {
        std::cerr << "Malformed credentials: " << exc.what() << "\n";
        return 1;
    }
}
