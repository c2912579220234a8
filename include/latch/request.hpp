#pragma once

#include <latch/header_value.hpp>
#include <latch/url/url.hpp>

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/verb.hpp>

#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>

namespace Latch
{
    namespace Detail
    {
        struct RequestExtensions
        {
            Url url_;
            std::set<std::string, boost::beast::iless> sensitiveFields_;
        };
    }

    /**
     * @brief This class extends the boost::beast::http::request<BodyT> with the full target url and with
     * knowledge about which header values must not be printed.
     *
     * @tparam BodyT Body type of the request. (empty_body, string_body, ...) See boost beast bodies.
     */
    template <typename BodyT>
    class Request
        : public boost::beast::http::request<BodyT>
        , private Detail::RequestExtensions
    {
      public:
        using self_type = Request<BodyT>;
        using beast_request = boost::beast::http::request<BodyT>;

        Request()
            : boost::beast::http::request<BodyT>{}
            , Detail::RequestExtensions{}
        {}

        /**
         * @brief Creates a request for the given url. Target and host header are taken from the url, the
         * userinfo is retained in the url but not written anywhere.
         *
         * @param method The http verb.
         * @param url The full url of the request.
         */
        Request(boost::beast::http::verb method, Url url)
            : boost::beast::http::request<BodyT>{method, url.target(), 11}
            , Detail::RequestExtensions{}
        {
            this->url(std::move(url));
        }

        /**
         * @brief Returns the complete url including userinfo.
         */
        Url const& url() const
        {
            return url_;
        }

        Request<BodyT>& url(Url url)
        {
            url_ = std::move(url);
            this->target(url_.target());
            auto host = url_.hostAsString();
            if (url_.authority.remote.port)
                host += ":" + std::to_string(*url_.authority.remote.port);
            if (host.empty())
                this->erase(boost::beast::http::field::host);
            else
                this->set(boost::beast::http::field::host, host);
            return *this;
        }

        /**
         * @brief Replaces all values of the field. The new value is not sensitive.
         */
        Request<BodyT>& setHeader(boost::beast::http::field field, std::string value)
        {
            this->set(field, std::move(value));
            sensitiveFields_.erase(std::string{boost::beast::http::to_string(field)});
            return *this;
        }

        /**
         * @brief Replaces all values of the field and remembers whether the value is sensitive.
         */
        Request<BodyT>& setHeader(boost::beast::http::field field, HeaderValue const& value)
        {
            this->set(field, value.value());
            if (value.sensitive())
                sensitiveFields_.insert(std::string{boost::beast::http::to_string(field)});
            else
                sensitiveFields_.erase(std::string{boost::beast::http::to_string(field)});
            return *this;
        }

        /**
         * @brief Returns the first value of the field, if present.
         */
        std::optional<HeaderValue> header(boost::beast::http::field field) const
        {
            auto iter = this->find(field);
            if (iter == std::end(*this))
                return std::nullopt;
            return HeaderValue{std::string{iter->value()}, isSensitive(iter->name_string())};
        }

        bool isSensitive(boost::beast::http::field field) const
        {
            return isSensitive(boost::beast::http::to_string(field));
        }

        bool isSensitive(boost::beast::string_view name) const
        {
            return sensitiveFields_.find(std::string{name}) != std::end(sensitiveFields_);
        }

        /**
         * @brief Renders all headers as "Name: value" lines. Sensitive values are replaced.
         */
        std::string headersAsString() const
        {
            std::stringstream result;
            for (auto const& field : *this)
            {
                result << field.name_string() << ": ";
                if (isSensitive(field.name_string()))
                    result << "Sensitive";
                else
                    result << field.value();
                result << "\r\n";
            }
            return result.str();
        }
    };

    /**
     * @brief Prints the request line and headers. Never prints sensitive header values or url credentials.
     */
    template <typename StreamT, typename BodyT>
    StreamT& operator<<(StreamT& stream, Request<BodyT> const& request)
    {
        stream << request.method_string() << ' ' << request.target() << " HTTP/" << request.version() / 10 << '.'
               << request.version() % 10 << "\r\n"
               << request.headersAsString();
        return stream;
    }

    using EmptyBodyRequest = Request<boost::beast::http::empty_body>;
}
