#include "auth/remote_backend.hpp"
#include "logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <format>

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

namespace auth
{

std::expected<RemoteBackend::Endpoint, std::string> RemoteBackend::parse_url(std::string_view url)
{
    constexpr std::string_view scheme = "http://";
    if (url.starts_with("https://"))
    {
        return std::unexpected("https is not supported; terminate TLS in front of the backend");
    }
    if (!url.starts_with(scheme))
    {
        return std::unexpected(std::format("Unsupported backend URL: {}", url));
    }
    url.remove_prefix(scheme.size());

    Endpoint out;
    auto slash = url.find('/');
    auto authority = url.substr(0, slash);
    if (slash != std::string_view::npos)
    {
        out.base_path = std::string(url.substr(slash));
        while (out.base_path.ends_with('/'))
        {
            out.base_path.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos)
    {
        out.host = std::string(authority.substr(0, colon));
        out.port = std::string(authority.substr(colon + 1));
        if (out.port.empty() || out.port.find_first_not_of("0123456789") != std::string::npos)
        {
            return std::unexpected(std::format("Invalid port in backend URL: {}", out.port));
        }
    }
    else
    {
        out.host = std::string(authority);
        out.port = "80";
    }

    if (out.host.empty())
    {
        return std::unexpected("Backend URL has no host");
    }
    return out;
}

std::expected<RemoteBackend, std::string> RemoteBackend::create(std::string_view base_url, std::chrono::seconds timeout)
{
    auto ep = parse_url(base_url);
    if (!ep)
    {
        return std::unexpected(ep.error());
    }
    return RemoteBackend(std::move(*ep), timeout);
}

RemoteBackend::RemoteBackend(Endpoint e, std::chrono::seconds t)
    : ep(std::move(e))
    , timeout(t)
{
}

BackendResponse RemoteBackend::interpret(int status, std::string_view body)
{
    BackendResponse out;
    out.status = status;
    out.success = status >= 200 && status < 300;
    out.message = "Request completed";

    boost::system::error_code ec;
    auto jv = json::parse(body, ec);
    if (ec || !jv.is_object())
    {
        if (out.success)
        {
            out.success = false;
            out.message = "Invalid response from server";
        }
        else
        {
            out.message = std::format("Request failed with status {}", status);
        }
        return out;
    }

    auto& obj = jv.as_object();
    if (auto it = obj.find("message"); it != obj.end() && it->value().is_string())
    {
        out.message = std::string(it->value().as_string());
    }
    if (auto it = obj.find("success"); it != obj.end() && it->value().is_bool() && !it->value().as_bool())
    {
        out.success = false;
    }

    if (auto it = obj.find("data"); it != obj.end() && it->value().is_object())
    {
        out.data = it->value().as_object();
    }
    else
    {
        out.data = std::move(obj);
        out.data.erase("success");
        out.data.erase("message");
    }
    return out;
}

BackendResponse RemoteBackend::request(http::verb method, std::string_view path,
                                       const json::object* body, std::string_view device_id)
{
    auto target = ep.base_path + std::string(path);
    try
    {
        boost::asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        stream.expires_after(timeout);
        stream.connect(resolver.resolve(ep.host, ep.port));

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, ep.host);
        req.set(http::field::user_agent, "gatehouse");
        req.set(http::field::accept, "application/json");
        if (!device_id.empty())
        {
            req.set("X-Device-ID", std::string(device_id));
        }
        if (body)
        {
            req.set(http::field::content_type, "application/json");
            req.body() = json::serialize(*body);
        }
        req.prepare_payload();

        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected)
        {
            LOG_DEBUG("Backend socket shutdown: {}", ec.message());
        }

        LOG_DEBUG("{} {} -> {}", std::string(http::to_string(method)), target, res.result_int());
        return interpret(static_cast<int>(res.result_int()), res.body());
    }
    catch (const beast::system_error& e)
    {
        LOG_WARN("{} {} failed: {}", std::string(http::to_string(method)), target, e.code().message());
        return BackendResponse::error(0, std::format("Network error: {}", e.code().message()));
    }
}

bool RemoteBackend::reachable()
{
    return request(http::verb::get, "/health", nullptr, "").success;
}

BackendResponse RemoteBackend::login(std::string_view email, std::string_view password, std::string_view device_id)
{
    json::object body{
        {"email", email},
        {"password", password}
    };
    return request(http::verb::post, "/auth/login", &body, device_id);
}

BackendResponse RemoteBackend::register_user(std::string_view name, std::string_view email, std::string_view password)
{
    json::object body{
        {"name", name},
        {"email", email},
        {"password", password}
    };
    return request(http::verb::post, "/auth/register", &body, "");
}

BackendResponse RemoteBackend::get_user(std::string_view user_id)
{
    return request(http::verb::get, std::format("/user/{}", user_id), nullptr, "");
}

BackendResponse RemoteBackend::refresh(std::string_view refresh_token, std::string_view device_id)
{
    json::object body{
        {"refresh_token", refresh_token}
    };
    return request(http::verb::post, "/auth/refresh", &body, device_id);
}

}
