#include "util/reachability.hpp"

#include <utility>

#include <boost/asio.hpp>

namespace ferry::util {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

bool tcpReachable(const Endpoint& ep, const std::chrono::milliseconds timeout) {
    if (ep.host.empty() || ep.port == 0) return false;

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    tcp::socket socket(ioc);
    bool connected = false;

    resolver.async_resolve(ep.host, std::to_string(ep.port),
        [&](const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
            if (ec) return;
            asio::async_connect(socket, results,
                [&](const boost::system::error_code& cec, const tcp::endpoint&) { connected = !cec; });
        });

    ioc.run_for(timeout);
    if (!ioc.stopped()) ioc.stop();

    boost::system::error_code ignored;
    socket.close(ignored);
    return connected;
}

std::optional<Endpoint> smbEndpointOf(const std::filesystem::path& path) {
    auto s = path.string();
    if (s.size() < 3) return std::nullopt;
    const bool unc = (s[0] == '/' && s[1] == '/') || (s[0] == '\\' && s[1] == '\\');
    if (!unc) return std::nullopt;

    s = s.substr(2);
    const auto end = s.find_first_of("/\\");
    auto host = s.substr(0, end);
    if (host.empty()) return std::nullopt;
    return Endpoint{std::move(host), 445};
}

}
