#include <dspool/pool/liveness_probe.h>

#include <dspool/core/log.h>
#include <dspool/pool/endpoint.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <string>

namespace dspool::pool {
namespace {
using tcp = boost::asio::ip::tcp;

struct ProbeOpState {
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    tcp::socket socket{ioc};
    boost::asio::steady_timer timer{ioc};
    boost::system::error_code ec;
    bool timed_out = false;
    bool connected = false;
};

} // namespace

TcpLivenessProbe::TcpLivenessProbe(std::chrono::milliseconds timeout) : timeout_(timeout) {
    if (timeout_.count() < 1) {
        timeout_ = std::chrono::milliseconds(1);
    }
}

bool TcpLivenessProbe::CheckAvailability(const Endpoint& endpoint) {
    ProbeOpState st;

    st.timer.expires_after(timeout_);
    st.timer.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        st.timed_out = true;
        st.resolver.cancel();
        boost::system::error_code ignored;
        st.socket.close(ignored);
    });

    st.resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
        [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                st.ec = ec;
                st.timer.cancel();
                return;
            }
            boost::asio::async_connect(st.socket, results, [&](const boost::system::error_code& ec, const tcp::endpoint&) {
                st.timer.cancel();
                if (ec) {
                    st.ec = ec;
                    return;
                }
                st.connected = true;
                boost::system::error_code ignored;
                st.socket.shutdown(tcp::socket::shutdown_both, ignored);
                st.socket.close(ignored);
            });
        });

    st.ioc.run();

    if (st.connected) {
        return true;
    }
    if (st.timed_out) {
        dspool::log::debug("liveness probe for {} timed out after {}ms", endpoint.ToString(), timeout_.count());
    } else {
        dspool::log::debug("liveness probe for {} failed: {}", endpoint.ToString(), st.ec.message());
    }
    return false;
}

} // namespace dspool::pool
