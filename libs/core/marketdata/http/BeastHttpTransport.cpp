#include "BeastHttpTransport.hpp"
#include "ChartwellLogging.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <memory>
#include <type_traits>
#include <QString>

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

// One request/response exchange. Keeps itself alive through the handler chain.
template <typename Stream>
class HttpSession : public std::enable_shared_from_this<HttpSession<Stream>> {
public:
    static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

    template <typename... StreamArgs>
    HttpSession(net::io_context& ioc,
                HttpRequest request,
                HttpTransport::ResponseCb onResponse,
                HttpTransport::ErrorCb onError,
                StreamArgs&&... streamArgs)
        : m_strand(net::make_strand(ioc))
        , m_resolver(m_strand)
        , m_stream(m_strand, std::forward<StreamArgs>(streamArgs)...)
        , m_request(std::move(request))
        , m_onResponse(std::move(onResponse))
        , m_onError(std::move(onError))
    {}

    void run() {
        m_req.version(11);
        m_req.method(http::verb::get);
        m_req.target(m_request.target);
        m_req.set(http::field::host, m_request.host);
        m_req.set(http::field::user_agent, "chartwell");
        m_req.set(http::field::accept, "application/json");

        if constexpr (kTls) {
            if (!SSL_set_tlsext_host_name(m_stream.native_handle(), m_request.host.c_str())) {
                beast::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                return fail("sni", ec);
            }
            if (!SSL_set1_host(m_stream.native_handle(), m_request.host.c_str())) {
                beast::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                return fail("verify host", ec);
            }
            m_stream.set_verify_mode(ssl::verify_peer);
        }

        m_resolver.async_resolve(m_request.host, m_request.port,
            beast::bind_front_handler(&HttpSession::onResolve, this->shared_from_this()));
    }

private:
    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);
        beast::get_lowest_layer(m_stream).expires_after(m_request.timeout);
        beast::get_lowest_layer(m_stream).async_connect(results,
            beast::bind_front_handler(&HttpSession::onConnect, this->shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail("connect", ec);
        if constexpr (kTls) {
            m_stream.async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&HttpSession::onHandshake, this->shared_from_this()));
        } else {
            sendRequest();
        }
    }

    void onHandshake(beast::error_code ec) {
        if (ec) return fail("tls handshake", ec);
        sendRequest();
    }

    void sendRequest() {
        beast::get_lowest_layer(m_stream).expires_after(m_request.timeout);
        http::async_write(m_stream, m_req,
            beast::bind_front_handler(&HttpSession::onWrite, this->shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) return fail("write", ec);
        http::async_read(m_stream, m_buffer, m_res,
            beast::bind_front_handler(&HttpSession::onRead, this->shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t bytes) {
        if (ec) return fail("read", ec);
        cwLog_Debug("HTTP" << m_res.result_int() << "for" << QString::fromStdString(m_request.target)
                    << "(" << static_cast<qulonglong>(bytes) << "bytes)");

        HttpResponse response;
        response.status = static_cast<int>(m_res.result_int());
        response.body = std::move(m_res.body());
        shutdown();
        if (m_onResponse) m_onResponse(std::move(response));
    }

    void shutdown() {
        beast::error_code ec;
        beast::get_lowest_layer(m_stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            cwLog_Debug("Socket shutdown:" << QString::fromStdString(ec.message()));
        }
    }

    void fail(const char* stage, const beast::error_code& ec) {
        const std::string message = fmt::format("{} {}:{} failed: {}",
                                                stage, m_request.host, m_request.port, ec.message());
        cwLog_Data("HTTP" << QString::fromStdString(message));
        if (m_onError) m_onError(message);
    }

    net::strand<net::io_context::executor_type> m_strand;
    tcp::resolver m_resolver;
    Stream m_stream;
    beast::flat_buffer m_buffer;
    http::request<http::empty_body> m_req;
    http::response<http::string_body> m_res;

    HttpRequest m_request;
    HttpTransport::ResponseCb m_onResponse;
    HttpTransport::ErrorCb m_onError;
};

} // namespace

BeastHttpTransport::BeastHttpTransport() {
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(ssl::verify_peer);
    start();
}

BeastHttpTransport::~BeastHttpTransport() {
    stop();
}

void BeastHttpTransport::start() {
    if (m_running) return;
    m_running = true;
    m_workGuard.emplace(m_ioc.get_executor());
    m_ioc.restart();
    m_ioThread = std::thread(&BeastHttpTransport::run, this);
}

void BeastHttpTransport::stop() {
    if (!m_running) return;
    m_running = false;
    m_workGuard.reset();
    m_ioc.stop();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }
    cwLog_Data("HTTP transport stopped");
}

void BeastHttpTransport::run() {
    cwLog_Data("HTTP io_context running");
    m_ioc.run();
    cwLog_Data("HTTP io_context stopped");
}

void BeastHttpTransport::get(HttpRequest request, ResponseCb onResponse, ErrorCb onError) {
    if (request.useTls) {
        std::make_shared<HttpSession<beast::ssl_stream<beast::tcp_stream>>>(
            m_ioc, std::move(request), std::move(onResponse), std::move(onError), m_sslCtx)->run();
    } else {
        std::make_shared<HttpSession<beast::tcp_stream>>(
            m_ioc, std::move(request), std::move(onResponse), std::move(onError))->run();
    }
}
