#pragma once
/*
Chartwell — BeastHttpTransport
Role: One-shot HTTP GETs against the analytics backend over plain TCP or TLS.
Inputs/Outputs: Takes an HttpRequest; reports an HttpResponse or an error string via callbacks.
Threading: Owns an io_context and a single worker thread; callbacks run on that thread.
Performance: One connection per request; the backend is queried once per symbol change or refresh.
Integration: Injected into AnalyticsClient as its HttpTransport.
Observability: Connection and protocol failures are logged under chartwell.data.
Related: HttpTransport.hpp, AnalyticsClient.hpp.
Assumptions: Requests still in flight at destruction are abandoned without a callback.
*/
#include "HttpTransport.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <optional>
#include <thread>

namespace net = boost::asio;
namespace ssl = net::ssl;

class BeastHttpTransport : public HttpTransport {
public:
    BeastHttpTransport();
    ~BeastHttpTransport() override;

    void get(HttpRequest request, ResponseCb onResponse, ErrorCb onError) override;

    void start();
    void stop();

    BeastHttpTransport(const BeastHttpTransport&) = delete;
    BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

private:
    void run();

    net::io_context m_ioc;
    ssl::context    m_sslCtx{ssl::context::tlsv12_client};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> m_workGuard;
    std::thread     m_ioThread;
    bool            m_running = false;
};
