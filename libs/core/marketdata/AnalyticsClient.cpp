#include "AnalyticsClient.hpp"
#include "ChartwellLogging.hpp"
#include "dispatch/DatasetParser.hpp"
#include "http/HttpTransport.hpp"
#include <QMetaObject>
#include <QPointer>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace {

std::string describeHttpFailure(const HttpResponse& response) {
    // Backend errors carry {"message": "..."} or {"error": "..."}
    const auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_object()) {
        for (const char* key : {"message", "error"}) {
            auto it = body.find(key);
            if (it != body.end() && it->is_string()) {
                return fmt::format("HTTP {}: {}", response.status, it->get<std::string>());
            }
        }
    }
    return fmt::format("HTTP {}", response.status);
}

} // namespace

AnalyticsClient::AnalyticsClient(HttpTransport& transport, ApiConfig api, QObject* parent)
    : DatasetFeed(parent)
    , m_transport(transport)
    , m_api(std::move(api))
{
    qRegisterMetaType<DatasetPtr>("DatasetPtr");
}

AnalyticsClient::~AnalyticsClient() = default;

void AnalyticsClient::requestSymbol(const QString& symbol) {
    const QString normalized = symbol.trimmed().toUpper();
    if (normalized.isEmpty()) {
        cwLog_Debug("Ignoring empty symbol request");
        return;
    }

    const bool changed = normalized != m_symbol;
    m_symbol = normalized;
    ++m_generation;

    if (changed) {
        // Old symbol's chart must not linger while the new one loads
        publish(nullptr);
    }
    issue();
}

void AnalyticsClient::refresh() {
    if (m_symbol.isEmpty()) return;
    ++m_generation;
    issue();
}

void AnalyticsClient::issue() {
    m_inFlight = true;
    emit fetchStarted(m_symbol);

    HttpRequest request;
    request.host = m_api.host;
    request.port = std::to_string(m_api.port);
    request.target = m_api.targetFor(m_symbol.toStdString());
    request.useTls = m_api.tls;
    request.timeout = std::chrono::seconds(m_api.timeoutSeconds);

    cwLog_Data("Fetching" << m_symbol << "generation" << static_cast<qulonglong>(m_generation)
               << QString::fromStdString(request.target));

    const uint64_t generation = m_generation;
    QPointer<AnalyticsClient> self(this);

    m_transport.get(std::move(request),
        [self, generation](HttpResponse response) {
            // Transport thread: parse here, hand the result to the GUI thread
            if (!response.ok()) {
                const QString message = QString::fromStdString(describeHttpFailure(response));
                QMetaObject::invokeMethod(self, [self, generation, message]{
                    if (!self) return;
                    self->fail(generation, message);
                }, Qt::QueuedConnection);
                return;
            }
            try {
                DatasetPtr dataset = DatasetParser::parse(response.body);
                QMetaObject::invokeMethod(self, [self, generation, dataset]{
                    if (!self) return;
                    self->deliver(generation, dataset);
                }, Qt::QueuedConnection);
            } catch (const DatasetParseError& e) {
                const QString message = QString("Malformed analytics payload: %1").arg(e.what());
                QMetaObject::invokeMethod(self, [self, generation, message]{
                    if (!self) return;
                    self->fail(generation, message);
                }, Qt::QueuedConnection);
            }
        },
        [self, generation](std::string error) {
            const QString message = QString::fromStdString(error);
            QMetaObject::invokeMethod(self, [self, generation, message]{
                if (!self) return;
                self->fail(generation, message);
            }, Qt::QueuedConnection);
        });
}

void AnalyticsClient::deliver(uint64_t generation, DatasetPtr dataset) {
    if (generation != m_generation) {
        cwLog_Debug("Dropping stale response, generation" << static_cast<qulonglong>(generation)
                    << "current" << static_cast<qulonglong>(m_generation));
        return;
    }
    m_inFlight = false;
    cwLog_Data("Fetched" << m_symbol << static_cast<qulonglong>(dataset->candles.size()) << "candles,"
               << static_cast<qulonglong>(dataset->patterns.size()) << "patterns");
    publish(std::move(dataset));
    emit fetchFinished(m_symbol);
}

void AnalyticsClient::fail(uint64_t generation, const QString& message) {
    if (generation != m_generation) {
        cwLog_Debug("Dropping stale failure:" << message);
        return;
    }
    m_inFlight = false;
    cwLog_Warning("Fetch failed for" << m_symbol << ":" << message);
    emit fetchFailed(message);
}
