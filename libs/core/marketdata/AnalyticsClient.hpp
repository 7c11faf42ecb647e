#pragma once
/*
Chartwell — AnalyticsClient
Role: Fetches the analytics payload for one symbol at a time and publishes it as a Dataset.
Inputs/Outputs: Takes symbols from the UI; emits datasetChanged, fetchStarted, fetchFinished, fetchFailed.
Threading: Public API and all signals on the GUI thread; payload parsing runs on the transport thread.
Performance: One request per symbol change or refresh; superseded responses never reach the feed.
Integration: Owned by MainWindow; LifecycleBinding subscribes to it as the chart's DatasetFeed.
Observability: Fetch start/finish/failure and stale drops logged under chartwell.data.
Related: DatasetFeed.hpp, HttpTransport.hpp, DatasetParser.hpp, ChartConfig.hpp.
Assumptions: The HttpTransport outlives this object.
*/
#include <QString>
#include <cstdint>
#include "DatasetFeed.hpp"
#include "config/ChartConfig.hpp"

class HttpTransport;

class AnalyticsClient : public DatasetFeed {
    Q_OBJECT

public:
    AnalyticsClient(HttpTransport& transport, ApiConfig api, QObject* parent = nullptr);
    ~AnalyticsClient() override;

    void requestSymbol(const QString& symbol);
    void refresh();

    QString currentSymbol() const { return m_symbol; }
    uint64_t generation() const { return m_generation; }
    bool isFetching() const { return m_inFlight; }

    AnalyticsClient(const AnalyticsClient&) = delete;
    AnalyticsClient& operator=(const AnalyticsClient&) = delete;

signals:
    void fetchStarted(const QString& symbol);
    void fetchFinished(const QString& symbol);
    void fetchFailed(const QString& message);

private:
    void issue();
    void deliver(uint64_t generation, DatasetPtr dataset);
    void fail(uint64_t generation, const QString& message);

    HttpTransport& m_transport;
    ApiConfig      m_api;
    QString        m_symbol;
    uint64_t       m_generation = 0;
    bool           m_inFlight = false;
};
