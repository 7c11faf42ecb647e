/*
Chartwell — LifecycleBinding
Role: Connects a DatasetFeed and a container resize source to the ChartOrchestrator.
Inputs/Outputs: Feed emissions become announce+reconcile cycles; resize widths become resizeAll calls.
Threading: GUI thread only.
Performance: Cycles are serialized; resizes arriving mid-cycle collapse to the last width.
Integration: Owned by MainWindow next to the orchestrator; bind() after construction, unbind() before teardown.
Observability: Bind/unbind and deferred work logged via cwLog_Render.
Related: LifecycleBinding.cpp, ChartOrchestrator.hpp, IResizeSource.hpp, DatasetFeed.hpp.
Assumptions: The orchestrator and resize source outlive the binding.
*/
#pragma once
#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <deque>
#include <optional>
#include "IResizeSource.hpp"
#include "marketdata/DatasetFeed.hpp"

class ChartOrchestrator;

class LifecycleBinding : public QObject {
    Q_OBJECT

public:
    LifecycleBinding(ChartOrchestrator& orchestrator, IResizeSource& resizeSource, QObject* parent = nullptr);
    ~LifecycleBinding() override;

    // Binding the already bound feed is a no-op; binding another feed rebinds.
    void bind(DatasetFeed& feed);
    void unbind();

    bool isBound() const { return m_bound; }
    bool isCycling() const { return m_cycling; }
    size_t pendingCycles() const { return m_pending.size(); }

private:
    void onDatasetChanged(DatasetPtr dataset);
    void onResize(int width);
    void drain();

    ChartOrchestrator& m_orchestrator;
    IResizeSource& m_resizeSource;

    bool m_bound = false;
    QPointer<DatasetFeed> m_feed;
    QMetaObject::Connection m_feedConnection;
    std::optional<IResizeSource::SubscriptionId> m_resizeSubscription;

    std::deque<DatasetPtr> m_pending;
    std::optional<int> m_pendingWidth;
    bool m_cycling = false;
};
