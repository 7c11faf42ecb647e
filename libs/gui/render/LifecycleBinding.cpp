#include "LifecycleBinding.hpp"
#include "ChartOrchestrator.hpp"
#include "ChartwellLogging.hpp"
#include <QScopeGuard>

LifecycleBinding::LifecycleBinding(ChartOrchestrator& orchestrator, IResizeSource& resizeSource, QObject* parent)
    : QObject(parent)
    , m_orchestrator(orchestrator)
    , m_resizeSource(resizeSource)
{
}

LifecycleBinding::~LifecycleBinding() {
    unbind();
}

void LifecycleBinding::bind(DatasetFeed& feed) {
    if (m_bound && m_feed == &feed) {
        return;
    }
    if (m_bound) {
        unbind();
    }

    m_feed = &feed;
    m_feedConnection = connect(&feed, &DatasetFeed::datasetChanged, this, &LifecycleBinding::onDatasetChanged);
    m_resizeSubscription = m_resizeSource.subscribe([this](int width) { onResize(width); });
    m_bound = true;
    cwLog_Render("Chart bound to dataset feed");

    if (DatasetPtr current = feed.current()) {
        onDatasetChanged(std::move(current));
    }
}

void LifecycleBinding::unbind() {
    if (!m_bound) {
        return;
    }
    m_bound = false;
    disconnect(m_feedConnection);
    m_feed = nullptr;
    if (m_resizeSubscription) {
        m_resizeSource.unsubscribe(*m_resizeSubscription);
        m_resizeSubscription.reset();
    }
    m_pending.clear();
    m_pendingWidth.reset();
    m_orchestrator.teardown();
    cwLog_Render("Chart unbound");
}

void LifecycleBinding::onDatasetChanged(DatasetPtr dataset) {
    if (!m_bound) return;
    m_orchestrator.announce(dataset);
    m_pending.push_back(std::move(dataset));
    if (m_cycling) {
        cwLog_Debug("Dataset arrived mid-cycle; queued" << static_cast<qulonglong>(m_pending.size()));
        return;
    }
    drain();
}

void LifecycleBinding::onResize(int width) {
    if (!m_bound) return;
    if (m_cycling) {
        m_pendingWidth = width;
        return;
    }
    m_orchestrator.resizeAll(width);
}

void LifecycleBinding::drain() {
    m_cycling = true;
    {
        auto done = qScopeGuard([this]{ m_cycling = false; });
        while (!m_pending.empty()) {
            DatasetPtr next = std::move(m_pending.front());
            m_pending.pop_front();
            m_orchestrator.reconcile(next);
        }
    }

    if (m_bound && m_pendingWidth) {
        const int width = *m_pendingWidth;
        m_pendingWidth.reset();
        cwLog_Render("Applying deferred resize" << width);
        m_orchestrator.resizeAll(width);
    }
}
