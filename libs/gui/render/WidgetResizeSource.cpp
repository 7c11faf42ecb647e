#include "WidgetResizeSource.hpp"
#include "ChartwellLogging.hpp"
#include <QEvent>
#include <QResizeEvent>
#include <QWidget>
#include <vector>

WidgetResizeSource::WidgetResizeSource(QWidget* watched, QObject* parent)
    : QObject(parent)
    , m_watched(watched)
{
    if (m_watched) {
        m_watched->installEventFilter(this);
    }
}

WidgetResizeSource::~WidgetResizeSource() {
    if (m_watched) {
        m_watched->removeEventFilter(this);
    }
}

IResizeSource::SubscriptionId WidgetResizeSource::subscribe(Callback callback) {
    const SubscriptionId id = m_nextId++;
    m_subscribers.emplace(id, std::move(callback));
    cwLog_Debug("Resize subscription" << static_cast<qulonglong>(id) << "added");
    return id;
}

void WidgetResizeSource::unsubscribe(SubscriptionId id) {
    if (m_subscribers.erase(id) > 0) {
        cwLog_Debug("Resize subscription" << static_cast<qulonglong>(id) << "removed");
    }
}

bool WidgetResizeSource::eventFilter(QObject* watched, QEvent* event) {
    if (watched == m_watched && event->type() == QEvent::Resize) {
        const int width = static_cast<QResizeEvent*>(event)->size().width();
        // Callbacks may unsubscribe while we iterate
        std::vector<SubscriptionId> ids;
        ids.reserve(m_subscribers.size());
        for (const auto& entry : m_subscribers) ids.push_back(entry.first);
        for (SubscriptionId id : ids) {
            auto it = m_subscribers.find(id);
            if (it != m_subscribers.end() && it->second) {
                auto callback = it->second;
                callback(width);
            }
        }
    }
    return QObject::eventFilter(watched, event);
}
