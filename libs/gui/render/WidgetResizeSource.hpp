#pragma once
#include <QObject>
#include <QPointer>
#include <map>
#include "IResizeSource.hpp"

class QWidget;

// IResizeSource over a Qt event filter on one widget
class WidgetResizeSource : public QObject, public IResizeSource {
    Q_OBJECT

public:
    explicit WidgetResizeSource(QWidget* watched, QObject* parent = nullptr);
    ~WidgetResizeSource() override;

    SubscriptionId subscribe(Callback callback) override;
    void unsubscribe(SubscriptionId id) override;

    size_t subscriberCount() const { return m_subscribers.size(); }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    QPointer<QWidget> m_watched;
    std::map<SubscriptionId, Callback> m_subscribers;
    SubscriptionId m_nextId = 1;
};
