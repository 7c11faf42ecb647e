#pragma once
#include <QObject>
#include "model/SeriesData.h"

// Source of Datasets for the chart. A null DatasetPtr means "no data" (loading or cleared).
class DatasetFeed : public QObject {
    Q_OBJECT

public:
    explicit DatasetFeed(QObject* parent = nullptr) : QObject(parent) {}
    ~DatasetFeed() override = default;

    DatasetPtr current() const { return m_current; }

signals:
    void datasetChanged(DatasetPtr dataset);

protected:
    void publish(DatasetPtr dataset) {
        m_current = std::move(dataset);
        emit datasetChanged(m_current);
    }

private:
    DatasetPtr m_current;
};
