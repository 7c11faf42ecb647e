/*
Chartwell — ChartOrchestrator
Role: Owns the price and oscillator panes and runs one destroy-then-mount-then-layer cycle per Dataset.
Inputs/Outputs: Takes Datasets (announce/reconcile), widths and zoom commands; emits panesChanged and renderSkipped.
Threading: GUI thread only.
Performance: A cycle rebuilds layers for the whole dataset; nothing is diffed.
Integration: Driven by LifecycleBinding; MainWindow forwards the zoom buttons.
Observability: Reconcile, skip and stale-drop decisions logged via cwLog_Render / cwLog_Debug.
Related: ChartOrchestrator.cpp, PaneController.hpp, LifecycleBinding.hpp, DatasetValidation.hpp.
Assumptions: The containers and the surface factory outlive the orchestrator.
*/
#pragma once
#include <QObject>
#include <QString>
#include <vector>
#include "ChartPalette.hpp"
#include "PaneController.hpp"
#include "marketdata/model/SeriesData.h"

class ISurfaceFactory;
class IPaneContainer;

struct ChartLayout {
    int priceHeight = 400;
    int oscillatorHeight = 120;
    ChartPalette palette;
};

class ChartOrchestrator : public QObject {
    Q_OBJECT

public:
    static constexpr double kOverboughtLevel = 70.0;
    static constexpr double kOversoldLevel = 30.0;

    ChartOrchestrator(ISurfaceFactory& factory,
                      const IPaneContainer& priceContainer,
                      const IPaneContainer& oscillatorContainer,
                      ChartLayout layout = {},
                      QObject* parent = nullptr);
    ~ChartOrchestrator() override;

    // Marks dataset as the latest one; reconcile ignores anything else afterwards.
    void announce(DatasetPtr dataset);
    void reconcile(const DatasetPtr& dataset);

    void resizeAll(int width);
    void teardown();

    void zoomIn();
    void zoomOut();
    void fitContent();

    // Null when the pane is not mounted
    PaneController* pane(PaneId id) const;
    size_t mountedPaneCount() const;
    DatasetPtr renderedDataset() const { return m_rendered; }
    const ChartLayout& layout() const { return m_layout; }

    PaneLayers buildPriceLayers(const Dataset& dataset) const;
    PaneLayers buildOscillatorLayers(const Dataset& dataset) const;

signals:
    void panesChanged();
    void renderSkipped(const QString& reason);

private:
    PaneHandle mountPane(PaneId id, const IPaneContainer& container, const PaneOptions& options);
    PaneOptions priceOptions() const;
    PaneOptions oscillatorOptions() const;
    void destroyPanes();
    void linkTimeRanges();
    void unlinkTimeRanges();
    void skip(const QString& reason);
    PaneController* primaryPane() const;

    ISurfaceFactory& m_factory;
    const IPaneContainer& m_priceContainer;
    const IPaneContainer& m_oscillatorContainer;
    ChartLayout m_layout;

    PaneHandle m_pricePane;
    PaneHandle m_oscillatorPane;
    std::vector<QMetaObject::Connection> m_links;

    DatasetPtr m_latest;
    bool m_hasAnnouncement = false;
    DatasetPtr m_rendered;
};
