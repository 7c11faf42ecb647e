#include "ChartOrchestrator.hpp"
#include "AnnotationMapper.hpp"
#include "ChartwellLogging.hpp"
#include "ISurfaceFactory.hpp"
#include "SeriesAdapter.hpp"
#include "marketdata/model/DatasetValidation.hpp"

ChartOrchestrator::ChartOrchestrator(ISurfaceFactory& factory,
                                     const IPaneContainer& priceContainer,
                                     const IPaneContainer& oscillatorContainer,
                                     ChartLayout layout,
                                     QObject* parent)
    : QObject(parent)
    , m_factory(factory)
    , m_priceContainer(priceContainer)
    , m_oscillatorContainer(oscillatorContainer)
    , m_layout(std::move(layout))
{
}

ChartOrchestrator::~ChartOrchestrator() {
    unlinkTimeRanges();
    m_oscillatorPane.reset();
    m_pricePane.reset();
}

void ChartOrchestrator::announce(DatasetPtr dataset) {
    m_latest = std::move(dataset);
    m_hasAnnouncement = true;
}

void ChartOrchestrator::reconcile(const DatasetPtr& dataset) {
    if (m_hasAnnouncement && dataset != m_latest) {
        cwLog_Debug("Ignoring stale dataset"
                    << (dataset ? QString::fromStdString(dataset->symbol) : QString("<none>")));
        return;
    }

    destroyPanes();
    m_rendered = dataset;

    if (!dataset || dataset->empty()) {
        cwLog_Render("Reconcile: no data, holding no panes");
        emit panesChanged();
        return;
    }

    const auto report = DatasetValidation::validate(*dataset);
    if (report.candleError) {
        skip(QString("Candles rejected: %1").arg(QString::fromStdString(*report.candleError)));
        emit panesChanged();
        return;
    }
    if (report.bandError) {
        skip(QString("Price pane skipped: %1").arg(QString::fromStdString(*report.bandError)));
        emit panesChanged();
        return;
    }

    m_pricePane = mountPane(PaneId::Price, m_priceContainer, priceOptions());
    if (m_pricePane) {
        m_pricePane->setLayers(buildPriceLayers(*dataset));
    }

    if (dataset->oscillatorSeries) {
        if (report.oscillatorError) {
            skip(QString("Oscillator pane skipped: %1").arg(QString::fromStdString(*report.oscillatorError)));
        } else {
            m_oscillatorPane = mountPane(PaneId::Oscillator, m_oscillatorContainer, oscillatorOptions());
            if (m_oscillatorPane) {
                m_oscillatorPane->setLayers(buildOscillatorLayers(*dataset));
            }
        }
    }

    if (m_pricePane) {
        m_pricePane->fitContent();
        if (m_oscillatorPane) {
            m_oscillatorPane->viewState()->followTimeAxis(*m_pricePane->viewState());
        }
    } else if (m_oscillatorPane) {
        m_oscillatorPane->fitContent();
    }
    linkTimeRanges();

    cwLog_Render("Reconciled" << QString::fromStdString(dataset->symbol)
                 << static_cast<qulonglong>(dataset->candles.size()) << "candles,"
                 << static_cast<qulonglong>(mountedPaneCount()) << "panes");
    emit panesChanged();
}

PaneHandle ChartOrchestrator::mountPane(PaneId id, const IPaneContainer& container, const PaneOptions& options) {
    auto pane = std::make_unique<PaneController>(id, m_factory);
    try {
        pane->mount(container, options);
    } catch (const PaneMountError& e) {
        skip(QString("Mount of %1 pane failed: %2").arg(QString::fromLatin1(paneName(id)), QString::fromUtf8(e.what())));
        return nullptr;
    }
    return pane;
}

PaneLayers ChartOrchestrator::buildPriceLayers(const Dataset& dataset) const {
    const auto& palette = m_layout.palette;
    PaneLayers layers;

    CandleStyle candleStyle;
    candleStyle.upColor = palette.candleUp;
    candleStyle.downColor = palette.candleDown;
    layers.series.emplace_back(SeriesAdapter::toCandleLayer(dataset.candles, candleStyle));

    if (dataset.bandOverlay && !dataset.bandOverlay->empty()) {
        const LineStyle edge{palette.bandEdge, 1.0, Qt::DashLine};
        const LineStyle middle{palette.bandMiddle, 1.0, Qt::DashLine};
        auto bands = SeriesAdapter::toBandLayers(*dataset.bandOverlay, edge, middle);
        layers.series.emplace_back(std::move(bands.upper));
        layers.series.emplace_back(std::move(bands.middle));
        layers.series.emplace_back(std::move(bands.lower));
    }

    if (!dataset.patterns.empty()) {
        layers.markers = AnnotationMapper::mapPatterns(dataset.patterns, dataset.lastTime(), palette);
    }
    return layers;
}

PaneLayers ChartOrchestrator::buildOscillatorLayers(const Dataset& dataset) const {
    const auto& palette = m_layout.palette;
    PaneLayers layers;
    if (!dataset.oscillatorSeries || dataset.oscillatorSeries->empty()) {
        return layers;
    }

    layers.series.emplace_back(SeriesAdapter::toLineLayer(*dataset.oscillatorSeries,
                                                          LineStyle{palette.oscillator, 2.0, Qt::SolidLine},
                                                          QStringLiteral("RSI")));
    layers.referenceLines.push_back({kOverboughtLevel, LineStyle{palette.overbought, 1.0, Qt::DashLine},
                                     QStringLiteral("Overbought")});
    layers.referenceLines.push_back({kOversoldLevel, LineStyle{palette.oversold, 1.0, Qt::DashLine},
                                     QStringLiteral("Oversold")});
    return layers;
}

PaneOptions ChartOrchestrator::priceOptions() const {
    PaneOptions options;
    options.name = QStringLiteral("Price");
    options.height = m_layout.priceHeight;
    options.timeAxisVisible = true;
    options.topMargin = 0.1;
    options.bottomMargin = 0.1;
    options.palette = m_layout.palette;
    return options;
}

PaneOptions ChartOrchestrator::oscillatorOptions() const {
    PaneOptions options;
    options.name = QStringLiteral("RSI");
    options.height = m_layout.oscillatorHeight;
    options.timeAxisVisible = false;
    options.topMargin = 0.1;
    options.bottomMargin = 0.1;
    options.palette = m_layout.palette;
    return options;
}

void ChartOrchestrator::linkTimeRanges() {
    unlinkTimeRanges();
    if (!m_pricePane || !m_oscillatorPane) return;

    PaneViewState* price = m_pricePane->viewState();
    PaneViewState* oscillator = m_oscillatorPane->viewState();

    // Both panes share one zoom state; setVisibleTimeRange ignores equal ranges, which ends the mirror loop
    m_links.push_back(connect(price, &PaneViewState::visibleTimeRangeChanged, this, [price, oscillator]{
        oscillator->followTimeAxis(*price);
    }));
    m_links.push_back(connect(oscillator, &PaneViewState::visibleTimeRangeChanged, this, [price, oscillator]{
        price->followTimeAxis(*oscillator);
    }));
}

void ChartOrchestrator::unlinkTimeRanges() {
    for (auto& link : m_links) {
        disconnect(link);
    }
    m_links.clear();
}

void ChartOrchestrator::destroyPanes() {
    unlinkTimeRanges();
    if (m_oscillatorPane) {
        m_oscillatorPane->destroy();
        m_oscillatorPane.reset();
    }
    if (m_pricePane) {
        m_pricePane->destroy();
        m_pricePane.reset();
    }
}

void ChartOrchestrator::resizeAll(int width) {
    if (width <= 0) {
        cwLog_Debug("Ignoring resize to" << width);
        return;
    }
    for (PaneController* pane : {m_pricePane.get(), m_oscillatorPane.get()}) {
        if (pane && pane->isMounted()) {
            pane->resize(width);
        }
    }
    cwLog_RenderN(20, "Resized panes to" << width);
}

void ChartOrchestrator::teardown() {
    const bool hadPanes = mountedPaneCount() > 0;
    destroyPanes();
    m_rendered.reset();
    m_latest.reset();
    m_hasAnnouncement = false;
    cwLog_Render("Chart torn down");
    if (hadPanes) {
        emit panesChanged();
    }
}

PaneController* ChartOrchestrator::primaryPane() const {
    if (m_pricePane) return m_pricePane.get();
    return m_oscillatorPane.get();
}

void ChartOrchestrator::zoomIn() {
    if (auto* pane = primaryPane()) pane->viewState()->zoomIn();
}

void ChartOrchestrator::zoomOut() {
    if (auto* pane = primaryPane()) pane->viewState()->zoomOut();
}

void ChartOrchestrator::fitContent() {
    if (auto* pane = primaryPane()) pane->fitContent();
}

PaneController* ChartOrchestrator::pane(PaneId id) const {
    const auto& handle = id == PaneId::Price ? m_pricePane : m_oscillatorPane;
    return handle && handle->isMounted() ? handle.get() : nullptr;
}

size_t ChartOrchestrator::mountedPaneCount() const {
    return (pane(PaneId::Price) ? 1 : 0) + (pane(PaneId::Oscillator) ? 1 : 0);
}

void ChartOrchestrator::skip(const QString& reason) {
    cwLog_Warning("Render skipped:" << reason);
    emit renderSkipped(reason);
}
