#pragma once

#include <QFrame>
#include <QLabel>
#include "render/IPaneSurface.hpp"

/**
 * Slot widget a pane surface is mounted into.
 */
class PaneContainer : public QWidget, public IPaneContainer {
    Q_OBJECT

public:
    PaneContainer(int paneHeight, QWidget* parent = nullptr);

    int availableWidth() const override { return width(); }
    QWidget* hostWidget() const override { return const_cast<PaneContainer*>(this); }
};

/**
 * The chart area: a price container above an oscillator container, each with a title.
 * Owns only the containers; surfaces inside them belong to the chart's pane controllers.
 */
class ChartView : public QFrame {
    Q_OBJECT

public:
    ChartView(int priceHeight, int oscillatorHeight, QWidget* parent = nullptr);

    PaneContainer& priceContainer() const { return *m_priceContainer; }
    PaneContainer& oscillatorContainer() const { return *m_oscillatorContainer; }

    void setTitle(const QString& symbol);
    void setOscillatorVisible(bool visible);

private:
    QLabel* m_priceTitle;
    QLabel* m_oscillatorTitle;
    PaneContainer* m_priceContainer;
    PaneContainer* m_oscillatorContainer;
};
