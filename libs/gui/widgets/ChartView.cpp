#include "ChartView.hpp"
#include <QVBoxLayout>

PaneContainer::PaneContainer(int paneHeight, QWidget* parent)
    : QWidget(parent)
{
    setMinimumHeight(paneHeight);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
    setFixedHeight(paneHeight);
}

ChartView::ChartView(int priceHeight, int oscillatorHeight, QWidget* parent)
    : QFrame(parent)
{
    setObjectName("chartView");

    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(4);

    m_priceTitle = new QLabel("Price", this);
    m_priceTitle->setObjectName("paneTitle");
    layout->addWidget(m_priceTitle);

    m_priceContainer = new PaneContainer(priceHeight, this);
    m_priceContainer->setObjectName("priceContainer");
    layout->addWidget(m_priceContainer);

    m_oscillatorTitle = new QLabel("RSI (14)", this);
    m_oscillatorTitle->setObjectName("paneTitle");
    layout->addWidget(m_oscillatorTitle);

    m_oscillatorContainer = new PaneContainer(oscillatorHeight, this);
    m_oscillatorContainer->setObjectName("oscillatorContainer");
    layout->addWidget(m_oscillatorContainer);

    layout->addStretch();
    setLayout(layout);
}

void ChartView::setTitle(const QString& symbol) {
    m_priceTitle->setText(symbol.isEmpty() ? QString("Price") : QString("%1 Price").arg(symbol));
}

void ChartView::setOscillatorVisible(bool visible) {
    // Only the title hides; the container keeps its width for later mounts
    m_oscillatorTitle->setVisible(visible);
}
