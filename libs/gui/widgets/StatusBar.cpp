#include "StatusBar.hpp"
#include <QHBoxLayout>

StatusBar::StatusBar(QWidget* parent)
    : QWidget(parent)
{
    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 2, 8, 2);
    layout->setSpacing(12);

    // Left: fetch state
    m_stateLabel = new QLabel("Ready", this);
    m_stateLabel->setStyleSheet("QLabel { color: #94a3b8; font-size: 11px; }");
    layout->addWidget(m_stateLabel);

    layout->addStretch();

    // Right: quote and pane count
    m_symbolLabel = new QLabel(this);
    m_symbolLabel->setStyleSheet("QLabel { color: #e2e8f0; font-size: 11px; font-weight: bold; }");
    layout->addWidget(m_symbolLabel);

    m_priceLabel = new QLabel(this);
    m_priceLabel->setStyleSheet("QLabel { color: #e2e8f0; font-size: 11px; }");
    layout->addWidget(m_priceLabel);

    m_changeLabel = new QLabel(this);
    layout->addWidget(m_changeLabel);

    m_panesLabel = new QLabel("Panes: 0", this);
    m_panesLabel->setStyleSheet("QLabel { color: #64748b; font-size: 11px; }");
    layout->addWidget(m_panesLabel);

    setLayout(layout);
}

void StatusBar::setFetchState(FetchState state, const QString& detail) {
    m_state = state;
    switch (state) {
        case FetchState::Idle:
            m_stateLabel->setText("Ready");
            m_stateLabel->setStyleSheet("QLabel { color: #94a3b8; font-size: 11px; }");
            break;
        case FetchState::Loading:
            m_stateLabel->setText(QString("Analyzing %1...").arg(detail));
            m_stateLabel->setStyleSheet("QLabel { color: #60a5fa; font-size: 11px; }");
            break;
        case FetchState::Loaded:
            m_stateLabel->setText(QString("Loaded %1").arg(detail));
            m_stateLabel->setStyleSheet("QLabel { color: #22c55e; font-size: 11px; }");
            break;
        case FetchState::Failed:
            m_stateLabel->setText(QString("Error: %1").arg(detail));
            m_stateLabel->setStyleSheet("QLabel { color: #ef4444; font-size: 11px; }");
            break;
    }
}

void StatusBar::setQuote(const QString& symbol, std::optional<double> price, std::optional<double> change) {
    m_symbolLabel->setText(symbol);
    m_priceLabel->setText(price ? QString("$%1").arg(*price, 0, 'f', 2) : QString());

    if (!change) {
        m_changeLabel->clear();
        return;
    }
    // Change is a percentage; positive values get an explicit sign
    const QString color = *change >= 0.0 ? "#22c55e" : "#ef4444";
    m_changeLabel->setText(QString("%1%2%").arg(*change >= 0.0 ? "+" : "").arg(*change, 0, 'f', 2));
    m_changeLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 11px; }").arg(color));
}

void StatusBar::clearQuote() {
    m_symbolLabel->clear();
    m_priceLabel->clear();
    m_changeLabel->clear();
}

void StatusBar::setPaneCount(int panes) {
    m_panesLabel->setText(QString("Panes: %1").arg(panes));
}
