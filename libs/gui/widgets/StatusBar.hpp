#pragma once

#include <QWidget>
#include <QLabel>
#include <optional>

/**
 * Bottom status strip for the Chartwell window.
 * Shows fetch state on the left and the symbol quote (price, change) on the right.
 */
class StatusBar : public QWidget {
    Q_OBJECT

public:
    enum class FetchState {
        Idle,
        Loading,
        Loaded,
        Failed
    };

    explicit StatusBar(QWidget* parent = nullptr);
    ~StatusBar() override = default;

    void setFetchState(FetchState state, const QString& detail = QString());
    void setQuote(const QString& symbol, std::optional<double> price, std::optional<double> change);
    void clearQuote();
    void setPaneCount(int panes);

    FetchState fetchState() const { return m_state; }
    QString stateText() const { return m_stateLabel->text(); }
    QString changeText() const { return m_changeLabel->text(); }

private:
    QLabel* m_stateLabel;
    QLabel* m_symbolLabel;
    QLabel* m_priceLabel;
    QLabel* m_changeLabel;
    QLabel* m_panesLabel;

    FetchState m_state = FetchState::Idle;
};
