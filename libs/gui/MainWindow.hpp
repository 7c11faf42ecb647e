/*
Chartwell — MainWindow
Role: Top-level window: symbol entry, chart controls, two-pane chart, pattern summary and status bar.
Inputs/Outputs: Takes user input and ChartConfig; drives AnalyticsClient and shows its Datasets through the chart.
Threading: GUI thread; network results arrive as queued signals from AnalyticsClient.
Performance: UI setup is a one-time cost; each Dataset triggers one chart reconcile.
Integration: Instantiated in apps/chartwell_gui/main.cpp after the theme is applied.
Observability: Lifecycle logged via cwLog_App; render skips shown in the status bar.
Related: MainWindow.cpp, AnalyticsClient.hpp, ChartOrchestrator.hpp, LifecycleBinding.hpp, ChartView.hpp.
Assumptions: The transport, when injected, is not shared with other clients.
*/
#pragma once

#include <QMainWindow>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <memory>
#include "config/ChartConfig.hpp"
#include "marketdata/AnalyticsClient.hpp"
#include "marketdata/http/HttpTransport.hpp"
#include "render/ChartOrchestrator.hpp"
#include "render/LifecycleBinding.hpp"
#include "render/WidgetResizeSource.hpp"
#include "render/WidgetSurfaceFactory.hpp"
#include "widgets/ChartView.hpp"
#include "widgets/StatusBar.hpp"

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    // A null transport means the Boost.Beast HTTP transport
    explicit MainWindow(ChartConfig config,
                        std::unique_ptr<HttpTransport> transport = nullptr,
                        QWidget* parent = nullptr);
    ~MainWindow() override;

    AnalyticsClient& client() const { return *m_client; }
    ChartOrchestrator& orchestrator() const { return *m_orchestrator; }
    ChartView& chartView() const { return *m_chartView; }
    StatusBar& statusStrip() const { return *m_statusBar; }
    QLineEdit& symbolInput() const { return *m_symbolInput; }
    QString patternSummaryText() const { return m_patternSummary->text(); }

    static QString describePatterns(const std::vector<PatternEvent>& patterns);

private slots:
    void onAnalyze();
    void onRefresh();
    void onDatasetChanged(DatasetPtr dataset);
    void onFetchStarted(const QString& symbol);
    void onFetchFinished(const QString& symbol);
    void onFetchFailed(const QString& message);
    void onRenderSkipped(const QString& reason);

private:
    void setupUI();
    void setupChart();
    void setupConnections();
    void setWindowProperties();

    ChartConfig m_config;

    std::unique_ptr<HttpTransport> m_transport;
    std::unique_ptr<AnalyticsClient> m_client;

    WidgetSurfaceFactory m_surfaceFactory;
    std::unique_ptr<ChartOrchestrator> m_orchestrator;
    std::unique_ptr<WidgetResizeSource> m_resizeSource;
    std::unique_ptr<LifecycleBinding> m_binding;

    QLineEdit* m_symbolInput = nullptr;
    QPushButton* m_analyzeButton = nullptr;
    QPushButton* m_refreshButton = nullptr;
    QPushButton* m_zoomInButton = nullptr;
    QPushButton* m_zoomOutButton = nullptr;
    QPushButton* m_fitButton = nullptr;
    ChartView* m_chartView = nullptr;
    QLabel* m_patternSummary = nullptr;
    StatusBar* m_statusBar = nullptr;
};
