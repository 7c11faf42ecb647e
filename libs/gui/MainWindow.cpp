#include "MainWindow.hpp"
#include "ChartwellLogging.hpp"
#include "marketdata/http/BeastHttpTransport.hpp"
#include "themes/ThemeManager.hpp"
#include <QHBoxLayout>
#include <QScopeGuard>
#include <QStatusBar>
#include <QStringList>
#include <QTimer>
#include <QVBoxLayout>

// Helper macro for scoped logging
#define LOG_SCOPE(msg) cwLog_App(msg " started"); auto _scopeGuard = qScopeGuard([=]{ cwLog_App(msg " complete"); });

MainWindow::MainWindow(ChartConfig config, std::unique_ptr<HttpTransport> transport, QWidget* parent)
    : QMainWindow(parent)
    , m_config(std::move(config))
    , m_transport(std::move(transport))
{
    LOG_SCOPE("MainWindow construction");

    if (!m_transport) {
        m_transport = std::make_unique<BeastHttpTransport>();
    }
    m_client = std::make_unique<AnalyticsClient>(*m_transport, m_config.api);

    setupUI();
    setupChart();
    setupConnections();
    setWindowProperties();

    if (!m_config.defaultSymbol.isEmpty()) {
        m_symbolInput->setText(m_config.defaultSymbol);
        QTimer::singleShot(0, this, &MainWindow::onAnalyze);
    }
}

MainWindow::~MainWindow() {
    LOG_SCOPE("MainWindow destruction");

    if (m_binding) m_binding->unbind();
    // Joins the I/O thread, so no transport callback can outlive the client
    m_transport.reset();
    m_client.reset();
}

void MainWindow::setupUI() {
    LOG_SCOPE("Setting up UI");

    QWidget* central = new QWidget(this);
    central->setObjectName("centralWidget");
    QVBoxLayout* layout = new QVBoxLayout(central);
    layout->setContentsMargins(12, 12, 12, 12);
    layout->setSpacing(8);

    QHBoxLayout* controls = new QHBoxLayout();
    m_symbolInput = new QLineEdit(central);
    m_symbolInput->setPlaceholderText("Symbol (e.g. AAPL)");
    m_symbolInput->setMaximumWidth(220);
    controls->addWidget(m_symbolInput);

    m_analyzeButton = new QPushButton("Analyze", central);
    m_analyzeButton->setObjectName("analyzeButton");
    controls->addWidget(m_analyzeButton);

    m_refreshButton = new QPushButton("Refresh", central);
    m_refreshButton->setEnabled(false);
    controls->addWidget(m_refreshButton);

    controls->addStretch();

    m_zoomInButton = new QPushButton("Zoom In", central);
    m_zoomOutButton = new QPushButton("Zoom Out", central);
    m_fitButton = new QPushButton("Fit", central);
    controls->addWidget(m_zoomInButton);
    controls->addWidget(m_zoomOutButton);
    controls->addWidget(m_fitButton);
    layout->addLayout(controls);

    m_chartView = new ChartView(m_config.priceHeight, m_config.oscillatorHeight, central);
    layout->addWidget(m_chartView);

    m_patternSummary = new QLabel(central);
    m_patternSummary->setObjectName("patternSummary");
    m_patternSummary->setWordWrap(true);
    m_patternSummary->setText("Enter a symbol and press Analyze");
    layout->addWidget(m_patternSummary);

    setCentralWidget(central);

    m_statusBar = new StatusBar(this);
    statusBar()->addPermanentWidget(m_statusBar, 1);
}

void MainWindow::setupChart() {
    ChartLayout layout;
    layout.priceHeight = m_config.priceHeight;
    layout.oscillatorHeight = m_config.oscillatorHeight;
    layout.palette = ThemeManager::instance().currentPalette();

    m_orchestrator = std::make_unique<ChartOrchestrator>(m_surfaceFactory,
                                                         m_chartView->priceContainer(),
                                                         m_chartView->oscillatorContainer(),
                                                         layout);
    m_resizeSource = std::make_unique<WidgetResizeSource>(&m_chartView->priceContainer());
    m_binding = std::make_unique<LifecycleBinding>(*m_orchestrator, *m_resizeSource);
    m_binding->bind(*m_client);
}

void MainWindow::setupConnections() {
    connect(m_analyzeButton, &QPushButton::clicked, this, &MainWindow::onAnalyze);
    connect(m_symbolInput, &QLineEdit::returnPressed, this, &MainWindow::onAnalyze);
    connect(m_refreshButton, &QPushButton::clicked, this, &MainWindow::onRefresh);

    connect(m_zoomInButton, &QPushButton::clicked, m_orchestrator.get(), &ChartOrchestrator::zoomIn);
    connect(m_zoomOutButton, &QPushButton::clicked, m_orchestrator.get(), &ChartOrchestrator::zoomOut);
    connect(m_fitButton, &QPushButton::clicked, m_orchestrator.get(), &ChartOrchestrator::fitContent);

    connect(m_client.get(), &AnalyticsClient::datasetChanged, this, &MainWindow::onDatasetChanged);
    connect(m_client.get(), &AnalyticsClient::fetchStarted, this, &MainWindow::onFetchStarted);
    connect(m_client.get(), &AnalyticsClient::fetchFinished, this, &MainWindow::onFetchFinished);
    connect(m_client.get(), &AnalyticsClient::fetchFailed, this, &MainWindow::onFetchFailed);

    connect(m_orchestrator.get(), &ChartOrchestrator::renderSkipped, this, &MainWindow::onRenderSkipped);
    connect(m_orchestrator.get(), &ChartOrchestrator::panesChanged, this, [this]{
        m_statusBar->setPaneCount(static_cast<int>(m_orchestrator->mountedPaneCount()));
        m_chartView->setOscillatorVisible(m_orchestrator->pane(PaneId::Oscillator) != nullptr);
    });
}

void MainWindow::setWindowProperties() {
    setWindowTitle("Chartwell - Pattern Analysis");
    resize(1200, 800);
    setMinimumSize(640, 480);
}

void MainWindow::onAnalyze() {
    const QString symbol = m_symbolInput->text().trimmed().toUpper();
    if (symbol.isEmpty()) {
        cwLog_Warning("Analyze requested without a symbol");
        statusBar()->showMessage("Enter a symbol to analyze", 3000);
        return;
    }
    cwLog_App("Analyzing:" << symbol);
    m_symbolInput->setText(symbol);
    m_client->requestSymbol(symbol);
}

void MainWindow::onRefresh() {
    m_client->refresh();
}

QString MainWindow::describePatterns(const std::vector<PatternEvent>& patterns) {
    if (patterns.empty()) {
        return "No patterns detected in recent candles";
    }
    QStringList parts;
    for (const auto& p : patterns) {
        parts << QString("%1 (%2, %3)")
                     .arg(QString::fromStdString(p.label),
                          QString::fromLatin1(toString(p.strength)),
                          QString::fromLatin1(toString(p.classification)));
    }
    return QString("Patterns: %1").arg(parts.join(", "));
}

void MainWindow::onDatasetChanged(DatasetPtr dataset) {
    if (!dataset) {
        m_patternSummary->setText("Loading...");
        m_statusBar->clearQuote();
        m_chartView->setTitle(m_client->currentSymbol());
        return;
    }
    m_patternSummary->setText(describePatterns(dataset->patterns));
    const QString symbol = dataset->symbol.empty() ? m_client->currentSymbol()
                                                   : QString::fromStdString(dataset->symbol);
    m_statusBar->setQuote(symbol, dataset->currentPrice, dataset->priceChange);
    m_chartView->setTitle(symbol);
}

void MainWindow::onFetchStarted(const QString& symbol) {
    m_statusBar->setFetchState(StatusBar::FetchState::Loading, symbol);
    m_refreshButton->setEnabled(false);
}

void MainWindow::onFetchFinished(const QString& symbol) {
    m_statusBar->setFetchState(StatusBar::FetchState::Loaded, symbol);
    m_refreshButton->setEnabled(true);
}

void MainWindow::onFetchFailed(const QString& message) {
    m_statusBar->setFetchState(StatusBar::FetchState::Failed, message);
    m_refreshButton->setEnabled(!m_client->currentSymbol().isEmpty());
}

void MainWindow::onRenderSkipped(const QString& reason) {
    statusBar()->showMessage(reason, 5000);
}
