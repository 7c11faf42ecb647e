#include "DarkTheme.hpp"

ChartPalette DarkTheme::chartPalette() const {
    // ChartPalette defaults are the dark palette
    return ChartPalette{};
}

QString DarkTheme::stylesheet() const {
    return R"(
        QMainWindow, QWidget#centralWidget {
            background-color: #0b1120;
        }

        /* Toolbar row */
        QLineEdit {
            background-color: #1e293b;
            color: #e2e8f0;
            border: 1px solid #334155;
            border-radius: 4px;
            padding: 4px 8px;
            text-transform: uppercase;
        }

        QLineEdit:focus {
            border: 1px solid #60a5fa;
        }

        QPushButton {
            background-color: #1e293b;
            color: #e2e8f0;
            border: 1px solid #334155;
            border-radius: 4px;
            padding: 5px 12px;
        }

        QPushButton:hover {
            background-color: #273449;
            border-color: #475569;
        }

        QPushButton:pressed {
            background-color: #172033;
        }

        QPushButton:disabled {
            background-color: #111827;
            color: #475569;
            border-color: #1f2937;
        }

        QPushButton#analyzeButton {
            background-color: #2563eb;
            border-color: #2563eb;
            color: #ffffff;
        }

        QPushButton#analyzeButton:hover {
            background-color: #3b82f6;
        }

        /* Chart area */
        QFrame#chartView {
            background-color: #0f172a;
            border: 1px solid #1e293b;
            border-radius: 6px;
        }

        QLabel {
            color: #cbd5e1;
        }

        QLabel#paneTitle {
            color: #94a3b8;
            font-weight: bold;
        }

        QLabel#patternSummary {
            color: #e2e8f0;
            padding: 6px;
            background-color: #111827;
            border: 1px solid #1e293b;
            border-radius: 4px;
        }

        /* Status bar */
        QStatusBar {
            background-color: #0f172a;
            color: #94a3b8;
            border-top: 1px solid #1e293b;
        }

        QStatusBar QLabel {
            color: #94a3b8;
            padding: 0 6px;
        }

        QScrollBar:vertical {
            background: #0f172a;
            width: 10px;
        }

        QScrollBar::handle:vertical {
            background: #334155;
            border-radius: 4px;
            min-height: 20px;
        }

        QScrollBar::add-line, QScrollBar::sub-line {
            height: 0px;
            width: 0px;
        }
    )";
}
