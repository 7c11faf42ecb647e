#pragma once
#include <QColor>

// Colors used by pane surfaces and layer construction. Defaults are the dark palette.
struct ChartPalette {
    QColor background{"#0f172a"};
    QColor grid{"#1e293b"};
    QColor axisText{"#94a3b8"};
    QColor crosshair{"#64748b"};
    QColor legendText{"#e2e8f0"};

    QColor candleUp{"#22c55e"};
    QColor candleDown{"#ef4444"};
    QColor bandEdge{"#60a5fa"};
    QColor bandMiddle{"#94a3b8"};
    QColor oscillator{"#8b5cf6"};
    QColor overbought{"#ef4444"};
    QColor oversold{"#22c55e"};

    QColor bullish{"#22c55e"};
    QColor bearish{"#ef4444"};
    QColor neutral{"#f59e0b"};
};
