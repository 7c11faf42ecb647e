#include "PaneController.hpp"
#include "ChartwellLogging.hpp"
#include "ISurfaceFactory.hpp"
#include <algorithm>
#include <limits>
#include <type_traits>
#include <variant>

namespace {

struct ValueBounds {
    double min = std::numeric_limits<double>::max();
    double max = std::numeric_limits<double>::lowest();

    bool valid() const { return min <= max; }
    void add(double lo, double hi) {
        min = std::min(min, lo);
        max = std::max(max, hi);
    }
};

// Min/max of all series values whose time lies in range (or everything when range is invalid)
ValueBounds collectBounds(const PaneLayers& layers, const TimeRange& range) {
    ValueBounds bounds;
    auto inRange = [&range](int64_t t) {
        return !range.valid() || (t >= range.from && t <= range.to);
    };
    for (const auto& series : layers.series) {
        std::visit([&](const auto& layer) {
            using T = std::decay_t<decltype(layer)>;
            if constexpr (std::is_same_v<T, CandleLayer>) {
                for (const auto& c : layer.candles) {
                    if (inRange(c.time)) bounds.add(c.low, c.high);
                }
            } else {
                for (const auto& p : layer.points) {
                    if (inRange(p.time)) bounds.add(p.value, p.value);
                }
            }
        }, series);
    }
    return bounds;
}

} // namespace

const char* paneName(PaneId id) {
    return id == PaneId::Price ? "price" : "oscillator";
}

std::optional<LayerExtent> timeExtent(const PaneLayers& layers) {
    std::optional<LayerExtent> extent;
    auto merge = [&extent](int64_t first, int64_t last, size_t count) {
        if (count == 0) return;
        if (!extent) {
            extent = LayerExtent{first, last, count};
            return;
        }
        extent->first = std::min(extent->first, first);
        extent->last = std::max(extent->last, last);
        extent->barCount = std::max(extent->barCount, count);
    };
    for (const auto& series : layers.series) {
        std::visit([&](const auto& layer) {
            using T = std::decay_t<decltype(layer)>;
            if constexpr (std::is_same_v<T, CandleLayer>) {
                if (!layer.candles.empty())
                    merge(layer.candles.front().time, layer.candles.back().time, layer.candles.size());
            } else {
                if (!layer.points.empty())
                    merge(layer.points.front().time, layer.points.back().time, layer.points.size());
            }
        }, series);
    }
    return extent;
}

PaneController::PaneController(PaneId id, ISurfaceFactory& factory)
    : m_id(id)
    , m_factory(factory) {
}

PaneController::~PaneController() {
    destroy();
}

void PaneController::requireMounted(const char* operation) const {
    if (!isMounted()) {
        throw PaneStateError(std::string(operation) + " on unmounted " + paneName(m_id) + " pane");
    }
}

void PaneController::mount(const IPaneContainer& container, const PaneOptions& options) {
    if (isMounted()) {
        throw PaneStateError(std::string("mount on already mounted ") + paneName(m_id) + " pane");
    }

    const int width = container.availableWidth();
    if (width <= 0) {
        throw PaneMountError(std::string(paneName(m_id)) + " container has zero width");
    }

    m_options = options;
    auto viewState = std::make_unique<PaneViewState>();
    viewState->setViewportSize(width, options.height);

    auto surface = m_factory.createSurface(container, *viewState, m_options);
    if (!surface) {
        throw PaneMountError(std::string("no surface created for ") + paneName(m_id) + " pane");
    }
    surface->setSurfaceSize(width, options.height);

    m_viewState = std::move(viewState);
    m_surface = std::move(surface);
    m_layers = {};

    QObject::connect(m_viewState.get(), &PaneViewState::visibleTimeRangeChanged,
                     m_viewState.get(), [this]{ refreshValueRange(); });

    cwLog_Render("Mounted" << paneName(m_id) << "pane" << width << "x" << options.height);
}

void PaneController::setLayers(PaneLayers layers) {
    requireMounted("setLayers");
    m_layers = std::move(layers);
    refreshValueRange();
    m_surface->applyLayers(m_layers);
}

void PaneController::resize(int width, bool autoFit) {
    requireMounted("resize");
    if (width <= 0) {
        cwLog_Debug("Ignoring resize of" << paneName(m_id) << "pane to" << width);
        return;
    }
    m_surface->setSurfaceSize(width, m_options.height);
    m_viewState->setViewportSize(width, m_options.height);
    if (autoFit) {
        fitContent();
    }
}

void PaneController::fitContent() {
    requireMounted("fitContent");
    if (auto extent = timeExtent(m_layers)) {
        m_viewState->fitTimeRange(extent->first, extent->last, extent->barCount);
    }
    refreshValueRange();
}

void PaneController::destroy() {
    if (!isMounted()) {
        return;
    }
    // Surface references the view state, so it goes first
    m_surface.reset();
    m_viewState.reset();
    m_layers = {};
    cwLog_Render("Destroyed" << paneName(m_id) << "pane");
}

int PaneController::width() const {
    return m_surface ? m_surface->surfaceWidth() : 0;
}

int PaneController::height() const {
    return m_surface ? m_surface->surfaceHeight() : 0;
}

void PaneController::refreshValueRange() {
    if (!m_viewState) return;
    ValueBounds bounds = collectBounds(m_layers, m_viewState->visibleTimeRange());
    if (!bounds.valid()) {
        bounds = collectBounds(m_layers, TimeRange{});
    }
    if (!bounds.valid()) return;

    const auto [lo, hi] = CoordinateSystem::fitValueRange(bounds.min, bounds.max,
                                                          m_options.topMargin, m_options.bottomMargin);
    m_viewState->setValueRange(lo, hi);
}
