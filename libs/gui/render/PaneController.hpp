/*
Chartwell — PaneController
Role: Two-state wrapper (Unmounted/Mounted) around one rendering surface and its view state.
Inputs/Outputs: Takes a container, options and layers; owns the surface created by an ISurfaceFactory.
Threading: GUI thread only.
Performance: setLayers replaces everything in one call; value autoscale is a linear pass over attached data.
Integration: Held by ChartOrchestrator through a PaneHandle; one controller per pane identity.
Observability: Mount, resize and destroy logged via cwLog_Render.
Related: PaneController.cpp, ChartOrchestrator.hpp, ISurfaceFactory.hpp, PaneViewState.hpp.
Assumptions: The container outlives the mount; misuse (setLayers/resize while Unmounted) is a programming error.
*/
#pragma once
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "IPaneSurface.hpp"
#include "PaneViewState.hpp"

class ISurfaceFactory;

enum class PaneId {
    Price,
    Oscillator
};

const char* paneName(PaneId id);

// Zero-width container or a factory that produced no surface
class PaneMountError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Operation not valid in the controller's current state
class PaneStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class PaneController {
public:
    PaneController(PaneId id, ISurfaceFactory& factory);
    ~PaneController();

    PaneController(const PaneController&) = delete;
    PaneController& operator=(const PaneController&) = delete;

    void mount(const IPaneContainer& container, const PaneOptions& options);
    void setLayers(PaneLayers layers);
    void resize(int width, bool autoFit = false);
    void fitContent();
    void destroy();

    bool isMounted() const { return m_surface != nullptr; }
    PaneId id() const { return m_id; }
    int width() const;
    int height() const;
    const PaneOptions& options() const { return m_options; }
    const PaneLayers& layers() const { return m_layers; }

    // Null while Unmounted
    PaneViewState* viewState() const { return m_viewState.get(); }
    IPaneSurface* surface() const { return m_surface.get(); }

private:
    void requireMounted(const char* operation) const;
    void refreshValueRange();

    PaneId m_id;
    ISurfaceFactory& m_factory;
    PaneOptions m_options;
    PaneLayers m_layers;

    std::unique_ptr<PaneViewState> m_viewState;
    std::unique_ptr<IPaneSurface> m_surface;
};

using PaneHandle = std::unique_ptr<PaneController>;

// Time extent over all series of a layer set
struct LayerExtent {
    int64_t first = 0;
    int64_t last = 0;
    size_t barCount = 0;
};

std::optional<LayerExtent> timeExtent(const PaneLayers& layers);
