#pragma once
#include "ISurfaceFactory.hpp"

// Creates PaneSurfaceWidgets as children of the container's host widget
class WidgetSurfaceFactory : public ISurfaceFactory {
public:
    std::unique_ptr<IPaneSurface> createSurface(const IPaneContainer& container,
                                                PaneViewState& viewState,
                                                const PaneOptions& options) override;
};
