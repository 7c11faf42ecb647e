#pragma once
#include <memory>
#include "IPaneSurface.hpp"

class PaneViewState;

class ISurfaceFactory {
public:
    virtual ~ISurfaceFactory() = default;

    // The returned surface must not outlive viewState.
    virtual std::unique_ptr<IPaneSurface> createSurface(const IPaneContainer& container,
                                                        PaneViewState& viewState,
                                                        const PaneOptions& options) = 0;
};
