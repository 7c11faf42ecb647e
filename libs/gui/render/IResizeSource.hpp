#pragma once
#include <cstdint>
#include <functional>

// Container resize notifications. Callbacks receive the new width in pixels.
class IResizeSource {
public:
    using SubscriptionId = uint64_t;
    using Callback = std::function<void(int width)>;

    virtual ~IResizeSource() = default;

    virtual SubscriptionId subscribe(Callback callback) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};
