#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

namespace charctl {

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. The controller emits via send(), hosts consume
// via read(). EventRegistry::flush_all() clears every queue at the start of
// each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        if (!world.try_resource<Events<T>>()) world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Controller events
// ---------------------------------------------------------------------------

// Emitted when a jump fires.
// jump_number: 1 = ground / coyote jump, 2 = first air jump, ...
struct JumpEvent {
    ecs::Entity entity;
    int         jump_number;
    float       launch_velocity; // m/s upward
};

// Emitted on a confirmed landing.
struct LandEvent {
    ecs::Entity entity;
    float       impact_velocity; // m/s downward at touchdown
};

} // namespace charctl
