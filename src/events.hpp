#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// Events sent during the fixed physics steps of a frame stay readable until
// EventRegistry::flush_all() runs at the start of the next frame.
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
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        world.set_resource(Events<T>{});
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
// Concrete event types
// ---------------------------------------------------------------------------

// Emitted by PhysicsSystem when the boundary resolver reflects the body.
// speed: magnitude of the velocity after the reflection (units/s).
struct BoundaryHitEvent {
    ecs::Entity entity;
    bool        x_axis;
    bool        y_axis;
    float       speed;
};
