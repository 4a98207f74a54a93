#pragma once

#include <Clock.hpp>

// Services handed to every command handler.
class Providers {
    template <typename T>
    struct Installable {
        T *instance;

        [[nodiscard]] T *get() const { return instance; }
        T *operator->() const { return get(); }
    };

   public:
    Installable<ClockBase> clock{};

    explicit Providers(ClockBase *clock) { this->clock.instance = clock; }
};
