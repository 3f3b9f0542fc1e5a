#pragma once

#include "backend/Config.hpp"
#include "backend/DeviceRegistry.hpp"
#include "backend/SelectionPublisher.hpp"
#include "output/Sink.hpp"
#include <utility>

namespace castbar::app {

// Process-wide state, built once in main and handed to each component.
struct Context {
    Context(backend::Config cfg, output::Sink& out)
        : config(std::move(cfg)), sink(out) {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const backend::Config config;
    backend::DeviceRegistry registry;
    backend::SelectionPublisher selection;
    output::Sink& sink;
};

}  // namespace castbar::app
