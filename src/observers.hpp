#pragma once
#include <exception>
#include <functional>
#include <vector>

#include "macros/logger.hpp"

// listeners of one event, a throwing listener never stops the others
template <class... Args>
struct Observers {
    static inline auto logger = Logger("LOCALTALK_EVENT");

    const char*                               name = "event";
    std::vector<std::function<void(Args...)>> handlers;

    auto add(std::function<void(Args...)> handler) -> void {
        handlers.push_back(std::move(handler));
    }

    auto fire(const Args&... args) -> void {
        // a handler may register further handlers
        const auto snapshot = handlers;
        for(const auto& handler : snapshot) {
            try {
                handler(args...);
            } catch(const std::exception& e) {
                LOG_ERROR(logger, "exception in {} handler: {}", name, e.what());
            } catch(...) {
                LOG_ERROR(logger, "unknown exception in {} handler", name);
            }
        }
    }
};
