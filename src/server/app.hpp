/*
 * Copyright 2025 Wren Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Wren Application - Header
// Route, error handler and middleware registration; frozen once before serving

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include "../control/config.hpp"
#include "../http/transport.hpp"
#include "../routing/pipeline.hpp"
#include "../routing/router.hpp"
#include "../templating/renderer.hpp"
#include "dispatcher.hpp"
#include "error_pipeline.hpp"
#include "handler.hpp"

namespace wren::server {

/// Application: collects registrations, then freezes exactly once.
///
/// Registration is single-threaded setup code. The first handle() (or an
/// explicit freeze()) compiles the router and composes the middleware chain;
/// any registration after that throws core::ConfigurationError.
class App {
public:
    explicit App(control::AppConfig config = {});
    ~App();

    // Non-copyable, non-movable (the dispatcher references the router)
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Register a route handler (see make_handler() for accepted signatures)
    template <typename F>
    App& route(std::string_view pattern, F handler, std::vector<std::string> methods = {"GET"},
               std::string name = {}) {
        return add_route(pattern, make_handler(std::move(handler)), methods, std::move(name));
    }

    /// Register an error handler for a status code
    template <typename F>
    App& error(int status, F handler) {
        return add_status_handler(status, make_error_handler(std::move(handler)));
    }

    /// Register an error handler for an exact exception type
    template <typename E, typename F>
    App& error(F handler) {
        return add_type_handler(std::type_index(typeid(E)),
                                make_exception_handler<E>(std::move(handler)));
    }

    /// Append a middleware; the first registered runs outermost
    App& use(routing::Middleware middleware, std::string name = "CustomMiddleware");

    /// Register the built-in middleware enabled in config (request logging,
    /// CORS, security headers, in that order)
    App& use_builtin_middleware(const control::Config& config);

    /// Template renderer for Template, Fragment and Stream return values
    App& set_renderer(std::shared_ptr<const templating::TemplateRenderer> renderer);

    /// Compile the router and compose the chain (idempotent, thread-safe)
    void freeze();

    [[nodiscard]] bool frozen() const noexcept { return frozen_.load(std::memory_order_acquire); }

    /// Handle one connection (freezes on first use)
    void handle(http::Transport& transport);

    [[nodiscard]] const routing::Router& router() const noexcept { return router_; }
    [[nodiscard]] const control::AppConfig& config() const noexcept { return config_; }

    /// Dispatcher of a frozen app (freezes on first use)
    [[nodiscard]] const Dispatcher& dispatcher();

private:
    App& add_route(std::string_view pattern, BoundHandler handler,
                   const std::vector<std::string>& methods, std::string name);
    App& add_status_handler(int status, ErrorHandler handler);
    App& add_type_handler(std::type_index type, ErrorHandler handler);

    /// Throws core::ConfigurationError once frozen; caller holds mutex_
    void ensure_mutable(std::string_view what) const;

    control::AppConfig config_;
    routing::Router router_;
    std::vector<Handler> handlers_;
    routing::Pipeline pipeline_;
    ErrorHandlerRegistry errors_;
    std::shared_ptr<const templating::TemplateRenderer> renderer_;

    mutable std::mutex mutex_;
    std::atomic<bool> frozen_{false};
    std::unique_ptr<Dispatcher> dispatcher_;
};

}  // namespace wren::server
