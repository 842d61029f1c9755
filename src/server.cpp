#include "vlive/server.hpp"
#include "vlive/builtin_tools.hpp"
#include "vlive/error.hpp"
#include "vlive/router.hpp"

#include <exception>
#include <stdexcept>

namespace vlive {

// ----------- Server::Impl -----------

struct Server::Impl {
    Options opts;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<ToolRegistry> registry;

    // Built on first serve(), once the registry is sealed
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<Router> router;

    // Transport reference for shutdown()
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    bool stop_requested{false};  // shutdown() arrived while no transport was attached

    explicit Impl(Options o)
        : opts(std::move(o))
        , logger(opts.logger ? opts.logger : std::make_shared<Logger>())
        , registry(std::make_shared<ToolRegistry>()) {
        if (!opts.dispatch.logger) opts.dispatch.logger = logger;
    }

    void build_router() {
        if (router) return;
        registry->seal();
        dispatcher = std::make_unique<Dispatcher>(registry, opts.dispatch);

        Router::Options ropts;
        ropts.server_info = opts.server_info;
        ropts.instructions = opts.instructions;
        ropts.page_size = opts.page_size;
        ropts.logger = logger;
        router = std::make_unique<Router>(*dispatcher, std::move(ropts));
    }

    void on_transport_fault(std::exception_ptr e) {
        try {
            std::rethrow_exception(e);
        } catch (const PayloadTooLargeError& err) {
            logger->warning("transport", {{"fault", "PayloadTooLarge"}, {"message", err.what()}});
        } catch (const FramingError& err) {
            logger->warning("transport", {{"fault", "FramingError"}, {"message", err.what()}});
        } catch (const TransportError& err) {
            logger->error("transport", {{"fault", "TransportError"}, {"message", err.what()}});
        } catch (const std::exception& err) {
            logger->error("transport", {{"fault", "unexpected"}, {"message", err.what()}});
        }
    }

    void detach_transport() {
        std::lock_guard<std::mutex> lock(transport_mutex);
        transport = nullptr;
        stop_requested = false;
        running = false;
    }
};

// ----------- Server -----------

Server::Server(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    if (impl_->opts.builtin_tools) {
        add_builtin_tools(*impl_->registry, impl_->opts.server_info);
    }
}

Server::~Server() {
    shutdown();
}

const ToolDescriptor& Server::add_tool(ToolDescriptor descriptor) {
    return impl_->registry->add(std::move(descriptor));
}

const ToolRegistry& Server::registry() const {
    return *impl_->registry;
}

Logger& Server::logger() {
    return *impl_->logger;
}

void Server::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Server::serve requires a transport");
    }
    if (impl_->running.exchange(true)) {
        throw VliveError("Server is already serving");
    }

    auto* t = transport.get();
    try {
        impl_->build_router();
        {
            std::lock_guard<std::mutex> lock(impl_->transport_mutex);
            impl_->transport = t;
            if (impl_->stop_requested) t->shutdown();
        }
        impl_->logger->info("server", {{"event", "serving"},
                                       {"server", impl_->opts.server_info.name},
                                       {"tools", impl_->registry->size()}});

        t->start(*impl_->router, [this](std::exception_ptr e) {
            impl_->on_transport_fault(e);
        });
    } catch (const std::exception& e) {
        impl_->logger->error("server", {{"event", "transport_failed"}, {"message", e.what()}});
        impl_->detach_transport();
        throw;
    }

    impl_->detach_transport();
    impl_->logger->info("server", {{"event", "stopped"}});
}

void Server::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void Server::serve_stdio(StdioTransport::Options opts) {
    serve(std::make_unique<StdioTransport>(opts));
}

void Server::serve_http(HttpServerTransport::Options opts) {
    serve(std::make_unique<HttpServerTransport>(std::move(opts)));
}

void Server::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    } else {
        impl_->stop_requested = true;
    }
}

bool Server::is_running() const {
    return impl_->running;
}

} // namespace vlive
