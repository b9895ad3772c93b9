#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <csignal>
#include <functional>
#include <memory>

#include "api/MemoryApi.hpp"
#include "embedding_cache.hpp"
#include "memory/MemoryEngine.hpp"
#include "MemoryConfig.hpp"

using json = nlohmann::json;

class MemoryServer {
public:
    explicit MemoryServer(const memory_core::MemoryConfig& config)
        : config_(config),
          memory_(std::make_shared<memory_core::MemoryEngine>(
              config.memory_dir, config.working_size, config.max_episodic)),
          cache_(std::make_shared<memory_core::EmbeddingCache>(config.cache_dir, config.cache_max_size)),
          api_(memory_, cache_)
    {
        setup_routes();
    }

    void run() {
        spdlog::info("🚀 Memory server listening on {}:{}", config_.host, config_.port);
        if (!server_.listen(config_.host.c_str(), config_.port)) {
            spdlog::error("❌ Could not bind {}:{}", config_.host, config_.port);
        }
    }

    void stop() { server_.stop(); }

    void shutdown() {
        if (!config_.save_on_exit) return;
        spdlog::info("💾 Saving memory and embedding cache before exit");
        memory_->save();
        cache_->save();
    }

private:
    using Handler = std::function<json(const httplib::Request&)>;

    memory_core::MemoryConfig config_;
    std::shared_ptr<memory_core::MemoryEngine> memory_;
    std::shared_ptr<memory_core::EmbeddingCache> cache_;
    memory_core::MemoryApi api_;
    httplib::Server server_;

    // Every route answers JSON; ApiError carries its own status, anything else is a 500
    httplib::Server::Handler wrap(Handler handler) {
        return [handler](const httplib::Request& req, httplib::Response& res) {
            try {
                res.set_content(handler(req).dump(-1, ' ', false, json::error_handler_t::replace),
                                "application/json");
            } catch (const memory_core::ApiError& e) {
                res.status = e.status();
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("❌ {} {} failed: {}", req.method, req.path, e.what());
                res.status = 500;
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            }
        };
    }

    json body_of(const httplib::Request& req) {
        return memory_core::MemoryApi::parse_body(req.body);
    }

    void setup_routes() {
        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        // --- WORKING MEMORY ---
        server_.Post("/memory/working", wrap([this](const httplib::Request& req) {
            return api_.add_working(body_of(req));
        }));
        server_.Get("/memory/working", wrap([this](const httplib::Request&) {
            return api_.get_working();
        }));
        server_.Delete("/memory/working", wrap([this](const httplib::Request&) {
            return api_.clear_working();
        }));

        // --- EPISODIC MEMORY ---
        server_.Post("/memory/episode", wrap([this](const httplib::Request& req) {
            return api_.add_episode(body_of(req));
        }));
        server_.Post("/memory/context", wrap([this](const httplib::Request& req) {
            return api_.relevant_context(body_of(req));
        }));

        // --- SEMANTIC MEMORY ---
        server_.Post("/memory/semantic", wrap([this](const httplib::Request& req) {
            return api_.add_semantic(body_of(req));
        }));
        server_.Get("/memory/semantic/:key", wrap([this](const httplib::Request& req) {
            return api_.get_semantic(req.path_params.at("key"));
        }));

        server_.Get("/memory/stats", wrap([this](const httplib::Request&) {
            return api_.memory_stats();
        }));
        server_.Post("/memory/save", wrap([this](const httplib::Request&) {
            return api_.save_memory();
        }));
        server_.Post("/memory/load", wrap([this](const httplib::Request&) {
            return api_.load_memory();
        }));

        // --- EMBEDDING CACHE ---
        server_.Post("/cache/get", wrap([this](const httplib::Request& req) {
            return api_.cache_get(body_of(req));
        }));
        server_.Post("/cache/put", wrap([this](const httplib::Request& req) {
            return api_.cache_put(body_of(req));
        }));
        server_.Post("/cache/contains", wrap([this](const httplib::Request& req) {
            return api_.cache_contains(body_of(req));
        }));
        server_.Get("/cache/stats", wrap([this](const httplib::Request&) {
            return api_.cache_stats();
        }));
        server_.Post("/cache/clear", wrap([this](const httplib::Request&) {
            return api_.cache_clear();
        }));
        server_.Post("/cache/save", wrap([this](const httplib::Request&) {
            return api_.cache_save();
        }));

        // --- SIMILARITY ---
        server_.Post("/similarity/cosine", wrap([this](const httplib::Request& req) {
            return api_.cosine(body_of(req));
        }));
        server_.Post("/similarity/batch", wrap([this](const httplib::Request& req) {
            return api_.batch_similarity(body_of(req));
        }));

        server_.Get("/api/admin/events", wrap([this](const httplib::Request&) {
            return api_.events();
        }));
    }
};

namespace {
MemoryServer* g_server = nullptr;

void handle_signal(int) {
    if (g_server) g_server->stop();
}
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path = argc > 1 ? argv[1] : "";
    auto config = memory_core::MemoryConfig::load(config_path);
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::debug("Effective config: {}", config.to_json().dump());

    MemoryServer server(config);
    g_server = &server;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    server.run();

    g_server = nullptr;
    server.shutdown();
    return 0;
}
