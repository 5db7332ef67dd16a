#include "core/types/PathCatalog.hpp"

#include <algorithm>
#include <utility>

namespace portsy::core {

PathCatalog PathCatalog::defaults() {
    PathCatalog catalog;
    catalog.common_ = {"/",        "/api",      "/api/v1",     "/api/v2",     "/health",
                       "/status",  "/metrics",  "/swagger",    "/docs",       "/graphql",
                       "/admin",   "/login",    "/register",   "/dashboard",  "/home",
                       "/about",   "/.well-known", "/robots.txt", "/sitemap.xml", "/favicon.ico"};

    catalog.frameworks_ = {
        {"flask",
         {"/static", "/_debug", "/api/health", "/flask-admin", "/admin/static", "/debug",
          "/blueprint", "/api/v1", "/api/v2", "/health", "/status", "/metrics", "/ping", "/info",
          "/version", "/api/status", "/api/info", "/api/ping", "/api/version", "/api/docs",
          "/api/spec", "/api/swagger", "/routes"}},
        {"django",
         {"/django-admin", "/static", "/media", "/admin/login", "/api-auth", "/api/schema",
          "/dj-rest-auth", "/accounts"}},
        {"fastapi",
         {"/docs", "/redoc", "/openapi.json", "/api/docs", "/health", "/metrics", "/status",
          "/api/v1/health"}},
        {"express",
         {"/api", "/users", "/auth", "/public", "/assets", "/socket.io", "/webpack-dev-server",
          "/hmr", "/api/health", "/api/status", "/api/info", "/api/version", "/routes"}},
        {"rails",
         {"/rails/info", "/rails/mailers", "/assets", "/admin", "/api/v1", "/users", "/sessions",
          "/devise"}},
        {"laravel",
         {"/api", "/admin", "/telescope", "/horizon", "/nova", "/broadcasting/auth", "/sanctum",
          "/passport"}},
        {"gin", {"/ping", "/health", "/metrics", "/api/v1", "/swagger", "/debug/pprof", "/static"}},
        {"gorilla", {"/api", "/health", "/metrics", "/static", "/ws", "/websocket", "/debug"}},
        {"fiber", {"/api", "/health", "/metrics", "/swagger", "/static", "/ws", "/monitor"}},
        {"spring",
         {"/actuator", "/actuator/health", "/actuator/metrics", "/actuator/info", "/api",
          "/swagger-ui", "/h2-console"}},
        {"quarkus",
         {"/q/health", "/q/metrics", "/q/openapi", "/q/swagger-ui", "/q/dev", "/api",
          "/health/live", "/health/ready"}},
        {"ollama",
         {"/api/tags", "/api/generate", "/api/chat", "/api/embeddings", "/api/create",
          "/api/show", "/api/copy", "/api/delete", "/api/pull", "/api/push", "/api/version",
          "/v1/chat/completions"}},
        {"jupyter",
         {"/api", "/api/kernels", "/api/sessions", "/api/contents", "/tree", "/notebooks",
          "/terminals", "/lab", "/static"}},
        {"vscode",
         {"/vscode-remote-resource", "/$vscode-remote", "/static", "/workbench", "/api"}},
        {"streamlit",
         {"/_stcore", "/healthz", "/static", "/media", "/_stcore/health", "/_stcore/stream"}},
        {"gradio",
         {"/api", "/api/predict", "/queue/join", "/queue/data", "/static", "/file", "/upload",
          "/component_server"}},
        {"nginx", {"/nginx_status", "/status", "/server-status", "/server-info", "/stats"}},
        {"apache", {"/server-status", "/server-info", "/stats", "/cgi-bin", "/icons"}},
        {"dev_servers",
         {"/webpack-dev-server", "/__webpack_dev_server__", "/sockjs-node", "/__dev__",
          "/hot-update", "/hmr", "/__vite_ping", "/__vite_client"}}};

    return catalog;
}

std::vector<std::string> PathCatalog::paths(PathSetMode mode) const {
    if (mode == PathSetMode::Common) {
        return common_;
    }

    // The common set counts as one of the lists
    std::vector<std::string> all(common_.begin(), common_.end());
    for (const auto& [name, list] : frameworks_) {
        all.insert(all.end(), list.begin(), list.end());
    }
    std::sort(all.begin(), all.end());
    all.erase(std::unique(all.begin(), all.end()), all.end());
    return all;
}

void PathCatalog::setCommonPaths(std::vector<std::string> paths) {
    common_ = std::move(paths);
}

void PathCatalog::setFrameworkPaths(const std::string& name, std::vector<std::string> paths) {
    frameworks_[name] = std::move(paths);
}

std::string PathCatalog::modeToString(PathSetMode mode) {
    switch (mode) {
    case PathSetMode::Common:
        return "common";
    case PathSetMode::Comprehensive:
        return "comprehensive";
    }
    return "common";
}

} // namespace portsy::core
