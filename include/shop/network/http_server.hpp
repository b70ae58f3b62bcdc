#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "shop/utils/thread_pool.hpp"

namespace shop {
namespace network {

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> path_params;
    std::map<std::string, std::string> query_params;
};

struct HttpResponse {
    int status_code{200};
    std::string body;
    std::map<std::string, std::string> headers;
};

// Percent-decoding with '+' as space (application/x-www-form-urlencoded rules)
std::string urlDecode(std::string_view str);

// "a=1&b=two" -> {a: 1, b: two}; keys without '=' map to ""
std::map<std::string, std::string> parseQueryParameters(std::string_view query_string);

// Case-insensitive header lookup
std::optional<std::string> findHeader(const HttpRequest& request, std::string_view name);

// Parses request line, headers and body of a raw HTTP/1.1 request.
// Returns std::nullopt if the header block is incomplete or the request line is malformed.
std::optional<HttpRequest> parseHttpRequest(const std::string& raw);

// Minimal HTTP/1.1 server: one accept thread, connections handled on a thread
// pool, one request per connection.
class HttpServer {
  public:
    using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

    static constexpr std::size_t kMaxRequestBytes = 1024 * 1024;

    // port 0 binds an ephemeral port; see getPort()
    HttpServer(const std::string& host, int port, int threads = 4);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    // Stops accepting and waits for every accepted connection to be answered
    void stop();
    bool isRunning() const;

    // Pattern segments of the form {name} are captured into path_params.
    // A method of "*" matches any method. Routes are tried in registration order.
    void registerRoute(const std::string& method, const std::string& path_pattern,
                       RequestHandler handler);

    // Dispatches a parsed request to the matching route. Handler exceptions
    // become 500 responses; unmatched requests become 404.
    HttpResponse routeRequest(const HttpRequest& request) const;

    void setTimeout(int seconds);
    void setMaxConnections(int max_connections);

    // Actual listening port once started
    [[nodiscard]] int getPort() const noexcept {
        return port_;
    }
    [[nodiscard]] const std::string& getHost() const noexcept {
        return host_;
    }

    static HttpResponse createErrorResponse(int status_code, const std::string& message);

  private:
    struct Route {
        std::string method;
        std::string path_pattern;
        std::regex path_regex;
        std::vector<std::string> param_names;
        RequestHandler handler;
    };

    std::string host_;
    int port_;
    std::atomic<bool> running_{false};
    int timeout_seconds_;
    int max_connections_;
    std::size_t thread_count_;

    std::vector<Route> routes_;
    // Declared after routes_ so queued connections are drained while the
    // routes still exist
    std::unique_ptr<utils::ThreadPool> thread_pool_;

    void acceptLoop();
    void handleClientRequest(int client_fd);

    static std::regex pathPatternToRegex(const std::string& pattern,
                                         std::vector<std::string>& param_names);

    int server_fd_ = -1;
    std::thread server_thread_;
    std::atomic<bool> stop_flag_{false};
};

}  // namespace network
}  // namespace shop
