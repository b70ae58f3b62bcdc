#include "shop/network/http_server.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace shop {
namespace network {

namespace {
std::string reasonPhrase(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 201:
            return "Created";
        case 202:
            return "Accepted";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 413:
            return "Payload Too Large";
        case 422:
            return "Unprocessable Entity";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "OK";
    }
}

void setSocketTimeout(int fd, int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

std::string toLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string trim(std::string_view value) {
    auto begin = value.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r");
    return std::string(value.substr(begin, end - begin + 1));
}

enum class ReadStatus { COMPLETE, CLOSED, TOO_LARGE, MALFORMED };

// Content-Length must be a plain decimal number no larger than kMaxRequestBytes
ReadStatus parseContentLength(const std::string& value, std::size_t& content_length) {
    std::uint64_t parsed = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec == std::errc::result_out_of_range) {
        return ReadStatus::TOO_LARGE;
    }
    if (ec != std::errc() || end != value.data() + value.size()) {
        return ReadStatus::MALFORMED;
    }
    if (parsed > HttpServer::kMaxRequestBytes) {
        return ReadStatus::TOO_LARGE;
    }
    content_length = static_cast<std::size_t>(parsed);
    return ReadStatus::COMPLETE;
}

// Reads one request (headers plus Content-Length body) from the socket
ReadStatus readRequest(int client_fd, std::string& raw) {
    char buf[4096];
    std::size_t header_end = std::string::npos;
    std::size_t expected_total = 0;

    while (true) {
        if (header_end == std::string::npos) {
            header_end = raw.find("\r\n\r\n");
            if (header_end != std::string::npos) {
                std::size_t content_length = 0;
                auto request = parseHttpRequest(raw.substr(0, header_end + 4));
                if (request) {
                    auto value = findHeader(*request, "Content-Length");
                    if (value) {
                        ReadStatus length_status = parseContentLength(*value, content_length);
                        if (length_status != ReadStatus::COMPLETE) {
                            return length_status;
                        }
                    }
                }
                expected_total = header_end + 4 + content_length;
                if (expected_total > HttpServer::kMaxRequestBytes) {
                    return ReadStatus::TOO_LARGE;
                }
            }
        }

        if (header_end != std::string::npos && raw.size() >= expected_total) {
            return ReadStatus::COMPLETE;
        }
        if (raw.size() > HttpServer::kMaxRequestBytes) {
            return ReadStatus::TOO_LARGE;
        }

        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            // Timeout, error or peer closed before the request was complete
            return ReadStatus::CLOSED;
        }
        raw.append(buf, buf + n);
    }
}

void writeResponse(int client_fd, HttpResponse resp) {
    if (resp.headers.find("Content-Type") == resp.headers.end()) {
        resp.headers["Content-Type"] = "application/json";
    }

    std::ostringstream out;
    out << "HTTP/1.1 " << resp.status_code << ' ' << reasonPhrase(resp.status_code) << "\r\n";
    out << "Content-Length: " << resp.body.size() << "\r\n";
    out << "Connection: close\r\n";
    for (const auto& kv : resp.headers) {
        out << kv.first << ": " << kv.second << "\r\n";
    }
    out << "\r\n";
    out << resp.body;

    auto out_str = out.str();
    std::size_t sent = 0;
    while (sent < out_str.size()) {
        ssize_t n = ::send(client_fd, out_str.data() + sent, out_str.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            break;
        }
        sent += static_cast<std::size_t>(n);
    }
}

std::string escapeRegex(std::string_view literal) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : literal) {
        if (kSpecial.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}
}  // namespace

std::string urlDecode(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (std::size_t i = 0; i < str.length(); ++i) {
        if (str[i] == '%' && i + 2 < str.length() &&
            std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            std::string hex(str.substr(i + 1, 2));
            result += static_cast<char>(std::strtol(hex.c_str(), nullptr, 16));
            i += 2;
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

std::map<std::string, std::string> parseQueryParameters(std::string_view query_string) {
    std::map<std::string, std::string> params;
    std::size_t start = 0;
    while (start <= query_string.size()) {
        std::size_t end = query_string.find('&', start);
        if (end == std::string_view::npos) {
            end = query_string.size();
        }
        std::string_view pair = query_string.substr(start, end - start);
        if (!pair.empty()) {
            auto equals_pos = pair.find('=');
            if (equals_pos != std::string_view::npos) {
                params[urlDecode(pair.substr(0, equals_pos))] =
                    urlDecode(pair.substr(equals_pos + 1));
            } else {
                params[urlDecode(pair)] = "";
            }
        }
        start = end + 1;
    }
    return params;
}

std::optional<std::string> findHeader(const HttpRequest& request, std::string_view name) {
    std::string wanted = toLower(name);
    for (const auto& [key, value] : request.headers) {
        if (toLower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<HttpRequest> parseHttpRequest(const std::string& raw) {
    std::size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return std::nullopt;
    }

    HttpRequest req;
    std::istringstream hs(raw.substr(0, header_end));
    std::string request_line;
    std::getline(hs, request_line);
    if (!request_line.empty() && request_line.back() == '\r') {
        request_line.pop_back();
    }

    std::istringstream rl(request_line);
    std::string target;
    if (!(rl >> req.method >> target)) {
        return std::nullopt;
    }

    auto query_pos = target.find('?');
    if (query_pos != std::string::npos) {
        req.path = target.substr(0, query_pos);
        req.query_params = parseQueryParameters(std::string_view(target).substr(query_pos + 1));
    } else {
        req.path = target;
    }

    std::string line;
    while (std::getline(hs, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[line.substr(0, colon)] = trim(std::string_view(line).substr(colon + 1));
        }
    }

    req.body = raw.substr(header_end + 4);
    return req;
}

HttpServer::HttpServer(const std::string& host, int port, int threads)
    : host_(host),
      port_(port),
      timeout_seconds_(30),
      max_connections_(100),
      thread_count_(static_cast<std::size_t>(std::max(threads, 0))) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_) {
        return true;
    }

    addrinfo hints{};
    addrinfo* res = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    std::string port_str = std::to_string(port_);
    int rc =
        getaddrinfo(host_ == "0.0.0.0" ? nullptr : host_.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        return false;
    }

    server_fd_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (server_fd_ < 0) {
        freeaddrinfo(res);
        return false;
    }

    int yes = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (::bind(server_fd_, res->ai_addr, res->ai_addrlen) < 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        freeaddrinfo(res);
        return false;
    }
    freeaddrinfo(res);

    if (::listen(server_fd_, max_connections_ > 0 ? max_connections_ : 100) < 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    thread_pool_ = std::make_unique<utils::ThreadPool>(thread_count_);
    stop_flag_ = false;
    running_ = true;
    server_thread_ = std::thread([this]() { acceptLoop(); });
    return true;
}

void HttpServer::acceptLoop() {
    // Periodic accept timeouts let the loop notice stop_flag_
    setSocketTimeout(server_fd_, 1);
    while (!stop_flag_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd =
            ::accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (stop_flag_) {
                break;
            }
            continue;
        }

        try {
            thread_pool_->enqueue([this, client_fd]() { handleClientRequest(client_fd); });
        } catch (const std::runtime_error&) {
            ::close(client_fd);
        }
    }
}

void HttpServer::handleClientRequest(int client_fd) {
    setSocketTimeout(client_fd, timeout_seconds_);

    std::string raw;
    ReadStatus status = readRequest(client_fd, raw);
    if (status == ReadStatus::TOO_LARGE) {
        writeResponse(client_fd, createErrorResponse(413, "Payload Too Large"));
        ::close(client_fd);
        return;
    }
    if (status == ReadStatus::MALFORMED) {
        writeResponse(client_fd, createErrorResponse(400, "Invalid Content-Length"));
        ::close(client_fd);
        return;
    }
    if (status == ReadStatus::CLOSED) {
        ::close(client_fd);
        return;
    }

    auto request = parseHttpRequest(raw);
    if (!request) {
        writeResponse(client_fd, createErrorResponse(400, "Malformed request"));
        ::close(client_fd);
        return;
    }

    writeResponse(client_fd, routeRequest(*request));
    ::close(client_fd);
}

void HttpServer::stop() {
    if (!running_) {
        return;
    }
    stop_flag_ = true;
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    // Answers the connections already accepted, then joins the workers
    thread_pool_.reset();
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    running_ = false;
}

bool HttpServer::isRunning() const {
    return running_;
}

void HttpServer::registerRoute(const std::string& method, const std::string& path_pattern,
                               RequestHandler handler) {
    Route route;
    route.method = method;
    route.path_pattern = path_pattern;
    route.path_regex = pathPatternToRegex(path_pattern, route.param_names);
    route.handler = std::move(handler);
    routes_.push_back(std::move(route));
}

std::regex HttpServer::pathPatternToRegex(const std::string& pattern,
                                          std::vector<std::string>& param_names) {
    param_names.clear();
    std::string result;

    std::size_t pos = 0;
    while (pos < pattern.size()) {
        auto open = pattern.find('{', pos);
        auto close = open == std::string::npos ? std::string::npos : pattern.find('}', open);
        if (open == std::string::npos || close == std::string::npos) {
            result += escapeRegex(std::string_view(pattern).substr(pos));
            break;
        }
        result += escapeRegex(std::string_view(pattern).substr(pos, open - pos));
        param_names.push_back(pattern.substr(open + 1, close - open - 1));
        result += "([^/]+)";
        pos = close + 1;
    }

    return std::regex("^" + result + "$");
}

HttpResponse HttpServer::routeRequest(const HttpRequest& request) const {
    for (const auto& route : routes_) {
        if (route.method != request.method && route.method != "*") {
            continue;
        }

        std::smatch match;
        if (!std::regex_match(request.path, match, route.path_regex)) {
            continue;
        }

        HttpRequest routed = request;
        for (std::size_t i = 0; i < route.param_names.size() && i + 1 < match.size(); ++i) {
            routed.path_params[route.param_names[i]] = urlDecode(match[i + 1].str());
        }

        try {
            return route.handler(routed);
        } catch (const std::exception& e) {
            return createErrorResponse(500, std::string("Internal server error: ") + e.what());
        }
    }

    return createErrorResponse(404, "Not Found");
}

void HttpServer::setTimeout(int seconds) {
    timeout_seconds_ = seconds;
}

void HttpServer::setMaxConnections(int max_connections) {
    max_connections_ = max_connections;
}

HttpResponse HttpServer::createErrorResponse(int status_code, const std::string& message) {
    HttpResponse response;
    response.status_code = status_code;
    response.body = nlohmann::json{{"error", message}}.dump();
    response.headers["Content-Type"] = "application/json";
    return response;
}

}  // namespace network
}  // namespace shop
