/**
 * @file callback_server.cpp
 * @brief Loopback HTTP listener for authorization redirects
 */

#include "tokenward/callback_server.hpp"
#include "tokenward/encoding.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/logging.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <map>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace tokenward {

static constexpr int LISTEN_BACKLOG = 8;
static constexpr int CLIENT_READ_TIMEOUT_SECONDS = 5;

static const char* SUCCESS_PAGE =
    "<!DOCTYPE html><html><head><title>Authorization Successful</title></head>"
    "<body><h1>Authorization Successful</h1>"
    "<p>You can close this window and return to the application.</p></body></html>";

static const char* FAILURE_PAGE =
    "<!DOCTYPE html><html><head><title>Authorization Failed</title></head>"
    "<body><h1>Authorization Failed</h1>"
    "<p>An error occurred during authorization. Please try again.</p></body></html>";

static const char* NOT_FOUND_PAGE =
    "<!DOCTYPE html><html><head><title>Not Found</title></head>"
    "<body><h1>Not Found</h1></body></html>";

static std::string socket_error(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

static void send_response(int fd, const std::string& status, const std::string& body) {
    const std::string response =
        "HTTP/1.1 " + status + "\r\n"
        "Content-Type: text/html; charset=utf-8\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n"
        "\r\n" + body;

    size_t sent = 0;
    while (sent < response.size()) {
        ssize_t n = send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            // The request was already read; a browser that hung up loses only the page
            logger()->debug("Callback response not delivered: {}", std::strerror(errno));
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

// Request line and headers, up to MAX_CALLBACK_REQUEST_BYTES
static std::string read_request_head(int fd) {
    std::string request;
    char buffer[1024];

    while (request.size() < MAX_CALLBACK_REQUEST_BYTES &&
           request.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        request.append(buffer, static_cast<size_t>(n));
    }
    return request;
}

static std::optional<std::string> take_param(const std::map<std::string, std::string>& params,
                                             const char* name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

CallbackServer::CallbackServer(uint16_t port, std::string path)
    : fd_(-1), port_(port), path_(std::move(path)) {
    if (path_.empty() || path_[0] != '/') {
        throw ValidationError("Callback path must start with '/'", "path", path_);
    }

    const std::string endpoint = "127.0.0.1:" + std::to_string(port);

    fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        throw TransportError(socket_error("Cannot create callback socket", errno), endpoint);
    }

    int reuse = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        logger()->debug("SO_REUSEADDR unavailable: {}", std::strerror(errno));
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t length = sizeof(address);

    if (bind(fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 ||
        listen(fd_, LISTEN_BACKLOG) != 0 ||
        getsockname(fd_, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
        int error = errno;
        close(fd_);
        throw TransportError(socket_error("Cannot listen on " + endpoint, error), endpoint);
    }

    port_ = ntohs(address.sin_port);
    logger()->debug("Callback server listening on {}", callback_url());
}

CallbackServer::~CallbackServer() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

std::string CallbackServer::callback_url() const {
    return "http://127.0.0.1:" + std::to_string(port_) + path_;
}

CallbackResult CallbackServer::wait_for_callback(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw TimeoutError(timeout.count() / 1000.0);
        }
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);

        pollfd listener{fd_, POLLIN, 0};
        int ready = poll(&listener, 1, static_cast<int>(std::min<int64_t>(remaining.count(), INT_MAX)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw TransportError(socket_error("Callback poll failed", errno), callback_url());
        }
        if (ready == 0) {
            continue;
        }

        int client = accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN) continue;
            throw TransportError(socket_error("Callback accept failed", errno), callback_url());
        }

        std::optional<CallbackResult> result;
        try {
            result = handle_connection(client);
        } catch (...) {
            close(client);
            throw;
        }
        close(client);

        if (result) {
            return *result;
        }
    }
}

std::optional<CallbackResult> CallbackServer::handle_connection(int client_fd) {
    timeval read_timeout{};
    read_timeout.tv_sec = CLIENT_READ_TIMEOUT_SECONDS;
    if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &read_timeout, sizeof(read_timeout)) != 0) {
        throw TransportError(socket_error("Cannot set callback read timeout", errno), callback_url());
    }

    const std::string request = read_request_head(client_fd);
    const std::string request_line = request.substr(0, request.find("\r\n"));

    // GET /callback?code=...&state=... HTTP/1.1
    size_t first = request_line.find(' ');
    size_t second = first == std::string::npos ? std::string::npos : request_line.find(' ', first + 1);
    if (second == std::string::npos) {
        send_response(client_fd, "400 Bad Request", FAILURE_PAGE);
        return std::nullopt;
    }

    const std::string method = request_line.substr(0, first);
    const std::string target = request_line.substr(first + 1, second - first - 1);
    const size_t question = target.find('?');

    if (method != "GET" || target.substr(0, question) != path_) {
        logger()->debug("Callback server ignoring {} {}", method, target.substr(0, question));
        send_response(client_fd, "404 Not Found", NOT_FOUND_PAGE);
        return std::nullopt;
    }

    std::map<std::string, std::string> params;
    if (question != std::string::npos) {
        try {
            params = parse_query(target);
        } catch (const ValidationError&) {
            send_response(client_fd, "400 Bad Request", FAILURE_PAGE);
            throw;
        }
    }

    CallbackResult result;
    result.code = take_param(params, "code");
    result.state = take_param(params, "state");
    result.error = take_param(params, "error");
    result.error_description = take_param(params, "error_description");

    if (result.is_success()) {
        send_response(client_fd, "200 OK", SUCCESS_PAGE);
    } else {
        send_response(client_fd, "400 Bad Request", FAILURE_PAGE);
    }
    return result;
}

} // namespace tokenward
