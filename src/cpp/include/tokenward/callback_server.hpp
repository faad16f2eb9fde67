/**
 * @file callback_server.hpp
 * @brief Loopback HTTP listener for authorization redirects
 */

#ifndef TOKENWARD_CALLBACK_SERVER_HPP
#define TOKENWARD_CALLBACK_SERVER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tokenward {

constexpr const char* DEFAULT_CALLBACK_PATH = "/callback";
constexpr size_t MAX_CALLBACK_REQUEST_BYTES = 8 * 1024;

/**
 * Query parameters of the redirect that reached the callback path
 */
struct CallbackResult {
    std::optional<std::string> code;
    std::optional<std::string> state;
    std::optional<std::string> error;
    std::optional<std::string> error_description;

    bool is_success() const { return code.has_value() && !error.has_value(); }
    bool is_error() const { return error.has_value(); }
};

/**
 * Single-use HTTP listener on 127.0.0.1
 *
 * Answers the browser with a small HTML page and hands the redirect's query
 * parameters to the caller. Requests for any other path get a 404 and the
 * server keeps waiting.
 */
class CallbackServer {
public:
    /**
     * Bind and listen
     * @param port Port on 127.0.0.1; 0 picks an ephemeral one
     * @param path Request path the redirect arrives on
     * @throws TransportError if the socket cannot be bound
     */
    explicit CallbackServer(uint16_t port = 0, std::string path = DEFAULT_CALLBACK_PATH);

    ~CallbackServer();

    CallbackServer(const CallbackServer&) = delete;
    CallbackServer& operator=(const CallbackServer&) = delete;

    uint16_t port() const { return port_; }
    const std::string& path() const { return path_; }

    /// http://127.0.0.1:<port><path>
    std::string callback_url() const;

    /**
     * Block until a GET on the callback path arrives
     * @param timeout Upper bound on the wait
     * @return Parameters of the redirect, successful or not
     * @throws TimeoutError if nothing arrives in time
     * @throws ValidationError if the redirect's query is malformed
     * @throws TransportError on socket failure
     */
    CallbackResult wait_for_callback(std::chrono::milliseconds timeout);

private:
    std::optional<CallbackResult> handle_connection(int client_fd);

    int fd_;
    uint16_t port_;
    std::string path_;
};

} // namespace tokenward

#endif // TOKENWARD_CALLBACK_SERVER_HPP
