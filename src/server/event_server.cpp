/**
 * @file event_server.cpp
 * @brief Event server implementation
 */

#include "event_server.h"

#include "event_stream.h"
#include "wws/core/wws_logger.h"
#include "wws/features/wakeword/wws_backend_registry.h"
#include "wws/features/wakeword/wws_keyword.h"
#include "wws/server/wws_events.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace wws {
namespace server {

namespace {

constexpr const char* kStdioPrefix = "stdio://";
constexpr const char* kTcpPrefix = "tcp://";
constexpr const char* kUnixPrefix = "unix://";

constexpr int kAcceptRetryMs = 100;

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

void set_fd_flags(int fd, bool non_blocking) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
    if (non_blocking) {
        flags = ::fcntl(fd, F_GETFL);
        if (flags >= 0) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
    }
}

}  // namespace

// =============================================================================
// URI PARSING
// =============================================================================

wws_result_t parseServerUri(const std::string& uri, ServerUri& out) {
    out = ServerUri();

    if (starts_with(uri, kStdioPrefix)) {
        out.scheme = UriScheme::Stdio;
        return WWS_SUCCESS;
    }

    if (starts_with(uri, kUnixPrefix)) {
        out.scheme = UriScheme::Unix;
        out.path = uri.substr(std::strlen(kUnixPrefix));
        return out.path.empty() ? WWS_ERROR_INVALID_URI : WWS_SUCCESS;
    }

    if (starts_with(uri, kTcpPrefix)) {
        const std::string rest = uri.substr(std::strlen(kTcpPrefix));
        const size_t colon = rest.rfind(':');
        if (colon == std::string::npos) {
            return WWS_ERROR_INVALID_URI;
        }

        std::string host = rest.substr(0, colon);
        const std::string port = rest.substr(colon + 1);
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }

        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != std::string::npos) {
            return WWS_ERROR_INVALID_URI;
        }
        const long value = std::stol(port);
        if (value > 65535) {
            return WWS_ERROR_INVALID_URI;
        }

        out.scheme = UriScheme::Tcp;
        out.host = host;
        out.port = static_cast<uint16_t>(value);
        return WWS_SUCCESS;
    }

    return WWS_ERROR_INVALID_URI;
}

// =============================================================================
// EVENT SERVER IMPLEMENTATION
// =============================================================================

EventServer& EventServer::instance() {
    static EventServer instance;
    return instance;
}

EventServer::EventServer() = default;

EventServer::~EventServer() {
    if (started_) {
        stop();
    }
}

wws_result_t EventServer::start(const wws_server_config_t& config,
                                std::unique_ptr<wakeword::DetectorFactory> factory) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (started_) {
        return WWS_ERROR_SERVER_ALREADY_RUNNING;
    }

    // Validate config
    if (!config.access_key || config.access_key[0] == '\0') {
        WWS_LOG_ERROR("Server", "access_key is required");
        return WWS_ERROR_ACCESS_KEY_MISSING;
    }
    if (!(config.sensitivity >= 0.0f && config.sensitivity <= 1.0f)) {
        WWS_LOG_ERROR("Server", "Sensitivity must be in [0, 1], got %f", config.sensitivity);
        return WWS_ERROR_INVALID_ARGUMENT;
    }
    if (config.num_custom_keyword_dirs < 0 ||
        (config.num_custom_keyword_dirs > 0 && !config.custom_keyword_dirs)) {
        return WWS_ERROR_INVALID_ARGUMENT;
    }

    const std::string uri = config.uri ? config.uri : kStdioPrefix;
    ServerUri parsed;
    if (WWS_FAILED(parseServerUri(uri, parsed))) {
        WWS_LOG_ERROR("Server", "Invalid URI: %s", uri.c_str());
        return WWS_ERROR_INVALID_URI;
    }

    // Discover keywords
    wakeword::DiscoveryOptions options;
    options.data_dir = config.data_dir ? config.data_dir : "./data";
    options.system = (config.system && config.system[0] != '\0') ? config.system
                                                                  : wakeword::detectSystem();
    options.custom_keyword_dirs.push_back(
        (std::filesystem::path(options.data_dir) / "custom_models").string());
    for (int32_t i = 0; i < config.num_custom_keyword_dirs; ++i) {
        if (config.custom_keyword_dirs[i]) {
            options.custom_keyword_dirs.push_back(config.custom_keyword_dirs[i]);
        }
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(options.data_dir, ec)) {
        WWS_LOG_WARNING("Server", "Data directory not found: %s", options.data_dir.c_str());
    }

    wakeword::DiscoveryResult discovered;
    wws_result_t rc = wakeword::discoverKeywords(options, discovered);
    if (WWS_FAILED(rc)) {
        return rc;
    }

    if (discovered.keywords.empty()) {
        WWS_LOG_WARNING("Server", "No keywords found for system %s", options.system.c_str());
    } else {
        WWS_LOG_INFO("Server", "Loaded %zu keyword(s) for system %s", discovered.keywords.size(),
                     options.system.c_str());
    }
    for (const auto& entry : discovered.keywords) {
        WWS_LOG_INFO("Server", "Keyword: %s (%s) %s", entry.second.name.c_str(),
                     entry.second.language.c_str(), entry.second.model_path.c_str());
    }

    // Detector factory
    if (!factory) {
        const std::string device = config.device ? config.device : "";
        rc = wakeword::createDetectorFactory(discovered.language_models, device, factory);
        if (WWS_FAILED(rc)) {
            return rc;
        }
    }

    factory_ = std::move(factory);
    numKeywords_ = static_cast<int32_t>(discovered.keywords.size());
    cache_ = std::make_unique<wakeword::DetectorCache>(std::move(discovered.keywords), *factory_);

    SessionConfig session_config;
    session_config.sensitivity = config.sensitivity;
    session_config.access_key = config.access_key;
    session_config.info = events::makeInfo(cache_->keywords());
    sessions_ = std::make_unique<SessionManager>(*cache_, std::move(session_config));

    // Cancellation pipe
    int fds[2];
    if (::pipe(fds) != 0) {
        WWS_LOG_ERROR("Server", "pipe failed: %s", std::strerror(errno));
        sessions_.reset();
        cache_.reset();
        factory_.reset();
        return WWS_ERROR_UNKNOWN;
    }
    set_fd_flags(fds[0], true);
    set_fd_flags(fds[1], true);
    cancelReadFd_ = fds[0];
    cancelWriteFd_ = fds[1];

    uri_ = parsed;
    uriString_ = uri;
    boundPort_ = 0;

    if (uri_.scheme != UriScheme::Stdio) {
        rc = openListener();
        if (WWS_FAILED(rc)) {
            closeCancelPipe();
            sessions_.reset();
            cache_.reset();
            factory_.reset();
            return rc;
        }
    }

    // Reset state
    connFds_.clear();
    connThreads_ = 0;
    exitCode_ = 0;
    startTime_ = std::chrono::steady_clock::now();
    running_ = true;
    started_ = true;

    serverThread_ = std::thread(&EventServer::serverThread, this);

    if (uri_.scheme == UriScheme::Tcp) {
        WWS_LOG_INFO("Server", "Wake word server listening on tcp://%s:%u",
                     uri_.host.empty() ? "0.0.0.0" : uri_.host.c_str(),
                     static_cast<unsigned>(boundPort_));
    } else {
        WWS_LOG_INFO("Server", "Wake word server started on %s", uriString_.c_str());
    }
    return WWS_SUCCESS;
}

wws_result_t EventServer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!started_) {
        return WWS_ERROR_SERVER_NOT_RUNNING;
    }

    WWS_LOG_INFO("Server", "Stopping server...");

    interrupt();

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    closeListener();
    closeCancelPipe();

    // Sessions hold references into the cache, and the cache into the factory
    sessions_.reset();
    cache_.reset();
    factory_.reset();

    started_ = false;
    running_ = false;

    WWS_LOG_INFO("Server", "Server stopped");
    return WWS_SUCCESS;
}

void EventServer::interrupt() {
    const int fd = cancelWriteFd_.load();
    if (fd < 0) {
        return;
    }
    // The pipe is never drained, so a failed write (EAGAIN) means it is
    // already signalled.
    const char byte = 1;
    ssize_t n = ::write(fd, &byte, 1);
    (void)n;
}

bool EventServer::isRunning() const {
    return running_;
}

void EventServer::getStatus(wws_server_status_t& status) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Use a thread_local copy so the c_str() pointer stays valid after lock release
    thread_local std::string tl_uri;
    tl_uri = uriString_;

    status.is_running = running_ ? WWS_TRUE : WWS_FALSE;
    status.uri = tl_uri.c_str();
    status.port = boundPort_;
    status.active_connections = sessions_ ? sessions_->activeConnections() : 0;
    status.total_connections = sessions_ ? sessions_->totalConnections() : 0;
    status.total_detections = sessions_ ? sessions_->totalDetections() : 0;
    status.idle_detectors = cache_ ? static_cast<int32_t>(cache_->totalIdle()) : 0;
    status.num_keywords = started_ ? numKeywords_ : 0;

    if (running_) {
        auto now = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_);
        status.uptime_seconds = duration.count();
    } else {
        status.uptime_seconds = 0;
    }
}

int EventServer::wait() {
    std::unique_lock<std::mutex> lock(doneMutex_);
    doneCv_.wait(lock, [this] { return !running_; });
    return exitCode_;
}

// =============================================================================
// SOCKETS
// =============================================================================

wws_result_t EventServer::openListener() {
    int fd = -1;

    if (uri_.scheme == UriScheme::Unix) {
        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        if (uri_.path.size() >= sizeof(addr.sun_path)) {
            WWS_LOG_ERROR("Server", "Socket path too long: %s", uri_.path.c_str());
            return WWS_ERROR_INVALID_URI;
        }
        addr.sun_family = AF_UNIX;
        std::memcpy(addr.sun_path, uri_.path.c_str(), uri_.path.size());

        // Remove a stale socket from a previous run
        if (::unlink(uri_.path.c_str()) != 0 && errno != ENOENT) {
            WWS_LOG_WARNING("Server", "Failed to remove %s: %s", uri_.path.c_str(),
                            std::strerror(errno));
        }

        fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0 || ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd, SOMAXCONN) != 0) {
            WWS_LOG_ERROR("Server", "Failed to bind to %s: %s", uri_.path.c_str(),
                          std::strerror(errno));
            if (fd >= 0) {
                ::close(fd);
            }
            return WWS_ERROR_SERVER_BIND_FAILED;
        }
    } else {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_PASSIVE;

        const std::string port = std::to_string(uri_.port);
        struct addrinfo* results = nullptr;
        int gai = ::getaddrinfo(uri_.host.empty() ? nullptr : uri_.host.c_str(), port.c_str(),
                                &hints, &results);
        if (gai != 0) {
            WWS_LOG_ERROR("Server", "Failed to resolve %s: %s", uri_.host.c_str(),
                          ::gai_strerror(gai));
            return WWS_ERROR_SERVER_BIND_FAILED;
        }

        int last_errno = 0;
        for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) {
                last_errno = errno;
                continue;
            }
            int yes = 1;
            if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
                WWS_LOG_DEBUG("Server", "SO_REUSEADDR failed: %s", std::strerror(errno));
            }
            if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, SOMAXCONN) == 0) {
                break;
            }
            last_errno = errno;
            ::close(fd);
            fd = -1;
        }
        ::freeaddrinfo(results);

        if (fd < 0) {
            WWS_LOG_ERROR("Server", "Failed to bind to %s:%u: %s", uri_.host.c_str(),
                          static_cast<unsigned>(uri_.port), std::strerror(last_errno));
            return WWS_ERROR_SERVER_BIND_FAILED;
        }

        struct sockaddr_storage bound;
        socklen_t bound_len = sizeof(bound);
        if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
            if (bound.ss_family == AF_INET) {
                boundPort_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
            } else if (bound.ss_family == AF_INET6) {
                boundPort_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&bound)->sin6_port);
            }
        } else {
            boundPort_ = uri_.port;
        }
    }

    set_fd_flags(fd, true);
    listenFd_ = fd;
    return WWS_SUCCESS;
}

void EventServer::closeListener() {
    if (listenFd_ < 0) {
        return;
    }
    ::close(listenFd_);
    listenFd_ = -1;

    if (uri_.scheme == UriScheme::Unix && ::unlink(uri_.path.c_str()) != 0 && errno != ENOENT) {
        WWS_LOG_WARNING("Server", "Failed to remove %s: %s", uri_.path.c_str(),
                        std::strerror(errno));
    }
}

void EventServer::closeCancelPipe() {
    const int write_fd = cancelWriteFd_.exchange(-1);
    if (write_fd >= 0) {
        ::close(write_fd);
    }
    if (cancelReadFd_ >= 0) {
        ::close(cancelReadFd_);
        cancelReadFd_ = -1;
    }
}

// =============================================================================
// SERVING
// =============================================================================

void EventServer::serverThread() {
    WWS_LOG_DEBUG("Server", "Server thread starting on %s", uriString_.c_str());

    if (uri_.scheme == UriScheme::Stdio) {
        FdEventStream stream(STDIN_FILENO, STDOUT_FILENO, false, cancelReadFd_);
        int exit_code = 0;
        try {
            wws_result_t rc = sessions_->runConnection(stream, stream);
            if (WWS_FAILED(rc)) {
                exit_code = 1;
            }
        } catch (const std::exception& e) {
            WWS_LOG_ERROR("Server", "Error serving stdio: %s", e.what());
            exit_code = 1;
        }
        finishServing(exit_code);
        return;
    }

    acceptLoop();
}

void EventServer::acceptLoop() {
    int exit_code = 0;

    for (;;) {
        struct pollfd fds[2];
        fds[0].fd = listenFd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = cancelReadFd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            WWS_LOG_ERROR("Server", "poll failed: %s", std::strerror(errno));
            exit_code = 1;
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if ((fds[0].revents & (POLLERR | POLLNVAL)) != 0) {
            WWS_LOG_ERROR("Server", "Listening socket failed");
            exit_code = 1;
            break;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        int fd = ::accept(listenFd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED || errno == EPROTO) {
                continue;
            }
            if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS || errno == ENOMEM) {
                WWS_LOG_WARNING("Server", "accept failed: %s", std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptRetryMs));
                continue;
            }
            WWS_LOG_ERROR("Server", "accept failed: %s", std::strerror(errno));
            exit_code = 1;
            break;
        }

        // Accepted sockets are blocking; reads are woken through the cancel pipe
        int flags = ::fcntl(fd, F_GETFL);
        if (flags >= 0 && (flags & O_NONBLOCK) != 0) {
            ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
        }
        set_fd_flags(fd, false);

        if (uri_.scheme == UriScheme::Tcp) {
            int yes = 1;
            if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) != 0) {
                WWS_LOG_DEBUG("Server", "TCP_NODELAY failed: %s", std::strerror(errno));
            }
        }

        {
            std::lock_guard<std::mutex> lock(connMutex_);
            connFds_.insert(fd);
            ++connThreads_;
        }

        try {
            std::thread(&EventServer::connectionThread, this, fd).detach();
        } catch (const std::system_error& e) {
            WWS_LOG_ERROR("Server", "Failed to start connection thread: %s", e.what());
            std::lock_guard<std::mutex> lock(connMutex_);
            connFds_.erase(fd);
            ::close(fd);
            --connThreads_;
        }
    }

    drainConnections();
    finishServing(exit_code);
    WWS_LOG_DEBUG("Server", "Server thread exiting");
}

void EventServer::connectionThread(int fd) {
    {
        FdEventStream stream(fd, fd, true, cancelReadFd_);
        try {
            wws_result_t rc = sessions_->runConnection(stream, stream);
            if (WWS_FAILED(rc)) {
                WWS_LOG_DEBUG("Server", "Connection closed: %s", wws_error_message(rc));
            }
        } catch (const std::exception& e) {
            WWS_LOG_ERROR("Server", "Error serving connection: %s", e.what());
        }
    }

    std::lock_guard<std::mutex> lock(connMutex_);
    connFds_.erase(fd);
    ::close(fd);
    --connThreads_;
    connCv_.notify_all();
}

void EventServer::drainConnections() {
    interrupt();

    std::unique_lock<std::mutex> lock(connMutex_);
    if (!connFds_.empty()) {
        WWS_LOG_DEBUG("Server", "Closing %zu connection(s)", connFds_.size());
    }
    for (int fd : connFds_) {
        ::shutdown(fd, SHUT_RDWR);
    }
    connCv_.wait(lock, [this] { return connThreads_ == 0; });
}

void EventServer::finishServing(int exit_code) {
    std::lock_guard<std::mutex> lock(doneMutex_);
    exitCode_ = exit_code;
    running_ = false;
    doneCv_.notify_all();
}

}  // namespace server
}  // namespace wws

// =============================================================================
// C API IMPLEMENTATION
// =============================================================================

extern "C" {

WWS_API wws_result_t wws_server_start(const wws_server_config_t* config) {
    if (!config) {
        return WWS_ERROR_INVALID_ARGUMENT;
    }
    return wws::server::EventServer::instance().start(*config);
}

WWS_API wws_result_t wws_server_stop(void) {
    return wws::server::EventServer::instance().stop();
}

WWS_API void wws_server_interrupt(void) {
    wws::server::EventServer::instance().interrupt();
}

WWS_API wws_bool_t wws_server_is_running(void) {
    return wws::server::EventServer::instance().isRunning() ? WWS_TRUE : WWS_FALSE;
}

WWS_API wws_result_t wws_server_get_status(wws_server_status_t* status) {
    if (!status) {
        return WWS_ERROR_NULL_POINTER;
    }
    wws::server::EventServer::instance().getStatus(*status);
    return WWS_SUCCESS;
}

WWS_API int wws_server_wait(void) {
    return wws::server::EventServer::instance().wait();
}

}  // extern "C"
