/**
 * @file event_server.h
 * @brief Internal event server implementation
 *
 * Owns the detector factory, the detector cache and the session manager for
 * the lifetime of one start/stop cycle. Serves a single stdio session, or
 * accepts TCP / Unix socket connections on a server thread and runs each
 * connection on its own thread.
 *
 * Shutdown uses a self-pipe: interrupt() writes one byte, which wakes the
 * accept loop and every blocked event read.
 */

#ifndef WWS_EVENT_SERVER_INTERNAL_H
#define WWS_EVENT_SERVER_INTERNAL_H

#include "session_manager.h"

#include "wws/features/wakeword/wws_detector.h"
#include "wws/features/wakeword/wws_detector_cache.h"
#include "wws/server/wws_server.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace wws {
namespace server {

enum class UriScheme { Stdio, Tcp, Unix };

struct ServerUri {
    UriScheme scheme = UriScheme::Stdio;
    std::string host;  ///< tcp only, empty = all interfaces
    uint16_t port = 0;  ///< tcp only, 0 = any free port
    std::string path;  ///< unix only
};

/**
 * @brief Parse stdio://, tcp://host:port or unix://path
 *
 * @return WWS_SUCCESS or WWS_ERROR_INVALID_URI
 */
wws_result_t parseServerUri(const std::string& uri, ServerUri& out);

class EventServer {
public:
    static EventServer& instance();

    /**
     * @brief Start serving
     *
     * @param config Server configuration
     * @param factory Detector factory to use. When null, one is created
     *        from the registered detector backend.
     * @return WWS_SUCCESS on success, error code on failure
     */
    wws_result_t start(const wws_server_config_t& config,
                       std::unique_ptr<wakeword::DetectorFactory> factory = nullptr);

    /**
     * @brief Stop serving and release every resource
     *
     * @return WWS_SUCCESS, or WWS_ERROR_SERVER_NOT_RUNNING
     */
    wws_result_t stop();

    /**
     * @brief Wake the server thread and every session (async-signal-safe)
     */
    void interrupt();

    bool isRunning() const;

    void getStatus(wws_server_status_t& status) const;

    /**
     * @brief Block until the server thread has finished serving
     *
     * @return Exit code
     */
    int wait();

    EventServer(const EventServer&) = delete;
    EventServer& operator=(const EventServer&) = delete;
    EventServer(EventServer&&) = delete;
    EventServer& operator=(EventServer&&) = delete;

private:
    EventServer();
    ~EventServer();

    wws_result_t openListener();
    void closeListener();
    void closeCancelPipe();

    /** stdio session, or the accept loop */
    void serverThread();
    void acceptLoop();
    void connectionThread(int fd);

    /** Shut down live sockets and wait for their sessions to finish */
    void drainConnections();

    void finishServing(int exit_code);

    // Server state
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    bool started_ = false;
    mutable std::mutex mutex_;

    // Configuration (copied on start)
    std::string uriString_;
    ServerUri uri_;
    uint16_t boundPort_ = 0;

    // Sockets
    int listenFd_ = -1;
    int cancelReadFd_ = -1;
    std::atomic<int> cancelWriteFd_{-1};

    // Detection
    std::unique_ptr<wakeword::DetectorFactory> factory_;
    std::unique_ptr<wakeword::DetectorCache> cache_;
    std::unique_ptr<SessionManager> sessions_;
    int32_t numKeywords_ = 0;

    // Live connections
    std::mutex connMutex_;
    std::condition_variable connCv_;
    std::set<int> connFds_;
    int32_t connThreads_ = 0;

    // Completion (for wait)
    std::mutex doneMutex_;
    std::condition_variable doneCv_;
    int exitCode_ = 0;

    std::chrono::steady_clock::time_point startTime_;
};

}  // namespace server
}  // namespace wws

#endif  // WWS_EVENT_SERVER_INTERNAL_H
