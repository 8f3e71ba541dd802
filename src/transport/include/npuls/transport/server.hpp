// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace npuls {

/**
 * @brief Blocks SIGINT and SIGTERM in the calling thread
 *
 * Call at the start of main, before any thread exists, so every thread inherits the mask
 * and the signals are only received by LatencyServer::shutdown_on_signals.
 */
void block_termination_signals();

struct ServerOptions {
    std::string host = "0.0.0.0";
    /// 0 lets the system pick a free port, see LatencyServer::port()
    int port = 15003;
    /// Upper bound of threads serving requests
    int max_threads = 4;
};

/**
 * @brief gRPC server hosting one service with an explicit shutdown control channel
 *
 * Shutdown requests are served by a control thread, optionally after a delay, so a request
 * handler can ask for the server to stop once its own response has been sent.
 */
class LatencyServer {
public:
    LatencyServer(ServerOptions options, std::shared_ptr<grpc::Service> service);
    ~LatencyServer();

    LatencyServer(const LatencyServer&) = delete;
    LatencyServer& operator=(const LatencyServer&) = delete;

    /**
     * @brief Binds the address and starts serving
     * @throw npuls::TransportError when the address cannot be bound
     */
    void start();

    /// @brief Blocks until the server is shut down
    void wait();

    /// @brief Bound port, valid after start()
    int port() const {
        return m_port;
    }

    /**
     * @brief Asks the server to stop; returns immediately
     * @param delay Time to wait before the shutdown starts
     */
    void request_shutdown(std::chrono::milliseconds delay = std::chrono::milliseconds(0));

    /**
     * @brief Serves SIGINT and SIGTERM as shutdown requests
     *
     * The signals must be blocked with block_termination_signals() first.
     */
    void shutdown_on_signals();

private:
    void control_loop();
    void signal_loop();

    ServerOptions m_options;
    std::shared_ptr<grpc::Service> m_service;
    std::unique_ptr<grpc::Server> m_server;
    int m_port = 0;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_shutdown_requested = false;
    std::chrono::milliseconds m_shutdown_delay{0};
    std::atomic<bool> m_stopped{false};
    std::thread m_control_thread;
    std::thread m_signal_thread;
};

}  // namespace npuls
