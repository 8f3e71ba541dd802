// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/transport/server.hpp"

#include <pthread.h>
#include <signal.h>

#include <ctime>

#include "npuls/common/except.hpp"
#include "npuls/common/slog.hpp"

namespace npuls {

namespace {
sigset_t termination_signals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    return signals;
}
}  // namespace

void block_termination_signals() {
    const auto signals = termination_signals();
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        NPULS_THROW("Cannot block termination signals");
    }
}

LatencyServer::LatencyServer(ServerOptions options, std::shared_ptr<grpc::Service> service)
    : m_options(std::move(options)),
      m_service(std::move(service)) {
    NPULS_ASSERT(m_service, "Service is not set");
}

LatencyServer::~LatencyServer() {
    request_shutdown();
    if (m_control_thread.joinable()) {
        m_control_thread.join();
    }
    m_stopped = true;
    if (m_signal_thread.joinable()) {
        m_signal_thread.join();
    }
}

void LatencyServer::start() {
    const std::string address = m_options.host + ":" + std::to_string(m_options.port);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &m_port);
    builder.RegisterService(m_service.get());
    builder.SetMaxReceiveMessageSize(-1);
    builder.SetMaxSendMessageSize(-1);
    grpc::ResourceQuota quota("npuls_server");
    quota.SetMaxThreads(m_options.max_threads);
    builder.SetResourceQuota(quota);

    m_server = builder.BuildAndStart();
    if (!m_server || m_port == 0) {
        throw TransportError(static_cast<int>(grpc::StatusCode::UNAVAILABLE), "Cannot listen on " + address);
    }
    slog::info << "Server listening on " << m_options.host << ":" << m_port << slog::endl;
    m_control_thread = std::thread(&LatencyServer::control_loop, this);
}

void LatencyServer::wait() {
    NPULS_ASSERT(m_server, "Server is not started");
    m_server->Wait();
    m_stopped = true;
}

void LatencyServer::request_shutdown(std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown_requested) {
            return;
        }
        m_shutdown_requested = true;
        m_shutdown_delay = delay;
    }
    m_cv.notify_all();
}

void LatencyServer::control_loop() {
    std::chrono::milliseconds delay;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] {
            return m_shutdown_requested;
        });
        delay = m_shutdown_delay;
    }
    if (delay.count() > 0) {
        slog::info << "Server shuts down in " << delay.count() << " ms" << slog::endl;
        std::this_thread::sleep_for(delay);
    }
    slog::info << "Shutting down server" << slog::endl;
    m_server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
}

void LatencyServer::shutdown_on_signals() {
    m_signal_thread = std::thread(&LatencyServer::signal_loop, this);
}

void LatencyServer::signal_loop() {
    const auto signals = termination_signals();
    const timespec timeout{0, 200 * 1000 * 1000};
    while (!m_stopped) {
        const int sig = sigtimedwait(&signals, nullptr, &timeout);
        if (sig > 0) {
            slog::info << "Received signal " << sig << slog::endl;
            request_shutdown();
            return;
        }
    }
}

}  // namespace npuls
