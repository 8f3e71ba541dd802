// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/transport/client.hpp"

#include <grpcpp/grpcpp.h>

#include "npuls/common/except.hpp"
#include "npuls/common/slog.hpp"

namespace npuls {

RemoteLatencyClient::RemoteLatencyClient(const std::string& host, int port, std::chrono::seconds timeout)
    : m_target(host + ":" + std::to_string(port)),
      m_timeout(timeout) {
    grpc::ChannelArguments args;
    args.SetMaxReceiveMessageSize(-1);
    args.SetMaxSendMessageSize(-1);
    m_stub = proto::LatencyService::NewStub(
        grpc::CreateCustomChannel(m_target, grpc::InsecureChannelCredentials(), args));
}

void RemoteLatencyClient::prepare(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + m_timeout);
}

LatencyReport RemoteLatencyClient::measure(const std::string& model_bytes) const {
    proto::MeasureRequest request;
    request.set_model(model_bytes);
    proto::LatencyReport response;
    grpc::ClientContext context;
    prepare(context);

    slog::info << "Sending " << model_bytes.size() << " bytes to " << m_target << " for measurement" << slog::endl;
    const auto status = m_stub->MeasureLatency(&context, request, &response);
    if (!status.ok()) {
        throw TransportError(static_cast<int>(status.error_code()), status.error_message());
    }
    LatencyReport report;
    for (const auto& item : response.values()) {
        report[item.first] = item.second;
    }
    return report;
}

RemoteCompileResult RemoteLatencyClient::compile(const std::string& model_bytes,
                                                 const std::optional<std::string>& calibration_bytes) const {
    proto::CompileRequest request;
    request.set_model(model_bytes);
    if (calibration_bytes) {
        request.set_calibration_data(*calibration_bytes);
    }
    proto::CompileResponse response;
    grpc::ClientContext context;
    prepare(context);

    slog::info << "Sending " << model_bytes.size() << " bytes to " << m_target << " for compilation" << slog::endl;
    const auto status = m_stub->Compile(&context, request, &response);
    if (!status.ok()) {
        throw TransportError(static_cast<int>(status.error_code()), status.error_message());
    }
    return {response.artifacts(), response.synthetic_calibration()};
}

}  // namespace npuls
