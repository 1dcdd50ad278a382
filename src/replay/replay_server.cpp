#include "replay/replay_server.hpp"
#include <spdlog/spdlog.h>

namespace draftlink::replay {

ReplayServer::ReplayServer(const CaptureSession& session, std::string capture_path,
                           std::string address, std::uint16_t port)
    : cursor_(build_steps(session))
    , capture_path_(std::move(capture_path))
    , started_(session.start_time)
    , address_(address)
    , server_(std::move(address), port, std::string(kWebSocketPath))
{
    server_.set_greeting_provider([this]() -> std::optional<std::string> {
        return cursor_.current().raw;
    });
    server_.set_health_provider([this]() {
        return health().dump();
    });
}

ReplayServer::~ReplayServer() {
    stop();
}

void ReplayServer::start() {
    server_.start();
    spdlog::info("Replay serving {} steps from {}", cursor_.size(), capture_path_);
}

void ReplayServer::stop() {
    server_.stop();
}

void ReplayServer::broadcast(const Step& step) {
    server_.broadcast_text(step.raw);
}

Json ReplayServer::health() const {
    const Step& step = cursor_.current();

    Json j;
    j["steps"] = cursor_.size();
    j["current"] = step.index;
    j["summary"] = step.summary;
    j["capture"] = capture_path_;
    j["started"] = started_;
    j["currentStepTimestamp"] = step_time_text(step);
    return j;
}

std::uint16_t ReplayServer::local_port() const noexcept {
    return server_.local_port();
}

std::size_t ReplayServer::client_count() const {
    return server_.client_count();
}

std::string ReplayServer::websocket_url() const {
    return "ws://" + address_ + ":" + std::to_string(local_port()) + std::string(kWebSocketPath);
}

std::string ReplayServer::health_url() const {
    return "http://" + address_ + ":" + std::to_string(local_port()) + "/health";
}

}  // namespace draftlink::replay
