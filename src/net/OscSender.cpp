#include "net/OscSender.hpp"
#include "core/Logger.hpp"

namespace net {

OscSender::OscSender(const std::string& host, const std::string& port)
    : _host(host), _port(port) {
}

OscSender::~OscSender() {
    stop();
}

bool OscSender::start() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_loAddress) return true;

    // Initialize liblo address
    _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    _hasLast = false;
    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
    return true;
}

void OscSender::stop() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_loAddress) return;
    lo_address_free(_loAddress);
    _loAddress = nullptr;
    core::Logger::info("OscSender stopped.");
}

bool OscSender::isRunning() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _loAddress != nullptr;
}

void OscSender::publish(const core::StableDecision& decision) {
    if (decision.status == core::DecisionStatus::Buffering) return;

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_loAddress) return;

    if (!_hasLast || decision.label != _lastLabel) {
        sendStable(decision);
        _lastLabel = decision.label;
        _hasLast = true;
    }

    if (decision.predictedClass >= 0) {
        sendActionable(decision);
    }
}

void OscSender::sendStable(const core::StableDecision& decision) {
    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, static_cast<int32_t>(decision.classId));
    lo_message_add_float(msg, decision.confidence);
    lo_message_add_string(msg, decision.label.c_str());
    lo_message_add_string(msg, core::statusName(decision.status));

    if (lo_send_message(_loAddress, "/gesture/stable", msg) == -1) {
        core::Logger::error("OscSender: Failed to send /gesture/stable: ", lo_address_errstr(_loAddress));
    }
    lo_message_free(msg);
}

void OscSender::sendActionable(const core::StableDecision& decision) {
    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, static_cast<int32_t>(decision.predictedClass));
    lo_message_add_float(msg, decision.confidence);

    if (lo_send_message(_loAddress, "/gesture/actionable", msg) == -1) {
        core::Logger::error("OscSender: Failed to send /gesture/actionable: ", lo_address_errstr(_loAddress));
    }
    lo_message_free(msg);
}

} // namespace net
