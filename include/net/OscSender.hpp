#pragma once

#include <mutex>
#include <string>
#include <lo/lo.h>

#include "core/Types.hpp"

namespace net {

/**
 * Pushes stabilizer decisions to an OSC listener.
 *
 *   /gesture/stable      i classId, f confidence, s label, s status  (on label change)
 *   /gesture/actionable  i classId, f confidence                     (predictedClass set)
 *
 * Called from the stabilizer's decision callback, so publish() is synchronous
 * and thread-safe. UDP sends never block long enough to matter.
 */
class OscSender {
public:
    OscSender(const std::string& host, const std::string& port);
    ~OscSender();

    /**
     * Returns false if the target address cannot be created.
     */
    bool start();
    void stop();

    void publish(const core::StableDecision& decision);

    [[nodiscard]] bool isRunning() const;

private:
    void sendStable(const core::StableDecision& decision);
    void sendActionable(const core::StableDecision& decision);

    std::string _host;
    std::string _port;

    mutable std::mutex _mutex;
    lo_address _loAddress = nullptr;
    std::string _lastLabel;
    bool _hasLast = false;
};

} // namespace net
