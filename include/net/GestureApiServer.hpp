#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "core/GestureStabilizer.hpp"
#include "core/Types.hpp"
#include "net/HttpServer.hpp"

namespace net {

/**
 * JSON API in front of the GestureStabilizer.
 *
 *   GET  /         backend info
 *   POST /ingest   one SensorSample, appended to the raw window
 *   POST /observe  {"class_id", "confidence"} straight into the vote
 *   GET  /predict  stabilized decision
 *   GET  /latest   last ingested sample
 *
 * Every response allows any origin (the browser UI is served elsewhere).
 */
class GestureApiServer {
public:
    struct Config {
        int port = 8000;
    };

    GestureApiServer(std::shared_ptr<core::GestureStabilizer> stabilizer, Config config);
    ~GestureApiServer();

    /**
     * Throws std::runtime_error if the port cannot be bound.
     */
    void start();
    void stop();

    [[nodiscard]] int port() const { return _server.port(); }

    /**
     * Route one request. Never throws.
     */
    HttpResponse handle(const HttpRequest& request);

    /**
     * Validate an /ingest body. Throws HttpError(422) naming the bad field.
     */
    static core::SensorSample parseSensorSample(const nlohmann::json& body);

    static nlohmann::json sampleToJson(const core::SensorSample& sample);

    /**
     * {"gesture", "predicted_class", "confidence" (2 dp), "status"}
     */
    static nlohmann::json decisionToJson(const core::StableDecision& decision);

private:
    HttpResponse ingest(const HttpRequest& request);
    HttpResponse observe(const HttpRequest& request);
    HttpResponse predict();
    HttpResponse latest();

    static nlohmann::json parseBody(const HttpRequest& request);
    static HttpResponse json(int status, const nlohmann::json& body);

    std::shared_ptr<core::GestureStabilizer> _stabilizer;
    Config _config;

    std::mutex _latestMutex;
    std::optional<core::SensorSample> _latest;

    HttpServer _server;
};

} // namespace net
