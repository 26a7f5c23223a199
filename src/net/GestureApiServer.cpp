#include "net/GestureApiServer.hpp"
#include "core/Logger.hpp"
#include "inference/Classifier.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace net {

namespace {

using nlohmann::json;

double roundTo(double value, double scale) {
    return std::round(value * scale) / scale;
}

const json& requireField(const json& body, const std::string& name) {
    auto it = body.find(name);
    if (it == body.end() || it->is_null()) {
        throw HttpError(422, name + ": field required");
    }
    return *it;
}

// Integral JSON number that fits an int; anything else is a 422
int requireInt(const json& body, const std::string& name) {
    constexpr int64_t MIN = std::numeric_limits<int>::min();
    constexpr int64_t MAX = std::numeric_limits<int>::max();

    const json& v = requireField(body, name);
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() <= static_cast<uint64_t>(MAX)) {
            return static_cast<int>(v.get<uint64_t>());
        }
        throw HttpError(422, name + ": integer out of range");
    }
    if (v.is_number_integer()) {
        int64_t i = v.get<int64_t>();
        if (i >= MIN && i <= MAX) {
            return static_cast<int>(i);
        }
        throw HttpError(422, name + ": integer out of range");
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && std::floor(d) == d) {
            if (d >= static_cast<double>(MIN) && d <= static_cast<double>(MAX)) {
                return static_cast<int>(d);
            }
            throw HttpError(422, name + ": integer out of range");
        }
    }
    throw HttpError(422, name + ": value is not a valid integer");
}

double requireNumber(const json& body, const std::string& name) {
    const json& v = requireField(body, name);
    if (!v.is_number()) {
        throw HttpError(422, name + ": value is not a valid number");
    }
    return v.get<double>();
}

} // namespace

GestureApiServer::GestureApiServer(std::shared_ptr<core::GestureStabilizer> stabilizer, Config config)
    : _stabilizer(std::move(stabilizer)),
      _config(config),
      _server("GestureApiServer", config.port,
              [this](const HttpRequest& request, HttpConnection& connection) {
                  connection.sendResponse(handle(request));
              }) {
}

GestureApiServer::~GestureApiServer() {
    stop();
}

void GestureApiServer::start() {
    _server.start();
}

void GestureApiServer::stop() {
    _server.stop();
}

HttpResponse GestureApiServer::handle(const HttpRequest& request) {
    HttpResponse response;
    try {
        if (request.method == "OPTIONS") {
            response.status = 204;
            response.header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            response.header("Access-Control-Allow-Headers", "*");
        } else if (request.path == "/" && request.method == "GET") {
            response = json(200, {{"status", "Gesture Backend Online"},
                                  {"model", _stabilizer->classifierName()}});
        } else if (request.path == "/ingest" && request.method == "POST") {
            response = ingest(request);
        } else if (request.path == "/observe" && request.method == "POST") {
            response = observe(request);
        } else if (request.path == "/predict" && request.method == "GET") {
            response = predict();
        } else if (request.path == "/latest" && request.method == "GET") {
            response = latest();
        } else if (request.path == "/" || request.path == "/ingest" || request.path == "/observe" ||
                   request.path == "/predict" || request.path == "/latest") {
            response = json(405, {{"detail", "Method Not Allowed"}});
        } else {
            response = json(404, {{"detail", "Not Found"}});
        }
    } catch (const HttpError& e) {
        response = json(e.status(), {{"detail", e.what()}});
    } catch (const inference::ClassifierError& e) {
        core::Logger::warn("GestureApiServer: classification failed: ", e.what());
        response = json(_stabilizer->hasClassifier() ? 500 : 503, {{"detail", e.what()}});
    } catch (const std::exception& e) {
        core::Logger::error("GestureApiServer: ", request.method, " ", request.path, " failed: ", e.what());
        response = json(500, {{"detail", "Internal Server Error"}});
    }

    response.header("Access-Control-Allow-Origin", "*");
    return response;
}

HttpResponse GestureApiServer::ingest(const HttpRequest& request) {
    core::SensorSample sample = parseSensorSample(parseBody(request));

    _stabilizer->addSample(sample.toFeatures());
    {
        std::lock_guard<std::mutex> lock(_latestMutex);
        _latest = std::move(sample);
    }
    return json(200, {{"status", "ok"}});
}

HttpResponse GestureApiServer::observe(const HttpRequest& request) {
    nlohmann::json body = parseBody(request);
    int classId = requireInt(body, "class_id");
    if (classId < 0) {
        throw HttpError(422, "class_id: must be >= 0");
    }
    double confidence = requireNumber(body, "confidence");
    if (confidence < 0.0 || confidence > 1.0) {
        throw HttpError(422, "confidence: must be within [0,1]");
    }

    core::StableDecision decision = _stabilizer->observe(classId, static_cast<float>(confidence));
    return json(200, decisionToJson(decision));
}

HttpResponse GestureApiServer::predict() {
    core::StableDecision decision = _stabilizer->predict();
    nlohmann::json body = decisionToJson(decision);

    if (decision.status != core::DecisionStatus::Buffering) {
        std::lock_guard<std::mutex> lock(_latestMutex);
        body["latest_values"] = _latest ? sampleToJson(*_latest) : nlohmann::json::object();
        body["raw_volts_ch0"] = _latest ? _latest->volt[0] : 0.0;
    }
    return json(200, body);
}

HttpResponse GestureApiServer::latest() {
    std::lock_guard<std::mutex> lock(_latestMutex);
    if (!_latest) {
        return json(200, {{"status", "no_data"}, {"message", "Waiting for sensor data..."}});
    }
    return json(200, sampleToJson(*_latest));
}

core::SensorSample GestureApiServer::parseSensorSample(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw HttpError(422, "body: expected a JSON object");
    }

    core::SensorSample sample;
    const nlohmann::json& timestamp = requireField(body, "timestamp");
    if (!timestamp.is_string()) {
        throw HttpError(422, "timestamp: value is not a valid string");
    }
    sample.timestamp = timestamp.get<std::string>();

    for (size_t ch = 0; ch < core::SENSOR_CHANNELS; ++ch) {
        const std::string prefix = "ch" + std::to_string(ch);
        sample.raw[ch] = requireInt(body, prefix + "_raw");
        sample.volt[ch] = requireNumber(body, prefix + "_volt");
    }
    sample.target = requireInt(body, "target");
    return sample;
}

nlohmann::json GestureApiServer::sampleToJson(const core::SensorSample& sample) {
    nlohmann::json out;
    out["timestamp"] = sample.timestamp;
    for (size_t ch = 0; ch < core::SENSOR_CHANNELS; ++ch) {
        const std::string prefix = "ch" + std::to_string(ch);
        out[prefix + "_raw"] = sample.raw[ch];
        out[prefix + "_volt"] = sample.volt[ch];
    }
    out["target"] = sample.target;
    return out;
}

nlohmann::json GestureApiServer::decisionToJson(const core::StableDecision& decision) {
    return {
        {"gesture", decision.label},
        {"predicted_class", decision.predictedClass},
        {"confidence", roundTo(decision.confidence, 100.0)},
        {"status", core::statusName(decision.status)},
    };
}

nlohmann::json GestureApiServer::parseBody(const HttpRequest& request) {
    try {
        return nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw HttpError(400, std::string("Malformed JSON: ") + e.what());
    }
}

HttpResponse GestureApiServer::json(int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.contentType = "application/json";
    response.body = body.dump();
    return response;
}

} // namespace net
