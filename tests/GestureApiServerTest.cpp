#include <gtest/gtest.h>

#include "net/GestureApiServer.hpp"
#include "TestUtils.hpp"

#include <nlohmann/json.hpp>

using net::GestureApiServer;
using net::HttpRequest;
using net::HttpResponse;
using nlohmann::json;

namespace {

json sampleBody(double ch0Volt = 1.25) {
    json body = {{"timestamp", "2024-05-01T12:00:00"}, {"target", 3}};
    for (int ch = 0; ch < 5; ++ch) {
        body["ch" + std::to_string(ch) + "_raw"] = 1000 + ch;
        body["ch" + std::to_string(ch) + "_volt"] = ch == 0 ? ch0Volt : 0.5 * ch;
    }
    return body;
}

HttpRequest request(const std::string& method, const std::string& path, const std::string& body = "") {
    HttpRequest r;
    r.method = method;
    r.target = path;
    r.path = path;
    r.version = "HTTP/1.1";
    r.body = body;
    return r;
}

std::string headerValue(const HttpResponse& response, const std::string& name) {
    for (const auto& [key, value] : response.headers) {
        if (key == name) return value;
    }
    return "";
}

std::shared_ptr<core::GestureStabilizer> makeStabilizer(std::shared_ptr<const inference::Classifier> classifier) {
    core::GestureStabilizer::Config config;
    config.labels = {"Call", "Emergency", "Food", "Medicine", "No",
                     "Sleep", "Stop", "Washroom", "Water", "Yes"};
    return std::make_shared<core::GestureStabilizer>(config, std::move(classifier));
}

class GestureApiServerTest : public ::testing::Test {
protected:
    void useClassifier(std::shared_ptr<const inference::Classifier> classifier) {
        stabilizer = makeStabilizer(std::move(classifier));
        api = std::make_unique<GestureApiServer>(stabilizer, GestureApiServer::Config{0});
    }

    void SetUp() override {
        useClassifier(std::make_shared<testutil::FixedClassifier>(2, 0.8f));
    }

    HttpResponse ingest(const json& body) {
        return api->handle(request("POST", "/ingest", body.dump()));
    }

    std::shared_ptr<core::GestureStabilizer> stabilizer;
    std::unique_ptr<GestureApiServer> api;
};

} // namespace

TEST(SensorSampleTest, FeaturesInterleaveRawAndVolt) {
    core::SensorSample sample = GestureApiServer::parseSensorSample(sampleBody(3.3));
    auto features = sample.toFeatures();
    ASSERT_EQ(features.size(), core::SENSOR_FEATURES);
    EXPECT_DOUBLE_EQ(features[0], 1000.0);
    EXPECT_DOUBLE_EQ(features[1], 3.3);
    EXPECT_DOUBLE_EQ(features[2], 1001.0);
    EXPECT_DOUBLE_EQ(features[3], 0.5);
    EXPECT_DOUBLE_EQ(features[9], 2.0);
    EXPECT_EQ(sample.target, 3);
}

TEST(SensorSampleTest, MissingFieldIsUnprocessable) {
    json body = sampleBody();
    body.erase("ch3_volt");
    try {
        GestureApiServer::parseSensorSample(body);
        FAIL() << "expected HttpError";
    } catch (const net::HttpError& e) {
        EXPECT_EQ(e.status(), 422);
        EXPECT_NE(std::string(e.what()).find("ch3_volt"), std::string::npos);
    }
}

TEST(SensorSampleTest, WrongTypesAreUnprocessable) {
    json body = sampleBody();
    body["ch1_raw"] = 12.5;
    EXPECT_THROW(GestureApiServer::parseSensorSample(body), net::HttpError);

    body = sampleBody();
    body["ch1_volt"] = "high";
    EXPECT_THROW(GestureApiServer::parseSensorSample(body), net::HttpError);

    EXPECT_THROW(GestureApiServer::parseSensorSample(json::array()), net::HttpError);
}

TEST(SensorSampleTest, IntegralFloatCountsAsInteger) {
    json body = sampleBody();
    body["ch4_raw"] = 17.0;
    EXPECT_EQ(GestureApiServer::parseSensorSample(body).raw[4], 17);
}

TEST(SensorSampleTest, IntegersOutsideIntRangeAreUnprocessable) {
    json body = sampleBody();
    body["ch2_raw"] = 4294967297LL;
    EXPECT_THROW(GestureApiServer::parseSensorSample(body), net::HttpError);

    body = sampleBody();
    body["target"] = -4294967297LL;
    EXPECT_THROW(GestureApiServer::parseSensorSample(body), net::HttpError);

    body = sampleBody();
    body["ch0_raw"] = 1e20;
    try {
        GestureApiServer::parseSensorSample(body);
        FAIL() << "expected HttpError";
    } catch (const net::HttpError& e) {
        EXPECT_EQ(e.status(), 422);
        EXPECT_NE(std::string(e.what()).find("ch0_raw"), std::string::npos);
    }
}

TEST(SensorSampleTest, DecisionJsonRoundsConfidence) {
    core::StableDecision decision;
    decision.label = "Water";
    decision.classId = 8;
    decision.predictedClass = 8;
    decision.confidence = 0.876f;
    decision.status = core::DecisionStatus::Confident;

    json out = GestureApiServer::decisionToJson(decision);
    EXPECT_EQ(out["gesture"], "Water");
    EXPECT_EQ(out["predicted_class"], 8);
    EXPECT_DOUBLE_EQ(out["confidence"].get<double>(), 0.88);
    EXPECT_EQ(out["status"], "confident");
}

TEST_F(GestureApiServerTest, RootDescribesBackend) {
    HttpResponse response = api->handle(request("GET", "/"));
    EXPECT_EQ(response.status, 200);
    json body = json::parse(response.body);
    EXPECT_EQ(body["status"], "Gesture Backend Online");
    EXPECT_EQ(body["model"], "fixed");
}

TEST_F(GestureApiServerTest, EveryResponseAllowsAnyOrigin) {
    for (const auto& r : {request("GET", "/"), request("GET", "/missing"), request("OPTIONS", "/predict"),
                          request("POST", "/ingest", "{")}) {
        EXPECT_EQ(headerValue(api->handle(r), "Access-Control-Allow-Origin"), "*") << r.path;
    }
}

TEST_F(GestureApiServerTest, PreflightHasNoContent) {
    HttpResponse response = api->handle(request("OPTIONS", "/ingest"));
    EXPECT_EQ(response.status, 204);
    EXPECT_NE(headerValue(response, "Access-Control-Allow-Methods").find("POST"), std::string::npos);
}

TEST_F(GestureApiServerTest, LatestBeforeAnyData) {
    json body = json::parse(api->handle(request("GET", "/latest")).body);
    EXPECT_EQ(body["status"], "no_data");
    EXPECT_EQ(body["message"], "Waiting for sensor data...");
}

TEST_F(GestureApiServerTest, IngestStoresLatestSample) {
    HttpResponse response = ingest(sampleBody(2.5));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(json::parse(response.body)["status"], "ok");
    EXPECT_EQ(stabilizer->rawCount(), 1u);

    json latest = json::parse(api->handle(request("GET", "/latest")).body);
    EXPECT_EQ(latest["timestamp"], "2024-05-01T12:00:00");
    EXPECT_DOUBLE_EQ(latest["ch0_volt"].get<double>(), 2.5);
    EXPECT_EQ(latest["ch4_raw"], 1004);
}

TEST_F(GestureApiServerTest, IngestErrors) {
    EXPECT_EQ(api->handle(request("POST", "/ingest", "{not json")).status, 400);

    json body = sampleBody();
    body.erase("timestamp");
    HttpResponse response = ingest(body);
    EXPECT_EQ(response.status, 422);
    EXPECT_TRUE(json::parse(response.body).contains("detail"));
    EXPECT_EQ(stabilizer->rawCount(), 0u);
}

TEST_F(GestureApiServerTest, PredictBuffersUntilWindowFull) {
    for (int i = 0; i < 19; ++i) ingest(sampleBody());

    HttpResponse response = api->handle(request("GET", "/predict"));
    EXPECT_EQ(response.status, 200);
    json body = json::parse(response.body);
    EXPECT_EQ(body["gesture"], "Initializing...");
    EXPECT_EQ(body["predicted_class"], -1);
    EXPECT_DOUBLE_EQ(body["confidence"].get<double>(), 0.0);
    EXPECT_EQ(body["status"], "buffering");
    EXPECT_FALSE(body.contains("latest_values"));
}

TEST_F(GestureApiServerTest, PredictAfterWindowFull) {
    for (int i = 0; i < 20; ++i) ingest(sampleBody(1.0 + i));

    json body = json::parse(api->handle(request("GET", "/predict")).body);
    EXPECT_EQ(body["gesture"], "Food");
    EXPECT_EQ(body["predicted_class"], 2);
    EXPECT_DOUBLE_EQ(body["confidence"].get<double>(), 0.8);
    EXPECT_EQ(body["status"], "confident");
    EXPECT_DOUBLE_EQ(body["raw_volts_ch0"].get<double>(), 20.0);
    EXPECT_EQ(body["latest_values"]["ch1_raw"], 1001);
}

TEST_F(GestureApiServerTest, ClassifierFailureIsServerError) {
    useClassifier(std::make_shared<testutil::ThrowingClassifier>());
    for (int i = 0; i < 20; ++i) ingest(sampleBody());

    HttpResponse response = api->handle(request("GET", "/predict"));
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(json::parse(response.body)["detail"], "model exploded");
}

TEST_F(GestureApiServerTest, MissingModelIsUnavailable) {
    useClassifier(nullptr);
    EXPECT_EQ(api->handle(request("GET", "/predict")).status, 200);

    for (int i = 0; i < 20; ++i) ingest(sampleBody());
    EXPECT_EQ(api->handle(request("GET", "/predict")).status, 503);
}

TEST_F(GestureApiServerTest, ObserveAppliesGates) {
    json low = json::parse(api->handle(request("POST", "/observe", R"({"class_id": 1, "confidence": 0.3})")).body);
    EXPECT_EQ(low["gesture"], "Unknown");
    EXPECT_EQ(low["status"], "low_confidence");

    json high = json::parse(api->handle(request("POST", "/observe", R"({"class_id": 1, "confidence": 0.9})")).body);
    EXPECT_EQ(high["gesture"], "Emergency");
    EXPECT_EQ(high["predicted_class"], 1);

    EXPECT_EQ(api->handle(request("POST", "/observe", R"({"class_id": 1, "confidence": 2})")).status, 422);
    EXPECT_EQ(api->handle(request("POST", "/observe", R"({"confidence": 0.9})")).status, 422);
}

TEST_F(GestureApiServerTest, ObserveRejectsInvalidClassIds) {
    for (const char* body : {R"({"class_id": -5, "confidence": 0.9})",
                             R"({"class_id": 4294967297, "confidence": 0.9})",
                             R"({"class_id": 1e20, "confidence": 0.9})"}) {
        HttpResponse response = api->handle(request("POST", "/observe", body));
        EXPECT_EQ(response.status, 422) << body;
        EXPECT_EQ(json::parse(response.body).count("detail"), 1u);
    }
    EXPECT_TRUE(stabilizer->voteHistory().empty());
}

TEST_F(GestureApiServerTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(api->handle(request("GET", "/nope")).status, 404);
    EXPECT_EQ(api->handle(request("GET", "/ingest")).status, 405);
    EXPECT_EQ(api->handle(request("DELETE", "/predict")).status, 405);
}

TEST_F(GestureApiServerTest, ServesOverLoopback) {
    api->start();
    ASSERT_GT(api->port(), 0);

    std::string body = sampleBody().dump();
    std::string response = testutil::httpExchange(api->port(),
        "POST /ingest HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: " +
        std::to_string(body.size()) + "\r\n\r\n" + body);
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_EQ(json::parse(testutil::responseBody(response))["status"], "ok");

    response = testutil::httpExchange(api->port(), "GET /latest HTTP/1.1\r\n\r\n");
    EXPECT_NE(response.find("Access-Control-Allow-Origin: *"), std::string::npos);
    EXPECT_EQ(json::parse(testutil::responseBody(response))["ch2_raw"], 1002);

    api->stop();
}
