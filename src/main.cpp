#include "core/CameraControl.hpp"
#include "core/CaptureLoop.hpp"
#include "core/CaptureSource.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/ServiceContext.hpp"
#include "net/GestureApiServer.hpp"
#include "net/MjpegServer.hpp"
#include "net/OscSender.hpp"
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

constexpr std::chrono::seconds RESTART_DELAY{5};
constexpr std::chrono::milliseconds POLL_INTERVAL{100};

// Sleep in short steps so Ctrl+C or a reconnect request is not delayed by the restart wait
void interruptibleSleep(std::chrono::milliseconds duration, core::CameraControl& camera) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        if (camera.takeReconnectRequest()) return;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

core::CaptureLoop::Settings captureSettings(const core::ServiceConfig& config) {
    core::CaptureLoop::Settings settings;
    settings.jpegQuality = config.stream.jpegQuality;
    return settings;
}

void waitForShutdown() {
    while (g_running) {
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

// Outer loop for auto-restart of the camera
void runCapture(const core::ServiceContext& context) {
    core::CameraControl& camera = *context.camera;

    while (g_running) {
        bool reconnect = false;
        try {
            auto source = core::createCaptureSource(context.config);
            const std::string sourceName = source->name();
            core::CaptureLoop captureLoop(std::move(source), context.frameBuffer, context.camera,
                                          captureSettings(context.config));
            captureLoop.start();
            camera.setConnected(true, sourceName);

            while (g_running) {
                // Camera disconnected or stopped delivering frames
                if (captureLoop.hasError()) {
                    core::Logger::warn("CaptureLoop reported critical error. Restarting capture...");
                    break;
                }
                if (camera.takeReconnectRequest()) {
                    core::Logger::info("Reconnecting camera...");
                    reconnect = true;
                    break;
                }
                std::this_thread::sleep_for(POLL_INTERVAL);
            }

            captureLoop.stop();
        } catch (const std::exception& e) {
            core::Logger::error("Capture failed: ", e.what());
        }
        camera.setConnected(false);

        if (!g_running) break;
        if (reconnect) continue;

        core::Logger::info("Retrying capture in ", RESTART_DELAY.count(), " seconds...");
        interruptibleSleep(RESTART_DELAY, camera);
    }
}

} // namespace

int main() {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::ServiceConfig config;
    try {
        config = core::ServiceConfig::fromEnvironment();
    } catch (const std::invalid_argument& e) {
        core::Logger::error("Invalid configuration: ", e.what());
        return 1;
    }
    core::Logger::setLevel(config.logLevel);

    core::Logger::info("Starting GestureStream...");
    config.log();

    core::ServiceContext context;
    try {
        context = core::ServiceContext::create(config);
    } catch (const std::exception& e) {
        core::Logger::error("Failed to initialize service: ", e.what());
        return 1;
    }

    std::unique_ptr<net::OscSender> oscSender;
    if (!config.osc.host.empty()) {
        oscSender = std::make_unique<net::OscSender>(config.osc.host, config.osc.port);
        if (oscSender->start()) {
            net::OscSender* sender = oscSender.get();
            context.stabilizer->setDecisionCallback([sender](const core::StableDecision& decision) {
                sender->publish(decision);
            });
        }
    }

    net::MjpegServer::Config streamConfig;
    streamConfig.port = config.stream.port;
    streamConfig.width = config.stream.width;
    streamConfig.height = config.stream.height;
    net::MjpegServer mjpegServer(context.frameBuffer, streamConfig, context.camera);

    std::unique_ptr<net::GestureApiServer> apiServer;
    if (config.api.port != 0) {
        net::GestureApiServer::Config apiConfig;
        apiConfig.port = config.api.port;
        apiServer = std::make_unique<net::GestureApiServer>(context.stabilizer, apiConfig);
    }

    try {
        mjpegServer.start();
        if (apiServer) apiServer->start();
    } catch (const std::exception& e) {
        core::Logger::error("Fatal: ", e.what());
        return 1;
    }

    core::Logger::info("Service running. Press Ctrl+C to exit.");

    if (config.capture.backend == core::CaptureBackend::None) {
        core::Logger::info("Capture disabled, serving API only.");
        waitForShutdown();
    } else {
        runCapture(context);
    }

    // Shutdown: wake stream clients first so the servers can join them
    core::Logger::info("Stopping modules...");
    context.frameBuffer->close();
    mjpegServer.stop();
    if (apiServer) apiServer->stop();
    if (oscSender) oscSender->stop();

    core::Logger::info("Service stopped cleanly.");
    return 0;
}
