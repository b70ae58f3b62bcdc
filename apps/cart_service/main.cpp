#include "shop/api/cart_controller.hpp"
#include "shop/core/cart_store.hpp"
#include "shop/logging/app_logger.hpp"
#include "shop/network/http_server.hpp"
#include "shop/utils/config.hpp"
#include "shop/validation/cart_request_validator.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <signal.h>

using namespace shop;

namespace {
std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = true;
}
}  // namespace

class CartService {
  public:
    CartService()
        : config_(std::make_shared<utils::Config>()),
          store_(std::make_shared<core::CartStore>()),
          validator_(std::make_shared<validation::CartRequestValidator>()),
          app_logger_(nullptr),
          controller_(nullptr),
          http_server_(nullptr),
          running_(false) {
    }

    ~CartService() {
        stop();
    }

    bool initialize(const std::string& config_file) {
        auto loaded = config_->loadFromFile(config_file);
        bool config_missing = !loaded && loaded.error() == utils::ConfigError::FILE_NOT_FOUND;
        if (!loaded && !config_missing) {
            std::cerr << "Failed to load configuration from " << config_file << ": "
                      << utils::configErrorToString(loaded.error()) << std::endl;
            return false;
        }

        app_logger_ = std::make_shared<logging::AppLogger>(
            config_->getString("logging.file", "cart_service.log"));
        app_logger_->enableConsoleOutput(config_->getBool("logging.console", true));

        std::string level_name = config_->getString("logging.level", "INFO");
        auto level = logging::parseLogLevel(level_name);
        if (!level) {
            std::cerr << "Unknown logging.level: " << level_name << std::endl;
            return false;
        }
        app_logger_->setLogLevel(*level);

        try {
            app_logger_->start();
        } catch (const std::runtime_error& e) {
            std::cerr << "Failed to start logger: " << e.what() << std::endl;
            return false;
        }

        if (config_missing) {
            app_logger_->log(logging::LogLevel::WARNING,
                             "Configuration file " + config_file + " not found, using defaults");
        }

        validator_->setMaxIdLength(
            static_cast<std::size_t>(config_->getInt("validation.max_id_length", 128)));
        validator_->setMaxQuantity(config_->getInt("validation.max_quantity", 1000000));

        std::string host = config_->getString("http.host", "0.0.0.0");
        int port = config_->getInt("http.port", 8080);
        int threads = config_->getInt("http.threads", 4);
        http_server_ = std::make_unique<network::HttpServer>(host, port, threads);
        http_server_->setTimeout(config_->getInt("http.timeout_seconds", 30));
        http_server_->setMaxConnections(config_->getInt("http.max_connections", 100));

        controller_ = std::make_unique<api::CartController>(store_, validator_, app_logger_);
        controller_->registerRoutes(*http_server_);

        app_logger_->log(logging::LogLevel::INFO, "Cart service initialized");
        return true;
    }

    bool start() {
        if (running_) {
            return false;
        }

        if (!http_server_->start()) {
            app_logger_->log(logging::LogLevel::ERROR,
                             "Failed to start HTTP server on " + http_server_->getHost() + ":" +
                                 std::to_string(http_server_->getPort()));
            return false;
        }

        running_ = true;
        app_logger_->log(logging::LogLevel::INFO,
                         "Cart service listening on " + http_server_->getHost() + ":" +
                             std::to_string(http_server_->getPort()));
        return true;
    }

    void stop() {
        if (!running_) {
            return;
        }
        running_ = false;

        // Returns once every accepted request has been answered and logged
        if (http_server_) {
            http_server_->stop();
        }

        app_logger_->log(logging::LogLevel::INFO,
                         "Cart service stopped with " + std::to_string(store_->cartCount()) +
                             " carts in memory");
        app_logger_->stop();
    }

    bool isRunning() const {
        return running_;
    }

  private:
    std::shared_ptr<utils::Config> config_;
    std::shared_ptr<core::CartStore> store_;
    std::shared_ptr<validation::CartRequestValidator> validator_;
    std::shared_ptr<logging::AppLogger> app_logger_;
    // The server runs controller handlers on its workers, so it must be
    // destroyed before the controller
    std::unique_ptr<api::CartController> controller_;
    std::unique_ptr<network::HttpServer> http_server_;
    bool running_;
};

int main(int argc, char* argv[]) {
    std::string config_file = "config/cart_service.json";
    if (argc > 1) {
        config_file = argv[1];
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    CartService service;
    if (!service.initialize(config_file)) {
        std::cerr << "Failed to initialize cart service" << std::endl;
        return 1;
    }

    if (!service.start()) {
        std::cerr << "Failed to start cart service" << std::endl;
        return 1;
    }

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    service.stop();
    return 0;
}
