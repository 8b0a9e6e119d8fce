#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "app/FulfillmentApplication.h"
#include "app/FulfillmentConfig.h"
#include "Logger.h"
#include "MQEventLoop.h"

namespace fs = std::filesystem;

// --------------------------- 信号处理 ---------------------------
static std::atomic<bool> g_stop{false};

static void HandleSignal(int) {
    g_stop.store(true);
}

// --------------------------- 配置路径解析 ---------------------------
static std::string ResolveConfigPath(int argc, char* argv[]) {
    std::string configPath;

    // 1. 命令行参数：--config /path/to/config.yaml
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            break;
        }
    }

    // 2. 环境变量：FULFILLMENT_SERVER_CONFIG
    if (configPath.empty()) {
        if (const char* env = std::getenv("FULFILLMENT_SERVER_CONFIG"))
            configPath = env;
    }

    // 3. 可执行文件相对路径（适合从 bin/ 启动）
    if (configPath.empty()) {
        std::error_code ec;
        fs::path exe = fs::canonical(fs::path(argv[0]), ec);
        if (!ec) {
            fs::path candidate = exe.parent_path() / "../apps/fulfillment_server/config/config.yaml";
            if (fs::exists(candidate, ec))
                configPath = candidate.string();
        }
    }

    // 4. 开发默认路径（适合直接在 apps/fulfillment_server 目录运行）
    if (configPath.empty()) {
        fs::path devPath = fs::current_path() / "config/config.yaml";
        if (fs::exists(devPath))
            configPath = devPath.string();
    }

    if (configPath.empty())
        throw std::runtime_error(
            "No valid configuration file found.\n"
            "Try: ./fulfillment_server --config /path/to/config.yaml\n"
            "Or set env: export FULFILLMENT_SERVER_CONFIG=/path/to/config.yaml");

    return fs::weakly_canonical(configPath).string();
}

// --------------------------- 主程序入口 ---------------------------
int main(int argc, char* argv[]) {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
        std::string configPath = ResolveConfigPath(argc, argv);
        std::cout << "[Boot] Using config: " << configPath << std::endl;

        FulfillmentServerOptions options = FulfillmentServerOptions::FromConfig(configPath);

        MQEventLoop loop;
        {
            FulfillmentApplication app(&loop, options);
            std::cout << "[Boot] Starting service: " << options.serviceName << std::endl;
            app.start();

            while (!g_stop.load())
                std::this_thread::sleep_for(std::chrono::milliseconds(200));

            std::cerr << "\n[Signal] Shutting down..." << std::endl;
            app.stop();
        }  // MQ 连接须在循环退出前关闭
        loop.quit();

        Logger::instance().shutdown();
        std::cout << "[Exit] Graceful shutdown complete." << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[Fatal] " << e.what() << std::endl;
        Logger::instance().shutdown();
        return 1;
    }
}
