/**
 * @file main_worker.cpp
 * @brief worker 守护进程入口
 *
 * 用法：sciverify_worker [config.yml]
 *
 * 启动顺序：加载配置 -> 初始化日志 -> 加载签名密钥 -> 准备运行时与队列 -> 启动线程池。
 * SIGTERM / SIGINT 触发排空式停止；签名失败时以非零状态退出，
 * 未确认的消息留给其它消费者回收。
 */

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

#include "sciverify.h"

using namespace sciv;

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
    g_stop = true;
}

int main(int argc, char **argv) {
    std::string config_path = argc > 1 ? argv[1] : "";

    Settings settings;
    try {
        settings = Settings::load(config_path).unwrap();
    } catch (const std::exception &e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 2;
    }

    auto logging = init_logging(settings.log);
    if (!logging.ok()) {
        std::cerr << "Failed to initialize logging: " << logging.error().to_string() << std::endl;
        return 2;
    }

    // 命名空间、cgroup 与 setresuid 都需要 root
    if (geteuid() != 0) {
        LOG_FATAL << "sciverify_worker must run as root to create sandboxes";
        return 2;
    }
    if (!sandbox::is_cgroup_v2_available()) {
        LOG_WARN << "cgroup v2 not detected, memory and pid limits will not be enforced";
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGTERM, &sa, nullptr) != 0 || sigaction(SIGINT, &sa, nullptr) != 0 ||
        signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        LOG_FATAL << "Cannot install signal handlers: " << std::strerror(errno);
        return 1;
    }

    WorkerContext ctx(settings);
    auto init = ctx.init();
    if (!init.ok()) {
        LOG_FATAL << "Worker initialization failed: " << init.error().to_string();
        return 1;
    }

    auto started = ctx.pool->start();
    if (!started.ok()) {
        LOG_FATAL << "Cannot start worker pool: " << started.error().to_string();
        return 1;
    }

    ctx.pool->run_until(g_stop);

    if (ctx.pool->fatal()) {
        LOG_FATAL << "Worker stopped on a fatal error";
        return 1;
    }
    LOG_INFO << "Worker shut down cleanly";
    return 0;
}
