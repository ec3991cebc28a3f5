/**
 * @file result.cpp
 * @brief 结果查询
 *
 * 用法：sciverify_result <config.yml> <job_id> [public_key.pem]
 *
 * 输出已签名结果、pending 状态或 not_found。给出公钥时同时校验签名，
 * 校验失败退出码为 3。
 */

#include <iostream>
#include <stdexcept>

#include "sciverify.h"

using namespace sciv;

int main(int argc, char **argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "usage: " << argv[0] << " <config.yml> <job_id> [public_key.pem]" << std::endl;
        return 2;
    }

    Settings settings;
    try {
        settings = Settings::load(argv[1]).unwrap();
    } catch (const std::exception &e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 2;
    }
    auto logging = init_logging(settings.log);
    if (!logging.ok()) {
        std::cerr << logging.error().to_string() << std::endl;
        return 2;
    }

    auto opened = queue::JobQueue::open(settings.queue);
    if (!opened.ok()) {
        std::cerr << "Queue unavailable: " << opened.error().to_string() << std::endl;
        return 2;
    }
    queue::ResultStore store(settings.queue.root + "/results", settings.results.retention_hours,
                             opened.value().get());

    std::string job_id = argv[2];
    auto found = store.lookup(job_id);
    if (!found.ok()) {
        std::cerr << "Lookup failed: " << found.error().to_string() << std::endl;
        return 2;
    }

    Json::Value out(Json::objectValue);
    out["job_id"] = job_id;
    const queue::Lookup &l = found.value();
    switch (l.kind) {
        case queue::Lookup::NOT_FOUND:
            out["state"] = "not_found";
            std::cout << json::write_pretty(out) << std::endl;
            return 1;
        case queue::Lookup::PENDING:
            out["state"] = "pending";
            out["status"] = job_status_str(*l.status);
            std::cout << json::write_pretty(out) << std::endl;
            return 0;
        case queue::Lookup::FOUND:
            break;
    }

    out["state"] = "found";
    out["result"] = json::result_to_json(*l.result);

    int rc = 0;
    if (argc == 4) {
        auto verifier = signing::PublicKeyVerifier::load(argv[3]);
        if (!verifier.ok()) {
            std::cerr << verifier.error().to_string() << std::endl;
            return 2;
        }
        auto verified = verifier.value().verify(*l.result);
        out["verified"] = verified.ok();
        if (!verified.ok()) {
            out["verify_error"] = verified.error().message();
            rc = 3;
        }
    }
    std::cout << json::write_pretty(out) << std::endl;
    return rc;
}
