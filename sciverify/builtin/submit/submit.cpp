/**
 * @file submit.cpp
 * @brief 作业提交
 *
 * 用法：sciverify_submit <config.yml> <submission.json | ->
 *
 * 校验提交（准入）后入队，在 stdout 输出 {"job_id": ..., "message_id": ...}。
 * 被拒绝的提交不签名，退出码 1，错误以 JSON 输出到 stdout。
 */

#include <iostream>
#include <iterator>
#include <stdexcept>

#include "sciverify.h"

using namespace sciv;

static int reject(const Error &err) {
    Json::Value v(Json::objectValue);
    v["error"] = error_code_str(err.code());
    v["message"] = err.message();
    std::cout << json::write_pretty(v) << std::endl;
    return 1;
}

int main(int argc, char **argv) {
    if (argc != 3) {
        std::cerr << "usage: " << argv[0] << " <config.yml> <submission.json | ->" << std::endl;
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

    std::string body;
    if (std::string(argv[2]) == "-") {
        body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        auto text = read_file(argv[2]);
        if (!text.ok()) {
            std::cerr << text.error().to_string() << std::endl;
            return 2;
        }
        body = text.value();
    }

    auto parsed = json::parse(body, ErrorCode::INVALID_SUBMISSION);
    if (!parsed.ok()) return reject(parsed.error());
    auto submission = json::submission_from_json(parsed.value());
    if (!submission.ok()) return reject(submission.error());

    auto job = settings.admit(submission.value());
    if (!job.ok()) {
        LOG_WARN << "Submission rejected: " << job.error().message();
        return reject(job.error());
    }

    auto opened = queue::JobQueue::open(settings.queue);
    if (!opened.ok()) {
        std::cerr << "Queue unavailable: " << opened.error().to_string() << std::endl;
        return 2;
    }

    auto message_id = opened.value()->enqueue(job.value());
    if (!message_id.ok()) {
        if (message_id.error().code() == ErrorCode::DUPLICATE_JOB) {
            return reject(message_id.error());
        }
        std::cerr << "Enqueue failed: " << message_id.error().to_string() << std::endl;
        return 2;
    }

    Json::Value out(Json::objectValue);
    out["job_id"] = job.value().id;
    out["message_id"] = message_id.value();
    out["code_hash"] = job.value().code_hash;
    out["status"] = job_status_str(JobStatus::QUEUED);
    std::cout << json::write_pretty(out) << std::endl;
    return 0;
}
