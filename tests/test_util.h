/**
 * @file test_util.h
 * @brief 测试辅助：临时目录与样例作业
 */

#ifndef SCIV_TESTS_TEST_UTIL_H
#define SCIV_TESTS_TEST_UTIL_H

#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>

#include "core/types.h"
#include "core/utils.h"

namespace sciv {
namespace fake {

/**
 * @brief 析构时递归删除的临时目录
 */
class TempDir {
private:
    std::string path_;

public:
    TempDir() {
        std::string tmpl = std::filesystem::temp_directory_path().string() + "/sciverify_test_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed for " + tmpl);
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string operator/(const std::string &name) const { return path_ + "/" + name; }
};

/**
 * @brief 以 nullptr 结尾的环境变量数组
 */
class EnvBlock {
private:
    std::vector<std::string> entries_;
    std::vector<char*> ptrs_;

public:
    explicit EnvBlock(std::vector<std::string> entries) : entries_(std::move(entries)) {
        for (auto &e : entries_) ptrs_.push_back(&e[0]);
        ptrs_.push_back(nullptr);
    }

    char** get() { return ptrs_.data(); }
};

inline Job sample_job(const std::string &id, RunnerKind runner = RunnerKind::PYTHON,
                      const std::string &source = "print(42)\n") {
    Job job;
    job.id = id;
    job.runner = runner;
    job.source = source;
    job.code_hash = sha256_hex(source);
    job.claim_id = "claim-" + id;
    job.submitted_by = "tester";
    job.limits.timeout_sec = 5;
    job.submitted_at_ms = 1700000000000;
    return job;
}

} // namespace fake
} // namespace sciv

#endif // SCIV_TESTS_TEST_UTIL_H
