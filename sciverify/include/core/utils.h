/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 编码与摘要（hex / base64 / SHA-256，基于 OpenSSL EVP）
 * - 时间与标识符
 * - 文件操作（原子写入）
 * - 输出清洗与截断
 */

#ifndef SCIV_CORE_UTILS_H
#define SCIV_CORE_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <climits>
#include <cerrno>
#include <atomic>
#include <locale>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "core/error.h"

namespace sciv {

//==============================================================================
// 编码与摘要
//==============================================================================

inline std::string hex_encode(const std::string &bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out += digits[c >> 4];
        out += digits[c & 0x0f];
    }
    return out;
}

/**
 * @brief SHA-256 原始摘要（32 字节）
 */
inline std::string sha256_raw(const std::string &data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        return "";
    }
    return std::string(reinterpret_cast<const char *>(digest), len);
}

inline std::string sha256_hex(const std::string &data) {
    return hex_encode(sha256_raw(data));
}

inline std::string base64_encode(const std::string &bytes) {
    if (bytes.empty()) return "";
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                            reinterpret_cast<const unsigned char *>(bytes.data()),
                            static_cast<int>(bytes.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

/**
 * @brief base64 解码
 *
 * EVP_DecodeBlock 不处理填充，这里按结尾 '=' 的个数截掉多出的零字节。
 */
inline Result<std::string> base64_decode(const std::string &text) {
    if (text.empty()) return std::string();
    if (text.size() % 4 != 0) {
        return Err<std::string>(ErrorCode::INVALID_SUBMISSION, "invalid base64 length");
    }
    std::string out(3 * text.size() / 4, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                            reinterpret_cast<const unsigned char *>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        return Err<std::string>(ErrorCode::INVALID_SUBMISSION, "invalid base64 data");
    }
    size_t pad = 0;
    if (text[text.size() - 1] == '=') pad++;
    if (text[text.size() - 2] == '=') pad++;
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

//==============================================================================
// 时间与标识符
//==============================================================================

inline int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/**
 * @brief 毫秒时间戳转 ISO-8601 UTC，如 2026-01-01T00:00:00.000Z
 */
inline std::string format_iso8601(int64_t ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm_buf;
    gmtime_r(&secs, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

/**
 * @brief 定点小数格式化，用于规范编码
 *
 * NaN 与无穷写作 "nan" / "inf" / "-inf"，避免依赖平台 printf 的拼写。
 */
inline std::string format_fixed(double v, int precision = 12) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    if (v == 0.0) v = 0.0;  // 去掉 -0
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

/**
 * @brief 随机 UUIDv4（RAND_bytes）
 */
inline Result<std::string> generate_uuid() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        return Err<std::string>(ErrorCode::SYSTEM_ERROR, "RAND_bytes failed");
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
    std::string hex = hex_encode(std::string(reinterpret_cast<char *>(b), sizeof(b)));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

/**
 * @brief 默认消费者名：hostname-pid
 */
inline std::string default_consumer_name() {
    char host[HOST_NAME_MAX + 1] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        std::strcpy(host, "localhost");
    }
    return std::string(host) + "-" + std::to_string(getpid());
}

//==============================================================================
// 文件操作
//==============================================================================

inline bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline bool is_directory(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

/**
 * @brief 获取真实路径
 * @return 规范化的绝对路径，失败返回空字符串
 */
inline std::string get_realpath(const std::string &path) {
    char real[PATH_MAX + 1];
    if (realpath(path.c_str(), real) == NULL) {
        return "";
    }
    return real;
}

/**
 * @brief 递归创建目录（mkdir -p）
 */
inline Result<void> make_dirs(const std::string &path, mode_t mode = 0755) {
    if (path.empty()) return Ok();
    std::string cur;
    std::istringstream iss(path);
    std::string part;
    if (path[0] == '/') cur = "/";
    while (std::getline(iss, part, '/')) {
        if (part.empty()) continue;
        cur += part;
        if (mkdir(cur.c_str(), mode) != 0 && errno != EEXIST) {
            return Err(ErrorCode::FILE_WRITE_ERROR,
                       "mkdir " + cur + ": " + std::strerror(errno));
        }
        cur += "/";
    }
    return Ok();
}

inline Result<std::string> read_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err<std::string>(errno == ENOENT ? ErrorCode::FILE_NOT_FOUND
                                                : ErrorCode::FILE_READ_ERROR,
                                "cannot read " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return Err<std::string>(ErrorCode::FILE_READ_ERROR, "read error on " + path);
    }
    return oss.str();
}

/**
 * @brief 原子写文件：写临时文件、fsync、rename
 */
inline Result<void> write_file_atomic(const std::string &path, const std::string &content,
                                      mode_t mode = 0644) {
    static std::atomic<uint64_t> seq{0};
    std::string tmp = path + ".tmp." + std::to_string(getpid()) + "." +
                      std::to_string(seq.fetch_add(1));
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        return Err(ErrorCode::FILE_WRITE_ERROR, "open " + tmp + ": " + std::strerror(errno));
    }
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            return Err(ErrorCode::FILE_WRITE_ERROR, "write " + tmp + ": " + std::strerror(saved));
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        ::unlink(tmp.c_str());
        return Err(ErrorCode::FILE_WRITE_ERROR, "flush " + tmp + " failed");
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int saved = errno;
        ::unlink(tmp.c_str());
        return Err(ErrorCode::FILE_WRITE_ERROR, "rename to " + path + ": " + std::strerror(saved));
    }
    return Ok();
}

/**
 * @brief 排他写文件：写临时文件后 link 到目标，目标已存在时不覆盖
 * @return true 表示已创建，false 表示目标已存在
 */
inline Result<bool> write_file_exclusive(const std::string &path, const std::string &content,
                                         mode_t mode = 0644) {
    std::string tmp = path + ".new";
    {
        static std::atomic<uint64_t> seq{0};
        tmp += "." + std::to_string(getpid()) + "." + std::to_string(seq.fetch_add(1));
    }
    auto w = write_file_atomic(tmp, content, mode);
    if (w.is_error()) return w.error();

    bool created = true;
    if (::link(tmp.c_str(), path.c_str()) != 0) {
        int saved = errno;
        ::unlink(tmp.c_str());
        if (saved != EEXIST) {
            return Err<bool>(ErrorCode::FILE_WRITE_ERROR,
                             "link " + path + ": " + std::strerror(saved));
        }
        created = false;
    } else {
        ::unlink(tmp.c_str());
    }
    return created;
}

/**
 * @brief 判断相对文件名是否安全（非空、非绝对路径、不含 ".." 段）
 */
inline bool is_safe_relative_name(const std::string &name) {
    if (name.empty() || name[0] == '/' || name.find('\0') != std::string::npos) {
        return false;
    }
    std::istringstream iss(name);
    std::string part;
    while (std::getline(iss, part, '/')) {
        if (part == "..") return false;
    }
    return true;
}

//==============================================================================
// 输出处理
//==============================================================================

/**
 * @brief 超过 cap 字节时截断并追加标记
 */
inline std::string truncate_output(const std::string &data, size_t cap) {
    if (data.size() <= cap) return data;
    return data.substr(0, cap) + "\n... [truncated at " + std::to_string(cap / 1024) + " KB]\n";
}

/**
 * @brief 去掉 ANSI 转义序列与控制字符（保留 \n \r \t）
 */
inline std::string sanitize_output(const std::string &raw) {
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (c == 0x1b) {
            // CSI: ESC [ 参数 终止字节
            if (i + 1 < raw.size() && raw[i + 1] == '[') {
                size_t j = i + 2;
                while (j < raw.size() &&
                       !(static_cast<unsigned char>(raw[j]) >= 0x40 &&
                         static_cast<unsigned char>(raw[j]) <= 0x7e)) {
                    j++;
                }
                i = (j < raw.size()) ? j + 1 : j;
            } else {
                i += 2;
            }
            continue;
        }
        if ((c < 0x20 && c != '\n' && c != '\r' && c != '\t') || c == 0x7f) {
            i++;
            continue;
        }
        out += static_cast<char>(c);
        i++;
    }
    return out;
}

inline std::string excerpt(const std::string &s, size_t n = 1000) {
    return s.size() <= n ? s : s.substr(0, n);
}

} // namespace sciv

#endif // SCIV_CORE_UTILS_H
