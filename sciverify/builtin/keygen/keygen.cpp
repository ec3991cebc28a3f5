/**
 * @file keygen.cpp
 * @brief 生成 Ed25519 签名密钥
 *
 * 用法：sciverify_keygen <private_key.pem> [public_key.pem]
 *
 * 私钥以 PKCS#8 PEM 写出（0600），已存在时拒绝覆盖。
 */

#include <iostream>

#include "sciverify.h"

using namespace sciv;

int main(int argc, char **argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: " << argv[0] << " <private_key.pem> [public_key.pem]" << std::endl;
        return 2;
    }
    std::string private_path = argv[1];
    if (file_exists(private_path)) {
        std::cerr << "Refusing to overwrite existing key " << private_path << std::endl;
        return 1;
    }

    auto signer = signing::Signer::generate();
    if (!signer.ok()) {
        std::cerr << signer.error().to_string() << std::endl;
        return 1;
    }
    auto saved = signer.value().save_private_key(private_path);
    if (!saved.ok()) {
        std::cerr << saved.error().to_string() << std::endl;
        return 1;
    }

    auto pem = signer.value().public_key_pem();
    if (!pem.ok()) {
        std::cerr << pem.error().to_string() << std::endl;
        return 1;
    }
    if (argc == 3) {
        auto written = write_file_atomic(argv[2], pem.value(), 0644);
        if (!written.ok()) {
            std::cerr << written.error().to_string() << std::endl;
            return 1;
        }
    } else {
        std::cout << pem.value();
    }
    std::cerr << "Generated " << signer.value().public_key_ref() << std::endl;
    return 0;
}
