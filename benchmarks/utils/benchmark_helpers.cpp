/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>
#include <sstream>

namespace kcenon::batch_import::benchmark {

namespace {

auto read_text(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

auto keystore_id(const std::filesystem::path& path) -> std::string {
    static const std::string key = "\"id\":\"";
    auto text = read_text(path);
    auto pos = text.find(key);
    if (pos == std::string::npos) {
        return {};
    }
    pos += key.size();
    auto end = text.find('"', pos);
    return end == std::string::npos ? std::string{} : text.substr(pos, end - pos);
}

}  // namespace

// plaintext_decryptor implementation

auto plaintext_decryptor::inspect(const std::filesystem::path& keystore_path) const
    -> result<void> {
    if (read_text(keystore_path).find("\"crypto\"") == std::string::npos) {
        return unexpected(error{error_code::invalid_keystore,
                                "missing crypto section: " + keystore_path.string()});
    }
    return {};
}

auto plaintext_decryptor::verify_password(const std::filesystem::path& keystore_path,
                                          const std::string& password) const -> bool {
    return !password.empty() && keystore_id(keystore_path) == password;
}

auto plaintext_decryptor::import_keystore(const std::filesystem::path& keystore_path,
                                          const std::string& password,
                                          const std::string& wallet_name)
    -> result<std::string> {
    if (!verify_password(keystore_path, password)) {
        return unexpected(error{error_code::keystore_import_failed, "incorrect password"});
    }
    return "wallet-" + wallet_name;
}

// keystore_set implementation

keystore_set::keystore_set(std::size_t count, bool with_password_files) {
    dir_ = std::filesystem::temp_directory_path() /
           ("batch_import_bench_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(dir_);

    for (std::size_t i = 0; i < count; ++i) {
        auto id = "key" + std::to_string(i);
        auto path = dir_ / (id + ".json");
        std::ofstream(path, std::ios::binary)
            << "{\"id\":\"" << id << "\",\"crypto\":{\"cipher\":\"aes-128-ctr\"}}";
        if (with_password_files) {
            std::ofstream(dir_ / (id + ".pwd"), std::ios::binary) << id << "\n";
        }
        files_.push_back(path);
    }
}

keystore_set::~keystore_set() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
}

}  // namespace kcenon::batch_import::benchmark
