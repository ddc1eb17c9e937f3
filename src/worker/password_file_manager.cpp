/**
 * @file password_file_manager.cpp
 * @brief Implementation of password file handling
 */

#include <kcenon/batch_import/worker/password_file_manager.h>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <system_error>

namespace kcenon::batch_import {

namespace {

auto trim(const std::string& input) -> std::string {
    constexpr const char* whitespace = " \t\r\n\v\f";
    auto begin = input.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = input.find_last_not_of(whitespace);
    return input.substr(begin, end - begin + 1);
}

}  // namespace

password_file_manager::password_file_manager(const import_config& config)
    : extension_(config.password_file_extension),
      max_file_size_(config.max_password_file_size),
      max_password_length_(config.max_password_length) {}

auto password_file_manager::find_password_file(const std::filesystem::path& keystore_path) const
    -> result<std::filesystem::path> {
    if (keystore_path.empty()) {
        return unexpected(
            error{error_code::password_file_invalid, "keystore path cannot be empty"});
    }

    auto candidate = keystore_path.parent_path() / (keystore_path.stem().string() + extension_);

    std::error_code ec;
    bool exists = std::filesystem::exists(candidate, ec);
    if (ec) {
        return unexpected(error{error_code::password_file_unreadable,
                                "cannot access password file: " + candidate.string()});
    }
    if (!exists) {
        return unexpected(error{error_code::password_file_not_found,
                                "password file not found: " + candidate.string()});
    }
    return candidate;
}

auto password_file_manager::validate_password_file(
    const std::filesystem::path& password_path) const -> result<void> {
    if (password_path.empty()) {
        return unexpected(
            error{error_code::password_file_invalid, "password file path cannot be empty"});
    }

    std::error_code ec;
    auto status = std::filesystem::status(password_path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return unexpected(error{error_code::password_file_not_found,
                                "password file not found: " + password_path.string()});
    }
    if (ec) {
        return unexpected(error{error_code::password_file_unreadable,
                                "cannot access password file: " + password_path.string()});
    }
    if (!std::filesystem::is_regular_file(status)) {
        return unexpected(error{error_code::password_file_invalid,
                                "password file is not a regular file: " +
                                    password_path.string()});
    }

    auto size = std::filesystem::file_size(password_path, ec);
    if (ec) {
        return unexpected(error{error_code::password_file_unreadable,
                                "cannot access password file: " + password_path.string()});
    }
    if (size > max_file_size_) {
        return unexpected(error{error_code::password_file_oversized,
                                "password file is too large (max " +
                                    std::to_string(max_file_size_) +
                                    " bytes): " + password_path.string()});
    }
    if (size == 0) {
        return unexpected(error{error_code::password_file_empty,
                                "password file is empty: " + password_path.string()});
    }
    return {};
}

auto password_file_manager::read_password_file(const std::filesystem::path& password_path) const
    -> result<std::string> {
    auto valid = validate_password_file(password_path);
    if (!valid) {
        return unexpected(valid.error());
    }

    std::ifstream file(password_path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::password_file_unreadable,
                                "failed to read password file: " + password_path.string()});
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return unexpected(error{error_code::password_file_unreadable,
                                "failed to read password file: " + password_path.string()});
    }

    if (!is_valid_utf8(content)) {
        return unexpected(error{error_code::password_file_corrupted,
                                "password file contains invalid UTF-8 encoding: " +
                                    password_path.string()});
    }

    auto password = trim(content);
    if (password.empty()) {
        return unexpected(error{error_code::password_file_empty,
                                "password file is empty: " + password_path.string()});
    }

    auto length_ok = validate_password_length(password);
    if (!length_ok) {
        return unexpected(length_ok.error());
    }
    return password;
}

auto password_file_manager::validate_password_length(const std::string& password) const
    -> result<void> {
    if (password.size() > max_password_length_) {
        return unexpected(error{error_code::password_file_invalid,
                                "password is too long (max " +
                                    std::to_string(max_password_length_) + " characters)"});
    }
    return {};
}

auto password_file_manager::requires_manual_password(
    const std::filesystem::path& keystore_path) const -> bool {
    auto found = find_password_file(keystore_path);
    if (!found) {
        return true;
    }
    return !read_password_file(found.value()).has_value();
}

auto password_file_manager::is_valid_utf8(const std::string& data) -> bool {
    std::size_t i = 0;
    const auto n = data.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(data[i]);
        std::size_t extra = 0;
        uint32_t code_point = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and out-of-range values
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

}  // namespace kcenon::batch_import
