/**
 * @file batch_import_example.cpp
 * @brief Interactive batch keystore import from the console
 *
 * This example demonstrates:
 * - Building the reference importer with a custom decryptor
 * - Driving an import with import_session
 * - Answering password prompts from the console
 * - Rendering progress through a progress_display
 * - Retrying failed imports from the completion screen
 *
 * The demo decryptor accepts a keystore when the SHA-256 of the password
 * matches the keystore's "mac" field. Use --create-test to generate such
 * keystores; the password for demoN.json is "demoN".
 */

#include <kcenon/batch_import/batch_import.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::batch_import;

namespace {

auto read_text(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

auto json_field(const std::string& text, const std::string& name) -> std::string {
    auto key = "\"" + name + "\":\"";
    auto pos = text.find(key);
    if (pos == std::string::npos) {
        return {};
    }
    pos += key.size();
    auto end = text.find('"', pos);
    return end == std::string::npos ? std::string{} : text.substr(pos, end - pos);
}

auto digest(const std::string& password) -> std::string {
    auto hash = checksum::sha256(std::as_bytes(std::span(password.data(), password.size())));
    return hash ? hash.value() : std::string{};
}

/**
 * @brief Decryptor for the demo keystore format
 */
class demo_decryptor : public keystore_decryptor {
public:
    auto inspect(const std::filesystem::path& keystore_path) const -> result<void> override {
        auto text = read_text(keystore_path);
        if (text.find("\"crypto\"") == std::string::npos || json_field(text, "mac").empty()) {
            return unexpected(error{error_code::invalid_keystore,
                                    "not a demo keystore: " + keystore_path.string()});
        }
        return {};
    }

    auto verify_password(const std::filesystem::path& keystore_path,
                         const std::string& password) const -> bool override {
        return !password.empty() && json_field(read_text(keystore_path), "mac") == digest(password);
    }

    auto import_keystore(const std::filesystem::path& keystore_path,
                         const std::string& password,
                         const std::string& wallet_name) -> result<std::string> override {
        if (!verify_password(keystore_path, password)) {
            return unexpected(error{error_code::keystore_import_failed,
                                    "could not decrypt keystore"});
        }
        auto id = json_field(read_text(keystore_path), "id");
        std::cout << "  stored wallet '" << wallet_name << "' (" << id << ")" << std::endl;
        return id;
    }
};

/**
 * @brief Single-line console progress bar
 */
class console_progress : public progress_display {
public:
    void reset(int total_files) override {
        std::cout << "Importing " << total_files << " keystore(s)" << std::endl;
    }

    void update(const import_progress& progress,
                bool paused,
                const std::string& last_error) override {
        std::cout << "  [" << std::fixed << std::setprecision(1) << std::setw(5)
                  << progress.percentage << "%] " << progress.processed_files << "/"
                  << progress.total_files;
        if (paused) {
            std::cout << " waiting for password: " << progress.pending_file;
        } else if (!progress.current_file.empty()) {
            std::cout << " " << std::filesystem::path(progress.current_file).filename().string();
        }
        if (!last_error.empty()) {
            std::cout << " (last error: " << last_error << ")";
        }
        std::cout << std::endl;
    }

    void finish() override { std::cout << "Import finished" << std::endl; }
};

auto prompt_password(const password_prompt& prompt) -> password_response {
    std::cout << std::endl;
    if (prompt.error_message) {
        std::cout << *prompt.error_message << std::endl;
    }
    std::cout << "Password for " << std::filesystem::path(prompt.keystore_file).filename().string()
              << " (attempt " << prompt.attempt << "/" << prompt.max_attempts
              << ", empty line skips, 'q' cancels): " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line) || line == "q") {
        return password_response{{}, true, false};
    }
    if (line.empty()) {
        return password_response{{}, false, true};
    }
    return password_response{line, false, false};
}

auto choose_action(const completion_report& report) -> completion_action {
    std::cout << std::endl << report.summary_text() << std::endl;
    for (const auto& e : report.summary.errors) {
        std::cout << "  " << (e.skipped ? "skipped " : "failed  ") << e.file << ": "
                  << e.cause.message << std::endl;
    }

    std::cout << std::endl;
    for (std::size_t i = 0; i < report.actions.size(); ++i) {
        std::cout << "  " << (i + 1) << ") " << to_string(report.actions[i]) << std::endl;
    }
    std::cout << "Choice: " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
        return completion_action::return_to_menu;
    }
    try {
        auto index = std::stoul(line);
        if (index >= 1 && index <= report.actions.size()) {
            return report.actions[index - 1];
        }
    } catch (const std::exception&) {
        // Fall through to the default.
    }
    return completion_action::return_to_menu;
}

void create_test_keystores(const std::filesystem::path& dir, int count) {
    std::filesystem::create_directories(dir);
    for (int i = 0; i < count; ++i) {
        auto name = "demo" + std::to_string(i);
        std::ofstream(dir / (name + ".json"))
            << "{\"id\":\"" << name << "\",\"crypto\":{\"cipher\":\"aes-128-ctr\"},"
            << "\"mac\":\"" << digest(name) << "\"}";
        // Every other keystore gets a password file; the rest prompt.
        if (i % 2 == 0) {
            std::ofstream(dir / (name + ".pwd")) << name << "\n";
        }
    }
    std::cout << "Created " << count << " test keystore(s) in " << dir << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [keystore files...]\n"
              << "\n"
              << "Options:\n"
              << "  -d, --directory <dir>  Import every keystore in a directory\n"
              << "  --create-test [N]      Create N demo keystores in the directory\n"
              << "  --json-logs            Emit structured JSON log lines\n"
              << "  --verbose              Enable debug logging\n"
              << "  --help                 Show this help\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::filesystem::path> files;
    std::optional<std::filesystem::path> directory;
    std::optional<int> create_test_count;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--directory") {
            if (++i >= argc) {
                std::cerr << "Error: --directory requires an argument" << std::endl;
                return 1;
            }
            directory = argv[i];
        } else if (arg == "--create-test") {
            create_test_count = 4;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                create_test_count = std::stoi(argv[++i]);
            }
        } else if (arg == "--json-logs") {
            get_logger().set_output_format(log_output_format::json);
        } else if (arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else if (arg[0] != '-') {
            files.emplace_back(arg);
        }
    }

    if (create_test_count) {
        if (!directory) {
            directory = std::filesystem::temp_directory_path() / "batch_import_demo";
        }
        create_test_keystores(*directory, *create_test_count);
    }

    if (!directory && files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto importer = keystore_batch_importer::builder()
                        .with_decryptor(std::make_shared<demo_decryptor>())
                        .build();
    if (!importer) {
        std::cerr << "Failed to create importer: " << importer.error().message << std::endl;
        return 1;
    }

    auto controller = import_controller::builder()
                          .with_importer(std::make_shared<keystore_batch_importer>(
                              std::move(importer.value())))
                          .with_progress_display(std::make_shared<console_progress>())
                          .build();
    if (!controller) {
        std::cerr << "Failed to create controller: " << controller.error().message << std::endl;
        return 1;
    }

    auto& ctrl = controller.value();
    import_session session(ctrl, std::make_shared<callback_password_provider>(prompt_password));

    if (directory) {
        ctrl.set_selected_directory(*directory);
    } else {
        ctrl.set_selected_files(files);
    }

    if (auto started = session.start(); !started) {
        std::cerr << "Failed to start import: " << started.error().message << std::endl;
        return 1;
    }

    while (true) {
        if (auto finished = session.run_until_done(std::chrono::hours(1)); !finished) {
            std::cerr << "Import failed: " << finished.error().message << std::endl;
            return 1;
        }

        if (ctrl.is_cancelled()) {
            std::cout << "Import cancelled" << std::endl;
            return 0;
        }

        auto report = ctrl.completion();
        if (!report) {
            return 0;
        }

        auto action = choose_action(*report);
        if (action == completion_action::return_to_menu ||
            action == completion_action::select_different_files) {
            return report->summary.failed_imports == 0 ? 0 : 2;
        }
        if (action == completion_action::view_error_details) {
            continue;
        }

        if (auto applied = session.apply_completion_action(action); !applied) {
            std::cerr << "Failed to retry: " << applied.error().message << std::endl;
            return 1;
        }
    }
}
