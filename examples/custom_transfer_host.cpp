/**
 * @file custom_transfer_host.cpp
 * @brief Drive a configured custom transfer program from the command line
 *
 * This example demonstrates:
 * - Declaring custom adapters with git-config style keys
 * - Creating an adapter from the registry and running a batch
 * - Reporting progress and per-object results
 * - Verifying uploads and storing downloads through adapter_services
 * - Cancelling a batch on SIGINT
 *
 * Remote objects live in a directory and are addressed with file:// hrefs,
 * so any transfer program that understands those can be tried out locally.
 */

#include <kcenon/transfer_adapter/transfer_adapter.h>
#include <kcenon/transfer_adapter/core/checksum.h>
#include <kcenon/transfer_adapter/core/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace kcenon::transfer_adapter;

namespace {

std::atomic<bool> interrupted{false};

void signal_handler(int /*signal*/) {
    interrupted = true;
}

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(int64_t bytes) -> std::string {
    constexpr int64_t KB = 1024;
    constexpr int64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto trim(std::string value) -> std::string {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

/**
 * @brief Load "key = value" lines; blank lines and '#' comments are skipped
 */
auto load_config_file(const std::filesystem::path& path, memory_config_source& config)
    -> result<void> {
    std::ifstream in(path);
    if (!in) {
        return unexpected{error{error_code::config_invalid,
                                "cannot open config file " + path.string()}};
    }

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto text = trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }
        auto eq = text.find('=');
        if (eq == std::string::npos) {
            return unexpected{error{error_code::config_invalid,
                                    path.string() + ":" + std::to_string(line_no) +
                                        ": expected key = value"}};
        }
        config.set(trim(text.substr(0, eq)), trim(text.substr(eq + 1)));
    }
    return {};
}

auto set_override(const std::string& assignment, memory_config_source& config) -> bool {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    config.set(assignment.substr(0, eq), assignment.substr(eq + 1));
    return true;
}

auto make_action(const std::filesystem::path& remote_dir, const std::string& oid) -> action {
    action link;
    link.href = "file://" + std::filesystem::absolute(remote_dir / oid).string();
    return link;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Custom Transfer Host - Transfer Adapter System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] upload <adapter> <file>..." << std::endl;
    std::cout << "   or: " << program << " [options] download <adapter> <oid>..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>         Read key = value settings from file" << std::endl;
    std::cout << "  -c <key>=<value>        Set one setting (repeatable)" << std::endl;
    std::cout << "  -j, --jobs <n>          Concurrent transfers (default: "
              << default_concurrent_transfers << ")" << std::endl;
    std::cout << "  --remote <dir>          Directory holding remote objects (default: ./remote)"
              << std::endl;
    std::cout << "  --objects <dir>         Local object store (default: ./objects)" << std::endl;
    std::cout << "  -v, --verbose           Log protocol traffic" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program
              << " -c lfs.customtransfer.agent.path=/usr/local/bin/lfs-agent upload agent a.bin"
              << std::endl;
    std::cout << "  " << program << " --config transfer.conf -j 8 download agent <oid>"
              << std::endl;
}

int main(int argc, char* argv[]) {
    memory_config_source config;
    int jobs = default_concurrent_transfers;
    std::filesystem::path remote_dir = "remote";
    std::filesystem::path objects_dir = "objects";
    bool verbose = false;
    std::vector<std::string> positional;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (++i >= argc) {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
            auto loaded = load_config_file(argv[i], config);
            if (!loaded) {
                std::cerr << "Error: " << loaded.error().message << std::endl;
                return 1;
            }
        } else if (arg == "-c") {
            if (++i >= argc || !set_override(argv[i], config)) {
                std::cerr << "Error: -c requires key=value" << std::endl;
                return 1;
            }
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            jobs = std::stoi(argv[i]);
        } else if (arg == "--remote") {
            if (++i >= argc) {
                std::cerr << "Error: --remote requires an argument" << std::endl;
                return 1;
            }
            remote_dir = argv[i];
        } else if (arg == "--objects") {
            if (++i >= argc) {
                std::cerr << "Error: --objects requires an argument" << std::endl;
                return 1;
            }
            objects_dir = argv[i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 3 || (positional[0] != "upload" && positional[0] != "download")) {
        print_usage(argv[0]);
        return 1;
    }
    const auto direction = positional[0] == "upload" ? transfer_direction::upload
                                                     : transfer_direction::download;
    const auto& adapter_name = positional[1];

    auto& logger = get_logger();
    logger.set_level(verbose ? log_level::trace : log_level::warn);
    logger.initialize();

    std::error_code ec;
    std::filesystem::create_directories(remote_dir, ec);
    std::filesystem::create_directories(objects_dir, ec);
    if (ec) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return 1;
    }

    // Register every adapter the configuration declares
    adapter_registry registry;
    auto report = configure_custom_adapters(config, registry);
    for (const auto& err : report.errors) {
        std::cerr << "Warning: " << err.message << std::endl;
    }

    adapter_services services;
    services.verify_download_content = true;
    services.verify_upload = [&](const transfer_object& object) -> result<void> {
        std::error_code size_ec;
        auto size = std::filesystem::file_size(remote_dir / object.oid, size_ec);
        if (size_ec || static_cast<int64_t>(size) != object.size) {
            return unexpected{error{error_code::verification_failed,
                                    "remote copy of " + object.oid + " is missing or truncated"}};
        }
        return {};
    };
    services.store_download = [&](const transfer_object& object,
                                  const std::filesystem::path& content) -> result<void> {
        std::error_code move_ec;
        std::filesystem::rename(content, objects_dir / object.oid, move_ec);
        if (move_ec) {
            return unexpected{error{error_code::download_store_failed, move_ec.message()}};
        }
        return {};
    };

    auto created = registry.create(adapter_name, direction, services);
    if (!created) {
        std::cerr << "Error: " << created.error().message << std::endl;
        return 1;
    }
    auto adapter = std::move(created.value());

    // Build the batch
    std::vector<transfer> batch;
    for (std::size_t i = 2; i < positional.size(); ++i) {
        transfer t;
        if (direction == transfer_direction::upload) {
            auto digest = checksum::sha256_file(positional[i]);
            if (!digest) {
                std::cerr << "Error: " << digest.error().message << std::endl;
                return 1;
            }
            t.name = positional[i];
            t.path = positional[i];
            t.object.oid = digest.value();
            t.object.size = static_cast<int64_t>(std::filesystem::file_size(t.path));
            t.object.actions["upload"] = make_action(remote_dir, t.object.oid);
        } else {
            std::error_code size_ec;
            auto size = std::filesystem::file_size(remote_dir / positional[i], size_ec);
            t.name = positional[i];
            t.object.oid = positional[i];
            t.object.size = size_ec ? 0 : static_cast<int64_t>(size);
            t.object.actions["download"] = make_action(remote_dir, t.object.oid);
        }
        batch.push_back(std::move(t));
    }

    std::mutex output_mutex;
    std::atomic<std::size_t> failed{0};

    auto on_progress = [&](const std::string& name, int64_t total, int64_t so_far, int64_t) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "  " << name << ": " << format_bytes(so_far) << " / "
                  << format_bytes(total) << std::endl;
    };
    auto on_complete = [&](const transfer_result& r) {
        std::lock_guard<std::mutex> lock(output_mutex);
        if (r.succeeded()) {
            std::cout << "[OK]     " << r.name << std::endl;
        } else {
            ++failed;
            std::cout << "[FAILED] " << r.name << ": " << r.err->message << std::endl;
        }
    };

    std::signal(SIGINT, signal_handler);

    std::cout << std::string(to_string(direction)) << " of " << batch.size()
              << " object(s) with \"" << adapter_name << "\"" << std::endl;

    auto begun = adapter->begin(jobs, on_progress, on_complete);
    if (!begun) {
        std::cerr << "Error: " << begun.error().message << std::endl;
        return 1;
    }

    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished) {
            if (interrupted) {
                std::cout << "Interrupted, cancelling..." << std::endl;
                adapter->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    for (auto& t : batch) {
        auto added = adapter->add(std::move(t));
        if (!added) {
            std::cerr << "Error: " << added.error().message << std::endl;
            break;
        }
    }
    adapter->end();
    finished = true;
    watcher.join();

    std::cout << std::endl;
    std::cout << "Done: " << batch.size() - failed.load() << " succeeded, " << failed.load()
              << " failed" << std::endl;

    logger.shutdown();
    return failed.load() == 0 ? 0 : 2;
}
