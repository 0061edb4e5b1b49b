#include "config.hpp"
#include "exception.hpp"
#include "lifecycle.hpp"
#include "localization.hpp"
#include "package_manager.hpp"
#include "packer.hpp"
#include "registry.hpp"
#include "repository.hpp"
#include "status.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("help.commands") << std::endl;
    for (const char* key : {"help.install_desc", "help.remove_desc", "help.list_desc", "help.search_desc",
                            "help.upgrade_desc", "help.update_desc", "help.build_desc", "help.clean_desc",
                            "help.status_desc"}) {
        std::cerr << get_string(key) << std::endl;
    }
}

void pre_operation_check(const cxxopts::ParseResult& result, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    size_t count = result.count("packages") ? result["packages"].as<std::vector<std::string>>().size() : 0;
    if (count < min || (max.has_value() && count > max.value())) {
        print_usage_func();
        throw PmsException(get_string("error.invalid_arg_count"));
    }
}

// "name=version" pins a version, a bare name takes the latest.
std::pair<std::string, std::optional<std::string>> parse_package_argument(const std::string& arg) {
    const auto pos = arg.find('=');
    if (pos == std::string::npos || pos == 0) {
        return {arg, std::nullopt};
    }
    return {arg.substr(0, pos), arg.substr(pos + 1)};
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(PROGRAM_NAME);
        options.custom_help(get_string("help.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("v,version", get_string("help.version"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("y,yes", get_string("help.assume_yes"), cxxopts::value<bool>()->default_value("false"))
            ("f,force", get_string("help.force"), cxxopts::value<bool>()->default_value("false"))
            ("s,summary", get_string("help.summary"), cxxopts::value<bool>()->default_value("false"))
            ("i,is-installed", get_string("help.is_installed"), cxxopts::value<bool>()->default_value("false"))
            ("non-interactive", get_string("help.non_interactive"), cxxopts::value<std::string>()->implicit_value("n"))
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("arch", get_string("help.target_arch"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("version")) {
            std::cout << PROGRAM_NAME << " " << PROGRAM_VERSION << std::endl;
            return 0;
        }

        set_quiet_mode(result["quiet"].as<bool>());

        if (result.count("root")) {
            set_root_path(result["root"].as<std::string>());
        }

        if (result.count("arch")) {
            set_architecture(result["arch"].as<std::string>());
        }

        if (result.count("non-interactive")) {
            std::string value = result["non-interactive"].as<std::string>();
            if (value == "y" || value == "Y") {
                set_non_interactive_mode(NonInteractiveMode::YES);
            } else if (value == "n" || value == "N") {
                set_non_interactive_mode(NonInteractiveMode::NO);
            } else {
                log_error(get_string("error.invalid_non_interactive_value"));
                return 1;
            }
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        auto usage_printer = [&]() { print_usage(options); };

        // build works on a source tree and never touches the system state
        if (command == "build") {
            pre_operation_check(result, usage_printer, 1, 1);
            build_package(result["packages"].as<std::vector<std::string>>()[0]);
            return 0;
        }

        static const std::set<std::string> known_commands = {
            "install", "remove", "list", "search", "upgrade", "update", "clean", "status"};
        if (!known_commands.contains(command)) {
            usage_printer();
            return 1;
        }

        LocalRegistry registry(REGISTRY_DIR);
        static const std::set<std::string> privileged_commands = {"install", "remove", "update", "upgrade", "clean"};
        std::unique_ptr<DBLock> db_lock;
        if (privileged_commands.contains(command)) {
            if (!registry.is_privileged()) {
                throw PmsException(get_string("error.root_required"));
            }
            init_filesystem();
            db_lock = std::make_unique<DBLock>();
        }

        RepositoryIndex index;
        if (command == "update") {
            index = update_local_repo_info(true);
            log_info(get_string("info.update_complete"));
            return 0;
        }
        if (command != "list" && command != "clean") {
            index = update_local_repo_info();
        }

        StatusLedger ledger(STATUS_FILE);
        LocalArchiveLifecycle lifecycle(TEMP_DIR, INFO_DIR);
        PackageManager manager(index, ledger, lifecycle, registry, {.assume_yes = result["yes"].as<bool>()});

        if (command == "install") {
            pre_operation_check(result, usage_printer, 1);
            for (const auto& arg : result["packages"].as<std::vector<std::string>>()) {
                const auto [name, version] = parse_package_argument(arg);
                manager.install_package(name, version);
            }
            log_info(get_string("info.install_complete"));
        } else if (command == "remove") {
            pre_operation_check(result, usage_printer, 1);
            const bool force = result["force"].as<bool>();
            for (const auto& name : result["packages"].as<std::vector<std::string>>()) {
                manager.remove_package(name, force);
            }
            log_info(get_string("info.uninstall_complete"));
        } else if (command == "list") {
            pre_operation_check(result, usage_printer, 0, 0);
            if (manager.list(result["summary"].as<bool>()).empty()) {
                return 1;
            }
        } else if (command == "search") {
            pre_operation_check(result, usage_printer, 0, 1);
            std::string query;
            if (result.count("packages")) {
                query = result["packages"].as<std::vector<std::string>>()[0];
            }
            if (manager.search(query, result["summary"].as<bool>()).empty()) {
                return 1;
            }
        } else if (command == "upgrade") {
            pre_operation_check(result, usage_printer, 0, 0);
            manager.upgrade();
        } else if (command == "clean") {
            pre_operation_check(result, usage_printer, 0, 0);
            manager.clean();
        } else if (command == "status") {
            pre_operation_check(result, usage_printer, 1, 1);
            const std::string name = result["packages"].as<std::vector<std::string>>()[0];
            if (result["is-installed"].as<bool>()) {
                return manager.is_installed(name) ? 0 : 1;
            }
            if (!manager.status(name)) {
                return 1;
            }
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const OperationCancelled& e) {
        log_error(e.what());
        return 1;
    } catch (const PmsException& e) {
        log_error(string_format("error.pms_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
