#include "config.hpp"
#include "console.hpp"
#include "content_source.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "extension_host.hpp"
#include "localization.hpp"
#include "package_manager.hpp"
#include "self_service.hpp"
#include "utils.hpp"
#include "verification.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.console_usage") << std::endl;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("platform", get_string("help.platform"), cxxopts::value<std::string>())
            ("api-url", get_string("help.api_url"), cxxopts::value<std::string>())
            ("no-safe-mode", get_string("help.no_safe_mode"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        LaunchOptions launch;
        if (result.count("root")) {
            launch.root = result["root"].as<std::string>();
            set_root_path(launch.root);
        }

        if (result.count("platform")) {
            launch.platform = result["platform"].as<std::string>();
            set_platform(launch.platform);
        }

        init_filesystem();
        Settings settings = load_settings();

        if (result.count("api-url")) {
            launch.api_url = result["api-url"].as<std::string>();
            settings.api_url = launch.api_url;
        }
        if (result["no-safe-mode"].as<bool>()) {
            launch.no_safe_mode = true;
            settings.safe_mode = false;
        }
        if (!settings.safe_mode) {
            log_warning(get_string("warning.safe_mode_disabled"));
        }

        GithubContentSource source(settings.api_url);
        VerificationService verifier(load_trust_registry(source, settings));
        DlopenExtensionHost host;
        ProcessSelfService self(restart_arguments(argv[0], launch));
        PackageManager manager(settings, verifier, source, host, self);

        if (!result.count("command")) {
            log_info(string_format("info.console_ready", get_platform(settings)));
            run_console(manager, std::cin, std::cout);
            return 0;
        }

        std::vector<std::string> command_line{result["command"].as<std::string>()};
        if (result.count("args")) {
            const auto& args = result["args"].as<std::vector<std::string>>();
            command_line.insert(command_line.end(), args.begin(), args.end());
        }
        return run_command(manager, command_line, std::cout);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", std::string(e.what())));
        return 1;
    } catch (const HotpackException& e) {
        log_error(string_format("error.hotpack_error", std::string(e.what())));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", std::string(e.what())));
        return 1;
    }
}
