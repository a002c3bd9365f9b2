#include "console.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <list>
#include <mutex>
#include <sstream>

namespace {

std::mutex out_mutex;

void emit(std::ostream& out, const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex);
    out << text << std::flush;
}

std::string render_install(const InstallReport& report) {
    std::ostringstream ss;
    const PackageManifest& m = report.manifest;
    ss << string_format("render.installed_title", m.name) << "\n";
    if (!m.description.empty()) ss << "  " << m.description << "\n";
    ss << string_format(report.activation == Activation::Reloaded ? "render.reloaded" : "render.loaded",
                        module_name_for(m.name)) << "\n";
    for (const auto& failure : report.failures) {
        ss << string_format("render.file_failed", failure.path, failure.author, failure.status) << "\n";
    }
    ss << string_format("render.duration", m.name, report.duration.count()) << "\n";
    return ss.str();
}

std::string render_view(const PackageView& view) {
    std::ostringstream ss;
    const PackageManifest& m = view.manifest;
    ss << m.name << " " << m.version << "\n";
    if (!m.description.empty()) ss << "  " << m.description << "\n";
    ss << string_format("render.author", m.author) << "\n";
    ss << string_format("render.color", m.display_color()) << "\n";
    if (m.logo) ss << string_format("render.logo", *m.logo) << "\n";
    if (!view.files_present) ss << get_string("render.files_missing") << "\n";
    for (const auto& file : view.files) {
        ss << "  " << file.sha256 << "  " << file.path << "\n";
    }
    return ss.str();
}

std::string render_self(const SelfView& view) {
    std::ostringstream ss;
    ss << get_string("render.self_title") << "\n";
    ss << get_string("render.self_description") << "\n";
    ss << string_format("render.self_footer", view.version,
                        get_string(view.outdated ? "render.outdated" : "render.latest")) << "\n";
    if (view.outdated && view.latest_version) {
        ss << string_format("render.outdated_notice", view.version, *view.latest_version) << "\n";
    }
    return ss.str();
}

std::string usage() {
    return get_string("info.console_usage") + "\n";
}

}

std::vector<std::string> split_command_line(const std::string& line) {
    std::vector<std::string> args;
    std::istringstream in(line);
    std::string word;
    while (in >> word) args.push_back(word);
    return args;
}

int run_command(PackageManager& manager, const std::vector<std::string>& args, std::ostream& out) {
    if (args.empty()) {
        emit(out, usage());
        return 1;
    }
    const std::string& command = args[0];
    const size_t argc = args.size() - 1;

    try {
        if (command == "view" && argc <= 1) {
            const std::string target = argc == 1 ? args[1] : "self";
            if (target == "self") {
                emit(out, render_self(manager.view_self()));
            } else {
                emit(out, render_view(manager.view(target)));
            }
        } else if (command == "install" && argc == 1) {
            emit(out, render_install(manager.install(args[1])));
        } else if (command == "uninstall" && argc == 1) {
            manager.uninstall(args[1]);
            emit(out, string_format("render.removed", args[1], args[1]) + "\n");
        } else if (command == "verify" && argc == 0) {
            manager.verify();
            emit(out, get_string("render.verified") + "\n");
        } else if (command == "update-self" && argc == 0) {
            manager.update_self();
            emit(out, get_string("render.self_updated") + "\n");
        } else if (command == "reload-self" && argc == 0) {
            emit(out, get_string("render.reloading_self") + "\n");
            manager.reload_self();
        } else {
            emit(out, usage());
            return 1;
        }
    } catch (const UntrustedReferenceError& e) {
        emit(out, get_string("render.caution") + "\n");
        log_error(e.what());
        return 1;
    } catch (const FetchFailedError& e) {
        log_error(e.what());
        emit(out, string_format("render.report_to", e.attribution(), e.status()) + "\n");
        return 1;
    } catch (const PackageNotFoundError& e) {
        log_error(e.what());
        return 1;
    } catch (const HotpackException& e) {
        log_error(string_format("error.hotpack_error", std::string(e.what())));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", std::string(e.what())));
        return 1;
    }
    return 0;
}

void run_console(PackageManager& manager, std::istream& in, std::ostream& out) {
    std::list<std::future<int>> tasks;
    std::vector<std::string> restart_command;
    std::string line;
    while (std::getline(in, line)) {
        std::vector<std::string> args = split_command_line(line);
        if (args.empty()) continue;
        if (args[0] == "exit" || args[0] == "quit") break;
        if (args[0] == "reload-self") {
            restart_command = std::move(args);
            break;
        }

        tasks.push_back(std::async(std::launch::async, [&manager, &out, args = std::move(args)]() {
            return run_command(manager, args, out);
        }));

        // Reap finished tasks so the list does not grow without bound
        tasks.remove_if([](std::future<int>& task) {
            return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
    }
    for (auto& task : tasks) {
        task.wait();
    }
    // Restart only once no install is left half written
    if (!restart_command.empty()) {
        run_command(manager, restart_command, out);
    }
}
