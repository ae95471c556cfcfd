/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/command_runner.hpp"
#include "include/config.hpp"
#include "include/distro_mirrors.hpp"
#include "include/dns_applier.hpp"
#include "include/http_context.hpp"
#include "include/interrupts.hpp"
#include "include/key_bindings.hpp"
#include "include/log.hpp"
#include "include/network_prober.hpp"
#include "include/target_loader.hpp"
#include "include/terminal.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;
using namespace vantage;

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options] [target,target,...]", app_name);
    std::println("");
    std::println("Options:");
    std::println("  --dns LIST              Comma-separated DNS resolver IPs");
    std::println("  --file PATH             Load targets from a CSV or JSON file");
    std::println("  --mode dns|mirror       Start in DNS or mirror mode (default: dns)");
    std::println("  --distro ID             Mirror set to use instead of the detected one");
    std::println("  --rank latency|throughput");
    std::println("                          How the best result is chosen (default: latency)");
    std::println("  --sort ip|latency|throughput|name");
    std::println("  --asc, --desc           Sort direction (default: throughput, desc)");
    std::println("  --batch                 Run once without the interactive screen");
    std::println("  --apply                 With --batch: apply the best DNS resolver");
    std::println("  --verbose               Print debug logging to stderr");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version information");
    std::println("");
    std::println("Examples:");
    std::println("  {} 1.1.1.1,8.8.8.8,9.9.9.9        # Interactive DNS benchmark", app_name);
    std::println("  {} --batch --file resolvers.csv   # Print a ranked table", app_name);
    std::println("  {} --mode mirror --distro debian  # Compare Debian mirrors", app_name);
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

void Application::load_targets(core::Session& session, const CliOptions& opts) const {
    auto add_parsed = [&](core::TargetKind kind, const std::vector<std::string>& entries) {
        for (const auto& entry : entries) {
            auto target = core::make_target(kind, entry);
            if (!target) {
                Log::warn("{}", target.error());
                continue;
            }
            session.add_targets({*target});
        }
    };

    add_parsed(core::TargetKind::Dns, opts.dns_entries);
    add_parsed(opts.mode, opts.entries);

    if (opts.file) {
        auto report = core::load_file(*opts.file, opts.mode);
        if (!report) {
            Log::error("{}", report.error());
        } else {
            session.add_targets(report->targets);
            Log::info("Loaded {} target(s) from {}", report->targets.size(), opts.file->string());
            if (report->skipped > 0) {
                Log::warn("Skipped {} malformed row(s) in {}", report->skipped, opts.file->string());
            }
        }
    }

    if (session.targets(core::Mode::Mirror).empty()) {
        auto distro = opts.distro ? core::distro_from_id(*opts.distro) : core::detect_distro();
        Log::debug("Mirror set: {}", core::to_string(distro));
        session.add_targets(core::mirrors_for(distro));
    }
    session.clear_status();
}

int Application::run_interactive(core::Session& session) {
    ui::Terminal terminal;
    std::string line;
    std::size_t tick = 0;

    while (true) {
        session.poll();
        if (g_interrupted.load())
            session.quit();
        if (session.quit_requested())
            break;

        terminal.draw(ui::render_frame(session, line, tick++, terminal.width()));

        if (auto key = terminal.read_key(Config::UI_FRAME_INTERVAL)) {
            if (ui::handle_key(session, line, *key) == ui::KeyAction::Quit)
                break;
        }
    }
    return 0;
}

int Application::run_batch(core::Session& session, const CliOptions& opts) {
    const auto& targets = session.targets();
    if (targets.empty()) {
        std::println(stderr, "{}No targets to test.{}", Color::YELLOW, Color::RESET);
        return 0;
    }

    const std::size_t total = targets.size();
    ui::render_batch_header(session.mode(), total);
    auto start_time = steady_clock::now();

    if (!session.start()) {
        std::println(stderr, "{}{}{}", Color::RED, session.status() ? session.status()->text : "", Color::RESET);
        return 0;
    }

    ui::UiSpinner spinner;
    std::size_t printed = 0;
    bool cancel_sent = false;
    spinner.start(std::format(" Testing {}", targets.front().display_name()));

    while (true) {
        bool idle = session.wait_until_idle(Config::UI_FRAME_INTERVAL);
        if (g_interrupted.load() && !cancel_sent) {
            session.cancel();
            cancel_sent = true;
        }

        const auto& table = session.table();
        while (printed < table.completed()) {
            spinner.stop();
            ui::render_batch_result(table.results()[printed], total);
            ++printed;
            if (!idle && printed < total) {
                spinner.start(std::format(" Testing {}", table.targets()[printed].display_name()));
            }
        }
        if (idle)
            break;
    }
    spinner.stop();

    ui::render_batch_summary(session);

    if (opts.apply && session.mode() == core::Mode::Dns && !g_interrupted.load()) {
        session.apply_best();
        session.wait_until_idle(Config::COMMAND_TIMEOUT * 4);
        if (const auto& status = session.status()) {
            std::println(" {}", Color::colorize(status->text, status->is_error ? Color::RED : Color::GREEN));
        }
    }

    print_line();
    std::println(" Finished in        : {:.0f} sec", duration<double>(steady_clock::now() - start_time).count());
    return 0;
}

int Application::run(int argc, char* argv[]) {
    try {
        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        std::vector<std::string_view> args;
        for (int i = 1; i < argc; ++i)
            args.emplace_back(argv[i]);

        auto opts = parse_args(args);
        if (!opts) {
            std::println(stderr, "{}Error: {}{}", Color::RED, opts.error(), Color::RESET);
            show_help(app_name);
            return 1;
        }
        if (opts->help) {
            show_help(app_name);
            return 0;
        }
        if (opts->version) {
            show_version();
            return 0;
        }
        if (opts->verbose)
            Log::set_level(Log::Level::Debug);

        SignalGuard signal_guard;
        net::HttpContext http_context;

        os::ShellCommandRunner runner;
        auto applier = os::make_platform_applier(runner);
        auto prober = std::make_shared<net::NetworkProber>();

        core::SessionOptions session_options;
        session_options.rank = opts->rank;
        session_options.sort = opts->sort;
        session_options.mode = opts->mode;

        core::Session session(prober, *applier, session_options);
        load_targets(session, *opts);

        return opts->batch ? run_batch(session, *opts) : run_interactive(session);
    } catch (const std::exception& e) {
        std::println(stderr, "\n{}Fatal Error: {}{}", Color::RED, e.what(), Color::RESET);
        return 1;
    }
}
