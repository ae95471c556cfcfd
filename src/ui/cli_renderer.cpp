#include "include/cli_renderer.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <iostream>
#include <print>

#include "include/color.hpp"
#include "include/config.hpp"
#include "include/key_bindings.hpp"
#include "include/utils.hpp"

namespace vantage::ui {

namespace {

constexpr std::string_view kSpinnerFrames = "|/-\\";
constexpr std::size_t kIndexWidth = 4;
constexpr std::size_t kLatencyWidth = 12;
constexpr std::size_t kRateWidth = 14;

std::string rule(std::size_t width) {
    return std::format("{:-<{}}\n", "", width);
}

std::size_t target_width(std::size_t width) {
    std::size_t fixed = kIndexWidth + kLatencyWidth + kRateWidth + 12;
    return width > fixed + 20 ? std::min<std::size_t>(width - fixed, 48) : 20;
}

std::string target_cell(const core::Target& target, core::Mode mode) {
    if (mode == core::Mode::Mirror && !target.label.empty()) {
        return std::format("{} ({})", target.label, target.id);
    }
    return target.id;
}

std::string_view column_title(core::SortColumn column, core::Mode mode) {
    switch (column) {
        case core::SortColumn::Identifier:
            return mode == core::Mode::Dns ? "IP" : "URL";
        case core::SortColumn::Latency:
            return "Latency";
        case core::SortColumn::Throughput:
            return "Throughput";
        case core::SortColumn::Label:
            return "Name";
    }
    return "";
}

}  // namespace

void UiSpinner::start(std::string_view text) {
    stop();
    text_ = text;

    worker_ = std::jthread([this](std::stop_token st) {
        std::size_t idx = 0;

        while (!st.stop_requested()) {
            std::print("\r{} {}", text_, kSpinnerFrames[idx++ % kSpinnerFrames.size()]);
            std::cout.flush();

            std::this_thread::sleep_for(std::chrono::milliseconds(Config::UI_SPINNER_DELAY_MS));
        }

        std::print("\r{}\r", std::string(text_.size() + 2, ' '));
        std::cout.flush();
    });
}

void UiSpinner::stop() {
    worker_ = std::jthread();
}

std::string create_progress_bar(std::size_t done, std::size_t total, int width) {
    if (width <= 0)
        return "[]";
    const auto w = static_cast<std::size_t>(width);
    std::size_t filled = total == 0 ? 0 : std::min(w, done * w / total);
    return std::format("[{}{}]", std::string(filled, '#'), std::string(w - filled, '-'));
}

std::string format_status_cell(const core::ProbeResult& result, bool in_progress) {
    switch (result.status) {
        case core::ProbeStatus::Success:
            return Color::colorize("OK", Color::GREEN);
        case core::ProbeStatus::Timeout:
            return Color::colorize("Timeout", Color::YELLOW);
        case core::ProbeStatus::Failed:
            return Color::colorize(truncate(std::format("Failed: {}", result.reason), Config::UI_MAX_REASON_LENGTH),
                                   Color::RED);
        case core::ProbeStatus::Pending:
            break;
    }
    return Color::colorize(in_progress ? "Testing..." : "Pending", Color::DIM);
}

std::string format_results_table(const std::vector<core::ProbeResult>& rows,
                                 const core::ProbeResult* best,
                                 core::Mode mode,
                                 std::size_t width,
                                 std::optional<std::size_t> in_progress) {
    const std::size_t tw = target_width(width);
    std::string out;

    out += std::format(" {:<{}}{:<{}}{:<{}}{:<{}}{}\n",
                       "#", kIndexWidth,
                       mode == core::Mode::Dns ? "Resolver" : "Mirror", tw + 1,
                       "Latency", kLatencyWidth,
                       "Throughput", kRateWidth,
                       "Status");

    for (const auto& r : rows) {
        const bool is_best = best && best->index == r.index;
        std::string marker = is_best ? "*" : " ";
        std::string latency = r.latency ? format_latency(r.latency->count()) : "-";
        std::string rate = r.throughput_mbps ? format_rate(*r.throughput_mbps) : "-";
        std::string name = truncate(target_cell(r.target, mode), tw);

        out += std::format("{}{:<{}}{}{:<{}}{} {}{:<{}}{}{:<{}}{}{}\n",
                           marker,
                           r.index + 1, kIndexWidth,
                           is_best ? Color::BOLD : Color::YELLOW, name, tw, Color::RESET,
                           Color::CYAN, latency, kLatencyWidth,
                           Color::GREEN, rate, kRateWidth,
                           Color::RESET,
                           format_status_cell(r, in_progress && *in_progress == r.index));
    }
    return out;
}

std::string render_frame(const core::Session& session,
                         std::string_view input_line,
                         std::size_t tick,
                         std::size_t width) {
    const auto& table = session.table();
    const auto mode = session.mode();
    std::string out;

    out += std::format(" {} v{}  {}  [{}]\n",
                       Color::colorize(Config::APP_NAME, Color::BOLD),
                       Config::APP_VERSION,
                       Color::colorize(std::format("{} mode", core::to_string(mode)), Color::MAGENTA),
                       core::to_string(session.screen()));
    out += rule(width);

    const auto& targets = session.targets();
    std::string listing;
    for (const auto& t : targets) {
        if (!listing.empty())
            listing += ", ";
        listing += t.display_name();
    }
    out += std::format(" Targets ({}): {}\n",
                       targets.size(),
                       targets.empty() ? Color::colorize("none", Color::DIM)
                                       : truncate(listing, width > 20 ? width - 16 : width));

    if (session.screen() == core::Screen::Input) {
        out += std::format(" > {}_\n", input_line);
    }
    out += rule(width);

    if (session.screen() == core::Screen::Running) {
        const auto total = table.total();
        const auto done = table.completed();
        std::string current;
        if (done < total)
            current = std::format("Testing {}", table.targets()[done].display_name());
        out += std::format(" {} {}/{} {} {}\n",
                           create_progress_bar(done, total, Config::UI_BAR_WIDTH),
                           done,
                           total,
                           kSpinnerFrames[tick % kSpinnerFrames.size()],
                           current);
    }

    if (const auto* last = table.last_result()) {
        out += std::format(" Last: {}  {}  {}  {}\n",
                           last->target.display_name(),
                           last->latency ? format_latency(last->latency->count()) : "-",
                           last->throughput_mbps ? format_rate(*last->throughput_mbps) : "-",
                           format_status_cell(*last, false));
    }
    if (const auto* best = table.best()) {
        out += std::format(" Best: {}\n",
                           Color::colorize(std::format("{}  {}  {}",
                                                       best->target.display_name(),
                                                       format_latency(best->latency->count()),
                                                       format_rate(best->throughput_mbps.value_or(0.0))),
                                           Color::GREEN));
    }

    if (!table.results().empty()) {
        const auto& sort = session.sort();
        out += std::format(" Sort: {} {}\n",
                           column_title(sort.column, mode),
                           sort.direction == core::SortDirection::Ascending ? "asc" : "desc");
        std::optional<std::size_t> in_progress;
        if (session.screen() == core::Screen::Running)
            in_progress = table.current_index();
        out += format_results_table(session.sorted_results(), table.best(), mode, width, in_progress);
        out += rule(width);
    }

    if (const auto& status = session.status()) {
        out += std::format(" {}\n", Color::colorize(status->text, status->is_error ? Color::RED : Color::CYAN));
    }
    out += std::format(" {}\n", Color::colorize(key_help(session.screen()), Color::DIM));
    return out;
}

void render_batch_header(core::Mode mode, std::size_t total) {
    print_line();
    std::println(" {} v{} - {} benchmark of {} target(s)",
                 Config::APP_NAME,
                 Config::APP_VERSION,
                 core::to_string(mode),
                 total);
    print_line();
}

void render_batch_result(const core::ProbeResult& result, std::size_t total) {
    std::println(" [{}/{}] {:<40} {:<12} {:<14} {}",
                 result.index + 1,
                 total,
                 truncate(result.target.display_name(), 40),
                 result.latency ? format_latency(result.latency->count()) : "-",
                 result.throughput_mbps ? format_rate(*result.throughput_mbps) : "-",
                 format_status_cell(result, false));
}

void render_batch_summary(const core::Session& session) {
    const auto& table = session.table();
    const auto width = get_term_width();

    print_line();
    std::print("{}", format_results_table(session.sorted_results(), table.best(), session.mode(), width));
    print_line();

    if (const auto* best = table.best()) {
        std::println(" Best: {}", Color::colorize(best->target.display_name(), Color::GREEN));
    } else {
        std::println(" {}", Color::colorize("No target succeeded", Color::RED));
    }
    std::println(" {} of {} target(s) succeeded ({})",
                 table.success_count(),
                 table.total(),
                 core::to_string(table.status()));
}

}  // namespace vantage::ui
