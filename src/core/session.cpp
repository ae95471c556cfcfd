/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/session.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <stdexcept>
#include <utility>
#include <variant>

#include "include/log.hpp"

namespace vantage::core {

std::string_view to_string(Screen screen) noexcept {
    switch (screen) {
        case Screen::Input:
            return "Input";
        case Screen::Running:
            return "Running";
        case Screen::Results:
            return "Results";
    }
    return "Unknown";
}

Session::Session(std::shared_ptr<Prober> prober, os::DnsApplier& applier, SessionOptions options)
    : prober_(std::move(prober)),
      applier_(applier),
      worker_options_(options.worker),
      mode_(options.mode),
      table_(options.rank),
      sort_(options.sort) {
    if (!prober_) {
        throw std::invalid_argument("Session: prober is required");
    }
    if (mode_ == Mode::Dns && sort_.column == SortColumn::Label) {
        sort_.column = SortColumn::Identifier;
    }
}

Session::~Session() {
    if (worker_) {
        worker_->cancel();
    }
}

std::vector<Target>& Session::active_targets() noexcept {
    return mode_ == Mode::Dns ? dns_targets_ : mirror_targets_;
}

void Session::set_status(std::string text, bool is_error) {
    Log::debug("status: {}", text);
    status_ = StatusMessage{std::move(text), is_error};
}

bool Session::reject_while_running(std::string_view action) {
    if (screen_ != Screen::Running)
        return false;
    set_status(std::format("Cannot {} while a benchmark is running", action), true);
    return true;
}

std::expected<void, std::string> Session::add_target(std::string_view text, std::string_view label) {
    if (reject_while_running("edit targets")) {
        return std::unexpected(status_->text);
    }

    auto target = make_target(mode_, text, label);
    if (!target) {
        set_status(target.error(), true);
        return std::unexpected(target.error());
    }

    auto& list = active_targets();
    if (std::ranges::any_of(list, [&](const Target& t) { return t.id == target->id; })) {
        auto msg = std::format("{} is already in the list", target->id);
        set_status(msg, true);
        return std::unexpected(msg);
    }

    set_status(std::format("Added {}", target->id));
    list.push_back(std::move(*target));
    return {};
}

std::size_t Session::add_targets(const std::vector<Target>& targets) {
    if (reject_while_running("edit targets"))
        return 0;

    std::size_t added = 0;
    for (const auto& t : targets) {
        (t.kind == Mode::Dns ? dns_targets_ : mirror_targets_).push_back(t);
        ++added;
    }
    if (added > 0) {
        set_status(std::format("Loaded {} target(s)", added));
    }
    return added;
}

std::optional<Target> Session::remove_last_target() {
    if (reject_while_running("edit targets"))
        return std::nullopt;

    auto& list = active_targets();
    if (list.empty())
        return std::nullopt;

    Target removed = std::move(list.back());
    list.pop_back();
    set_status(std::format("Removed {}", removed.id));
    return removed;
}

bool Session::start() {
    if (reject_while_running("start another run"))
        return false;
    if (quit_requested_)
        return false;

    const auto& list = active_targets();
    if (list.empty()) {
        set_status("Add at least one target first", true);
        return false;
    }

    table_.begin_run(list);
    worker_ = std::make_unique<BenchmarkWorker>(list, prober_, worker_options_);
    worker_->start();
    screen_ = Screen::Running;
    reset_pending_ = false;

    Log::debug("Run started: {} {} target(s)", list.size(), to_string(mode_));
    set_status(std::format("Testing {} target(s)...", list.size()));
    return true;
}

void Session::handle_event(const WorkerEvent& event) {
    if (table_.apply(event)) {
        finish_run();
    }
}

void Session::finish_run() {
    if (worker_) {
        if (worker_->exited()) {
            worker_->join();
        } else {
            retired_.push_back(std::move(worker_));
        }
        worker_.reset();
    }

    if (reset_pending_) {
        reset_pending_ = false;
        table_.reset();
        screen_ = Screen::Input;
        set_status("Results cleared");
        return;
    }

    screen_ = Screen::Results;
    if (table_.status() == RunStatus::Cancelled) {
        set_status(std::format("Cancelled after {} of {} target(s)", table_.completed(), table_.total()));
    } else {
        set_status(std::format("Done: {} of {} target(s) succeeded", table_.success_count(), table_.total()));
    }
}

void Session::poll() {
    if (worker_) {
        for (const auto& event : worker_->events().drain()) {
            handle_event(event);
        }
    }
    std::erase_if(retired_, [](const auto& worker) { return worker->exited(); });
    poll_apply();
}

void Session::poll_apply() {
    if (!apply_future_.valid() ||
        apply_future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }

    try {
        last_apply_ = apply_future_.get();
    } catch (const std::exception& e) {
        last_apply_ = std::unexpected(os::ApplyError{os::ApplyErrorKind::InvocationFailed, e.what()});
    }

    if (*last_apply_) {
        Log::info("DNS set to {} ({})", apply_address_, applier_.platform());
        set_status(std::format("DNS set to {}", apply_address_));
    } else {
        Log::debug("Applying {} failed: {}", apply_address_, last_apply_->error().message());
        set_status(last_apply_->error().message(), true);
    }
}

bool Session::cancel() {
    if (screen_ != Screen::Running || !worker_)
        return false;
    if (worker_->cancel_requested())
        return true;

    worker_->cancel();
    set_status("Cancelling after the current target...");
    return true;
}

void Session::reset() {
    if (screen_ == Screen::Running) {
        reset_pending_ = true;
        if (worker_)
            worker_->cancel();
        set_status("Stopping run...");
        return;
    }

    table_.reset();
    screen_ = Screen::Input;
}

bool Session::toggle_mode() {
    if (reject_while_running("switch mode"))
        return false;

    mode_ = mode_ == Mode::Dns ? Mode::Mirror : Mode::Dns;
    if (mode_ == Mode::Dns && sort_.column == SortColumn::Label) {
        sort_.column = SortColumn::Identifier;
    }
    table_.reset();
    screen_ = Screen::Input;
    set_status(std::format("Mode: {}", to_string(mode_)));
    return true;
}

void Session::cycle_sort_column() {
    switch (sort_.column) {
        case SortColumn::Identifier:
            sort_.column = SortColumn::Latency;
            break;
        case SortColumn::Latency:
            sort_.column = SortColumn::Throughput;
            break;
        case SortColumn::Throughput:
            sort_.column = mode_ == Mode::Mirror ? SortColumn::Label : SortColumn::Identifier;
            break;
        case SortColumn::Label:
            sort_.column = SortColumn::Identifier;
            break;
    }
}

void Session::toggle_sort_direction() {
    sort_.direction = sort_.direction == SortDirection::Ascending ? SortDirection::Descending
                                                                  : SortDirection::Ascending;
}

void Session::set_sort(SortSpec spec) {
    if (mode_ == Mode::Dns && spec.column == SortColumn::Label) {
        spec.column = SortColumn::Identifier;
    }
    sort_ = spec;
}

void Session::set_rank_policy(RankPolicy policy) {
    table_.set_rank_policy(policy);
}

bool Session::apply_best() {
    if (mode_ != Mode::Dns) {
        set_status("Apply is only available in DNS mode", true);
        return false;
    }
    if (screen_ != Screen::Results) {
        set_status("Run a benchmark before applying", true);
        return false;
    }
    if (apply_future_.valid()) {
        set_status("An apply is already in progress", true);
        return false;
    }

    const ProbeResult* best = table_.best();
    if (!best) {
        os::ApplyError err{os::ApplyErrorKind::NoCandidate, "no successful target to apply"};
        set_status(err.message(), true);
        last_apply_ = std::unexpected(std::move(err));
        return false;
    }

    apply_address_ = best->target.id;
    apply_future_ = std::async(std::launch::async, [this, address = apply_address_] {
        return applier_.apply(address);
    });
    set_status(std::format("Applying {} via {}...", apply_address_, applier_.platform()));
    return true;
}

void Session::quit() {
    quit_requested_ = true;
    if (worker_) {
        worker_->cancel();
    }
}

bool Session::wait_until_idle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    constexpr auto slice = std::chrono::milliseconds(50);

    while (true) {
        poll();
        if (!busy())
            return true;

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        const auto wait = std::min<std::chrono::steady_clock::duration>(deadline - now, slice);

        if (worker_) {
            if (auto event = worker_->events().pop_for(wait)) {
                handle_event(*event);
            }
        } else {
            apply_future_.wait_for(wait);
        }
    }
}

}  // namespace vantage::core
