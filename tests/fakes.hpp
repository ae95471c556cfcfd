#pragma once

#include <atomic>
#include <chrono>
#include <expected>
#include <map>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "include/command_runner.hpp"
#include "include/dns_applier.hpp"
#include "include/prober.hpp"

namespace vantage::testing {

// Scripted probe outcomes keyed by target id. Unknown ids succeed with 10 ms
// and 100 Mbps.
class FakeProber : public core::Prober {
   public:
    struct Script {
        std::expected<core::Measurement, std::string> outcome =
            core::Measurement{core::Milliseconds{10.0}, 100.0};
        std::chrono::milliseconds delay{0};
        // Sleep through stop requests, like a probe stuck in a syscall.
        bool ignore_stop = false;
    };

    void set(const std::string& id, Script script) {
        std::lock_guard lock(mutex_);
        scripts_[id] = std::move(script);
    }

    void succeed(const std::string& id, double latency_ms, double mbps) {
        set(id, Script{core::Measurement{core::Milliseconds{latency_ms}, mbps}});
    }

    void fail(const std::string& id, std::string reason) {
        set(id, Script{std::unexpected(std::move(reason))});
    }

    void hang(const std::string& id, std::chrono::milliseconds delay) {
        set(id, Script{core::Measurement{core::Milliseconds{1.0}, 1.0}, delay, true});
    }

    void delay_all(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        default_.delay = delay;
    }

    std::expected<core::Measurement, std::string> probe(const core::Target& target,
                                                        std::stop_token stop) override {
        Script script;
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(target.id);
            auto it = scripts_.find(target.id);
            script = it != scripts_.end() ? it->second : default_;
        }

        const auto until = std::chrono::steady_clock::now() + script.delay;
        while (std::chrono::steady_clock::now() < until) {
            if (!script.ignore_stop && stop.stop_requested())
                return std::unexpected("stopped");
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return script.outcome;
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

   private:
    mutable std::mutex mutex_;
    std::map<std::string, Script> scripts_;
    Script default_;
    std::vector<std::string> calls_;
};

// Records every command and answers from a table keyed by the joined command
// line. Unlisted commands succeed with empty output.
class FakeCommandRunner : public os::CommandRunner {
   public:
    std::set<std::string> programs;
    bool privileged = false;
    std::map<std::string, os::CommandResult> responses;
    std::vector<std::vector<std::string>> calls;

    void respond(const std::vector<std::string>& args, int exit_code, std::string output) {
        responses[os::join_command(args)] = os::CommandResult{exit_code, std::move(output), false};
    }

    [[nodiscard]] bool has_program(std::string_view name) const override {
        return programs.contains(std::string(name));
    }

    [[nodiscard]] bool is_privileged() const override { return privileged; }

    std::expected<os::CommandResult, std::string> run(const std::vector<std::string>& args,
                                                      std::chrono::milliseconds) override {
        calls.push_back(args);
        auto it = responses.find(os::join_command(args));
        if (it != responses.end())
            return it->second;
        return os::CommandResult{0, "", false};
    }

    [[nodiscard]] bool ran(const std::vector<std::string>& args) const {
        for (const auto& c : calls) {
            if (c == args)
                return true;
        }
        return false;
    }
};

class FakeDnsApplier : public os::DnsApplier {
   public:
    std::atomic<int> calls{0};
    std::string last_address;
    std::expected<void, os::ApplyError> result{};

    [[nodiscard]] std::string_view platform() const noexcept override { return "Fake"; }

    std::expected<void, os::ApplyError> apply(std::string_view address) override {
        ++calls;
        last_address = address;
        return result;
    }
};

}  // namespace vantage::testing
