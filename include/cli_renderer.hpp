/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "results.hpp"
#include "session.hpp"

namespace vantage::ui {

// Spinner on the current stdout line, driven by its own thread. Used by
// batch mode while a target is being probed.
class UiSpinner {
    std::jthread worker_;
    std::string text_;

   public:
    void start(std::string_view text);
    void stop();
};

std::string create_progress_bar(std::size_t done, std::size_t total, int width);

[[nodiscard]] std::string format_status_cell(const core::ProbeResult& result, bool in_progress);

// One table row per result; `best` (may be null) is highlighted.
std::string format_results_table(const std::vector<core::ProbeResult>& rows,
                                 const core::ProbeResult* best,
                                 core::Mode mode,
                                 std::size_t width,
                                 std::optional<std::size_t> in_progress = std::nullopt);

// Whole interactive screen for the current session state.
std::string render_frame(const core::Session& session,
                         std::string_view input_line,
                         std::size_t tick,
                         std::size_t width);

// Batch mode output.
void render_batch_header(core::Mode mode, std::size_t total);
void render_batch_result(const core::ProbeResult& result, std::size_t total);
void render_batch_summary(const core::Session& session);

}  // namespace vantage::ui
