/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>
#include <string_view>

#include "session.hpp"
#include "terminal.hpp"

namespace vantage::ui {

enum class KeyAction { Ignored, Handled, Quit };

// Maps one key press to a session action for the current screen. `line` is
// the pending text of the Input screen's entry field.
KeyAction handle_key(core::Session& session, std::string& line, const Key& key);

[[nodiscard]] std::string_view key_help(core::Screen screen) noexcept;

}  // namespace vantage::ui
