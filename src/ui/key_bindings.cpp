/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/key_bindings.hpp"

#include <vector>

#include "include/utils.hpp"

namespace vantage::ui {

namespace {

constexpr std::size_t kMaxLineLength = 512;

KeyAction quit(core::Session& session) {
    session.quit();
    return KeyAction::Quit;
}

// Adds every comma-separated entry; rejected ones stay in the line for editing.
void submit_line(core::Session& session, std::string& line) {
    std::string rejected;
    for (const auto& entry : split_list(line)) {
        if (!session.add_target(entry)) {
            if (!rejected.empty())
                rejected += ',';
            rejected += entry;
        }
    }
    line = std::move(rejected);
}

KeyAction on_input(core::Session& session, std::string& line, const Key& key) {
    switch (key.code) {
        case KeyCode::Char:
            if (line.size() < kMaxLineLength)
                line += key.ch;
            return KeyAction::Handled;
        case KeyCode::Backspace:
            if (!line.empty()) {
                line.pop_back();
            } else {
                (void)session.remove_last_target();
            }
            return KeyAction::Handled;
        case KeyCode::Enter:
            if (!trim_sv(line).empty()) {
                submit_line(session, line);
            } else {
                line.clear();
                session.start();
            }
            return KeyAction::Handled;
        case KeyCode::Tab:
            session.toggle_mode();
            return KeyAction::Handled;
        case KeyCode::Escape:
        case KeyCode::CtrlD:
            return quit(session);
        default:
            return KeyAction::Ignored;
    }
}

KeyAction on_running(core::Session& session, const Key& key) {
    if (key.code == KeyCode::Escape)
        return session.cancel() ? KeyAction::Handled : KeyAction::Ignored;
    if (key.code == KeyCode::Tab) {
        session.toggle_mode();
        return KeyAction::Handled;
    }
    if (key.code != KeyCode::Char)
        return KeyAction::Ignored;

    switch (key.ch) {
        case 'c':
            session.cancel();
            return KeyAction::Handled;
        case 'r':
            session.reset();
            return KeyAction::Handled;
        case 's':
            session.cycle_sort_column();
            return KeyAction::Handled;
        case 'd':
            session.toggle_sort_direction();
            return KeyAction::Handled;
        case 'q':
            return quit(session);
        default:
            return KeyAction::Ignored;
    }
}

KeyAction on_results(core::Session& session, const Key& key) {
    switch (key.code) {
        case KeyCode::Enter:
            session.start();
            return KeyAction::Handled;
        case KeyCode::Tab:
            session.toggle_mode();
            return KeyAction::Handled;
        case KeyCode::Escape:
        case KeyCode::CtrlD:
            return quit(session);
        case KeyCode::Char:
            break;
        default:
            return KeyAction::Ignored;
    }

    switch (key.ch) {
        case 's':
            session.cycle_sort_column();
            return KeyAction::Handled;
        case 'd':
            session.toggle_sort_direction();
            return KeyAction::Handled;
        case 'a':
            session.apply_best();
            return KeyAction::Handled;
        case 'r':
            session.reset();
            return KeyAction::Handled;
        case 'm':
            session.toggle_mode();
            return KeyAction::Handled;
        case 'q':
            return quit(session);
        default:
            return KeyAction::Ignored;
    }
}

}  // namespace

KeyAction handle_key(core::Session& session, std::string& line, const Key& key) {
    if (key.code == KeyCode::CtrlC)
        return quit(session);

    switch (session.screen()) {
        case core::Screen::Input:
            return on_input(session, line, key);
        case core::Screen::Running:
            return on_running(session, key);
        case core::Screen::Results:
            return on_results(session, key);
    }
    return KeyAction::Ignored;
}

std::string_view key_help(core::Screen screen) noexcept {
    switch (screen) {
        case core::Screen::Input:
            return "Enter: add / start  Backspace: delete  Tab: mode  Esc: quit";
        case core::Screen::Running:
            return "c/Esc: cancel  r: reset  s: sort  d: direction  q: quit";
        case core::Screen::Results:
            return "Enter: rerun  s: sort  d: direction  a: apply  r: reset  Tab: mode  q: quit";
    }
    return "";
}

}  // namespace vantage::ui
