/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>

#include "cli_options.hpp"
#include "session.hpp"

class Application {
   public:
    int run(int argc, char* argv[]);

   private:
    void show_help(const std::string& app_name) const;
    void show_version() const;

    void load_targets(vantage::core::Session& session, const CliOptions& opts) const;
    int run_interactive(vantage::core::Session& session);
    int run_batch(vantage::core::Session& session, const CliOptions& opts);
};
