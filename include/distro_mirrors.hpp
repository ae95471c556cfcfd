/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "target.hpp"

namespace vantage::core {

enum class Distro { Arch, Debian, Ubuntu, Kali, Mint, Manjaro, Docker, Unknown };

[[nodiscard]] std::string_view to_string(Distro distro) noexcept;

// Maps an os-release ID (case-insensitive) to a known distro.
[[nodiscard]] Distro distro_from_id(std::string_view id);

// Value of ID= in an os-release file, unquoted.
[[nodiscard]] std::optional<std::string> read_os_release_id(const std::filesystem::path& path);

[[nodiscard]] Distro detect_distro(const std::filesystem::path& os_release = "/etc/os-release",
                                   const std::filesystem::path& container_marker = "/.dockerenv");

// Built-in mirror set for `distro`; Docker and Unknown get the generic set.
[[nodiscard]] std::vector<Target> mirrors_for(Distro distro);

}  // namespace vantage::core
