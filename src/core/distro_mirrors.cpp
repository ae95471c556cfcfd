/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/distro_mirrors.hpp"

#include <fstream>
#include <span>
#include <system_error>

#include "include/log.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;

namespace vantage::core {

namespace {

struct MirrorEntry {
    std::string_view name;
    std::string_view url;
};

constexpr MirrorEntry kArch[] = {
    {"Arch Geo", "https://geo.mirror.pkgbuild.com/extra/os/x86_64/extra.db"},
    {"Kernel.org", "https://mirrors.kernel.org/archlinux/extra/os/x86_64/extra.db"},
    {"Rackspace", "https://mirror.rackspace.com/archlinux/extra/os/x86_64/extra.db"},
    {"MIT", "https://mirrors.mit.edu/archlinux/extra/os/x86_64/extra.db"},
};

constexpr MirrorEntry kDebian[] = {
    {"Debian CDN", "https://deb.debian.org/debian/ls-lR.gz"},
    {"Kernel.org", "https://mirrors.kernel.org/debian/ls-lR.gz"},
    {"MIT", "https://mirrors.mit.edu/debian/ls-lR.gz"},
    {"OSUOSL", "https://debian.osuosl.org/debian/ls-lR.gz"},
};

constexpr MirrorEntry kUbuntu[] = {
    {"Ubuntu Archive", "http://archive.ubuntu.com/ubuntu/ls-lR.gz"},
    {"Kernel.org", "https://mirrors.kernel.org/ubuntu/ls-lR.gz"},
    {"MIT", "https://mirrors.mit.edu/ubuntu/ls-lR.gz"},
    {"OCF Berkeley", "https://mirrors.ocf.berkeley.edu/ubuntu/ls-lR.gz"},
};

constexpr MirrorEntry kKali[] = {
    {"Kali Redirector", "https://http.kali.org/kali/dists/kali-rolling/main/binary-amd64/Packages.gz"},
    {"Kali CDN", "https://kali.download/kali/dists/kali-rolling/main/binary-amd64/Packages.gz"},
    {"OCF Berkeley", "https://mirrors.ocf.berkeley.edu/kali/dists/kali-rolling/main/binary-amd64/Packages.gz"},
};

constexpr MirrorEntry kMint[] = {
    {"Linux Mint", "http://packages.linuxmint.com/dists/wilma/main/binary-amd64/Packages.gz"},
    {"Kernel.org", "https://mirrors.kernel.org/linuxmint-packages/dists/wilma/main/binary-amd64/Packages.gz"},
    {"Ubuntu Archive", "http://archive.ubuntu.com/ubuntu/ls-lR.gz"},
};

constexpr MirrorEntry kManjaro[] = {
    {"Manjaro Global", "https://mirrors.manjaro.org/repo/stable/extra/x86_64/extra.db"},
    {"Init7", "https://mirror.init7.net/manjaro/stable/extra/x86_64/extra.db"},
    {"RWTH Aachen", "https://ftp.halifax.rwth-aachen.de/manjaro/stable/extra/x86_64/extra.db"},
};

constexpr MirrorEntry kGeneric[] = {
    {"Cloudflare", "https://speed.cloudflare.com/__down?bytes=1048576"},
    {"OVH", "https://proof.ovh.net/files/1Mb.dat"},
    {"Tele2", "http://speedtest.tele2.net/1MB.zip"},
    {"Hetzner", "https://ash-speed.hetzner.com/100MB.bin"},
};

std::span<const MirrorEntry> table_for(Distro distro) {
    switch (distro) {
        case Distro::Arch:
            return kArch;
        case Distro::Debian:
            return kDebian;
        case Distro::Ubuntu:
            return kUbuntu;
        case Distro::Kali:
            return kKali;
        case Distro::Mint:
            return kMint;
        case Distro::Manjaro:
            return kManjaro;
        case Distro::Docker:
        case Distro::Unknown:
            break;
    }
    return kGeneric;
}

}  // namespace

std::string_view to_string(Distro distro) noexcept {
    switch (distro) {
        case Distro::Arch:
            return "Arch";
        case Distro::Debian:
            return "Debian";
        case Distro::Ubuntu:
            return "Ubuntu";
        case Distro::Kali:
            return "Kali";
        case Distro::Mint:
            return "Mint";
        case Distro::Manjaro:
            return "Manjaro";
        case Distro::Docker:
            return "Docker";
        case Distro::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

Distro distro_from_id(std::string_view id) {
    auto key = to_lower(trim_sv(id));
    if (key == "arch" || key == "archlinux")
        return Distro::Arch;
    if (key == "debian")
        return Distro::Debian;
    if (key == "ubuntu")
        return Distro::Ubuntu;
    if (key == "kali")
        return Distro::Kali;
    if (key == "linuxmint" || key == "mint")
        return Distro::Mint;
    if (key == "manjaro")
        return Distro::Manjaro;
    if (key == "docker")
        return Distro::Docker;
    return Distro::Unknown;
}

std::optional<std::string> read_os_release_id(const fs::path& path) {
    std::ifstream os_file(path);
    if (!os_file)
        return std::nullopt;

    std::string line;
    while (std::getline(os_file, line)) {
        if (!line.starts_with("ID="))
            continue;

        auto id = trim(std::string_view(line).substr(3));
        if (!id.empty() && (id.front() == '"' || id.front() == '\''))
            id.erase(0, 1);
        if (!id.empty() && (id.back() == '"' || id.back() == '\''))
            id.pop_back();
        return id;
    }
    return std::nullopt;
}

Distro detect_distro(const fs::path& os_release, const fs::path& container_marker) {
    std::error_code ec;
    if (!container_marker.empty() && fs::exists(container_marker, ec)) {
        Log::debug("Container marker {} found", container_marker.string());
        return Distro::Docker;
    }

    auto id = read_os_release_id(os_release);
    if (!id) {
        Log::debug("No ID= in {}", os_release.string());
        return Distro::Unknown;
    }
    return distro_from_id(*id);
}

std::vector<Target> mirrors_for(Distro distro) {
    std::vector<Target> targets;
    for (const auto& entry : table_for(distro)) {
        targets.push_back(Target{std::string(entry.url), TargetKind::Mirror, std::string(entry.name)});
    }
    return targets;
}

}  // namespace vantage::core
