#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "include/dns_applier.hpp"
#include "include/log.hpp"
#include "tests/fakes.hpp"

using namespace vantage::os;
using vantage::testing::FakeCommandRunner;

namespace {

const std::vector<std::string> kNmRunning = {"nmcli", "-t", "-f", "RUNNING", "general"};
const std::vector<std::string> kNmActive = {"nmcli", "-t", "-f", "NAME,TYPE", "connection", "show", "--active"};
const std::vector<std::string> kNmPrevious = {"nmcli", "-g", "ipv4.dns,ipv4.ignore-auto-dns",
                                              "connection", "show", "Home WiFi"};

void networkmanager_up(FakeCommandRunner& runner) {
    runner.programs = {"nmcli", "sudo"};
    runner.respond(kNmRunning, 0, "running\n");
    runner.respond(kNmActive, 0, "lo:loopback\nHome WiFi:802-11-wireless\n");
    runner.respond(kNmPrevious, 0, "192.168.1.1\nno\n");
}

}  // namespace

TEST(DnsApplierTest, NetworkManagerPathUsesSudoWhenUnprivileged) {
    FakeCommandRunner runner;
    networkmanager_up(runner);

    LinuxDnsApplier applier(runner);
    auto result = applier.apply("1.1.1.1");
    ASSERT_TRUE(result) << result.error().message();

    EXPECT_TRUE(runner.ran({"sudo", "-n", "nmcli", "connection", "modify", "Home WiFi",
                            "ipv4.dns", "1.1.1.1", "ipv4.ignore-auto-dns", "yes"}));
    EXPECT_TRUE(runner.ran({"sudo", "-n", "nmcli", "connection", "up", "Home WiFi"}));
}

TEST(DnsApplierTest, NetworkManagerRollsBackWhenActivationFails) {
    FakeCommandRunner runner;
    networkmanager_up(runner);
    runner.privileged = true;
    runner.respond({"nmcli", "connection", "up", "Home WiFi"}, 4, "Error: Connection activation failed\n");

    LinuxDnsApplier applier(runner);
    auto result = applier.apply("1.1.1.1");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ApplyErrorKind::InvocationFailed);
    EXPECT_NE(result.error().detail.find("Connection activation failed"), std::string::npos);

    EXPECT_TRUE(runner.ran({"nmcli", "connection", "modify", "Home WiFi",
                            "ipv4.dns", "192.168.1.1", "ipv4.ignore-auto-dns", "no"}));
}

TEST(DnsApplierTest, FailedRollbackIsReportedInDetailOnly) {
    FakeCommandRunner runner;
    networkmanager_up(runner);
    runner.privileged = true;
    runner.respond({"nmcli", "connection", "up", "Home WiFi"}, 4, "Error: Connection activation failed\n");
    runner.respond({"nmcli", "connection", "modify", "Home WiFi",
                    "ipv4.dns", "192.168.1.1", "ipv4.ignore-auto-dns", "no"},
                   1, "Error: failed to modify connection\n");

    LinuxDnsApplier applier(runner);
    Log::set_level(Log::Level::Warn);
    ::testing::internal::CaptureStderr();
    auto result = applier.apply("1.1.1.1");
    std::fflush(stderr);
    const std::string written = ::testing::internal::GetCapturedStderr();
    Log::set_level(Log::Level::Off);

    ASSERT_FALSE(result);
    EXPECT_NE(result.error().detail.find("previous settings could not be restored"), std::string::npos);
    EXPECT_EQ(written, "");
}

TEST(DnsApplierTest, SudoPasswordPromptIsPermissionDenied) {
    FakeCommandRunner runner;
    networkmanager_up(runner);
    runner.respond({"sudo", "-n", "nmcli", "connection", "modify", "Home WiFi",
                    "ipv4.dns", "1.1.1.1", "ipv4.ignore-auto-dns", "yes"},
                   1, "sudo: a password is required\n");

    LinuxDnsApplier applier(runner);
    auto result = applier.apply("1.1.1.1");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ApplyErrorKind::PermissionDenied);
    EXPECT_EQ(result.error().message(), "Permission denied: sudo: a password is required");
}

TEST(DnsApplierTest, NoSudoAndNotRootIsPermissionDenied) {
    FakeCommandRunner runner;
    networkmanager_up(runner);
    runner.programs.erase("sudo");

    LinuxDnsApplier applier(runner);
    auto result = applier.apply("1.1.1.1");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ApplyErrorKind::PermissionDenied);
}

TEST(DnsApplierTest, FallsBackToResolvedWhenNetworkManagerIsStopped) {
    FakeCommandRunner runner;
    runner.programs = {"nmcli", "resolvectl", "ip"};
    runner.privileged = true;
    runner.respond(kNmRunning, 0, "asleep\n");
    runner.respond({"ip", "route", "show", "default"}, 0, "default via 10.0.0.1 dev eth0 proto dhcp metric 100\n");

    LinuxDnsApplier applier(runner);
    auto result = applier.apply("9.9.9.9");
    ASSERT_TRUE(result) << result.error().message();

    EXPECT_TRUE(runner.ran({"resolvectl", "dns", "eth0", "9.9.9.9"}));
    EXPECT_TRUE(runner.ran({"resolvectl", "flush-caches"}));
    EXPECT_FALSE(runner.ran({"nmcli", "connection", "up", "Home WiFi"}));
}

TEST(DnsApplierTest, NoMechanismIsReported) {
    FakeCommandRunner runner;
    runner.privileged = true;

    LinuxDnsApplier applier(runner);
    auto result = applier.apply("9.9.9.9");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ApplyErrorKind::MechanismUnavailable);
    EXPECT_TRUE(runner.calls.empty());
}

TEST(DnsApplierTest, ResolvedFailureCarriesExitDetail) {
    FakeCommandRunner runner;
    runner.programs = {"resolvectl", "ip"};
    runner.privileged = true;
    runner.respond({"ip", "route", "show", "default"}, 0, "default via 10.0.0.1 dev wlan0\n");
    runner.respond({"resolvectl", "dns", "wlan0", "9.9.9.9"}, 1, "Failed to set DNS configuration: Unit dbus-org.freedesktop.resolve1.service not found.\n");

    LinuxDnsApplier applier(runner);
    auto result = applier.apply("9.9.9.9");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ApplyErrorKind::InvocationFailed);
    EXPECT_NE(result.error().detail.find("exited with status 1"), std::string::npos);
}

TEST(DnsApplierTest, MacUsesFirstServiceWithAddress) {
    FakeCommandRunner runner;
    runner.programs = {"networksetup", "sudo"};
    runner.respond({"networksetup", "-listallnetworkservices"}, 0,
                   "An asterisk (*) denotes that a network service is disabled.\n*Bluetooth PAN\nEthernet\nWi-Fi\n");
    runner.respond({"networksetup", "-getinfo", "Wi-Fi"}, 0, "DHCP Configuration\nIP address: 192.168.1.20\n");
    runner.respond({"networksetup", "-getinfo", "Ethernet"}, 0, "DHCP Configuration\n");

    MacDnsApplier applier(runner);
    auto result = applier.apply("1.1.1.1");
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_TRUE(runner.ran({"sudo", "-n", "networksetup", "-setdnsservers", "Wi-Fi", "1.1.1.1"}));
    EXPECT_FALSE(runner.ran({"networksetup", "-getinfo", "*Bluetooth PAN"}));
}

TEST(DnsApplierTest, WindowsNeedsElevation) {
    FakeCommandRunner runner;
    runner.programs = {"powershell", "netsh"};

    WindowsDnsApplier applier(runner);
    auto result = applier.apply("1.1.1.1");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ApplyErrorKind::PermissionDenied);
}

TEST(DnsApplierTest, WindowsSetsStaticDnsOnFirstUpAdapter) {
    FakeCommandRunner runner;
    runner.programs = {"powershell", "netsh"};
    runner.privileged = true;
    runner.respond({"powershell", "-NoProfile", "-Command",
                    "Get-NetAdapter | Where-Object { $_.Status -eq 'Up' } | Select-Object -ExpandProperty Name"},
                   0, "\r\nEthernet 2\r\n");

    WindowsDnsApplier applier(runner);
    auto result = applier.apply("1.1.1.1");
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_TRUE(runner.ran({"netsh", "interface", "ip", "set", "dns", "name=Ethernet 2", "source=static", "addr=1.1.1.1"}));
}

TEST(DnsApplierTest, UnsupportedPlatform) {
    UnsupportedDnsApplier applier;
    auto result = applier.apply("1.1.1.1");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ApplyErrorKind::Unsupported);
}

TEST(DnsApplierTest, ClassifyTimeout) {
    CommandResult timed_out{-1, "", true};
    auto err = classify_failure({"resolvectl", "dns"}, timed_out);
    EXPECT_EQ(err.kind, ApplyErrorKind::InvocationFailed);
    EXPECT_EQ(err.detail, "'resolvectl dns' timed out");
}
