/**
 * @file test_pve_host_parsers.cpp
 * @brief Parsers of the Proxmox binding against captured tool output
 * @date 2025
 */

#include "ctforge/host/pve_host.hpp"

#include <gtest/gtest.h>

using namespace ctforge::core;
using ctforge::host::PveHost;

TEST(PveHostParsersTest, StorageStatus) {
    const std::string output =
        "Name             Type     Status           Total            Used       Available        %\n"
        "local             dir     active        98559220        12763272        80746400   12.95%\n"
        "local-zfs     zfspool     active       450157032         1064796       449092236    0.24%\n"
        "\n"
        "broken            dir     active\n";

    auto pools = PveHost::ParseStorageStatus(output);

    ASSERT_EQ(2u, pools.size());
    EXPECT_EQ("local", pools[0].tag);
    EXPECT_EQ("dir", pools[0].type_name);
    EXPECT_EQ(StorageKind::DIR, pools[0].kind);
    EXPECT_EQ(80746400ULL * 1024, pools[0].free_bytes);
    EXPECT_TRUE(pools[0].supports_rootdir);

    EXPECT_EQ("local-zfs", pools[1].tag);
    EXPECT_EQ(StorageKind::ZFSPOOL, pools[1].kind);
}

TEST(PveHostParsersTest, StorageStatusSkipsUnreadableSizes) {
    auto pools = PveHost::ParseStorageStatus(
        "nas   nfs   inactive   0   0   N/A   0%\n", false);
    EXPECT_TRUE(pools.empty());
}

TEST(PveHostParsersTest, AvailableTemplates) {
    const std::string output =
        "system          alpine-3.12-default_20200823_amd64.tar.xz\n"
        "system          debian-10-standard_10.7-1_amd64.tar.gz\n"
        "system          debian-9.0-standard_9.7-1_amd64.tar.gz\n"
        "turnkeylinux    debian-10-turnkey-wordpress_16.1-1_amd64.tar.gz\n";

    auto names = PveHost::ParseAvailableTemplates(output, "debian");

    ASSERT_EQ(3u, names.size());
    EXPECT_EQ("debian-10-standard_10.7-1_amd64.tar.gz", names[0]);
    EXPECT_EQ("debian-9.0-standard_9.7-1_amd64.tar.gz", names[1]);
}

TEST(PveHostParsersTest, CachedTemplates) {
    const std::string output =
        "NAME                                                         SIZE\n"
        "local:vztmpl/debian-10-standard_10.7-1_amd64.tar.gz          231.29MB\n";

    auto names = PveHost::ParseCachedTemplates(output);

    ASSERT_EQ(1u, names.size());
    EXPECT_EQ("debian-10-standard_10.7-1_amd64.tar.gz", names[0]);
}

TEST(PveHostParsersTest, VolumeList) {
    const std::string output =
        "Volid                          Format  Type              Size VMID\n"
        "local:105/vm-105-disk-0.raw    raw     rootdir    21474836480 105\n";

    EXPECT_EQ((std::vector<std::string>{"local:105/vm-105-disk-0.raw"}),
              PveHost::ParseVolumeList(output));
    EXPECT_TRUE(PveHost::ParseVolumeList("").empty());
}

TEST(PveHostParsersTest, NextId) {
    EXPECT_EQ(105, PveHost::ParseNextId("\"105\"\n").value());
    EXPECT_EQ(106, PveHost::ParseNextId("106").value());
    EXPECT_FALSE(PveHost::ParseNextId("null").has_value());
    EXPECT_FALSE(PveHost::ParseNextId("garbage").has_value());
}

TEST(PveHostParsersTest, MountPath) {
    EXPECT_EQ("/var/lib/lxc/105/rootfs",
              PveHost::ParseMountPath("mounted CT 105 in '/var/lib/lxc/105/rootfs'\n").value());
    EXPECT_FALSE(PveHost::ParseMountPath("mounted CT 105").has_value());
    EXPECT_FALSE(PveHost::ParseMountPath("''").has_value());
}

TEST(PveHostParsersTest, ContainerStatus) {
    auto running = PveHost::ParseContainerStatus("status: running\n");
    EXPECT_TRUE(running.defined);
    EXPECT_TRUE(running.running);

    auto stopped = PveHost::ParseContainerStatus("status: stopped\n");
    EXPECT_TRUE(stopped.defined);
    EXPECT_FALSE(stopped.running);

    EXPECT_FALSE(PveHost::ParseContainerStatus("").defined);
}

TEST(PveHostParsersTest, MountLock) {
    const std::string mounted =
        "arch: amd64\n"
        "hostname: UnifiNetworkController\n"
        "lock: mounted\n"
        "memory: 2048\n";
    EXPECT_TRUE(PveHost::ParseMountLock(mounted));

    EXPECT_FALSE(PveHost::ParseMountLock("arch: amd64\nlock: backup\n"));
    EXPECT_FALSE(PveHost::ParseMountLock("arch: amd64\nmemory: 2048\n"));
    EXPECT_FALSE(PveHost::ParseMountLock(""));
}

TEST(PveHostParsersTest, InterfaceAddress) {
    const std::string output =
        "2: eth0@if12: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc noqueue state UP\n"
        "    link/ether 2a:9c:41:0e:77:10 brd ff:ff:ff:ff:ff:ff link-netnsid 0\n"
        "    inet 192.168.1.50/24 brd 192.168.1.255 scope global dynamic eth0\n"
        "    inet6 fe80::289c:41ff:fe0e:7710/64 scope link\n";

    EXPECT_EQ("192.168.1.50", PveHost::ParseInterfaceAddress(output).value());
    EXPECT_FALSE(PveHost::ParseInterfaceAddress("2: eth0: <NO-CARRIER>\n").has_value());
}

TEST(PveHostParsersTest, SizeArgument) {
    EXPECT_EQ("20G", PveHost::FormatSizeArgument(20ULL * 1024 * 1024 * 1024));
    EXPECT_EQ("512M", PveHost::FormatSizeArgument(512ULL * 1024 * 1024));
    EXPECT_EQ("2K", PveHost::FormatSizeArgument(1025));
}
