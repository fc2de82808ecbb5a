/**
 * @file test_storage_selector.cpp
 * @date 2025
 */

#include "ctforge/core/errors.hpp"
#include "ctforge/core/storage_selector.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace ctforge::core;

namespace {

constexpr std::uint64_t kGiB = 1024ULL * 1024 * 1024;

StoragePool MakePool(const std::string& tag, const std::string& type,
                     std::uint64_t free_bytes, bool rootdir = true) {
    StoragePool pool;
    pool.tag = tag;
    pool.type_name = type;
    pool.kind = StorageKindFromString(type);
    pool.free_bytes = free_bytes;
    pool.supports_rootdir = rootdir;
    return pool;
}

} // namespace

TEST(StorageSelectorTest, LabelLayout) {
    EXPECT_EQ("  Type: dir        Free:    50.00GB ",
              FormatStorageLabel(MakePool("local", "dir", 50 * kGiB)));
}

TEST(StorageSelectorTest, SinglePoolNeverPrompts) {
    int prompts = 0;
    StorageSelector selector([&](const StorageMenu&) -> std::optional<std::string> {
        ++prompts;
        return std::string("other");
    });

    auto pool = selector.Select({MakePool("local", "dir", 50 * kGiB),
                                 MakePool("backup", "nfs", 10 * kGiB, false)});

    EXPECT_EQ("local", pool.tag);
    EXPECT_EQ(0, prompts);
}

TEST(StorageSelectorTest, SinglePoolWithoutPromptAvailable) {
    StorageSelector selector(nullptr);
    EXPECT_EQ("local-zfs", selector.Select({MakePool("local-zfs", "zfspool", kGiB)}).tag);
}

TEST(StorageSelectorTest, NoEligiblePool) {
    StorageSelector selector(nullptr);

    try {
        selector.Select({MakePool("backup", "nfs", kGiB, false)});
        FAIL() << "expected ProvisionError";
    }
    catch (const ProvisionError& e) {
        EXPECT_EQ(ErrorKind::NO_ELIGIBLE_STORAGE, e.GetKind());
        EXPECT_STREQ("Unable to detect valid storage location.", e.what());
    }
}

TEST(StorageSelectorTest, PromptChoosesAmongSeveral) {
    std::vector<StorageMenu> shown;
    StorageSelector selector([&](const StorageMenu& menu) -> std::optional<std::string> {
        shown.push_back(menu);
        return std::string("local-zfs");
    });

    auto pool = selector.Select({MakePool("local", "dir", 50 * kGiB),
                                 MakePool("local-zfs", "zfspool", 200 * kGiB)});

    EXPECT_EQ("local-zfs", pool.tag);
    EXPECT_EQ(StorageKind::ZFSPOOL, pool.kind);
    ASSERT_EQ(1u, shown.size());
    ASSERT_EQ(2u, shown[0].rows.size());
    EXPECT_EQ("local", shown[0].rows[0].tag);
    EXPECT_EQ("local-zfs", shown[0].rows[1].tag);
}

TEST(StorageSelectorTest, UnknownAnswerPromptsAgain) {
    std::vector<std::string> answers = {"nope", "local"};
    std::size_t next = 0;
    StorageSelector selector([&](const StorageMenu&) -> std::optional<std::string> {
        return answers.at(next++);
    });

    auto pool = selector.Select({MakePool("local", "dir", kGiB),
                                 MakePool("local-lvm", "lvmthin", kGiB)});

    EXPECT_EQ("local", pool.tag);
    EXPECT_EQ(2u, next);
}

TEST(StorageSelectorTest, CancelledPrompt) {
    StorageSelector selector([](const StorageMenu&) -> std::optional<std::string> {
        return std::nullopt;
    });

    try {
        selector.Select({MakePool("a", "dir", kGiB), MakePool("b", "dir", kGiB)});
        FAIL() << "expected ProvisionError";
    }
    catch (const ProvisionError& e) {
        EXPECT_EQ(ErrorKind::SELECTION_CANCELLED, e.GetKind());
        EXPECT_EQ(1, e.GetExitCode());
    }
}

TEST(StorageSelectorTest, SeveralPoolsWithoutPromptIsCancelled) {
    StorageSelector selector(nullptr);
    EXPECT_THROW(selector.Select({MakePool("a", "dir", kGiB), MakePool("b", "dir", kGiB)}),
                 ProvisionError);
}

TEST(StorageSelectorTest, MenuWidthCoversEveryLabel) {
    const std::vector<std::string> types = {"dir", "nfs", "zfspool", "lvmthin", "cephfs-extra-long"};
    const std::vector<std::uint64_t> sizes = {0, 1, 1023, kGiB, 999 * kGiB, 5000 * kGiB * 1024};

    for (std::size_t count = 2; count <= types.size(); ++count) {
        std::vector<StoragePool> pools;
        for (std::size_t i = 0; i < count; ++i) {
            pools.push_back(MakePool("pool" + std::to_string(i), types[i], sizes[i % sizes.size()]));
        }

        auto menu = FormatStorageMenu(pools);
        ASSERT_EQ(count, menu.rows.size());

        std::size_t longest = 0;
        for (const auto& row : menu.rows) {
            longest = std::max(longest, row.label.size());
        }
        EXPECT_GE(menu.width, longest + kMenuColumnOffset);
    }
}
