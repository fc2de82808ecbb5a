/**
 * @file test_template_resolver.cpp
 * @date 2025
 */

#include "ctforge/core/errors.hpp"
#include "ctforge/core/template_resolver.hpp"

#include "mock_host_capability.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

using namespace ctforge::core;
using ctforge::host::HostCommandError;
using ctforge::tests::MockHostCapability;

using testing::_;
using testing::InSequence;
using testing::Return;
using testing::Throw;

TEST(TemplateResolverTest, NewestVersionWins) {
    auto candidates = TemplateResolver::SelectCandidates(
        {"debian-10.0-std", "debian-10.7-std", "debian-10.2-std"}, "debian", "10");

    ASSERT_EQ(3u, candidates.size());
    EXPECT_EQ("debian-10.7-std", candidates.back());
}

TEST(TemplateResolverTest, OrderingIsIndependentOfInputOrder) {
    std::vector<std::string> names = {"debian-10.0-std", "debian-10.7-std", "debian-10.2-std"};
    std::sort(names.begin(), names.end());

    do {
        auto candidates = TemplateResolver::SelectCandidates(names, "debian", "10");
        EXPECT_EQ((std::vector<std::string>{"debian-10.0-std", "debian-10.2-std", "debian-10.7-std"}),
                  candidates);
    } while (std::next_permutation(names.begin(), names.end()));
}

TEST(TemplateResolverTest, CandidatesStartAtFamilyVersion) {
    auto candidates = TemplateResolver::SelectCandidates(
        {"system debian-10-standard_10.7-1_amd64.tar.gz", "ubuntu-20.04-standard_20.04-1_amd64.tar.gz"},
        "debian", "10");

    ASSERT_EQ(1u, candidates.size());
    EXPECT_EQ("debian-10-standard_10.7-1_amd64.tar.gz", candidates[0]);
}

TEST(TemplateResolverTest, RealTemplateNames) {
    auto candidates = TemplateResolver::SelectCandidates(
        {"debian-10-standard_10.7-1_amd64.tar.gz",
         "debian-9.0-standard_9.7-1_amd64.tar.gz",
         "debian-10-standard_10.5-1_amd64.tar.gz"},
        "debian", "10");

    ASSERT_EQ(2u, candidates.size());
    EXPECT_EQ("debian-10-standard_10.7-1_amd64.tar.gz", candidates.back());
}

TEST(TemplateResolverTest, ComparisonIsStrictWeakOrder) {
    EXPECT_FALSE(TemplateResolver::CompareTemplateNames("debian-10.7-std", "debian-10.7-std"));
    EXPECT_TRUE(TemplateResolver::CompareTemplateNames("debian-10.2-std", "debian-10.7-std"));
    EXPECT_FALSE(TemplateResolver::CompareTemplateNames("debian-10.7-std", "debian-10.2-std"));
    EXPECT_TRUE(TemplateResolver::CompareTemplateNames("debian-10", "debian-10-std"));
}

TEST(TemplateResolverTest, CachedTemplateIsNotDownloaded) {
    MockHostCapability host;
    InSequence sequence;

    EXPECT_CALL(host, RefreshTemplateIndex());
    EXPECT_CALL(host, ListAvailableTemplates("debian"))
        .WillOnce(Return(std::vector<std::string>{"debian-10.0-std", "debian-10.7-std"}));
    EXPECT_CALL(host, IsTemplateCached("local", "debian-10.7-std")).WillOnce(Return(true));
    EXPECT_CALL(host, DownloadTemplate(_, _)).Times(0);

    TemplateResolver resolver(host, "local");
    auto reference = resolver.Resolve("debian", "10");

    EXPECT_EQ("debian", reference.os_family);
    EXPECT_EQ("10", reference.os_version);
    EXPECT_EQ("debian-10.7-std", reference.full_name);
}

TEST(TemplateResolverTest, MissingTemplateIsDownloaded) {
    MockHostCapability host;

    EXPECT_CALL(host, RefreshTemplateIndex());
    EXPECT_CALL(host, ListAvailableTemplates("debian"))
        .WillOnce(Return(std::vector<std::string>{"debian-10.7-std"}));
    EXPECT_CALL(host, IsTemplateCached("local", "debian-10.7-std")).WillOnce(Return(false));
    EXPECT_CALL(host, DownloadTemplate("local", "debian-10.7-std"));

    TemplateResolver resolver(host, "local");
    EXPECT_EQ("debian-10.7-std", resolver.Resolve("debian", "10").full_name);
}

TEST(TemplateResolverTest, NoMatchingTemplate) {
    MockHostCapability host;

    EXPECT_CALL(host, RefreshTemplateIndex());
    EXPECT_CALL(host, ListAvailableTemplates("debian"))
        .WillOnce(Return(std::vector<std::string>{"debian-9.0-std"}));
    EXPECT_CALL(host, IsTemplateCached(_, _)).Times(0);

    TemplateResolver resolver(host, "local");

    try {
        resolver.Resolve("debian", "10");
        FAIL() << "expected ProvisionError";
    }
    catch (const ProvisionError& e) {
        EXPECT_EQ(ErrorKind::TEMPLATE_NOT_FOUND, e.GetKind());
    }
}

TEST(TemplateResolverTest, DownloadFailureCarriesExitCode) {
    MockHostCapability host;

    EXPECT_CALL(host, RefreshTemplateIndex());
    EXPECT_CALL(host, ListAvailableTemplates(_))
        .WillOnce(Return(std::vector<std::string>{"debian-10.7-std"}));
    EXPECT_CALL(host, IsTemplateCached(_, _)).WillOnce(Return(false));
    EXPECT_CALL(host, DownloadTemplate(_, _))
        .WillOnce(Throw(HostCommandError("pveam download local debian-10.7-std", 4, "")));

    TemplateResolver resolver(host, "local");

    try {
        resolver.Resolve("debian", "10");
        FAIL() << "expected ProvisionError";
    }
    catch (const ProvisionError& e) {
        EXPECT_EQ(ErrorKind::TEMPLATE_DOWNLOAD_FAILED, e.GetKind());
        EXPECT_EQ(4, e.GetExitCode());
        EXPECT_STREQ("A problem occurred while downloading the LXC template.", e.what());
        EXPECT_EQ("pveam download local debian-10.7-std", e.GetContext());
    }
}

TEST(TemplateResolverTest, IndexFailureIsHostCapabilityError) {
    MockHostCapability host;

    EXPECT_CALL(host, RefreshTemplateIndex())
        .WillOnce(Throw(HostCommandError("pveam update", 255, "no network")));

    TemplateResolver resolver(host, "local");

    try {
        resolver.Resolve("debian", "10");
        FAIL() << "expected ProvisionError";
    }
    catch (const ProvisionError& e) {
        EXPECT_EQ(ErrorKind::HOST_CAPABILITY_UNAVAILABLE, e.GetKind());
        EXPECT_EQ(255, e.GetExitCode());
    }
}
