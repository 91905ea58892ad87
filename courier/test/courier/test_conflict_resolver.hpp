#pragma once

#include "recording_event_sink.hpp"

#include <courier/conflict_resolver.hpp>

#include <gtest/gtest.h>

#include <set>

namespace Test
{
    class FakeExistenceCheck : public Courier::ExistenceCheck
    {
      public:
        explicit FakeExistenceCheck(std::set<std::string> existing)
            : existing_{std::move(existing)}
        {}

        bool exists(std::string const& name) override
        {
            asked.push_back(name);
            return existing_.contains(name);
        }

        std::vector<std::string> asked{};

      private:
        std::set<std::string> existing_;
    };

    class ConflictResolverTests : public ::testing::Test
    {
      protected:
        std::shared_ptr<RecordingEventSink> events_ = std::make_shared<RecordingEventSink>();
    };

    TEST_F(ConflictResolverTests, FreeNameIsReturnedUnchangedForEveryPolicy)
    {
        using enum Persistence::OverwritePolicy;
        for (auto policy : {Never, Always, AddSuffixBeforeExtension, AddSuffixAfterExtension})
        {
            FakeExistenceCheck check{std::set<std::string>{}};
            Courier::ConflictResolver resolver{policy, events_};
            const auto name = resolver.resolve("/d/a.txt", check);
            ASSERT_TRUE(name.has_value());
            EXPECT_EQ(*name, "/d/a.txt");
        }
    }

    TEST_F(ConflictResolverTests, NeverPolicyFailsOnExistingName)
    {
        FakeExistenceCheck check{{"/d/a.txt"}};
        Courier::ConflictResolver resolver{Persistence::OverwritePolicy::Never, events_};

        const auto name = resolver.resolve("/d/a.txt", check);
        ASSERT_FALSE(name.has_value());
        EXPECT_EQ(name.error().type, Courier::ErrorType::AlreadyExists);
    }

    TEST_F(ConflictResolverTests, AlwaysPolicyKeepsExistingName)
    {
        FakeExistenceCheck check{{"/d/a.txt"}};
        Courier::ConflictResolver resolver{Persistence::OverwritePolicy::Always, events_};

        const auto name = resolver.resolve("/d/a.txt", check);
        ASSERT_TRUE(name.has_value());
        EXPECT_EQ(*name, "/d/a.txt");
    }

    TEST_F(ConflictResolverTests, SuffixBeforeExtensionTakesFirstFreeCounter)
    {
        FakeExistenceCheck check{{"/d/a.txt", "/d/a.1.txt", "/d/a.2.txt"}};
        Courier::ConflictResolver resolver{Persistence::OverwritePolicy::AddSuffixBeforeExtension, events_};

        const auto name = resolver.resolve("/d/a.txt", check);
        ASSERT_TRUE(name.has_value());
        EXPECT_EQ(*name, "/d/a.3.txt");
    }

    TEST_F(ConflictResolverTests, CandidatesAreCheckedOneAtATime)
    {
        FakeExistenceCheck check{{"/d/a.txt", "/d/a.1.txt"}};
        Courier::ConflictResolver resolver{Persistence::OverwritePolicy::AddSuffixBeforeExtension, events_};

        ASSERT_TRUE(resolver.resolve("/d/a.txt", check).has_value());
        EXPECT_EQ(check.asked, (std::vector<std::string>{"/d/a.txt", "/d/a.1.txt", "/d/a.2.txt"}));
    }

    TEST_F(ConflictResolverTests, SuffixAfterExtension)
    {
        FakeExistenceCheck check{{"/d/a.txt", "/d/a.txt.1"}};
        Courier::ConflictResolver resolver{Persistence::OverwritePolicy::AddSuffixAfterExtension, events_};

        const auto name = resolver.resolve("/d/a.txt", check);
        ASSERT_TRUE(name.has_value());
        EXPECT_EQ(*name, "/d/a.txt.2");
    }

    TEST_F(ConflictResolverTests, NameWithoutExtensionGetsPlainSuffix)
    {
        using enum Persistence::OverwritePolicy;
        for (auto policy : {AddSuffixBeforeExtension, AddSuffixAfterExtension})
        {
            FakeExistenceCheck check{{"/d/README"}};
            Courier::ConflictResolver resolver{policy, events_};
            const auto name = resolver.resolve("/d/README", check);
            ASSERT_TRUE(name.has_value());
            EXPECT_EQ(*name, "/d/README.1");
        }
    }

    TEST_F(ConflictResolverTests, DotsInFolderNamesAreNoExtension)
    {
        const auto [base, extension] = Courier::ConflictResolver::splitExtension("/data.d/file");
        EXPECT_EQ(base, "/data.d/file");
        EXPECT_EQ(extension, "");

        EXPECT_EQ(
            Courier::ConflictResolver::candidateName(
                "/data.d/file", Persistence::OverwritePolicy::AddSuffixBeforeExtension, 4),
            "/data.d/file.4");
    }

    TEST_F(ConflictResolverTests, OnlyTheLastDotSeparatesTheExtension)
    {
        EXPECT_EQ(
            Courier::ConflictResolver::candidateName(
                "/d/archive.tar.gz", Persistence::OverwritePolicy::AddSuffixBeforeExtension, 1),
            "/d/archive.tar.1.gz");
        EXPECT_EQ(
            Courier::ConflictResolver::candidateName(
                "/d/archive.tar.gz", Persistence::OverwritePolicy::AddSuffixAfterExtension, 1),
            "/d/archive.tar.gz.1");
    }

    TEST_F(ConflictResolverTests, ResolutionIsReported)
    {
        FakeExistenceCheck check{{"/d/a.txt"}};
        Courier::ConflictResolver resolver{Persistence::OverwritePolicy::AddSuffixBeforeExtension, events_};

        ASSERT_TRUE(resolver.resolve("/d/a.txt", check).has_value());
        ASSERT_EQ(events_->resolutions().size(), 1u);
        EXPECT_EQ(events_->resolutions().front().first, "/d/a.txt");
        EXPECT_EQ(events_->resolutions().front().second, "/d/a.1.txt");
    }
}
