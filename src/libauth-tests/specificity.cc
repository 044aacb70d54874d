#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <limits>
#include <sstream>

#include "ociauth/auth/specificity.hh"

namespace ociauth {

TEST(CredentialsSpecificity, tiersAreOrdered)
{
    EXPECT_LT(CredentialsSpecificity::none(), CredentialsSpecificity::global());
    EXPECT_LT(CredentialsSpecificity::global(), CredentialsSpecificity::domain());
    EXPECT_LT(CredentialsSpecificity::domain(), CredentialsSpecificity::repository(1));
    EXPECT_EQ(CredentialsSpecificity(), CredentialsSpecificity::none());
}

TEST(CredentialsSpecificity, repositoryOrderFollowsSegmentCount)
{
    for (unsigned int a = 1; a < 6; a++)
        for (unsigned int b = 1; b < 6; b++) {
            EXPECT_EQ(CredentialsSpecificity::repository(a) > CredentialsSpecificity::repository(b), a > b);
            EXPECT_EQ(CredentialsSpecificity::repository(a) == CredentialsSpecificity::repository(b), a == b);
        }
}

TEST(CredentialsSpecificity, predicates)
{
    auto none = CredentialsSpecificity::none();
    EXPECT_FALSE(none);
    EXPECT_FALSE(none.matchedRegistryDomain());
    EXPECT_FALSE(none.matchedRepositoryPath());

    auto global = CredentialsSpecificity::global();
    EXPECT_TRUE(global);
    EXPECT_FALSE(global.matchedRegistryDomain());
    EXPECT_FALSE(global.matchedRepositoryPath());
    EXPECT_EQ(global.matchedRepositoryPathSegments(), 0u);

    auto domain = CredentialsSpecificity::domain();
    EXPECT_TRUE(domain.matchedRegistryDomain());
    EXPECT_FALSE(domain.matchedRepositoryPath());
    EXPECT_EQ(domain.matchedRepositoryPathSegments(), 0u);

    auto repo = CredentialsSpecificity::repository(3);
    EXPECT_TRUE(repo.matchedRegistryDomain());
    EXPECT_TRUE(repo.matchedRepositoryPath());
    EXPECT_EQ(repo.matchedRepositoryPathSegments(), 3u);
}

TEST(CredentialsSpecificity, zeroSegmentsIsDomain)
{
    EXPECT_EQ(CredentialsSpecificity::repository(0), CredentialsSpecificity::domain());
}

TEST(CredentialsSpecificity, saturatesInsteadOfOverflowing)
{
    constexpr auto max = std::numeric_limits<unsigned int>::max();
    auto huge = CredentialsSpecificity::repository(max);
    EXPECT_EQ(huge, CredentialsSpecificity::repository(max - 1));
    EXPECT_GT(huge, CredentialsSpecificity::repository(1000));
    EXPECT_TRUE(huge.matchedRepositoryPath());
}

TEST(CredentialsSpecificity, print)
{
    auto str = [](CredentialsSpecificity s) {
        std::ostringstream out;
        out << s;
        return out.str();
    };
    EXPECT_EQ(str(CredentialsSpecificity::none()), "none");
    EXPECT_EQ(str(CredentialsSpecificity::global()), "global");
    EXPECT_EQ(str(CredentialsSpecificity::domain()), "domain");
    EXPECT_EQ(str(CredentialsSpecificity::repository(2)), "repository(2)");
}

RC_GTEST_PROP(CredentialsSpecificity, repositoryOrderFollowsSegments, (uint16_t a, uint16_t b))
{
    auto sa = CredentialsSpecificity::repository(a);
    auto sb = CredentialsSpecificity::repository(b);
    RC_ASSERT((sa < sb) == (a < b));
    RC_ASSERT((sa == sb) == (a == b));
    RC_ASSERT(sa >= CredentialsSpecificity::domain());
    RC_ASSERT(sa > CredentialsSpecificity::global());
    RC_ASSERT(sa.matchedRepositoryPathSegments() == a);
}

} // namespace ociauth
