#include <folly/portability/GTest.h>
#include <migration/MigrationException.h>
#include <migration/MigrationSettings.h>
#include <migration/transport/ProtocolVersion.h>

using namespace testing;

namespace migration {
namespace test {

class ProtocolVersionTest : public Test {
 public:
  ProtocolVersionNegotiator negotiator{localProtocolVersion()};
};

TEST_F(ProtocolVersionTest, TestParse) {
  auto version = ProtocolVersion::parse("2.1.0");
  ASSERT_TRUE(version.hasValue());
  EXPECT_EQ(*version, ProtocolVersion(2, 1, 0));
  EXPECT_EQ(version->toString(), "2.1.0");

  EXPECT_EQ(*ProtocolVersion::parse("3"), ProtocolVersion(3, 0, 0));
  EXPECT_EQ(*ProtocolVersion::parse("2.4"), ProtocolVersion(2, 4, 0));

  EXPECT_FALSE(ProtocolVersion::parse("").hasValue());
  EXPECT_FALSE(ProtocolVersion::parse("2.x.0").hasValue());
  EXPECT_FALSE(ProtocolVersion::parse("2..0").hasValue());
  EXPECT_FALSE(ProtocolVersion::parse("2.1.0.1").hasValue());
  EXPECT_FALSE(ProtocolVersion::parse("-2.1.0").hasValue());
}

TEST_F(ProtocolVersionTest, TestLocalVersion) {
  EXPECT_EQ(negotiator.getLocalVersionString(), "AccountMigration.2.1.0");
  EXPECT_EQ(negotiator.getLocalVersion(), ProtocolVersion(2, 1, 0));
  EXPECT_FALSE(negotiator.getPeerVersion().hasValue());
  EXPECT_EQ(negotiator.peerVersionToString(), "none");

  EXPECT_THROW(
      ProtocolVersionNegotiator("2.1.0"), MigrationInternalException);
  EXPECT_THROW(
      ProtocolVersionNegotiator("AccountMigration.two"),
      MigrationInternalException);
}

TEST_F(ProtocolVersionTest, TestAcceptPeerVersion) {
  EXPECT_TRUE(negotiator.onPeerVersionReceived("AccountMigration.2.1.0"));
  EXPECT_EQ(*negotiator.getPeerVersion(), ProtocolVersion(2, 1, 0));
  EXPECT_EQ(negotiator.accountSchemaVersion(), kAccountSchemaVersion);

  EXPECT_TRUE(negotiator.onPeerVersionReceived("AccountMigration.3.0.2"));
  EXPECT_EQ(negotiator.peerVersionToString(), "3.0.2");
  EXPECT_EQ(negotiator.accountSchemaVersion(), kAccountSchemaVersion);
}

TEST_F(ProtocolVersionTest, TestLegacyPeerAccountSchema) {
  EXPECT_TRUE(negotiator.onPeerVersionReceived("AccountMigration.2.0.0"));
  EXPECT_EQ(negotiator.accountSchemaVersion(), kLegacyAccountSchemaVersion);

  negotiator.reset();
  EXPECT_FALSE(negotiator.getPeerVersion().hasValue());
  EXPECT_EQ(negotiator.accountSchemaVersion(), kAccountSchemaVersion);
}

TEST_F(ProtocolVersionTest, TestRejectPeerVersion) {
  EXPECT_FALSE(negotiator.onPeerVersionReceived("AccountMigration.1.9.0"));
  EXPECT_FALSE(negotiator.getPeerVersion().hasValue());
  EXPECT_FALSE(negotiator.onPeerVersionReceived("2.1.0"));
  EXPECT_FALSE(negotiator.onPeerVersionReceived("Migration.2.1.0"));
  EXPECT_FALSE(negotiator.onPeerVersionReceived("AccountMigration."));
  EXPECT_FALSE(negotiator.onPeerVersionReceived(""));

  // A rejected version clears the previous one.
  EXPECT_TRUE(negotiator.onPeerVersionReceived("AccountMigration.2.1.0"));
  EXPECT_FALSE(negotiator.onPeerVersionReceived("AccountMigration.1.0.0"));
  EXPECT_FALSE(negotiator.getPeerVersion().hasValue());
}

TEST_F(ProtocolVersionTest, TestMinimumPeerMajorVersion) {
  ProtocolVersionNegotiator strict(localProtocolVersion(), 3);
  EXPECT_FALSE(strict.onPeerVersionReceived("AccountMigration.2.1.0"));
  EXPECT_TRUE(strict.onPeerVersionReceived("AccountMigration.3.0.0"));
}

} // namespace test
} // namespace migration
