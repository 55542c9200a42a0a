#include <gtest/gtest.h>

#include "app/AppConfig.h"

#include <QCommandLineParser>
#include <QSettings>
#include <QTemporaryDir>

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("lanmeet.ini");
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(AppConfigTest, DefaultsMatchTheLanProtocol) {
    QSettings settings(path, QSettings::IniFormat);
    AppConfig config = AppConfig::load(settings);

    EXPECT_EQ(config.discoveryGroup, QHostAddress("239.255.255.250"));
    EXPECT_EQ(config.discoveryPort, 55555);
    EXPECT_EQ(config.relayPort, 57788);
    EXPECT_EQ(config.timings.roomIntervalMs, 2000);
    EXPECT_EQ(config.timings.peerIntervalMs, 3000);
    EXPECT_EQ(config.timings.sweepIntervalMs, 1000);
    EXPECT_EQ(config.timings.ttlMs, 6000);
    EXPECT_EQ(config.reconnectDelayMs, 2000);
    EXPECT_EQ(config.maxReconnectAttempts, 5);
    EXPECT_TRUE(config.cryptoEnabled);
    EXPECT_FALSE(config.displayName.isEmpty());
}

TEST_F(AppConfigTest, PeerIdIsGeneratedOnceAndKept) {
    QString firstId;
    {
        QSettings settings(path, QSettings::IniFormat);
        firstId = AppConfig::load(settings).peerId;
        EXPECT_FALSE(firstId.isEmpty());
    }
    QSettings settings(path, QSettings::IniFormat);
    EXPECT_EQ(AppConfig::load(settings).peerId, firstId);
}

TEST_F(AppConfigTest, SavedValuesLoadBack) {
    {
        QSettings settings(path, QSettings::IniFormat);
        AppConfig config = AppConfig::load(settings);
        config.relayPort = 60001;
        config.timings.ttlMs = 9000;
        config.cryptoEnabled = false;
        config.displayName = "Meeting Room PC";
        config.save(settings);
    }
    QSettings settings(path, QSettings::IniFormat);
    AppConfig config = AppConfig::load(settings);
    EXPECT_EQ(config.relayPort, 60001);
    EXPECT_EQ(config.timings.ttlMs, 9000);
    EXPECT_FALSE(config.cryptoEnabled);
    EXPECT_EQ(config.displayName, "Meeting Room PC");
}

TEST_F(AppConfigTest, CommandLineOverridesSettings) {
    QSettings settings(path, QSettings::IniFormat);
    AppConfig config = AppConfig::load(settings);

    QCommandLineParser parser;
    AppConfig::addOptions(parser);
    ASSERT_TRUE(parser.parse({"lanmeet", "--port", "60123", "--group", "239.1.2.3",
                              "--name", "Bob", "--no-crypto"}));
    QString error;
    ASSERT_TRUE(config.applyOptions(parser, &error)) << error.toStdString();
    EXPECT_EQ(config.relayPort, 60123);
    EXPECT_EQ(config.discoveryGroup, QHostAddress("239.1.2.3"));
    EXPECT_EQ(config.displayName, "Bob");
    EXPECT_FALSE(config.cryptoEnabled);
}

TEST_F(AppConfigTest, InvalidCommandLineValuesAreReported) {
    AppConfig config;
    QCommandLineParser parser;
    AppConfig::addOptions(parser);
    ASSERT_TRUE(parser.parse({"lanmeet", "--port", "70000"}));
    QString error;
    EXPECT_FALSE(config.applyOptions(parser, &error));
    EXPECT_TRUE(error.contains("port"));

    QCommandLineParser groupParser;
    AppConfig::addOptions(groupParser);
    ASSERT_TRUE(groupParser.parse({"lanmeet", "--group", "10.0.0.1"}));
    EXPECT_FALSE(config.applyOptions(groupParser, &error));
}

TEST_F(AppConfigTest, OutOfRangeSettingsAreClamped) {
    {
        QSettings settings(path, QSettings::IniFormat);
        settings.setValue("discovery/roomIntervalMs", 0);
        settings.setValue("discovery/peerIntervalMs", -50);
        settings.setValue("discovery/sweepIntervalMs", 0);
        settings.setValue("discovery/ttlMs", 10);
        settings.setValue("relay/reconnectDelayMs", -1);
        settings.setValue("relay/maxReconnectAttempts", 40);
    }
    QSettings settings(path, QSettings::IniFormat);
    AppConfig config = AppConfig::load(settings);

    EXPECT_EQ(config.timings.roomIntervalMs, AppConfig::kMinIntervalMs);
    EXPECT_EQ(config.timings.peerIntervalMs, AppConfig::kMinIntervalMs);
    EXPECT_EQ(config.timings.sweepIntervalMs, AppConfig::kMinIntervalMs);
    EXPECT_GT(config.timings.ttlMs, qMax(config.timings.roomIntervalMs, config.timings.peerIntervalMs));
    EXPECT_EQ(config.reconnectDelayMs, AppConfig::kMinIntervalMs);
    EXPECT_EQ(config.maxReconnectAttempts, AppConfig::kMaxReconnectAttempts);
}

TEST_F(AppConfigTest, ReconnectDelayDoublesUpToTheCap) {
    AppConfig config;
    EXPECT_EQ(config.reconnectDelayFor(0), 2000);
    EXPECT_EQ(config.reconnectDelayFor(1), 4000);
    EXPECT_EQ(config.reconnectDelayFor(4), 32000);

    for (int attempt = 5; attempt < 64; ++attempt) {
        int delay = config.reconnectDelayFor(attempt);
        ASSERT_GT(delay, 0) << "attempt " << attempt;
        ASSERT_LE(delay, AppConfig::kMaxReconnectDelayMs) << "attempt " << attempt;
    }
}
