#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "logvec/ingest/normalizer.h"

using namespace logvec::ingest;

TEST(NormalizerTest, SyslogLinesDifferingOnlyInPrefixAndPidMatch) {
    std::string a = normalize("Nov 04 23:58:33 archlinux sshd[812]: Connection closed by 10.0.0.7");
    std::string b = normalize("Nov 05 01:02:03 buildhost sshd[9931]: Connection closed by 10.0.0.7");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, "sshd: Connection closed by 10.0.0.7");
}

TEST(NormalizerTest, IsoTimestampPrefixIsRemoved) {
    std::string a = normalize("2024-11-04T23:58:33+0100 archlinux kernel: usb 1-1: new device");
    std::string b = normalize("2024-11-05T08:00:01.250+01:00 archlinux kernel: usb 1-1: new device");
    EXPECT_EQ(a, "kernel: usb 1-1: new device");
    EXPECT_EQ(a, b);
}

TEST(NormalizerTest, TrailingCounterIsRemoved) {
    EXPECT_EQ(normalize("Nov 04 23:58:33 host app: retry attempt 17"),
              normalize("Nov 04 23:58:34 host app: retry attempt 18"));
    EXPECT_EQ(normalize("Nov 04 23:58:33 host app: retry attempt 17"), "app: retry attempt");
}

TEST(NormalizerTest, DifferentMessagesStayDifferent) {
    EXPECT_NE(normalize("Nov 04 23:58:33 host sshd[1]: Accepted publickey for root"),
              normalize("Nov 04 23:58:33 host sshd[1]: Failed password for root"));
}

TEST(NormalizerTest, WhitespaceIsCollapsed) {
    EXPECT_EQ(normalize("  disk   full \t on   /var  "), "disk full on /var");
}

TEST(NormalizerTest, Idempotent) {
    std::vector<std::string> lines = {
        "Nov 04 23:58:33 archlinux systemd[1]: Started Session 3 of user root.",
        "2024-11-04T23:58:33+0100 host kernel: eth0 link up 1000",
        "Nov 04 23:58:33 host Nov 04 23:58:33 nested prefix",
        "[1234]",
        "plain text 1 2 3",
        "   ",
    };
    for (const auto& line : lines) {
        std::string once = normalize(line);
        EXPECT_EQ(normalize(once), once) << "line: " << line;
    }
}

TEST(NormalizerTest, BlankInputMapsToEmpty) {
    EXPECT_EQ(normalize(""), "");
    EXPECT_EQ(normalize(" \t  "), "");
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \t\n"));
    EXPECT_FALSE(is_blank(" x "));
}

TEST(NormalizerTest, LineThatNormalizesToNothingFallsBackToRawText) {
    EXPECT_EQ(normalize("[1234]"), "[1234]");
    EXPECT_EQ(normalize("  [42]   [43] "), "[42] [43]");
}

TEST(NormalizerTest, CollapseWhitespace) {
    EXPECT_EQ(collapse_whitespace(""), "");
    EXPECT_EQ(collapse_whitespace("   "), "");
    EXPECT_EQ(collapse_whitespace("a\t\tb\n c"), "a b c");
}

TEST(NormalizerTest, LongWhitespaceRunsAreHandled) {
    EXPECT_EQ(normalize("kernel: msg" + std::string(100000, ' ') + "42"), "kernel: msg");
    EXPECT_EQ(normalize(std::string(100000, ' ')), "");
    EXPECT_EQ(normalize("x" + std::string(100000, '\t')), "x");
    EXPECT_EQ(normalize("Nov 04" + std::string(100000, ' ') + "23:58:33 host sshd[7]: ok"),
              "sshd: ok");
}

TEST(NormalizerTest, LongDigitRunsAreHandled) {
    EXPECT_EQ(normalize("app[" + std::string(100000, '7') + "]: started"), "app: started");

    std::string counters = "values";
    for (int i = 0; i < 50000; ++i) {
        counters += " 1";
    }
    EXPECT_EQ(normalize(counters), "values");
}

TEST(NormalizerTest, MalformedPrefixesAreKept) {
    EXPECT_EQ(normalize("2024-11-04T23:58:33+01 host msg"), "2024-11-04T23:58:33+01 host msg");
    EXPECT_EQ(normalize("Nov 04 23:58 host msg"), "Nov 04 23:58 host msg");
    EXPECT_EQ(normalize("sshd[12a]: x"), "sshd[12a]: x");
}
