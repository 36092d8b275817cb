#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/errors.hpp>
#include <cstdint>

TEST(Utils, ParseU64) {
    EXPECT_EQ(parse_u64("0"), 0u);
    EXPECT_EQ(parse_u64("4096"), 4096u);
    EXPECT_EQ(parse_u64("18446744073709551615"), UINT64_MAX);
    EXPECT_FALSE(parse_u64("18446744073709551616").has_value());
    EXPECT_FALSE(parse_u64("").has_value());
    EXPECT_FALSE(parse_u64("-1").has_value());
    EXPECT_FALSE(parse_u64("12mb").has_value());
    EXPECT_FALSE(parse_u64(" 5").has_value());
}

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("/tmp/a b"), "'/tmp/a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(4ULL * 1024 * 1024), "4.00 MB");
    EXPECT_EQ(format_bytes(1536ULL * 1024 * 1024), "1.50 GB");
}

TEST(Utils, StripCrAndTrim) {
    EXPECT_EQ(strip_cr("a\r\nb\r\n"), "a\nb\n");
    std::string s = "  md5sum \r\n";
    trim(s);
    EXPECT_EQ(s, "md5sum");
}

TEST(Errors, ExitCodesAreDistinctPerClass) {
    EXPECT_EQ(exit_code_for(ErrorKind::Usage), 2);
    EXPECT_EQ(exit_code_for(ErrorKind::DependencyMissing), 3);
    EXPECT_EQ(exit_code_for(ErrorKind::Endpoint), 4);
    EXPECT_EQ(exit_code_for(ErrorKind::AuthFailed), 5);
    EXPECT_EQ(exit_code_for(ErrorKind::TransferIncomplete), 6);
    EXPECT_EQ(exit_code_for(ErrorKind::Reassembly), 7);
    EXPECT_EQ(exit_code_for(ErrorKind::Interrupted), 130);
    EXPECT_STREQ(error_kind_name(ErrorKind::Reassembly), "Reassembly error");
}

TEST(Errors, CarriesMissingCount) {
    NimbusError e(ErrorKind::TransferIncomplete, "3 missing", 3);
    EXPECT_EQ(e.kind(), ErrorKind::TransferIncomplete);
    EXPECT_EQ(e.missing_blocks(), 3u);
    EXPECT_STREQ(e.what(), "3 missing");
}
