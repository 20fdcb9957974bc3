#include <gtest/gtest.h>
#include "fs/Eligibility.hpp"
#include "support/TempTree.hpp"

using namespace md::fs;
using md::test::TempTree;

class EligibilityTest : public ::testing::Test {
protected:
    TempTree tree;
    md::config::EligibilityConfig cnf;
};

TEST_F(EligibilityTest, PlainTextIsEligible) {
    const auto p = tree.write("src/main.cpp", "int main() {\n\treturn 0;\r\n}\n");
    EXPECT_EQ(Eligibility(cnf).check(p), Verdict::Eligible);
}

TEST_F(EligibilityTest, EmptyFileIsEligible) {
    const auto p = tree.write("empty.txt", "");
    EXPECT_TRUE(Eligibility(cnf).isEligible(p));
}

TEST_F(EligibilityTest, DirectoriesAndMissingFilesAreNotFiles) {
    EXPECT_EQ(Eligibility(cnf).check(tree.mkdir("dir")), Verdict::NotAFile);
    EXPECT_EQ(Eligibility(cnf).check(tree.path("nope.txt")), Verdict::NotAFile);
}

TEST_F(EligibilityTest, OversizedFileIsRejected) {
    cnf.max_file_size_bytes = 16;
    const auto p = tree.write("big.txt", std::string(17, 'x'));
    EXPECT_EQ(Eligibility(cnf).check(p), Verdict::TooLarge);
}

TEST_F(EligibilityTest, BinaryExtensionIsCaseInsensitive) {
    const auto p = tree.write("logo.PNG", "not really a png");
    EXPECT_EQ(Eligibility(cnf).check(p), Verdict::BinaryExtension);
}

TEST_F(EligibilityTest, NulByteMeansBinary) {
    const auto p = tree.write("blob", std::string("abc\0def", 7));
    EXPECT_EQ(Eligibility(cnf).check(p), Verdict::BinaryContent);
}

TEST_F(EligibilityTest, SuspiciousRatioThreshold) {
    // 3 of 10 bytes outside printable ASCII: exactly at the 0.3 limit
    const auto atLimit = tree.write("a.txt", std::string("abcdefg") + "\x01\x02\x03");
    EXPECT_EQ(Eligibility(cnf).check(atLimit), Verdict::Eligible);

    const auto over = tree.write("b.txt", std::string("abcdef") + "\x01\x02\x03\x04");
    EXPECT_EQ(Eligibility(cnf).check(over), Verdict::BinaryContent);
}

TEST_F(EligibilityTest, OnlyTheHeadIsSniffed) {
    cnf.sniff_bytes = 8;
    const auto p = tree.write("c.txt", std::string("plain te") + std::string("\x01\x02\x03\x04\x05", 5));
    EXPECT_EQ(Eligibility(cnf).check(p), Verdict::Eligible);
}
