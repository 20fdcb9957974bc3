#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>

namespace md::fs {

enum class Verdict { Eligible, NotAFile, TooLarge, BinaryExtension, BinaryContent, Unreadable };

std::string to_string(Verdict v);

// Decides whether a candidate reference file is safe to diff: regular file,
// size within limit, not a known binary extension, and a text-looking head.
class Eligibility {
public:
    explicit Eligibility(config::EligibilityConfig cnf);

    [[nodiscard]] Verdict check(const std::filesystem::path& path) const;
    [[nodiscard]] bool isEligible(const std::filesystem::path& path) const { return check(path) == Verdict::Eligible; }

private:
    config::EligibilityConfig cnf_;

    [[nodiscard]] bool hasBinaryExtension(const std::filesystem::path& path) const;
    [[nodiscard]] Verdict sniff(const std::filesystem::path& path) const;
};

}
