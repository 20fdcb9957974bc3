#include "fs/Eligibility.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

using namespace md::fs;
using namespace md::logging;

std::string md::fs::to_string(const Verdict v) {
    switch (v) {
        case Verdict::Eligible: return "eligible";
        case Verdict::NotAFile: return "not a regular file";
        case Verdict::TooLarge: return "file too large";
        case Verdict::BinaryExtension: return "binary file type";
        case Verdict::BinaryContent: return "binary content";
        case Verdict::Unreadable: return "unreadable";
    }
    return "unknown";
}

Eligibility::Eligibility(config::EligibilityConfig cnf) : cnf_(std::move(cnf)) {}

Verdict Eligibility::check(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return Verdict::NotAFile;

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return Verdict::Unreadable;
    if (size > cnf_.max_file_size_bytes) return Verdict::TooLarge;

    if (hasBinaryExtension(path)) return Verdict::BinaryExtension;

    return sniff(path);
}

bool Eligibility::hasBinaryExtension(const std::filesystem::path& path) const {
    auto ext = path.extension().string();
    if (ext.empty()) return false;
    ext.erase(0, 1);
    std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::ranges::find(cnf_.binary_extensions, ext) != cnf_.binary_extensions.end();
}

Verdict Eligibility::sniff(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        LogRegistry::multidiff()->debug("[Eligibility] Cannot open {}, treating as binary", path.string());
        return Verdict::Unreadable;
    }

    std::vector<char> head(cnf_.sniff_bytes);
    in.read(head.data(), static_cast<std::streamsize>(head.size()));
    const auto bytes = static_cast<std::size_t>(in.gcount());

    std::size_t suspicious = 0;
    for (std::size_t i = 0; i < bytes; ++i) {
        const auto c = static_cast<unsigned char>(head[i]);
        if (c == 0) return Verdict::BinaryContent;
        if (c == '\t' || c == '\n' || c == '\r') continue;
        if (c >= 32 && c <= 126) continue;
        // bytes above 127 are tolerated as UTF-8 up to the ratio
        ++suspicious;
    }

    if (bytes > 0 && static_cast<double>(suspicious) / static_cast<double>(bytes) > cnf_.max_suspicious_ratio)
        return Verdict::BinaryContent;
    return Verdict::Eligible;
}
