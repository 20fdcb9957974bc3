#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>
#include <unistd.h>

namespace md::test {

// Scratch directory removed on destruction.
class TempTree {
public:
    TempTree() {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() /
                ("multidiff-test-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    std::filesystem::path path(const std::filesystem::path& rel) const { return root_ / rel; }

    std::filesystem::path write(const std::filesystem::path& rel, const std::string& content) const {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
        return p;
    }

    std::filesystem::path mkdir(const std::filesystem::path& rel) const {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p);
        return p;
    }

private:
    std::filesystem::path root_;
};

}
