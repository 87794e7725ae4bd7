#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include "core/config/session_id.hpp"

namespace toolsrv::testing {

// Scratch directory under the current directory, removed on destruction.
class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& tag = "ws") {
        root_ = std::filesystem::current_path() /
                (".tmp_" + tag + "_" + toolsrv::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace toolsrv::testing
