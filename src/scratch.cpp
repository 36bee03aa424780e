#include "scratch.hpp"
#include <filesystem>
#include <stdexcept>
#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

bool removeScratchPath(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !fs::exists(path, ec);
}

ScratchDirectory::ScratchDirectory(const std::string& base, const std::string& name)
    : path_((fs::path(base) / name).string()) {
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("Failed to create scratch directory {}: {}", path_, ec.message()));
    }
}

ScratchDirectory::~ScratchDirectory() {
    removeScratchPath(path_);
}

ScratchFiles::ScratchFiles(std::string dir, std::string executionId, std::string basename)
    : prefix_((fs::path(dir) / fmt::format("restore-{}-{}", executionId, basename)).string()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
}

ScratchFiles::~ScratchFiles() {
    cleanup();
}

std::string ScratchFiles::path(const std::string& suffix) {
    std::string p = prefix_ + suffix;
    if (std::ranges::find(paths_, p) == paths_.end()) {
        paths_.push_back(p);
    }
    return p;
}

std::vector<std::string> ScratchFiles::cleanup() {
    std::vector<std::string> leftovers;
    for (const auto& p : paths_) {
        if (!removeScratchPath(p)) {
            leftovers.push_back(p);
        }
    }
    paths_.clear();
    return leftovers;
}
