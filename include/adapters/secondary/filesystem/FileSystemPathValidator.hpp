#pragma once

#include "domain/Errors.hpp"
#include "ports/output/IPathValidator.hpp"
#include "settings/TransferSettings.hpp"
#include "utils/Paths.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace hostlink::adapters::secondary {

/**
 * @brief Проверка путей по списку разрешённых корней (transfer.allowed_roots)
 */
class FileSystemPathValidator : public ports::output::IPathValidator {
public:
    explicit FileSystemPathValidator(std::shared_ptr<settings::TransferSettings> settings)
        : home_(utils::homeDirectory())
    {
        for (const auto& root : settings->getAllowedRoots()) {
            std::error_code ec;
            auto canonical = std::filesystem::weakly_canonical(expandHome(root), ec);
            if (ec) {
                std::cerr << "[FileSystemPathValidator] Ignoring allowed root " << root
                          << ": " << ec.message() << std::endl;
                continue;
            }
            roots_.push_back(canonical);
        }
        std::cout << "[FileSystemPathValidator] Created with " << roots_.size() << " allowed roots" << std::endl;
    }

    std::string resolve(const std::string& path) override
    {
        if (path.empty()) {
            throw domain::ValidationError("Path is required");
        }
        std::filesystem::path raw = expandHome(path);
        for (const auto& part : raw) {
            if (part == "..") {
                throw domain::ValidationError("Path traversal is not allowed");
            }
        }
        if (raw.is_relative()) {
            raw = std::filesystem::path(home_) / raw;
        }

        std::error_code ec;
        auto resolved = std::filesystem::weakly_canonical(raw, ec);
        if (ec) {
            throw domain::ValidationError("Invalid path");
        }
        if (!isAllowed(resolved)) {
            throw domain::ValidationError("Path is outside the allowed directories");
        }
        return resolved.string();
    }

    std::string validateFileName(const std::string& fileName) override
    {
        if (fileName.empty() || fileName == "." || fileName == "..") {
            throw domain::ValidationError("File name is required");
        }
        if (fileName.size() > 255) {
            throw domain::ValidationError("File name is too long");
        }
        for (char c : fileName) {
            if (c == '/' || c == '\\') {
                throw domain::ValidationError("File name must not contain path separators");
            }
            if (std::string(":*?\"<>|").find(c) != std::string::npos ||
                static_cast<unsigned char>(c) < 0x20) {
                throw domain::ValidationError("File name contains invalid characters");
            }
        }
        return fileName;
    }

private:
    std::string home_;
    std::vector<std::filesystem::path> roots_;

    std::filesystem::path expandHome(const std::string& path) const
    {
        if (path == "~") {
            return home_;
        }
        if (path.rfind("~/", 0) == 0) {
            return std::filesystem::path(home_) / path.substr(2);
        }
        return path;
    }

    bool isAllowed(const std::filesystem::path& resolved) const
    {
        for (const auto& root : roots_) {
            if (resolved == root) {
                return true;
            }
            auto rel = resolved.lexically_relative(root);
            if (!rel.empty() && *rel.begin() != ".." && !rel.is_absolute()) {
                return true;
            }
        }
        return false;
    }
};

} // namespace hostlink::adapters::secondary
