#ifndef LEVEL_CATALOG_HPP
#define LEVEL_CATALOG_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/include/level_error.hpp"
#include "model/include/level_loader.hpp"

/// Ordered list of level files described by a JSON manifest:
///     { "name": "arcade", "levels": ["0.lvl", "1.lvl"] }
/// Level paths are resolved relative to the manifest's directory. This is
/// the layer that turns parser exceptions into log lines for the front end.
class LevelCatalog {
public:
    /// Parse the manifest at 'manifest_path'. Throws std::runtime_error when
    /// the file is missing, is not JSON or has no usable "levels" array.
    static LevelCatalog load(const std::filesystem::path& manifest_path) {
        std::ifstream file(manifest_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open level manifest: " + manifest_path.string());
        }

        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& ex) {
            throw std::runtime_error("Malformed level manifest " + manifest_path.string() + ": " + ex.what());
        }

        if (!j.is_object() || !j.contains("levels") || !j["levels"].is_array() || j["levels"].empty()) {
            throw std::runtime_error("Level manifest has no levels: " + manifest_path.string());
        }

        LevelCatalog catalog;
        catalog.name_ = j.value("name", manifest_path.stem().string());
        const std::filesystem::path base = manifest_path.parent_path();
        for (const auto& entry : j["levels"]) {
            if (!entry.is_string()) {
                throw std::runtime_error("Level manifest entry is not a path: " + entry.dump());
            }
            catalog.levels_.push_back(base / entry.get<std::string>());
        }
        return catalog;
    }

    /// Directories searched for a manifest, nearest first: 'start' and each
    /// of its ancestors, then the source tree this header lives in.
    static std::vector<std::filesystem::path> searchRoots(const std::filesystem::path& start) {
        std::vector<std::filesystem::path> roots;
        for (std::filesystem::path dir = start; !dir.empty(); dir = dir.parent_path()) {
            roots.push_back(dir);
            if (dir == dir.parent_path()) {
                break;
            }
        }
        roots.push_back(std::filesystem::path(__FILE__).parent_path().parent_path());
        return roots;
    }

    /// First "levels/levels.json" or "model/levels/levels.json" found under
    /// the search roots of 'start'.
    static std::optional<std::filesystem::path> findManifest(const std::filesystem::path& start) {
        for (const auto& root : searchRoots(start)) {
            for (const char* rel : {"levels/levels.json", "model/levels/levels.json"}) {
                std::error_code ec;
                if (std::filesystem::is_regular_file(root / rel, ec)) {
                    return root / rel;
                }
            }
        }
        return std::nullopt;
    }

    static std::optional<std::filesystem::path> findManifest() {
        return findManifest(std::filesystem::current_path());
    }

    /// Load the first level of the default manifest. Failures are reported
    /// on stderr and yield std::nullopt.
    static std::optional<Level> loadDefault() {
        auto manifest = findManifest();
        if (!manifest) {
            std::cerr << "No level manifest found (looked for levels/levels.json)" << std::endl;
            return std::nullopt;
        }

        try {
            LevelCatalog catalog = load(*manifest);
            std::cout << "Loading level 0 of " << catalog.name() << " from " << catalog.levelPath(0) << std::endl;
            return catalog.loadLevel(0);
        } catch (const LevelError& ex) {
            std::cerr << "Error loading default level (" << errorKindName(ex.kind()) << "): " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "Error loading default level: " << ex.what() << std::endl;
        }
        return std::nullopt;
    }

    const std::string& name() const {
        return name_;
    }

    std::size_t size() const {
        return levels_.size();
    }

    /// Throws std::out_of_range for an index past the end of the manifest.
    std::string levelPath(std::size_t index) const {
        if (index >= levels_.size()) {
            throw std::out_of_range("Level index " + std::to_string(index) + " out of range (" + std::to_string(levels_.size()) + " levels)");
        }
        return levels_[index].string();
    }

    Level loadLevel(std::size_t index) const {
        return LevelLoader::loadLevel(levelPath(index));
    }

private:
    LevelCatalog() = default;

    std::string name_;
    std::vector<std::filesystem::path> levels_;
};

#endif // LEVEL_CATALOG_HPP
