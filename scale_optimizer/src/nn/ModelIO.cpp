#include "nn/ModelIO.hpp"

#include <filesystem>
#include <fstream>

#include "utils/Errors.hpp"

namespace fs = std::filesystem;

std::string resolveModelPath(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return (fs::path(path) / kModelFileName).string();
    }
    return path;
}

void writeModelDocument(const std::string& path, const nlohmann::json& doc) {
    if (path.empty()) throw PersistenceError("Model save failed: empty path");

    std::string target = resolveModelPath(path);
    std::ofstream file(target, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw PersistenceError("Model save failed: cannot open " + target + " for writing");
    }

    file << doc.dump();
    file.flush();
    if (!file) {
        throw PersistenceError("Model save failed: write error on " + target);
    }
}

nlohmann::json readModelDocument(const std::string& path, const std::string& expectedFormat) {
    std::string target = resolveModelPath(path);
    std::ifstream file(target);
    if (!file.is_open()) {
        throw PersistenceError("Model load failed: cannot open " + target);
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Model load failed: " + std::string(e.what()));
    }

    std::string format = doc.value("format", "");
    if (format != expectedFormat) {
        throw PersistenceError("Model load failed: expected format '" + expectedFormat +
                               "' but found '" + format + "'");
    }
    return doc;
}
