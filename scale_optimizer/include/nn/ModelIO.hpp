#pragma once
#include <nlohmann/json.hpp>
#include <string>

// File name used when a model path points at a directory
constexpr const char* kModelFileName = "model.json";

std::string resolveModelPath(const std::string& path);

// Both throw PersistenceError ("Model save failed: ..." / "Model load failed: ...")
void writeModelDocument(const std::string& path, const nlohmann::json& doc);
nlohmann::json readModelDocument(const std::string& path, const std::string& expectedFormat);
