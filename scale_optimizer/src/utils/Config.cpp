#include "utils/Config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

#include "utils/Errors.hpp"

using json = nlohmann::json;

OptimizerConfig::OptimizerConfig(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + path);
        }

        json j;
        file >> j;

        *this = fromJson(j);

        std::cout << "[Config] Loaded: architecture=" << architecture
                  << ", epochs=" << training.epochs
                  << ", normalization=" << normalization
                  << "\n";

    } catch (const std::exception& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;

        // fallback DEFAULT values
        *this = OptimizerConfig();
    }
}

OptimizerConfig OptimizerConfig::fromJson(const json& j) {
    OptimizerConfig cfg;

    cfg.architecture = j.value("architecture", cfg.architecture);
    std::transform(cfg.architecture.begin(), cfg.architecture.end(), cfg.architecture.begin(),
                   [](unsigned char c){ return std::tolower(c); });

    if (j.contains("training")) {
        const auto& t = j.at("training");
        cfg.training.epochs          = t.value("epochs", cfg.training.epochs);
        cfg.training.batchSize       = t.value("batchSize", cfg.training.batchSize);
        cfg.training.learningRate    = t.value("learningRate", cfg.training.learningRate);
        cfg.training.validationSplit = t.value("validationSplit", cfg.training.validationSplit);
        cfg.training.l2              = t.value("l2", cfg.training.l2);
        cfg.training.seed            = t.value("seed", cfg.training.seed);
        cfg.training.shuffle         = t.value("shuffle", cfg.training.shuffle);
    }

    if (j.contains("network")) {
        const auto& n = j.at("network");
        cfg.network.hiddenUnits = n.value("hiddenUnits", cfg.network.hiddenUnits);
        cfg.network.dropout     = n.value("dropout", cfg.network.dropout);
    }

    if (j.contains("features")) {
        cfg.normalization = j.at("features").value("normalization", cfg.normalization);
    }

    if (j.contains("inference")) {
        const auto& i = j.at("inference");
        cfg.inference.confidenceSamples = i.value("confidenceSamples", cfg.inference.confidenceSamples);
        cfg.inference.seed              = i.value("seed", cfg.inference.seed);
        cfg.inference.topFeatures       = i.value("topFeatures", cfg.inference.topFeatures);
    }

    if (j.contains("heuristics")) {
        const auto& h = j.at("heuristics");
        auto& heur = cfg.heuristics;
        heur.dominanceThreshold = h.value("dominanceThreshold", heur.dominanceThreshold);
        heur.renderBudgetMs     = h.value("renderBudgetMs", heur.renderBudgetMs);
        if (h.contains("archetypes")) heur.archetypes = h.at("archetypes").get<std::map<std::string, std::string>>();
        if (h.contains("positions"))  heur.positions  = h.at("positions").get<std::map<std::string, std::string>>();
        if (h.contains("industries")) heur.industries = h.at("industries").get<std::map<std::string, std::string>>();
    }

    if (j.contains("constraints") && j.at("constraints").contains("performance")) {
        cfg.performanceConstraints.clear();
        for (const auto& r : j.at("constraints").at("performance")) {
            cfg.performanceConstraints.push_back(
                {r.value("name", ""), r.value("min", 0.0), r.value("max", 0.0)});
        }
    }

    if (j.contains("logging")) {
        const auto& l = j.at("logging");
        cfg.logging.level     = l.value("level", cfg.logging.level);
        cfg.logging.traceFile = l.value("traceFile", cfg.logging.traceFile);
    }

    cfg.threads = j.value("threads", cfg.threads);
    return cfg;
}

void OptimizerConfig::validate() const {
    if (training.epochs < 1 || training.epochs > 10000) {
        throw ValidationError("Training epochs must be between 1 and 10000");
    }
    if (training.batchSize < 1 || training.batchSize > 1024) {
        throw ValidationError("Training batch size must be between 1 and 1024");
    }
    if (training.learningRate <= 0.0 || training.learningRate > 1.0) {
        throw ValidationError("Learning rate must be between 0 and 1");
    }
    if (training.validationSplit < 0.0 || training.validationSplit >= 1.0) {
        throw ValidationError("Validation split must be between 0 and 1");
    }
    if (network.hiddenUnits.size() != network.dropout.size()) {
        throw ValidationError("Network hiddenUnits and dropout must have the same length");
    }
    for (int units : network.hiddenUnits) {
        if (units < 1) throw ValidationError("Hidden layer size must be positive");
    }
    for (double rate : network.dropout) {
        if (rate < 0.0 || rate >= 1.0) throw ValidationError("Dropout rate must be in [0, 1)");
    }
    if (inference.confidenceSamples < 2) {
        throw ValidationError("Confidence estimation needs at least 2 samples");
    }
    if (threads < 1) {
        throw ValidationError("Thread count must be positive");
    }
    for (const auto& r : performanceConstraints) {
        if (r.min > r.max) {
            throw ValidationError("Performance constraint '" + r.name + "' has min > max");
        }
    }
}
