#include "engine/Optimizer.hpp"
#include "model/JsonIO.hpp"
#include "monitor/Logger.hpp"
#include "utils/Config.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

static std::optional<std::string> flagValue(const std::string& arg, const std::string& name) {
    std::string prefix = "--" + name + "=";
    if (arg.rfind(prefix, 0) == 0) return arg.substr(prefix.size());
    return std::nullopt;
}

int main(int argc, char* argv[]) {
    std::string configPath = "config/optimizer.json";
    std::string responsivePath;
    std::string usagePath;
    std::string trainPath;
    std::optional<std::string> modelPath;
    std::string savePath;
    std::string folds;

    // Read CLI args: --config=X --responsive=X --usage=X --train=X --folds=K --model=X --save=X
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool known = false;
        auto take = [&](const std::string& name, std::string& target) {
            if (known) return;
            if (auto v = flagValue(arg, name)) {
                target = *v;
                known = true;
            }
        };

        std::string model;
        take("config", configPath);
        take("responsive", responsivePath);
        take("usage", usagePath);
        take("train", trainPath);
        take("model", model);
        take("save", savePath);
        take("folds", folds);

        if (!known) {
            std::cerr << "[MAIN] Unknown argument: " << arg << "\n";
            return 1;
        }
        if (!model.empty()) modelPath = model;
    }

    if (responsivePath.empty() || usagePath.empty()) {
        std::cerr << "[MAIN] Usage: scale_optimizer --responsive=<config.json> --usage=<usage.json>"
                     " [--config=<optimizer.json>] [--train=<training.json> [--folds=<k>]] [--model=<in>] [--save=<out>]\n";
        return 1;
    }

    OptimizerConfig cfg(configPath);

    // keep stdout for the JSON result
    auto logger = std::make_shared<Logger>(std::cerr, parseLogLevel(cfg.logging.level), cfg.logging.traceFile);

    try {
        Optimizer optimizer(cfg, logger);
        optimizer.initialize(modelPath);

        nlohmann::json out;

        if (!trainPath.empty()) {
            auto training = readJsonFile(trainPath).get<std::vector<TrainingData>>();
            out["hyperparameters"] = optimizer.suggestHyperparameters(training);
            if (!folds.empty()) {
                out["crossValidation"] = optimizer.crossValidateModel(training, std::stoi(folds));
            }
            out["training"] = optimizer.trainModel(training);
        }

        auto responsive = readJsonFile(responsivePath).get<ResponsiveConfig>();
        auto usage = readJsonFile(usagePath).get<std::vector<ComponentUsageData>>();

        out["suggestions"] = optimizer.optimizeScaling(responsive, usage);
        out["model"] = optimizer.getModelInfo();

        if (!savePath.empty()) {
            optimizer.saveModel(savePath);
        }

        std::cout << out.dump(2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
