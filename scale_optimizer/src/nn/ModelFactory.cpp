#include "nn/ModelFactory.hpp"
#include "nn/LinearModel.hpp"
#include "nn/NeuralNetwork.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "model/Types.hpp"
#include "nn/ModelIO.hpp"
#include "monitor/Logger.hpp"
#include "utils/Config.hpp"
#include "utils/Errors.hpp"

std::unique_ptr<TrainableModel> ModelFactory::create(const OptimizerConfig& config, Logger& log) {
    std::string name = config.architecture;

    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c){ return std::tolower(c); });

    Scaler::Mode normalization = Scaler::parseMode(config.normalization);

    log.info("ModelFactory", "Creating model: " + name);

    if (name == "linear-regression" || name == "linear") {
        return std::make_unique<LinearModel>(kFeatureDimension, kOutputDimension, normalization);
    }
    if (name != "neural-network" && name != "mlp") {
        log.warn("ModelFactory", "Unknown architecture '" + config.architecture +
                                 "', fallback = neural-network");
    }

    return std::make_unique<NeuralNetwork>(kFeatureDimension, kOutputDimension,
                                           config.network.hiddenUnits, config.network.dropout,
                                           normalization, config.training.seed);
}

std::unique_ptr<TrainableModel> ModelFactory::load(const std::string& path, const OptimizerConfig& config,
                                                   Logger& log) {
    std::string target = resolveModelPath(path);
    std::ifstream file(target);
    if (!file.is_open()) {
        throw PersistenceError("Model load failed: cannot open " + target);
    }

    std::string format;
    try {
        nlohmann::json doc;
        file >> doc;
        format = doc.value("format", "");
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Model load failed: " + std::string(e.what()));
    }

    OptimizerConfig effective = config;
    if (format == "scale-optimizer/linear-regression") {
        effective.architecture = "linear-regression";
    } else if (format == "scale-optimizer/neural-network") {
        effective.architecture = "neural-network";
    } else {
        throw PersistenceError("Model load failed: unrecognised model format '" + format + "'");
    }

    log.info("ModelFactory", "Loading " + effective.architecture + " from " + target);
    auto model = create(effective, log);
    model->load(target);
    return model;
}
