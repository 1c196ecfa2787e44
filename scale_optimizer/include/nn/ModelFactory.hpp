#pragma once
#include <memory>
#include <string>

#include "nn/Model.hpp"

class OptimizerConfig;
class Logger;

class ModelFactory {
public:
    // Builds the architecture named in config; unknown names fall back to neural-network.
    static std::unique_ptr<TrainableModel> create(const OptimizerConfig& config, Logger& log);

    // Restores a saved model; the architecture comes from the file, not the config.
    // Throws PersistenceError.
    static std::unique_ptr<TrainableModel> load(const std::string& path, const OptimizerConfig& config,
                                                Logger& log);
};
