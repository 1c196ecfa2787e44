#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "features/FeatureExtractor.hpp"
#include "model/Types.hpp"
#include "nn/Model.hpp"
#include "utils/Config.hpp"

class Logger;

// Fits and evaluates models against labelled examples.
// train() mutates the model; callers must not train one model from two threads.
class ModelTrainer {
public:
    ModelTrainer(const OptimizerConfig& config, std::shared_ptr<Logger> log);

    // Throws ValidationError on an empty set, TrainingError otherwise
    TrainingMetrics train(TrainableModel& model, const std::vector<TrainingData>& data);
    TrainingMetrics train(TrainableModel& model, const Tensor& x, const Tensor& y);

    TrainingMetrics evaluate(const PredictiveModel& model, const std::vector<TrainingData>& data) const;
    TrainingMetrics evaluate(const PredictiveModel& model, const Tensor& x, const Tensor& y) const;

    // k-fold cross validation, one fresh model per fold from makeModel.
    // Fold i validates on rows [i*n/k, (i+1)*n/k), the last fold takes the remainder.
    // Folds that fail to train are logged and left out of the aggregate.
    // Throws ValidationError when k < 1 or there are fewer than k examples.
    CrossValidationMetrics crossValidate(const std::function<std::unique_ptr<TrainableModel>()>& makeModel,
                                         const std::vector<TrainingData>& data, int k = 5);

    // Learning rate, batch size, epoch and architecture advice from the data size
    HyperparameterAdvice suggestHyperparameters(const std::vector<TrainingData>& data) const;

    // 32-slot label layout matching the model output
    static std::vector<double> labelsToVector(const ModelLabels& labels);

    // predictions and labels in label units, same shape
    static TrainingMetrics computeMetrics(const Tensor& predictions, const Tensor& labels);

private:
    void prepare(const std::vector<TrainingData>& data, Tensor& x, Tensor& y) const;
    double normalizedLoss(const PredictiveModel& model, const Tensor& x, const Tensor& y) const;

    TrainingConfig training_;
    std::string architecture_;
    FeatureExtractor extractor_;
    std::shared_ptr<Logger> log_;
};
