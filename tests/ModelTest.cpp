#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <memory>
#include <stdexcept>

#include "TestData.hpp"
#include "monitor/Logger.hpp"
#include "nn/LinearModel.hpp"
#include "nn/ModelFactory.hpp"
#include "nn/NeuralNetwork.hpp"
#include "nn/Scaler.hpp"
#include "nn/Tensor.hpp"
#include "utils/Errors.hpp"

namespace {

// y0 = x0 + 2*x1, y1 = x2 - x3, on a small grid of inputs
void linearDataset(Tensor& x, Tensor& y) {
    std::vector<std::vector<double>> xs, ys;
    for (int i = 0; i < 24; ++i) {
        double a = (i % 4) * 0.5, b = (i % 3) * 0.25, c = (i % 5) * 0.2, d = (i % 2) * 0.3;
        xs.push_back({a, b, c, d});
        ys.push_back({a + 2 * b, c - d});
    }
    x = Tensor::fromRows(xs);
    y = Tensor::fromRows(ys);
}

std::vector<double> sampleInput(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = 0.1 * static_cast<double>(i % 7) - 0.2;
    return v;
}

}  // namespace

// ==========================================================
// Tensor / Scaler
// ==========================================================
TEST(TensorTest, ReleasedBufferCannotBeRead) {
    Tensor t = Tensor::fromRow({1.0, 2.0, 3.0});
    EXPECT_EQ(t.rows(), 1u);
    EXPECT_EQ(t.cols(), 3u);
    EXPECT_FLOAT_EQ(t.at(0, 2), 3.0f);

    t.release();
    EXPECT_TRUE(t.released());
    EXPECT_THROW(t.data(), std::runtime_error);
}

TEST(TensorTest, RaggedRowsAreRejected) {
    EXPECT_THROW(Tensor::fromRows({{1.0, 2.0}, {3.0}}), std::runtime_error);
}

TEST(ScalerTest, MinMaxRoundTrip) {
    Tensor t = Tensor::fromRows({{0.0, 10.0}, {5.0, 20.0}, {10.0, 30.0}});
    Scaler s;
    s.fit(t, Scaler::MINMAX);

    Tensor scaled = s.transform(t);
    EXPECT_FLOAT_EQ(scaled.at(1, 0), 0.5f);
    EXPECT_FLOAT_EQ(scaled.at(2, 1), 1.0f);

    Tensor back = s.inverse(scaled);
    EXPECT_FLOAT_EQ(back.at(1, 1), 20.0f);
}

TEST(ScalerTest, ConstantColumnIsOnlyShifted) {
    Tensor t = Tensor::fromRows({{3.0}, {3.0}});
    Scaler s;
    s.fit(t, Scaler::STANDARD);
    EXPECT_FLOAT_EQ(s.transform(t).at(0, 0), 0.0f);
    EXPECT_FLOAT_EQ(s.transform(Tensor::fromRow({5.0})).at(0, 0), 2.0f);
    EXPECT_FLOAT_EQ(s.inverse(Tensor::fromRow({2.0})).at(0, 0), 5.0f);

    Scaler m;
    m.fit(Tensor::fromRow({0.81}), Scaler::MINMAX);
    EXPECT_FLOAT_EQ(m.inverse(Tensor::fromRow({0.25})).at(0, 0), 1.06f);
}

TEST(ScalerTest, PartialFitMergesLaterBatches) {
    Scaler merged;
    merged.partialFit(Tensor::fromRows({{1.0, 5.0}, {2.0, 5.0}}), Scaler::STANDARD);
    merged.partialFit(Tensor::fromRows({{3.0, 5.0}, {4.0, 5.0}, {5.0, 5.0}}), Scaler::STANDARD);

    Scaler whole;
    whole.fit(Tensor::fromRows({{1.0, 5.0}, {2.0, 5.0}, {3.0, 5.0}, {4.0, 5.0}, {5.0, 5.0}}), Scaler::STANDARD);

    EXPECT_EQ(merged.count, 5u);
    EXPECT_FLOAT_EQ(merged.param1[0], 3.0f);
    EXPECT_FLOAT_EQ(merged.param2[0], std::sqrt(2.0f));
    EXPECT_FLOAT_EQ(merged.param1[0], whole.param1[0]);
    EXPECT_FLOAT_EQ(merged.param2[0], whole.param2[0]);
    EXPECT_FLOAT_EQ(merged.param2[1], 0.0f);

    Scaler range;
    range.partialFit(Tensor::fromRow({0.8}), Scaler::MINMAX);
    range.partialFit(Tensor::fromRows({{0.5}, {1.1}}), Scaler::MINMAX);
    EXPECT_FLOAT_EQ(range.param1[0], 0.5f);
    EXPECT_FLOAT_EQ(range.param2[0], 1.1f);

    // fit() starts over
    range.fit(Tensor::fromRow({2.0}), Scaler::MINMAX);
    EXPECT_EQ(range.count, 1u);
    EXPECT_FLOAT_EQ(range.param1[0], 2.0f);
}

TEST(ScalerTest, RunningStatisticsSurviveJson) {
    Scaler s;
    s.partialFit(Tensor::fromRows({{1.0}, {2.0}}), Scaler::STANDARD);
    Scaler restored = Scaler::fromJson(s.toJson());
    restored.partialFit(Tensor::fromRows({{3.0}, {4.0}, {5.0}}), Scaler::STANDARD);

    EXPECT_EQ(restored.count, 5u);
    EXPECT_FLOAT_EQ(restored.param1[0], 3.0f);
    EXPECT_FLOAT_EQ(restored.param2[0], std::sqrt(2.0f));
}

TEST(ScalerTest, UnfittedScalerOnlyClips) {
    Scaler s;
    Tensor out = s.transform(Tensor::fromRow({-50.0, 0.5, 50.0}));
    EXPECT_FLOAT_EQ(out.at(0, 0), -10.0f);
    EXPECT_FLOAT_EQ(out.at(0, 1), 0.5f);
    EXPECT_FLOAT_EQ(out.at(0, 2), 10.0f);
}

TEST(ScalerTest, ParsesModes) {
    EXPECT_EQ(Scaler::parseMode("minmax"), Scaler::MINMAX);
    EXPECT_EQ(Scaler::parseMode("robust"), Scaler::STANDARD);
    EXPECT_EQ(Scaler::parseMode("none"), Scaler::NONE);
}

// ==========================================================
// NeuralNetwork
// ==========================================================
TEST(NeuralNetworkTest, PredictShapeAndDeterminism) {
    NeuralNetwork nn(kFeatureDimension, kOutputDimension, {16, 8}, {0.2, 0.0}, Scaler::STANDARD, 42);
    Tensor input = Tensor::fromRow(sampleInput(kFeatureDimension));

    Tensor a = nn.predict(input);
    Tensor b = nn.predict(input);
    ASSERT_EQ(a.rows(), 1u);
    ASSERT_EQ(a.cols(), kOutputDimension);
    EXPECT_EQ(a.data(), b.data());
}

TEST(NeuralNetworkTest, StochasticInferenceFollowsSeed) {
    NeuralNetwork nn(8, 4, {64}, {0.5}, Scaler::NONE, 3);
    Tensor input = Tensor::fromRow({1, 1, 1, 1, 1, 1, 1, 1});

    InferenceOptions first{true, 11};
    InferenceOptions second{true, 12};
    EXPECT_EQ(nn.predict(input, first).data(), nn.predict(input, first).data());
    EXPECT_NE(nn.predict(input, first).data(), nn.predict(input, second).data());
}

TEST(NeuralNetworkTest, CountsParametersAndLayers) {
    NeuralNetwork nn(4, 2, {3}, {0.1}, Scaler::NONE, 1);
    EXPECT_EQ(nn.parameterCount(), 4u * 3 + 3 + 3 * 2 + 2);
    // dense, dropout, dense
    EXPECT_EQ(nn.layerCount(), 3u);
    EXPECT_EQ(nn.architecture(), "neural-network");
}

TEST(NeuralNetworkTest, FitReducesLoss) {
    Tensor x, y;
    linearDataset(x, y);
    NeuralNetwork nn(4, 2, {16}, {0.0}, Scaler::STANDARD, 5);

    FitOptions opts;
    opts.epochs = 150;
    opts.batchSize = 8;
    opts.learningRate = 0.01;
    FitHistory h = nn.fit(x, y, opts);

    ASSERT_EQ(h.loss.size(), 150u);
    EXPECT_LT(h.loss.back(), h.loss.front());
    EXPECT_EQ(nn.trainedSamples(), 24u);
}

TEST(NeuralNetworkTest, FitContinuesFromCurrentWeights) {
    Tensor x, y;
    linearDataset(x, y);
    NeuralNetwork nn(4, 2, {16}, {0.0}, Scaler::STANDARD, 5);

    FitOptions opts;
    opts.epochs = 100;
    opts.learningRate = 0.01;
    FitHistory first = nn.fit(x, y, opts);

    opts.epochs = 1;
    FitHistory second = nn.fit(x, y, opts);
    EXPECT_LT(second.loss.front(), first.loss.front());
    EXPECT_EQ(nn.trainedSamples(), 48u);
}

TEST(NeuralNetworkTest, OneRowFirstFitStillLearnsFromLaterBatches) {
    Tensor x, y;
    linearDataset(x, y);
    NeuralNetwork nn(4, 2, {16}, {0.0}, Scaler::STANDARD, 5);

    FitOptions opts;
    opts.epochs = 5;
    opts.learningRate = 0.01;
    nn.fit(Tensor::fromRow({0.5, 0.25, 0.2, 0.3}), Tensor::fromRow({1.0, -0.1}), opts);

    Tensor a = Tensor::fromRow({0.0, 0.0, 0.0, 0.0});
    Tensor b = Tensor::fromRow({1.5, 0.5, 0.8, 0.0});
    auto before = nn.predict(a).data();

    opts.epochs = 50;
    nn.fit(x, y, opts);

    EXPECT_NE(nn.predict(a).data(), before);
    EXPECT_NE(nn.predict(a).at(0, 0), nn.predict(b).at(0, 0));
}

TEST(NeuralNetworkTest, RejectsMismatchedShapes) {
    NeuralNetwork nn(4, 2, {8}, {0.0}, Scaler::NONE, 1);
    EXPECT_THROW(nn.predict(Tensor::fromRow({1, 2, 3})), std::invalid_argument);

    FitOptions opts;
    EXPECT_THROW(nn.fit(Tensor::fromRow({1, 2, 3, 4}), Tensor::fromRow({1, 2, 3}), opts), std::invalid_argument);
}

TEST(NeuralNetworkTest, SaveLoadKeepsPredictions) {
    Tensor x, y;
    linearDataset(x, y);
    NeuralNetwork nn(4, 2, {8}, {0.25}, Scaler::STANDARD, 9);
    FitOptions opts;
    opts.epochs = 10;
    nn.fit(x, y, opts);

    std::string path = testdata::tempPath("nn_roundtrip.json");
    nn.save(path);

    NeuralNetwork restored(4, 2, {2}, {0.0}, Scaler::NONE, 1);
    restored.load(path);

    Tensor input = Tensor::fromRow({0.5, 0.25, 0.2, 0.3});
    EXPECT_EQ(nn.predict(input).data(), restored.predict(input).data());
    EXPECT_EQ(restored.parameterCount(), nn.parameterCount());
    EXPECT_EQ(restored.trainedSamples(), 24u);

    InferenceOptions mc{true, 77};
    EXPECT_EQ(nn.predict(input, mc).data(), restored.predict(input, mc).data());
}

TEST(NeuralNetworkTest, LoadRejectsMissingOrForeignFiles) {
    NeuralNetwork nn(4, 2, {8}, {0.0}, Scaler::NONE, 1);
    EXPECT_THROW(nn.load(testdata::tempPath("does_not_exist.json")), PersistenceError);

    std::string path = testdata::tempPath("foreign_model.json");
    {
        std::ofstream out(path);
        out << R"({"format": "something-else"})";
    }
    EXPECT_THROW(nn.load(path), PersistenceError);

    std::string broken = testdata::tempPath("broken_model.json");
    {
        std::ofstream out(broken);
        out << "{ truncated";
    }
    EXPECT_THROW(nn.load(broken), PersistenceError);
}

// ==========================================================
// LinearModel / ModelFactory
// ==========================================================
TEST(LinearModelTest, FitReducesLossAndPersists) {
    Tensor x, y;
    linearDataset(x, y);
    LinearModel lm(4, 2, Scaler::STANDARD);

    FitOptions opts;
    opts.epochs = 60;
    opts.learningRate = 0.01;
    FitHistory h = lm.fit(x, y, opts);
    EXPECT_LT(h.loss.back(), h.loss.front());
    EXPECT_EQ(lm.parameterCount(), 4u * 2 + 2);

    std::string path = testdata::tempPath("linear_roundtrip.json");
    lm.save(path);
    LinearModel restored(4, 2, Scaler::NONE);
    restored.load(path);

    Tensor input = Tensor::fromRow({1.0, 0.5, 0.4, 0.0});
    EXPECT_EQ(lm.predict(input).data(), restored.predict(input).data());
}

TEST(ModelFactoryTest, BuildsConfiguredArchitecture) {
    auto log = Logger::silent();
    OptimizerConfig cfg = testdata::fastConfig();

    auto nn = ModelFactory::create(cfg, *log);
    EXPECT_EQ(nn->architecture(), "neural-network");
    EXPECT_EQ(nn->inputSize(), kFeatureDimension);
    EXPECT_EQ(nn->outputSize(), kOutputDimension);

    cfg.architecture = "Linear-Regression";
    EXPECT_EQ(ModelFactory::create(cfg, *log)->architecture(), "linear-regression");

    cfg.architecture = "transformer";
    EXPECT_EQ(ModelFactory::create(cfg, *log)->architecture(), "neural-network");
}

TEST(ModelFactoryTest, LoadPicksArchitectureFromFile) {
    auto log = Logger::silent();
    OptimizerConfig cfg = testdata::fastConfig();
    cfg.architecture = "linear-regression";

    std::string path = testdata::tempPath("factory_linear.json");
    ModelFactory::create(cfg, *log)->save(path);

    OptimizerConfig other = testdata::fastConfig();
    auto loaded = ModelFactory::load(path, other, *log);
    EXPECT_EQ(loaded->architecture(), "linear-regression");

    EXPECT_THROW(ModelFactory::load(testdata::tempPath("missing_model.json"), other, *log), PersistenceError);
}
