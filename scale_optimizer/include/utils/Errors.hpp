#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by the optimizer. Messages are meant to be shown
// to the caller as-is.
class OptimizerError : public std::runtime_error {
public:
    explicit OptimizerError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed or missing configuration / usage / training input
class ValidationError : public OptimizerError {
public:
    explicit ValidationError(const std::string& msg) : OptimizerError(msg) {}
};

// Public call made before initialize()
class NotInitializedError : public OptimizerError {
public:
    explicit NotInitializedError(const std::string& msg) : OptimizerError(msg) {}
};

// The underlying model call failed
class InferenceError : public OptimizerError {
public:
    explicit InferenceError(const std::string& msg) : OptimizerError(msg) {}
};

// Model lacks a capability needed to explain a prediction
class ExplanationError : public OptimizerError {
public:
    explicit ExplanationError(const std::string& msg) : OptimizerError(msg) {}
};

// Save/load I/O or (de)serialization failure
class PersistenceError : public OptimizerError {
public:
    explicit PersistenceError(const std::string& msg) : OptimizerError(msg) {}
};

class TrainingError : public OptimizerError {
public:
    explicit TrainingError(const std::string& msg) : OptimizerError(msg) {}
};

class PostProcessingError : public OptimizerError {
public:
    explicit PostProcessingError(const std::string& msg) : OptimizerError(msg) {}
};
