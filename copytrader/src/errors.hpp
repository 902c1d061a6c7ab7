#pragma once

#include <stdexcept>
#include <string>

// Base for every failure the copy trader reports.
class AppError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing startup dependency; fatal before monitoring begins.
class InitializationError : public AppError {
public:
    using AppError::AppError;
};

// Feed or relay transport failure; retried by the owning task.
class TransportError : public AppError {
public:
    using AppError::AppError;
};

// Malformed frame, payload or account buffer; the item is dropped.
class DecodeError : public AppError {
public:
    using AppError::AppError;
};

class ValidationError : public AppError {
public:
    using AppError::AppError;
};

class InvalidPriceError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

// A single copy trade failed; the pipeline moves on.
class ProcessingError : public AppError {
public:
    using AppError::AppError;
};
