// errors.hpp - Typed error taxonomy for the voxelizer and solver
//
// Configuration and resource errors are thrown before any field memory is
// allocated. Divergence is not an exception: it ends a run with
// RunStatus::Diverged (see simulation.hpp).

#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Configuration,  // missing/invalid parameter, position outside the domain
    Resource,       // grid exceeds the memory budget
    MeshInput,      // unusable mesh (no triangles at all)
    Spectral,       // misaligned or too-short series
    State,          // illegal solver state transition
    Io              // export failure
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
    case ErrorKind::Configuration: return "configuration";
    case ErrorKind::Resource:      return "resource";
    case ErrorKind::MeshInput:     return "mesh-input";
    case ErrorKind::Spectral:      return "spectral";
    case ErrorKind::State:         return "state";
    case ErrorKind::Io:            return "io";
    }
    return "unknown";
}

class FdtdError : public std::runtime_error {
public:
    FdtdError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigError : public FdtdError {
public:
    ConfigError(const std::string& key, const std::string& what)
        : FdtdError(ErrorKind::Configuration, "[Config] " + key + ": " + what), key_(key) {}

    // Parameter the error refers to ("" when not tied to one key)
    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class ResourceError : public FdtdError {
public:
    ResourceError(const std::string& what, std::array<std::size_t, 3> dims, char axis,
                  std::size_t bytes_required, std::size_t budget)
        : FdtdError(ErrorKind::Resource, what),
          dims_(dims), axis_(axis), bytes_required_(bytes_required), budget_(budget) {}

    std::array<std::size_t, 3> dims() const noexcept { return dims_; }
    char offending_axis() const noexcept { return axis_; }
    std::size_t bytes_required() const noexcept { return bytes_required_; }
    std::size_t budget() const noexcept { return budget_; }

private:
    std::array<std::size_t, 3> dims_;
    char axis_;
    std::size_t bytes_required_;
    std::size_t budget_;
};

class MeshError : public FdtdError {
public:
    explicit MeshError(const std::string& what) : FdtdError(ErrorKind::MeshInput, what) {}
};

class SpectralError : public FdtdError {
public:
    explicit SpectralError(const std::string& what) : FdtdError(ErrorKind::Spectral, what) {}
};

class StateError : public FdtdError {
public:
    explicit StateError(const std::string& what) : FdtdError(ErrorKind::State, what) {}
};

class IoError : public FdtdError {
public:
    explicit IoError(const std::string& what) : FdtdError(ErrorKind::Io, what) {}
};
