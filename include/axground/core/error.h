#pragma once
#include <stdexcept>
#include <string>

namespace axground {

// The caller handed the core something that is not shaped the way the
// interface requires (bad integration, as opposed to bad data).
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error(what) {}
};

// A snapshot could not be read at the boundary: I/O, JSON syntax,
// compression or an unrecognized document shape.
class SnapshotReadError : public std::runtime_error {
public:
    explicit SnapshotReadError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace axground
