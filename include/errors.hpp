#pragma once
#include <stdexcept>
#include <string>

// Fatal conditions of a reconciliation run. None of them is recovered locally;
// they propagate to main(), which reports the message and exits non-zero.
namespace scafbreak {

// unreadable input or unwritable output, malformed field, wrong column count
struct IoError : std::runtime_error {
    explicit IoError(const std::string& msg) : std::runtime_error(msg) {}
};

// AGP vocabulary (component type, gap type, linkage) outside the expected set
struct SchemaError : std::runtime_error {
    explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {}
};

// FASTA segment disagrees with its paired AGP record (type or length)
struct MismatchError : std::runtime_error {
    explicit MismatchError(const std::string& msg) : std::runtime_error(msg) {}
};

// unmatched sequence fragment while no AGP split is open
struct SplitStateError : std::runtime_error {
    explicit SplitStateError(const std::string& msg) : std::runtime_error(msg) {}
};

// break causes do not sum to the raw break count
struct AccountingError : std::runtime_error {
    explicit AccountingError(const std::string& msg) : std::runtime_error(msg) {}
};

// scaffold without chromosome assignment
struct LookupError : std::runtime_error {
    explicit LookupError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace scafbreak
