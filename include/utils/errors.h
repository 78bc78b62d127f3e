#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by generation or option handling.
class JigsawError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The requested options cannot produce a valid world (too few pieces for the
// requested checks, repair loop exhausted, ...). Generation aborts; re-run with
// other options or another seed.
class InfeasibleConfigError : public JigsawError {
public:
    explicit InfeasibleConfigError(const std::string& what)
        : JigsawError("Jigsaw: " + what) {}
};

// Unknown key, unparsable value or value outside the option's range.
class OptionError : public JigsawError {
public:
    explicit OptionError(const std::string& what)
        : JigsawError("Option: " + what) {}
};
