#pragma once

#include <stdexcept>
#include <string>

namespace uc {

// Archive entry, update file, descriptor or config could not be read
struct ReadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Writing into the staging area or the update zip failed
struct CopyError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// User selection or update descriptor content is malformed
struct ValidationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Interactive input stream was closed or failed
struct InputError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
