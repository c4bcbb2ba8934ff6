#include "mepa/machine/errors.hpp"

namespace mepa {

std::string MachineError::to_string() const {
    if (line) {
        return "Error at line " + std::to_string(*line) + ": " + message;
    }
    return message;
}

} // namespace mepa
