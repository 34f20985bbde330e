#include "transaction.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace safe::types {
    Operation parse_operation(std::string_view text) {
        const std::string normalized = string_utils::to_lower(string_utils::trim(std::string(text)));

        if (normalized == constants::OP_CALL) {
            return Operation::CALL;
        }
        if (normalized == constants::OP_DELEGATE_CALL) {
            return Operation::DELEGATE_CALL;
        }

        throw std::invalid_argument("Unknown operation: " + std::string(text));
    }
}  // namespace safe::types
