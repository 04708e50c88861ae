#include "hyperdb/core/error.h"

namespace hyperdb {
namespace core {

const char* state_code(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN:             return "HD000";
        case Error::Code::REENTRANT_INSERT:    return "HD001";
        case Error::Code::INVALID_ARGUMENT:    return "HD002";
        case Error::Code::NOT_FOUND:           return "HD003";
        case Error::Code::ALREADY_EXISTS:      return "HD004";
        case Error::Code::TIMEOUT:             return "HD005";
        case Error::Code::RESOURCE_EXHAUSTED:  return "HD006";
        case Error::Code::TRANSACTION_ABORTED: return "HD007";
        case Error::Code::INTERNAL:            return "HD500";
        case Error::Code::EPOCH_NOT_FOUND:     return "HD501";
        case Error::Code::PARTITION_NOT_FOUND: return "HD502";
    }
    return "HD000";
}

bool is_internal_inconsistency(Error::Code code) {
    return state_code(code)[2] == '5';
}

const char* code_name(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN:             return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND:           return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS:      return "ALREADY_EXISTS";
        case Error::Code::TIMEOUT:             return "TIMEOUT";
        case Error::Code::RESOURCE_EXHAUSTED:  return "RESOURCE_EXHAUSTED";
        case Error::Code::INTERNAL:            return "INTERNAL";
        case Error::Code::REENTRANT_INSERT:    return "REENTRANT_INSERT";
        case Error::Code::EPOCH_NOT_FOUND:     return "EPOCH_NOT_FOUND";
        case Error::Code::PARTITION_NOT_FOUND: return "PARTITION_NOT_FOUND";
        case Error::Code::TRANSACTION_ABORTED: return "TRANSACTION_ABORTED";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace hyperdb
