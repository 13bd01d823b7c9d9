#include "vlock_result.hpp"
#include <sstream>

namespace vlock {

const char* conflictKindToString(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::SUCCESS:
            return "SUCCESS";
        case ConflictKind::VERSION_MISMATCH:
            return "VERSION_MISMATCH";
        case ConflictKind::LOCK_TIMEOUT:
            return "LOCK_TIMEOUT";
        case ConflictKind::LOCK_HELD_BY_OTHER:
            return "LOCK_HELD_BY_OTHER";
        case ConflictKind::NOT_FOUND:
            return "NOT_FOUND";
        case ConflictKind::CANCELLED:
            return "CANCELLED";
        case ConflictKind::INVALID_STATE:
            return "INVALID_STATE";
        default:
            return "UNKNOWN";
    }
}

ConflictResult ConflictResult::success(Version new_version, const Key& key) {
    ConflictResult result;
    result.kind = ConflictKind::SUCCESS;
    result.key = key;
    result.version = new_version;
    return result;
}

ConflictResult ConflictResult::versionMismatch(const Key& key, Version expected, Version actual) {
    ConflictResult result;
    result.kind = ConflictKind::VERSION_MISMATCH;
    result.key = key;
    result.expected = expected;
    result.actual = actual;
    return result;
}

ConflictResult ConflictResult::lockTimeout(const Key& key, Milliseconds waited) {
    ConflictResult result;
    result.kind = ConflictKind::LOCK_TIMEOUT;
    result.key = key;
    result.waited = waited;
    return result;
}

ConflictResult ConflictResult::lockHeldByOther(const Key& key, TransactionID holder) {
    ConflictResult result;
    result.kind = ConflictKind::LOCK_HELD_BY_OTHER;
    result.key = key;
    result.holder = holder;
    return result;
}

ConflictResult ConflictResult::notFound(const Key& key) {
    ConflictResult result;
    result.kind = ConflictKind::NOT_FOUND;
    result.key = key;
    return result;
}

ConflictResult ConflictResult::cancelled(const Key& key) {
    ConflictResult result;
    result.kind = ConflictKind::CANCELLED;
    result.key = key;
    return result;
}

ConflictResult ConflictResult::invalidState(TransactionState state) {
    ConflictResult result;
    result.kind = ConflictKind::INVALID_STATE;
    result.state = state;
    return result;
}

std::string ConflictResult::toString() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const ConflictResult& result) {
    os << conflictKindToString(result.kind) << "{";
    switch (result.kind) {
        case ConflictKind::SUCCESS:
            os << "key=" << result.key << ", version=" << result.version;
            break;
        case ConflictKind::VERSION_MISMATCH:
            os << "key=" << result.key << ", expected=" << result.expected
               << ", actual=" << result.actual;
            break;
        case ConflictKind::LOCK_TIMEOUT:
            os << "key=" << result.key << ", waited=" << result.waited.count() << "ms";
            break;
        case ConflictKind::LOCK_HELD_BY_OTHER:
            os << "key=" << result.key << ", holder=" << result.holder;
            break;
        case ConflictKind::INVALID_STATE:
            os << "state=" << transactionStateToString(result.state);
            break;
        default:
            os << "key=" << result.key;
            break;
    }
    os << "}";
    return os;
}

} // namespace vlock
