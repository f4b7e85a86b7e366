#include "lanshare/transfer/transfer_events.hpp"

namespace lanshare::transfer {

const char* to_string(TransferEventType type) {
    switch (type) {
        case TransferEventType::WAITING: return "transfer-waiting";
        case TransferEventType::STARTED: return "transfer-started";
        case TransferEventType::CONNECTED: return "transfer-connected";
        case TransferEventType::PROGRESS: return "transfer-progress";
        case TransferEventType::COMPLETED: return "transfer-completed";
        case TransferEventType::TRANSFER_ERROR: return "transfer-error";
        case TransferEventType::CANCELLED: return "transfer-cancelled";
    }
    return "transfer-unknown";
}

}
