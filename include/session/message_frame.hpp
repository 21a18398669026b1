#ifndef FSTORE_SESSION_MESSAGE_FRAME_HPP
#define FSTORE_SESSION_MESSAGE_FRAME_HPP

#include <cstdint>
#include <vector>

namespace fstore {
namespace session {

// Request and response discriminator on the wire
enum class MessageType : uint8_t {
    HELLO = 1,
    OPEN_WRITE = 2,
    WRITE_BLOCK = 3,
    FINISH_WRITE = 4,
    ABORT_WRITE = 5,
    OPEN_READ = 6,
    READ_BLOCK = 7,
    CLOSE_READ = 8,
    LIST_DIR = 9,
    FILE_INFO = 10,
    CHECK_PATHS = 11,
    RESPONSE_OK = 128,
    RESPONSE_ERROR = 129
};

const char* message_type_to_string(MessageType type);
bool is_known_message_type(uint8_t raw);

// A decoded frame. Responses carry the request_id of the request they answer.
struct MessageFrame {
    MessageType message_type{MessageType::RESPONSE_OK};
    uint64_t request_id{0};
    std::vector<uint8_t> payload;
};

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_MESSAGE_FRAME_HPP
