#ifndef FSTORE_SESSION_SESSION_HPP
#define FSTORE_SESSION_SESSION_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "transfer/block_codec.hpp"

namespace fstore {
namespace session {

struct RemoteFileInfo {
    std::string name;
    uint64_t size{0};
    // Hex SHA-256 of the content, when the server has one
    std::optional<std::string> hash;
    // Seconds since the Unix epoch
    int64_t create_time{0};
    bool is_directory{false};
    bool can_modify{false};
};

struct ReadGrant {
    uint64_t key{0};
    RemoteFileInfo info;
};

struct WriteAck {
    uint64_t index{0};
    uint32_t length{0};
};

// A read response names its own destination range
struct BlockData {
    uint64_t index{0};
    uint64_t offset{0};
    std::vector<uint8_t> bytes;
};

// Invoked exactly once per read_block_async call, from a session thread.
// On failure error is set and data is empty.
using BlockCallback = std::function<void(const transfer::BlockSpec& requested,
                                         BlockData data,
                                         std::exception_ptr error)>;

// Request/response access to the remote file store. Every call may throw
// SessionError. Only read_block_async may be issued concurrently with
// other outstanding requests.
class Session {
public:
    virtual ~Session() = default;

    // ---- PUSH ----
    // Returns the remote write key. Fails with RemoteStatus::ALREADY_EXISTS
    // when the path exists and overwrite is false.
    virtual uint64_t open_write(const std::string& remote_path, uint64_t size,
                                const std::string& hash, bool overwrite) = 0;
    virtual WriteAck write_block(uint64_t key, const transfer::BlockSpec& block,
                                 const std::vector<uint8_t>& data) = 0;
    // Commits the file, returns the committed size
    virtual uint64_t finish_write(uint64_t key) = 0;
    virtual void abort_write(uint64_t key) = 0;


    // ---- PULL ----
    virtual ReadGrant open_read(const std::string& remote_path) = 0;
    virtual BlockData read_block(uint64_t key, const transfer::BlockSpec& block) = 0;
    virtual void read_block_async(uint64_t key, const transfer::BlockSpec& block,
                                  BlockCallback callback) = 0;
    virtual void close_read(uint64_t key) = 0;


    // ---- ONE-SHOT QUERIES ----
    virtual std::vector<RemoteFileInfo> list_directory(const std::string& remote_dir) = 0;
    virtual RemoteFileInfo file_info(const std::string& remote_path) = 0;
    // Asks the server whether every path may be written
    virtual std::pair<bool, std::string> check_paths(const std::vector<std::string>& remote_paths,
                                                     bool overwrite) = 0;


    // True once the underlying connection is gone for good
    virtual bool is_lost() const = 0;

protected:
    Session() = default;
};

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_SESSION_HPP
