// In-memory SessionProvider for tests. Each session interprets the started
// scp command and plays the remote sink ("-t") or source ("-f", "-f -p")
// over in-process pipes, against a simulated remote file table.
#pragma once
#include "RemoteSession.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scpbridge {

struct MockFile {
    std::string content;
    std::uint32_t permissions = 0644;
    std::int64_t mtime = 0;
    std::int64_t atime = 0;
};

// Scripted misbehaviour, applied to every session opened afterwards.
struct MockFaults {
    // Sink: sent instead of the ack after the "C" header.
    // Source: sent instead of the generated "C" header line.
    std::optional<std::string> header_reply;
    // Sink: sent instead of the ack after the payload terminator.
    std::optional<std::string> final_reply;
    // Source in preserve mode: sent instead of the generated "T" line.
    std::optional<std::string> time_line;
    // Stop answering after the first control message until the session closes.
    bool stall = false;
    // Exit status reported once the peer is done.
    std::optional<int> exit_status;
    bool fail_new_session = false;
    bool fail_start = false;
};

// What one session saw from the client.
struct MockSessionRecord {
    std::string command;
    std::string remote_binary;
    std::string flags;
    std::string path;
    std::string header_line;          // sink: header as received
    std::uint64_t payload_bytes = 0;  // sink: body bytes received
    bool terminator_received = false; // sink: 0x00 after the body
    int acks_received = 0;            // source: 0x00 bytes received
    int exit_status = -1;
};

class MockRemote : public SessionProvider {
public:
    MockRemote();

    std::shared_ptr<RemoteSession> newSession(std::string &err) override;

    void putFile(const std::string &path, MockFile file);
    bool getFile(const std::string &path, MockFile &out) const;

    void setFaults(MockFaults faults);

    std::size_t sessionCount() const;
    // Record of the most recent session; empty record when none was opened.
    MockSessionRecord lastSession() const;

    struct State {
        mutable std::mutex mtx;
        std::map<std::string, MockFile> files;
        MockFaults faults;
        std::vector<MockSessionRecord> records;
    };

private:
    std::shared_ptr<State> state_;
};

} // namespace scpbridge
