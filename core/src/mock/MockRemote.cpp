#include "scpbridge/MockRemote.hpp"
#include "scpbridge/ScpProtocol.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

namespace scpbridge {

namespace {

// Unbounded one-way byte pipe. Closing the write side is a clean EOF for
// the reader; abort() fails every pending and later call.
class Pipe {
public:
    bool write(const char *buf, std::size_t len, std::string &err) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (aborted_) {
                err = "session closed";
                return false;
            }
            if (writeClosed_) {
                err = "write after close";
                return false;
            }
            data_.insert(data_.end(), buf, buf + len);
        }
        cv_.notify_all();
        return true;
    }

    bool read(char *buf, std::size_t len, std::size_t &got, std::string &err) {
        got = 0;
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this, len]() { return aborted_ || writeClosed_ || !data_.empty() || len == 0; });
        if (aborted_) {
            err = "session closed";
            return false;
        }
        while (got < len && !data_.empty()) {
            buf[got++] = data_.front();
            data_.pop_front();
        }
        return true;
    }

    void closeWrite() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            writeClosed_ = true;
        }
        cv_.notify_all();
    }

    void abort() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            aborted_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<char> data_;
    bool writeClosed_ = false;
    bool aborted_ = false;
};

class PipeWriter : public ByteWriter {
public:
    explicit PipeWriter(Pipe &p) : p_(p) {}
    bool write(const char *buf, std::size_t len, std::string &err) override {
        return p_.write(buf, len, err);
    }
    void close() override { p_.closeWrite(); }

private:
    Pipe &p_;
};

class PipeReader : public ByteReader {
public:
    explicit PipeReader(Pipe &p) : p_(p) {}
    bool read(char *buf, std::size_t len, std::size_t &got,
              std::string &err) override {
        return p_.read(buf, len, got, err);
    }

private:
    Pipe &p_;
};

// Inverse of shellQuote(), plus backslash escapes outside quotes.
std::string shellUnquote(const std::string &s) {
    std::string out;
    bool inQuote = false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '\'') {
            inQuote = !inQuote;
        } else if (c == '\\' && !inQuote && i + 1 < s.size()) {
            out.push_back(s[++i]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// "<bin> <flags...> <quoted path>"; the path starts at the first quote.
bool parseCommand(const std::string &cmd, MockSessionRecord &rec) {
    const std::size_t sp = cmd.find(' ');
    const std::size_t quote = cmd.find('\'');
    if (sp == std::string::npos || quote == std::string::npos || quote < sp)
        return false;
    rec.remote_binary = cmd.substr(0, sp);
    std::string flags = cmd.substr(sp + 1, quote - sp - 1);
    while (!flags.empty() && flags.back() == ' ')
        flags.pop_back();
    rec.flags = flags;
    rec.path = shellUnquote(cmd.substr(quote));
    return true;
}

class MockSession : public RemoteSession {
public:
    explicit MockSession(std::shared_ptr<MockRemote::State> state)
        : state_(std::move(state)), inWriter_(stdin_), inReader_(stdin_),
          outWriter_(stdout_), outReader_(stdout_) {}

    ~MockSession() override {
        close();
        if (peer_.joinable())
            peer_.join();
    }

    bool start(const std::string &command, std::string &err) override {
        MockFaults faults;
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            faults = state_->faults;
            rec_.command = command;
            recIdx_ = state_->records.size();
            state_->records.push_back(rec_);
        }
        if (faults.fail_start) {
            err = "mock: exec refused";
            return false;
        }
        if (!parseCommand(command, rec_)) {
            err = "mock: malformed command \"" + command + "\"";
            return false;
        }
        std::function<int()> role;
        if (rec_.flags == "-qt" || rec_.flags == "-t") {
            role = [this, faults]() { return runSink(faults); };
        } else if (rec_.flags == "-f" || rec_.flags == "-f -p") {
            const bool preserve = rec_.flags == "-f -p";
            role = [this, faults, preserve]() { return runSource(faults, preserve); };
        } else {
            err = "mock: unsupported flags \"" + rec_.flags + "\"";
            return false;
        }
        peer_ = std::thread([this, role, faults]() {
            int status = role();
            if (status == 0 && faults.exit_status)
                status = *faults.exit_status;
            outWriter_.close();
            {
                std::lock_guard<std::mutex> lk(state_->mtx);
                rec_.exit_status = status;
                state_->records[recIdx_] = rec_;
            }
            {
                std::lock_guard<std::mutex> lk(mtx_);
                exited_ = true;
                status_ = status;
            }
            cv_.notify_all();
        });
        return true;
    }

    ByteWriter &input() override { return inWriter_; }
    ByteReader &output() override { return outReader_; }

    bool wait(std::string &err) override {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this]() { return exited_ || closed_; });
        if (!exited_) {
            err = "session closed";
            return false;
        }
        if (status_ != 0) {
            err = "remote command exited with status " + std::to_string(status_);
            return false;
        }
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_)
                return;
            closed_ = true;
        }
        stdin_.abort();
        stdout_.abort();
        cv_.notify_all();
    }

private:
    void waitClosed() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this]() { return closed_; });
    }

    bool send(const std::string &s) {
        std::string err;
        return outWriter_.write(s.data(), s.size(), err);
    }

    bool readByte(char &c) {
        std::size_t got = 0;
        std::string err;
        return inReader_.read(&c, 1, got, err) && got == 1;
    }

    bool readAck() {
        char c = 1;
        if (!readByte(c) || c != '\0')
            return false;
        ++rec_.acks_received;
        return true;
    }

    // Reads until the client closes its side.
    void drainInput() {
        char buf[256];
        for (;;) {
            std::size_t got = 0;
            std::string err;
            if (!inReader_.read(buf, sizeof(buf), got, err) || got == 0)
                return;
        }
    }

    int runSink(const MockFaults &faults) {
        std::string header;
        std::string err;
        if (!readLine(inReader_, header, err))
            return 1;
        rec_.header_line = header;
        if (faults.stall) {
            waitClosed();
            return 1;
        }
        if (faults.header_reply) {
            if (!send(*faults.header_reply))
                return 1;
            if (!faults.header_reply->empty() && (*faults.header_reply)[0] == '\2') {
                drainInput();
                return 1;
            }
        } else if (!send(std::string(1, '\0'))) {
            return 1;
        }

        FileInfos infos;
        TransferError perr;
        if (!parseFileInfos(header, infos, perr)) {
            send("\2scp: protocol error: " + perr.message + "\n");
            drainInput();
            return 1;
        }

        std::string body;
        std::vector<char> buf(4096);
        while (body.size() < infos.size) {
            const std::size_t want = static_cast<std::size_t>(
                std::min<std::uint64_t>(infos.size - body.size(), buf.size()));
            std::size_t got = 0;
            if (!inReader_.read(buf.data(), want, got, err) || got == 0)
                return 1;
            body.append(buf.data(), got);
            rec_.payload_bytes += got;
        }
        char term = 1;
        if (!readByte(term) || term != '\0')
            return 1;
        rec_.terminator_received = true;

        if (!send(faults.final_reply ? *faults.final_reply : std::string(1, '\0')))
            return 1;
        if (faults.final_reply && !faults.final_reply->empty() &&
            (*faults.final_reply)[0] == '\2') {
            drainInput();
            return 1;
        }

        MockFile file;
        file.content = std::move(body);
        file.permissions = infos.permissions;
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            state_->files[rec_.path] = std::move(file);
        }
        drainInput();
        return 0;
    }

    int runSource(const MockFaults &faults, bool preserve) {
        if (!readAck())
            return 1;
        MockFile file;
        bool found = false;
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            auto it = state_->files.find(rec_.path);
            if (it != state_->files.end()) {
                file = it->second;
                found = true;
            }
        }
        if (!found) {
            send("\2scp: " + rec_.path + ": No such file or directory\n");
            return 1;
        }
        if (faults.stall) {
            waitClosed();
            return 1;
        }
        if (preserve) {
            if (!send(faults.time_line ? *faults.time_line
                                       : encodeFileTime(file.mtime, file.atime)))
                return 1;
            if (!readAck())
                return 1;
        }
        const std::string header =
            faults.header_reply
                ? *faults.header_reply
                : encodeFileHeader(file.permissions, file.content.size(),
                                   remoteBaseName(rec_.path));
        if (!send(header))
            return 1;
        if (!readAck())
            return 1;
        if (!send(file.content) || !send(std::string(1, '\0')))
            return 1;
        if (!readAck())
            return 1;
        return 0;
    }

    std::shared_ptr<MockRemote::State> state_;
    MockSessionRecord rec_; // owned by the peer thread once started
    std::size_t recIdx_ = 0;

    Pipe stdin_;
    Pipe stdout_;
    PipeWriter inWriter_;
    PipeReader inReader_;
    PipeWriter outWriter_;
    PipeReader outReader_;

    std::mutex mtx_;
    std::condition_variable cv_;
    bool exited_ = false;
    bool closed_ = false;
    int status_ = 0;
    std::thread peer_;
};

} // namespace

MockRemote::MockRemote() : state_(std::make_shared<State>()) {}

std::shared_ptr<RemoteSession> MockRemote::newSession(std::string &err) {
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (state_->faults.fail_new_session) {
            err = "mock: connection lost";
            return nullptr;
        }
    }
    return std::make_shared<MockSession>(state_);
}

void MockRemote::putFile(const std::string &path, MockFile file) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->files[path] = std::move(file);
}

bool MockRemote::getFile(const std::string &path, MockFile &out) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->files.find(path);
    if (it == state_->files.end())
        return false;
    out = it->second;
    return true;
}

void MockRemote::setFaults(MockFaults faults) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->faults = std::move(faults);
}

std::size_t MockRemote::sessionCount() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->records.size();
}

MockSessionRecord MockRemote::lastSession() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->records.empty())
        return {};
    return state_->records.back();
}

} // namespace scpbridge
