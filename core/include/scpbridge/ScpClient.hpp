// SCP transfer engine. Every call opens its own session from the provider,
// starts the remote scp command and runs the protocol state machine next to
// a process-exit waiter, both supervised by a TransferHarness.
//
// A cancelled call (token or deadline) returns without waiting for its units.
// They are left to finish on their own once the session is closed. The
// session and the engine-owned streams are kept alive by the units. For the
// overloads that borrow a caller's reader, writer or iostream, no new read or
// write is started after the call returns. A read or write that was already
// running (and its progress report) may still complete, so the borrowed
// object must stay valid until then. The std::shared_ptr overloads leave
// that to the units.
#pragma once
#include "ByteStream.hpp"
#include "CancelToken.hpp"
#include "RemoteSession.hpp"
#include "ScpTypes.hpp"
#include "TransferHarness.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace scpbridge {

class ScpClient {
public:
    explicit ScpClient(std::shared_ptr<SessionProvider> provider,
                       ClientOptions opt = {});

    const ClientOptions &options() const { return opt_; }
    void setOptions(ClientOptions opt) { opt_ = std::move(opt); }

    // Upload exactly "size" bytes of src to remotePath. "permissions" is octal
    // text such as "0644". The header carries the base name of remotePath; a
    // path without a usable file name ("/", "..") fails with Format before
    // any session is opened.
    bool copy(const CancelToken &token,
              ByteReader &src,
              const std::string &remotePath,
              const std::string &permissions,
              std::uint64_t size,
              TransferError &err,
              ProgressCB progress = {});

    bool copy(const CancelToken &token,
              std::shared_ptr<ByteReader> src,
              const std::string &remotePath,
              const std::string &permissions,
              std::uint64_t size,
              TransferError &err,
              ProgressCB progress = {});

    bool copy(const CancelToken &token,
              std::istream &src,
              const std::string &remotePath,
              const std::string &permissions,
              std::uint64_t size,
              TransferError &err,
              ProgressCB progress = {});

    // Upload a stream of unknown length; it is read fully to learn the size.
    // Prefer copy() when the size is known in advance.
    bool copyFile(const CancelToken &token,
                  std::istream &src,
                  const std::string &remotePath,
                  const std::string &permissions,
                  TransferError &err,
                  ProgressCB progress = {});

    // Upload a local file; the size comes from the file system.
    bool copyFromFile(const CancelToken &token,
                      const std::string &localPath,
                      const std::string &remotePath,
                      const std::string &permissions,
                      TransferError &err,
                      ProgressCB progress = {});

    // Download remotePath into dst.
    bool copyFromRemote(const CancelToken &token,
                        ByteWriter &dst,
                        const std::string &remotePath,
                        TransferError &err,
                        ProgressCB progress = {});

    bool copyFromRemote(const CancelToken &token,
                        std::shared_ptr<ByteWriter> dst,
                        const std::string &remotePath,
                        TransferError &err,
                        ProgressCB progress = {});

    bool copyFromRemote(const CancelToken &token,
                        std::ostream &dst,
                        const std::string &remotePath,
                        TransferError &err,
                        ProgressCB progress = {});

    // Download with "-p": infos receives name, size, permissions, mtime and atime.
    bool copyFromRemoteFileInfos(const CancelToken &token,
                                 ByteWriter &dst,
                                 const std::string &remotePath,
                                 FileInfos &infos,
                                 TransferError &err,
                                 ProgressCB progress = {});

    bool copyFromRemoteFileInfos(const CancelToken &token,
                                 std::shared_ptr<ByteWriter> dst,
                                 const std::string &remotePath,
                                 FileInfos &infos,
                                 TransferError &err,
                                 ProgressCB progress = {});

    // Download into a local file. With preserve the file gets the remote
    // permissions, mtime and atime once the body is complete.
    bool copyFromRemoteToFile(const CancelToken &token,
                              const std::string &localPath,
                              const std::string &remotePath,
                              bool preserve,
                              FileInfos &infos,
                              TransferError &err,
                              ProgressCB progress = {});

private:
    bool download(const CancelToken &token,
                  std::shared_ptr<ByteWriter> dst,
                  const std::string &remotePath,
                  bool preserve,
                  FileInfos &infos,
                  TransferError &err,
                  ProgressCB progress);

    // Opens a session and starts the remote command.
    std::shared_ptr<RemoteSession> openSession(const std::string &command,
                                               TransferError &err);

    // Runs the protocol unit and the exit waiter, then tears the session down.
    bool supervise(const std::shared_ptr<RemoteSession> &session,
                   TransferHarness::Unit protocol,
                   const CancelToken &token,
                   TransferError &err);

    std::shared_ptr<SessionProvider> provider_;
    ClientOptions opt_;
};

} // namespace scpbridge
