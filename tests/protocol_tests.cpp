// SCP control-line codec and byte-stream tests without external framework
// (run via CTest).
#include "scpbridge/ByteStream.hpp"
#include "scpbridge/ScpProtocol.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

const std::string kWarn(1, '\1');
const std::string kFail(1, '\2');

class StringWriter : public scpbridge::ByteWriter {
public:
    bool write(const char *buf, std::size_t len, std::string &) override {
        data.append(buf, len);
        return true;
    }
    std::string data;
};

void test_response_success_consumes_one_byte(TestContext &t) {
    scpbridge::StringReader in(std::string(1, '\0') + "C0644 1 a\n");
    scpbridge::Response res;
    std::string err;
    t.check(scpbridge::Response::parse(in, res, err), "0x00 should parse");
    t.check(res.isSuccess(), "0x00 should be Success");
    t.check(res.message().empty(), "Success should carry no message");

    std::string line;
    t.check(scpbridge::readLine(in, line, err),
            "bytes after 0x00 should remain readable");
    t.check(line == "C0644 1 a", "parse must not consume past the 0x00 byte");
}

void test_response_warning_and_failure(TestContext &t) {
    scpbridge::StringReader in(kWarn + "disk almost full\n" + kFail +
                               "scp: no space\n" + kFail + "\n");
    scpbridge::Response res;
    std::string err;

    t.check(scpbridge::Response::parse(in, res, err), "0x01 should parse");
    t.check(res.isWarning() && !res.isFailure(), "0x01 should be Warning only");
    t.check(res.message() == "disk almost full", "warning text should be kept");

    t.check(scpbridge::Response::parse(in, res, err), "0x02 should parse");
    t.check(res.isFailure(), "0x02 should be Failure");
    t.check(res.message() == "scp: no space", "failure text should be kept");

    t.check(scpbridge::Response::parse(in, res, err),
            "0x02 with empty text should parse");
    t.check(res.isFailure(), "0x02 with empty text is still a Failure");
    t.check(res.message().empty(), "empty failure text should stay empty");
}

void test_response_non_protocol_line(TestContext &t) {
    scpbridge::StringReader in("T1700000000 0 1700000001 0\n");
    scpbridge::Response res;
    std::string err;
    t.check(scpbridge::Response::parse(in, res, err), "T line should parse");
    t.check(res.isNonProtocol(), "T line should be flagged non-protocol");
    t.check(!res.isFailure(), "non-protocol line must not be a Failure");
    t.check(res.code() == 'T', "leading byte should be kept as code");
    t.check(res.line() == "T1700000000 0 1700000001 0",
            "line() should rebuild the full text");
}

void test_response_truncated_stream(TestContext &t) {
    scpbridge::Response res;
    std::string err;
    scpbridge::StringReader empty("");
    t.check(!scpbridge::Response::parse(empty, res, err),
            "empty stream should fail");
    t.checkContains(err, "end of stream", "empty stream error should say so");

    err.clear();
    scpbridge::StringReader noNewline(kFail + "scp: cut");
    t.check(!scpbridge::Response::parse(noNewline, res, err),
            "message without newline should fail");
    t.check(!err.empty(), "missing newline should report an error");
}

void test_check_response(TestContext &t) {
    std::vector<std::string> warnings;
    auto cb = [&warnings](const std::string &w) { warnings.push_back(w); };

    scpbridge::StringReader in(kWarn + "careful\n" + kFail + "scp: denied\n");
    scpbridge::TransferError err;
    t.check(scpbridge::checkResponse(in, err, cb), "warning should not fail");
    t.check(!err.isSet(), "warning should leave the error unset");
    t.check(warnings.size() == 1 && warnings[0] == "careful",
            "warning should reach the callback");

    t.check(!scpbridge::checkResponse(in, err, cb), "failure should fail");
    t.check(err.kind == scpbridge::ErrorKind::Protocol,
            "failure should map to Protocol");
    t.check(err.message == "scp: denied",
            "failure message should be the peer text verbatim");

    scpbridge::StringReader ok(std::string(1, '\0'));
    scpbridge::TransferError err2;
    t.check(scpbridge::checkResponse(ok, err2), "0x00 should succeed");
}

void test_parse_file_infos(TestContext &t) {
    scpbridge::FileInfos fi;
    scpbridge::TransferError err;
    t.check(scpbridge::parseFileInfos("C0644 5 test.txt", fi, err),
            "valid header should parse");
    t.check(fi.permissions == 0644, "mode should be octal 0644");
    t.check(fi.size == 5, "size should be 5");
    t.check(fi.name == "test.txt", "name should be test.txt");
    t.check(fi.message == "C0644 5 test.txt", "raw header should be kept");

    t.check(scpbridge::parseFileInfos("C0755 0 my file.txt", fi, err),
            "name with spaces should parse");
    t.check(fi.name == "my file.txt", "name is the rest of the line");
    t.check(fi.size == 0, "zero size should parse");

    t.check(scpbridge::parseFileInfos("C0600 18446744073709551615 big", fi, err),
            "max uint64 size should parse");
    t.check(fi.size == 18446744073709551615ULL, "max size should round trip");
}

void test_parse_file_infos_rejects(TestContext &t) {
    const std::vector<std::string> bad = {
        "",
        "D0755 0 dir",
        "C0x44 5 a",
        "C0944 5 a",
        "C0644 -5 a",
        "C0644 abc a",
        "C0644 5",
        "C0644 5 ",
        "C0644 5 a/b",
        "C0644 5 .",
        "C0644 5 ..",
        "C0644 18446744073709551616 a",
    };
    for (const auto &line : bad) {
        scpbridge::FileInfos fi;
        scpbridge::TransferError err;
        t.check(!scpbridge::parseFileInfos(line, fi, err),
                "header should be rejected: \"" + line + "\"");
        t.check(err.kind == scpbridge::ErrorKind::Format,
                "rejected header should be a Format error: \"" + line + "\"");
    }
}

void test_parse_file_time(TestContext &t) {
    scpbridge::FileInfos fi;
    scpbridge::TransferError err;
    t.check(scpbridge::parseFileTime("T1700000000 0 1700000001 0", fi, err),
            "valid time line should parse");
    t.check(fi.mtime && *fi.mtime == 1700000000, "mtime is the first field");
    t.check(fi.atime && *fi.atime == 1700000001, "atime is the third field");

    const std::vector<std::string> bad = {
        "T1 2 3", "T1 0 2 0 5", "T1 0 x 0", "T-1 0 2 0", "C0644 1 a", "",
    };
    for (const auto &line : bad) {
        scpbridge::FileInfos f2;
        scpbridge::TransferError e2;
        t.check(!scpbridge::parseFileTime(line, f2, e2),
                "time line should be rejected: \"" + line + "\"");
        t.check(e2.kind == scpbridge::ErrorKind::Format,
                "rejected time line should be a Format error");
    }
}

void test_file_infos_update_merges_times(TestContext &t) {
    scpbridge::FileInfos header;
    scpbridge::FileInfos times;
    scpbridge::TransferError err;
    t.check(scpbridge::parseFileInfos("C0640 3 x", header, err), "header parses");
    t.check(scpbridge::parseFileTime("T10 0 20 0", times, err), "time parses");
    header.update(times);
    t.check(header.mtime && *header.mtime == 10, "update should copy mtime");
    t.check(header.atime && *header.atime == 20, "update should copy atime");
    t.check(header.permissions == 0640 && header.size == 3 && header.name == "x",
            "update must not touch header fields");
}

void test_parse_permissions(TestContext &t) {
    std::uint32_t mode = 0;
    scpbridge::TransferError err;
    t.check(scpbridge::parsePermissions("0644", mode, err) && mode == 0644,
            "0644 should parse");
    t.check(scpbridge::parsePermissions("755", mode, err) && mode == 0755,
            "755 should parse as octal");
    t.check(scpbridge::parsePermissions("4755", mode, err) && mode == 04755,
            "setuid bit should be accepted");
    for (const std::string bad : {"", "0999", "17777", "0644x", "rw-r--r--"}) {
        scpbridge::TransferError e;
        t.check(!scpbridge::parsePermissions(bad, mode, e),
                "permissions should be rejected: \"" + bad + "\"");
        t.check(e.kind == scpbridge::ErrorKind::Format,
                "bad permissions should be a Format error");
    }
}

void test_encoders(TestContext &t) {
    t.check(scpbridge::encodeFileHeader(0644, 5, "test.txt") == "C0644 5 test.txt\n",
            "header encoding");
    t.check(scpbridge::encodeFileHeader(0, 0, "a") == "C0000 0 a\n",
            "mode is zero padded to four digits");
    t.check(scpbridge::encodeFileTime(1700000000, 1700000001) ==
                "T1700000000 0 1700000001 0\n",
            "time line encoding");

    // What we send must be what we accept.
    std::string line = scpbridge::encodeFileHeader(0751, 1234567, "report final.pdf");
    line.pop_back();
    scpbridge::FileInfos fi;
    scpbridge::TransferError err;
    t.check(scpbridge::parseFileInfos(line, fi, err), "encoded header should parse");
    t.check(fi.permissions == 0751 && fi.size == 1234567 &&
                fi.name == "report final.pdf",
            "encoded header fields should survive parsing");
}

void test_remote_base_name(TestContext &t) {
    t.check(scpbridge::remoteBaseName("/tmp/a.txt") == "a.txt", "absolute path");
    t.check(scpbridge::remoteBaseName("a.txt") == "a.txt", "bare name");
    t.check(scpbridge::remoteBaseName("/tmp/dir/") == "dir", "trailing slash");
    t.check(scpbridge::remoteBaseName("") == ".", "empty path");
    t.check(scpbridge::remoteBaseName("/") == "/", "root");
}

void test_shell_quote_and_commands(TestContext &t) {
    t.check(scpbridge::shellQuote("/tmp/a b") == "'/tmp/a b'", "spaces quoted");
    t.check(scpbridge::shellQuote("it's") == "'it'\\''s'",
            "single quote escaped");
    t.check(scpbridge::shellQuote("$(rm -rf ~)") == "'$(rm -rf ~)'",
            "substitution stays literal");

    using scpbridge::CommandMode;
    t.check(scpbridge::buildCommand("scp", CommandMode::Upload, "/tmp/x") ==
                "scp -qt '/tmp/x'",
            "upload command");
    t.check(scpbridge::buildCommand("scp", CommandMode::Download, "/tmp/x") ==
                "scp -f '/tmp/x'",
            "download command");
    t.check(scpbridge::buildCommand("scp", CommandMode::DownloadPreserve, "/tmp/x") ==
                "scp -f -p '/tmp/x'",
            "preserve download command");
    t.check(scpbridge::buildCommand("/usr/local/bin/scp", CommandMode::Upload, "f") ==
                "/usr/local/bin/scp -qt 'f'",
            "custom remote binary");
}

void test_copy_n(TestContext &t) {
    StringWriter dst;
    std::uint64_t copied = 0;
    std::string err;

    scpbridge::StringReader full("hello world");
    t.check(scpbridge::copyN(dst, full, 5, copied, err), "copyN of a prefix");
    t.check(copied == 5 && dst.data == "hello", "copyN stops at n bytes");

    StringWriter dst2;
    scpbridge::StringReader shortSrc("abc");
    t.check(!scpbridge::copyN(dst2, shortSrc, 5, copied, err),
            "short source should fail");
    t.check(copied == 3, "bytes before the end should be counted");
    t.check(dst2.data == "abc", "bytes before the end should be delivered");
    t.checkContains(err, "unexpected end of stream after 3 of 5 bytes",
                    "short source error text");

    StringWriter dst3;
    scpbridge::StringReader none("");
    err.clear();
    t.check(scpbridge::copyN(dst3, none, 0, copied, err), "zero-byte copy");
    t.check(copied == 0 && dst3.data.empty(), "zero-byte copy writes nothing");
}

void test_istream_adapters(TestContext &t) {
    std::istringstream in(std::string(70000, 'z'));
    scpbridge::IstreamReader reader(in);
    std::string all;
    std::string err;
    t.check(scpbridge::readAll(reader, all, err), "readAll over istream");
    t.check(all.size() == 70000, "readAll should return every byte");

    std::ostringstream out;
    scpbridge::OstreamWriter writer(out);
    t.check(writer.write("abc", 3, err), "ostream write");
    t.check(out.str() == "abc", "ostream should receive the bytes");
}

void test_error_kind_names(TestContext &t) {
    t.check(std::string(scpbridge::errorKindName(scpbridge::ErrorKind::Protocol)) ==
                "Protocol",
            "Protocol name");
    t.check(std::string(scpbridge::errorKindName(scpbridge::ErrorKind::Cancellation)) ==
                "Cancellation",
            "Cancellation name");
}

} // namespace

int main() {
    TestContext t;
    test_response_success_consumes_one_byte(t);
    test_response_warning_and_failure(t);
    test_response_non_protocol_line(t);
    test_response_truncated_stream(t);
    test_check_response(t);
    test_parse_file_infos(t);
    test_parse_file_infos_rejects(t);
    test_parse_file_time(t);
    test_file_infos_update_merges_times(t);
    test_parse_permissions(t);
    test_encoders(t);
    test_remote_base_name(t);
    test_shell_quote_and_commands(t);
    test_copy_n(t);
    test_istream_adapters(t);
    test_error_kind_names(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scpbridge_protocol_tests\n";
    return EXIT_SUCCESS;
}
