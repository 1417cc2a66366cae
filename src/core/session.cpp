#include <decoyfs/core/session.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>
#include <decoyfs/fs/listing.hpp>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>

namespace decoyfs {

namespace {

std::string reply(int code, const std::string& text) {
    std::ostringstream oss;
    oss << code << ' ' << text << "\r\n";
    return oss.str();
}

// "verb rest of line" -> {"VERB", "rest of line"}
void split_command(const std::string& line, std::string& verb, std::string& args) {
    std::string trimmed = trim(line);
    size_t space = trimmed.find(' ');
    if (space == std::string::npos) {
        verb = to_upper(trimmed);
        args.clear();
        return;
    }
    verb = to_upper(trimmed.substr(0, space));
    args = trim(trimmed.substr(space + 1));
}

std::string format_mdtm(int64_t t) {
    time_t tt = static_cast<time_t>(t);
    struct tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &tm_buf);
    return std::string(buf);
}

bool parse_mdtm(const std::string& text, int64_t& out) {
    if (text.size() != 14) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') return false;
    }
    struct tm tm_buf = tm();
    tm_buf.tm_year = atoi(text.substr(0, 4).c_str()) - 1900;
    tm_buf.tm_mon = atoi(text.substr(4, 2).c_str()) - 1;
    tm_buf.tm_mday = atoi(text.substr(6, 2).c_str());
    tm_buf.tm_hour = atoi(text.substr(8, 2).c_str());
    tm_buf.tm_min = atoi(text.substr(10, 2).c_str());
    tm_buf.tm_sec = atoi(text.substr(12, 2).c_str());
    if (tm_buf.tm_mon < 0 || tm_buf.tm_mon > 11 || tm_buf.tm_mday < 1 || tm_buf.tm_mday > 31) {
        return false;
    }
    out = static_cast<int64_t>(timegm(&tm_buf));
    return true;
}

std::string base_name(const std::string& path) {
    size_t pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

int reply_code_for(const FsStatus& status) {
    switch (status.code) {
        case FsError::None: return 200;
        case FsError::AlreadyExists: return 553;
        case FsError::NotFound:
        case FsError::NotADirectory:
        case FsError::NotASymlink: return 550;
        case FsError::NotImplemented: return 502;
        case FsError::InvalidArgument: return 501;
        case FsError::IoError: return 451;
        default: return 550;
    }
}

ProtocolSession::ProtocolSession(ProtocolJail& jail, UploadCapture* capture)
    : jail_(jail)
    , capture_(capture)
{}

std::string ProtocolSession::failure(const FsStatus& status, const std::string& subject) const {
    int code = reply_code_for(status);
    switch (status.code) {
        case FsError::NotFound:
        case FsError::NotADirectory:
            return reply(code, subject + ": No such file or directory.");
        case FsError::AlreadyExists:
            return reply(code, subject + ": File exists.");
        case FsError::InvalidArgument:
            return reply(code, "Syntax error in parameters or arguments.");
        case FsError::NotImplemented:
            return reply(code, "Command not implemented.");
        default:
            return reply(code, subject + ": Requested action aborted. Local error in processing.");
    }
}

std::string ProtocolSession::handle(const std::string& line) {
    std::string verb, args;
    split_command(line, verb, args);
    if (verb.empty()) {
        return reply(500, "Syntax error, command unrecognized.");
    }

    // Two-word verbs ("SITE CHMOD 644 file")
    if (verb == "SITE") {
        std::string sub, rest;
        split_command(args, sub, rest);
        verb += " " + sub;
        args = rest;
    }

    JailOp op = lookup_command(jail_.protocol(), verb);
    LOG_DEBUG("[Session] %s: %s -> %s", jail_.protocol().c_str(), verb.c_str(), jail_op_name(op));

    switch (op) {
        case JailOp::Chdir: return do_chdir(args);
        case JailOp::ChdirUp: return do_chdir("..");
        case JailOp::Getcwd: return do_getcwd();
        case JailOp::List: return do_list(args, false);
        case JailOp::NameList: return do_list(args, true);
        case JailOp::Stat: return do_stat(args);
        case JailOp::Size: return do_size(args);
        case JailOp::Getmtime: return do_getmtime(args);
        case JailOp::Utime: return do_utime(args);
        case JailOp::Chmod: return do_chmod(args);
        case JailOp::Upload: return do_upload(args);
        default:
            return reply(500, "'" + verb + "': command not understood.");
    }
}

std::string ProtocolSession::do_chdir(const std::string& args) {
    FsStatus status = jail_.chdir(args);
    if (!status.is_ok()) return failure(status, args);
    return reply(250, "CWD command successful.");
}

std::string ProtocolSession::do_getcwd() {
    return reply(257, "\"" + jail_.getcwd() + "\" is the current directory.");
}

std::string ProtocolSession::do_list(const std::string& args, bool names_only) {
    std::string target = args;
    // Client-side ls flags are accepted and ignored
    if (starts_with(target, "-")) {
        size_t space = target.find(' ');
        target = space == std::string::npos ? "" : trim(target.substr(space + 1));
    }
    if (target.empty()) target = jail_.getcwd();

    std::string basedir = target;
    std::vector<std::string> names;
    FsStatus status = jail_.listdir(target, names);
    if (status.code == FsError::NotADirectory) {
        // A plain file lists as itself
        StatInfo st;
        FsStatus single = jail_.stat(target, st);
        if (!single.is_ok()) return failure(single, args);
        std::string resolved;
        if (!jail_.resolve(target, resolved)) {
            return failure(FsStatus::fail(FsError::NotFound, target), args);
        }
        basedir = parent_path(resolved);
        names.assign(1, base_name(resolved));
        status = FsStatus::ok();
    }
    if (!status.is_ok()) return failure(status, args);

    std::string body;
    if (names_only) {
        for (size_t i = 0; i < names.size(); ++i) {
            body += names[i] + "\r\n";
        }
    } else {
        DirListing listing = jail_.format_list(basedir, names);
        status = listing.read_all(body);
        if (!status.is_ok()) {
            LOG_WARN("[Session] %s: listing of %s failed: %s", jail_.protocol().c_str(),
                     basedir.c_str(), status.to_string().c_str());
            return failure(status, args);
        }
    }
    return reply(150, "Here comes the directory listing.") + body + reply(226, "Transfer complete.");
}

std::string ProtocolSession::do_stat(const std::string& args) {
    if (args.empty()) {
        return reply(211, "FTP server status: OK");
    }
    StatInfo st;
    FsStatus status = jail_.stat(args, st);
    if (!status.is_ok()) return failure(status, args);

    std::string resolved;
    if (!jail_.resolve(args, resolved)) {
        return failure(FsStatus::fail(FsError::NotFound, args), args);
    }
    std::vector<std::string> one(1, base_name(resolved));
    std::string body;
    DirListing listing = jail_.format_list(parent_path(resolved), one);
    status = listing.read_all(body);
    if (!status.is_ok()) return failure(status, args);

    return "213-Status of " + args + ":\r\n" + body + reply(213, "End of status");
}

std::string ProtocolSession::do_size(const std::string& args) {
    StatInfo st;
    FsStatus status = jail_.stat(args, st);
    if (!status.is_ok()) return failure(status, args);
    if (st.is_dir()) {
        return reply(550, args + ": not a regular file");
    }
    std::ostringstream oss;
    oss << st.size;
    return reply(213, oss.str());
}

std::string ProtocolSession::do_getmtime(const std::string& args) {
    int64_t mtime = 0;
    FsStatus status = jail_.getmtime(args, mtime);
    if (!status.is_ok()) return failure(status, args);
    return reply(213, format_mdtm(mtime));
}

std::string ProtocolSession::do_utime(const std::string& args) {
    std::string stamp, path;
    split_command(args, stamp, path);
    int64_t mtime = 0;
    if (path.empty() || !parse_mdtm(stamp, mtime)) {
        return failure(FsStatus::fail(FsError::InvalidArgument, args), args);
    }
    FsStatus status = jail_.utime(path, mtime, mtime);
    if (!status.is_ok()) return failure(status, path);
    return reply(213, "Modify=" + stamp + "; " + path);
}

std::string ProtocolSession::do_chmod(const std::string& args) {
    std::string mode_text, path;
    split_command(args, mode_text, path);
    char* end = NULL;
    long mode = strtol(mode_text.c_str(), &end, 8);
    if (path.empty() || mode_text.empty() || *end != '\0' || mode < 0 || mode > 07777) {
        return failure(FsStatus::fail(FsError::InvalidArgument, args), args);
    }
    FsStatus status = jail_.chmod(path, static_cast<uint32_t>(mode));
    if (!status.is_ok()) return failure(status, path);
    return reply(200, "SITE CHMOD command successful.");
}

std::string ProtocolSession::do_upload(const std::string& args) {
    if (!capture_ || !capture_->is_open()) {
        return reply(550, "Permission denied.");
    }
    // "<local source> [name the client sent]"
    std::string source, name;
    size_t space = args.find(' ');
    if (space == std::string::npos) {
        source = args;
        name = base_name(args);
    } else {
        source = args.substr(0, space);
        name = trim(args.substr(space + 1));
    }
    if (source.empty()) {
        return failure(FsStatus::fail(FsError::InvalidArgument, args), args);
    }

    std::ifstream in(source.c_str(), std::ios::binary);
    if (!in) {
        return reply(451, source + ": cannot read upload source.");
    }

    CaptureRecord record;
    FsStatus status = capture_->capture(jail_.protocol(), name, in, record);
    if (!status.is_ok()) {
        LOG_WARN("[Session] %s: upload of '%s' failed: %s", jail_.protocol().c_str(),
                 name.c_str(), status.to_string().c_str());
        return failure(status, name);
    }
    return reply(150, "Ok to send data.") + reply(226, "Transfer complete.");
}

} // namespace decoyfs
