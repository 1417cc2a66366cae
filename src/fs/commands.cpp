#include <decoyfs/fs/commands.hpp>
#include <decoyfs/core/utils.hpp>


namespace decoyfs {

namespace {

struct CommandAlias {
    const char* protocol;
    const char* verb;
    JailOp op;
};

static const CommandAlias command_aliases[] = {
    {"ftp", "CWD",        JailOp::Chdir},
    {"ftp", "XCWD",       JailOp::Chdir},
    {"ftp", "CDUP",       JailOp::ChdirUp},
    {"ftp", "XCUP",       JailOp::ChdirUp},
    {"ftp", "PWD",        JailOp::Getcwd},
    {"ftp", "XPWD",       JailOp::Getcwd},
    {"ftp", "LIST",       JailOp::List},
    {"ftp", "NLST",       JailOp::NameList},
    {"ftp", "STAT",       JailOp::Stat},
    {"ftp", "SIZE",       JailOp::Size},
    {"ftp", "MDTM",       JailOp::Getmtime},
    {"ftp", "MFMT",       JailOp::Utime},
    {"ftp", "SITE CHMOD", JailOp::Chmod},
    {"ftp", "CHMOD",      JailOp::Chmod},
    {"ftp", "STOR",       JailOp::Upload},
    {"ftp", "STOU",       JailOp::Upload},
    {"tftp", "WRQ",       JailOp::Upload},
    {"tftp", "RRQ",       JailOp::Stat},
    {NULL, NULL, JailOp::Unknown}
};

static const char* const months[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

} // namespace

const char* jail_op_name(JailOp op) {
    switch (op) {
        case JailOp::Chdir: return "chdir";
        case JailOp::ChdirUp: return "chdir_up";
        case JailOp::Getcwd: return "getcwd";
        case JailOp::List: return "list";
        case JailOp::NameList: return "name_list";
        case JailOp::Stat: return "stat";
        case JailOp::Size: return "size";
        case JailOp::Getmtime: return "getmtime";
        case JailOp::Utime: return "utime";
        case JailOp::Chmod: return "chmod";
        case JailOp::Upload: return "upload";
        default: return "unknown";
    }
}

JailOp lookup_command(const std::string& protocol, const std::string& verb) {
    std::string proto = to_lower(protocol);
    std::string upper = to_upper(trim(verb));
    for (int i = 0; command_aliases[i].protocol != NULL; ++i) {
        if (proto == command_aliases[i].protocol && upper == command_aliases[i].verb) {
            return command_aliases[i].op;
        }
    }
    return JailOp::Unknown;
}

std::vector<std::string> protocol_commands(const std::string& protocol) {
    std::vector<std::string> verbs;
    std::string proto = to_lower(protocol);
    for (int i = 0; command_aliases[i].protocol != NULL; ++i) {
        if (proto == command_aliases[i].protocol) {
            verbs.push_back(command_aliases[i].verb);
        }
    }
    return verbs;
}

const char* month_abbrev(int month) {
    if (month < 1 || month > 12) return NULL;
    return months[month - 1];
}

} // namespace decoyfs
