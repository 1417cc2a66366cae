/*
 * decoyfs - Protocol command aliases and listing lookup tables
 *
 * Protocol adapters never reach the jail by name lookup; every verb a
 * protocol accepts is mapped onto the closed JailOp set here.
 */
#ifndef decoyfs_FS_COMMANDS_HPP
#define decoyfs_FS_COMMANDS_HPP

#include <string>
#include <vector>

namespace decoyfs {

enum class JailOp {
    Unknown = 0,
    Chdir,
    ChdirUp,
    Getcwd,
    List,
    NameList,
    Stat,
    Size,
    Getmtime,
    Utime,
    Chmod,
    Upload
};

const char* jail_op_name(JailOp op);

// Case-insensitive. Multi-word verbs ("SITE CHMOD") are matched whole.
JailOp lookup_command(const std::string& protocol, const std::string& verb);

// Verbs registered for a protocol, in table order
std::vector<std::string> protocol_commands(const std::string& protocol);

// 1 -> "Jan" ... 12 -> "Dec"; NULL outside that range
const char* month_abbrev(int month);

} // namespace decoyfs

#endif // decoyfs_FS_COMMANDS_HPP
