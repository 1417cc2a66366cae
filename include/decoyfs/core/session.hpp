/*
 * decoyfs - Protocol session
 *
 * Minimal protocol adapter: takes one client command line, maps the verb
 * through the alias table onto a jail operation and renders an FTP-style
 * reply. Uploads read their bytes from a local file named in the command.
 */
#ifndef decoyfs_CORE_SESSION_HPP
#define decoyfs_CORE_SESSION_HPP

#include <decoyfs/fs/jail.hpp>
#include <decoyfs/fs/commands.hpp>
#include <decoyfs/capture/capture.hpp>
#include <string>

namespace decoyfs {

// Reply code a client sees for a failed operation
int reply_code_for(const FsStatus& status);

class ProtocolSession {
public:
    // capture may be NULL, uploads are then refused
    ProtocolSession(ProtocolJail& jail, UploadCapture* capture);

    // "LIST /pub", "SITE CHMOD 644 readme.txt", ... Reply lines end in CRLF.
    std::string handle(const std::string& line);

    ProtocolJail& jail() { return jail_; }

private:
    std::string do_chdir(const std::string& args);
    std::string do_getcwd();
    std::string do_list(const std::string& args, bool names_only);
    std::string do_stat(const std::string& args);
    std::string do_size(const std::string& args);
    std::string do_getmtime(const std::string& args);
    std::string do_utime(const std::string& args);
    std::string do_chmod(const std::string& args);
    std::string do_upload(const std::string& args);

    std::string failure(const FsStatus& status, const std::string& subject) const;

    ProtocolJail& jail_;
    UploadCapture* capture_;
};

} // namespace decoyfs

#endif // decoyfs_CORE_SESSION_HPP
