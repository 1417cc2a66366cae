/*
 * decoyfs - Application
 *
 * Process lifecycle: config, logging, jail root, one mirrored jail per
 * configured protocol, capture store, console session, teardown.
 */
#ifndef decoyfs_CORE_APPLICATION_HPP
#define decoyfs_CORE_APPLICATION_HPP

#include <decoyfs/core/config.hpp>
#include <decoyfs/core/session.hpp>
#include <decoyfs/fs/jail.hpp>
#include <decoyfs/capture/capture.hpp>

#include <atomic>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>

namespace decoyfs {

struct AppInfo {
    static constexpr const char* NAME = "decoyfs";
    static constexpr const char* VERSION = "0.4.1";
};

class Application {
public:
    static Application& instance();

    // False for --help/--version (is_running() stays true only on errors)
    bool init(int argc, char* argv[]);

    // Console protocol adapter: "<protocol> <VERB> [args]" per line
    int run();
    int run(std::istream& in, std::ostream& out);

    void stop() { running_ = false; }
    bool is_running() const { return running_; }
    void shutdown();

    ProtocolJail* jail(const std::string& protocol);
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void load_config();
    void setup_logging();
    bool setup_jails();
    bool setup_capture();

    std::atomic<bool> running_;
    std::string config_file_;
    Config config_;
    JailRoot jail_root_;
    UploadCapture capture_;
    std::map<std::string, std::unique_ptr<ProtocolJail> > jails_;
    std::map<std::string, std::unique_ptr<ProtocolSession> > sessions_;
};

} // namespace decoyfs

#endif // decoyfs_CORE_APPLICATION_HPP
