/*
 * decoyfs - Application Implementation
 */
#include <decoyfs/core/application.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>

namespace decoyfs {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - chroot-jail filesystem for protocol emulators\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -c, --config   Configuration file (default: config.json)\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Console commands: <protocol> <VERB> [args], e.g.\n"
              << "  ftp LIST /\n"
              << "  ftp STOR /path/to/local/file name-the-client-sent\n"
              << "  QUIT\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , config_file_("config.json")
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_ = false;
            return false;
        }
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (argv[i][0] != '-') {
            config_file_ = argv[i];
        }
    }
    return true;
}

void Application::load_config() {
    if (!config_.load_file(config_file_)) {
        LOG_WARN("Config '%s' not loaded (%s), using defaults",
                 config_file_.c_str(), config_.last_error().c_str());
    } else {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

bool Application::setup_jails() {
    std::string root_dir = expand_home(config_.get_string("jail.root_dir", ""));
    bool keep = config_.get_bool("jail.keep_on_exit", false);
    if (!jail_root_.open(root_dir, keep)) {
        LOG_ERROR("Failed to open jail root: %s", jail_root_.last_error().c_str());
        return false;
    }

    std::vector<std::string> protocols = config_.keys("protocols");
    if (protocols.empty()) {
        LOG_WARN("No protocols configured; nothing to serve");
    }

    for (size_t i = 0; i < protocols.size(); ++i) {
        const std::string& name = protocols[i];
        std::string source = expand_home(config_.get_string("protocols." + name + ".source_dir", ""));
        if (source.empty()) {
            LOG_ERROR("protocols.%s.source_dir is not set", name.c_str());
            return false;
        }

        std::unique_ptr<ProtocolJail> jail(new ProtocolJail(jail_root_));
        FsStatus status = jail->initialize(name, source);
        if (!status.is_ok()) {
            LOG_ERROR("Cannot set up jail for %s: %s", name.c_str(), status.to_string().c_str());
            return false;
        }
        sessions_[name].reset(new ProtocolSession(*jail, &capture_));
        jails_[name] = std::move(jail);
    }

    LOG_INFO("Jails ready: %zu protocol(s)", jails_.size());
    return true;
}

bool Application::setup_capture() {
    CaptureConfig cc;
    cc.data_dir = expand_home(config_.get_string("capture.data_dir", "~/.decoyfs/uploads"));
    cc.catalog_path = expand_home(config_.get_string("capture.catalog_path", "~/.decoyfs/db/captures.db"));
    int64_t chunk = config_.get_int("capture.chunk_size", 8192);
    cc.chunk_size = chunk > 0 ? static_cast<size_t>(chunk) : 8192;

    if (!capture_.open(cc)) {
        LOG_ERROR("Failed to open capture store: %s", capture_.last_error().c_str());
        return false;
    }
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    load_config();
    setup_logging();

    LOG_INFO("Starting %s v%s", AppInfo::NAME, AppInfo::VERSION);

    if (!setup_capture() || !setup_jails()) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    return true;
}

ProtocolJail* Application::jail(const std::string& protocol) {
    std::map<std::string, std::unique_ptr<ProtocolJail> >::iterator it = jails_.find(protocol);
    return it == jails_.end() ? nullptr : it->second.get();
}

int Application::run() {
    return run(std::cin, std::cout);
}

int Application::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (running_ && std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;
        if (to_upper(line) == "QUIT") break;

        size_t space = line.find(' ');
        std::string protocol = to_lower(line.substr(0, space));
        std::map<std::string, std::unique_ptr<ProtocolSession> >::iterator it = sessions_.find(protocol);
        if (it == sessions_.end() || space == std::string::npos) {
            out << "500 Unknown protocol or missing command.\r\n" << std::flush;
            continue;
        }
        out << it->second->handle(line.substr(space + 1)) << std::flush;
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");
    sessions_.clear();
    jails_.clear();
    jail_root_.close();
    capture_.close();
    LOG_INFO("Shutdown complete");
}

} // namespace decoyfs
