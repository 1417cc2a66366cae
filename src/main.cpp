/*
 * decoyfs - chroot-jail filesystem for honeypot protocol emulators
 *
 * Usage:
 *   ./decoyfs [--config config.json]
 */
#include <decoyfs/core/application.hpp>

int main(int argc, char* argv[]) {
    decoyfs::Application& app = decoyfs::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        int rc = app.is_running() ? 1 : 0;
        app.shutdown();
        return rc;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
