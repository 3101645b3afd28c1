#include "map_window.h"

#include "slippymap/log.h"
#include "slippymap/settings.h"

#include <gtkmm.h>

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [flags]\n\n"
              << "Interactive slippy map viewer.\n\n"
              << "Flags:\n"
              << "  --settings <path>  Settings JSON (default: " << slippymap::settings_path() << ")\n"
              << "  --marks <path>     Mapmark JSON array to show\n"
              << "  -v, -vv            Verbose / debug output\n"
              << "  -h, --help         Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string settings_file;
    std::string marks_file;
    int verbosity = 0;

    // Own flags are handled before GTK so --help works without a display.
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help(argv[0]);
            return 0;
        }
        if (arg == "--settings" && i + 1 < argc) {
            settings_file = argv[++i];
        } else if (arg == "--marks" && i + 1 < argc) {
            marks_file = argv[++i];
        } else if (arg == "-v") {
            verbosity = std::max(verbosity, 1);
        } else if (arg == "-vv") {
            verbosity = 2;
        } else {
            std::cerr << "Error: unknown argument " << arg << "\n\n";
            print_help(argv[0]);
            return 1;
        }
    }

    const slippymap::Settings settings =
        settings_file.empty() ? slippymap::load_settings() : slippymap::load_settings(settings_file);
    slippymap::log::set_verbosity(std::max(verbosity, settings.log_verbosity));
    LOGI("[gui] settings:", settings_file.empty() ? slippymap::settings_path() : settings_file);

    if (!gtk_init_check()) {
        LOGE("[gui] Failed to initialize GTK display");
        return 1;
    }

    Glib::add_exception_handler([]() {
        try {
            throw;
        } catch (const std::exception& e) {
            LOGE("[gui] Unhandled exception in GTK callback:", e.what());
        } catch (...) {
            LOGE("[gui] Unhandled non-std exception in GTK callback");
        }
    });

    auto app = Gtk::Application::create("org.slippymap.viewer");

    std::unique_ptr<MapWindow> window;
    app->signal_activate().connect([&]() {
        if (!window) {
            try {
                window = std::make_unique<MapWindow>(settings, marks_file);
                app->add_window(*window);
            } catch (const std::exception& e) {
                LOGE("[gui] Exception creating MapWindow:", e.what());
                return;
            }
        }
        window->present();
    });

    // Own flags were consumed above, GTK only sees the program name.
    int exit_code = 1;
    try {
        exit_code = app->run(1, argv);
    } catch (const std::exception& e) {
        LOGE("[gui] Fatal exception in main loop:", e.what());
    }
    return exit_code;
}
