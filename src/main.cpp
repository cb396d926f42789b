#include <gst/gst.h>
#include <opencv2/highgui.hpp>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "app_config.h"
#include "audio/clip_library.h"
#include "audio/gst_audio_player.h"
#include "core/scare_system.h"
#include "detect/detection_config.h"
#include "ui/display_loop.h"
#include "video/gst_frame_source.h"


std::atomic<bool> g_running{true};


int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    if (!std::getenv("DISPLAY")) {
        setenv("DISPLAY", ":0", 0);
    }

    gst_init(&argc, &argv);

    // usage: scarecam [config.toml] [stream-url]
    const std::string config_path = argc > 1 ? argv[1] : "config.toml";

    AppConfig app;
    detect::DetectionConfig tunables;
    load_app_config_file(config_path, app, tunables);
    if (argc > 2) {
        app.stream.url = argv[2];
    }

    std::cout << "[MAIN] Halloween scare system" << std::endl;
    std::cout << "[MAIN] stream: " << app.stream.url << std::endl;

    auto clips = std::make_shared<audio::ClipLibrary>(app.clips, app.logging);
    clips->load();
    auto player = std::make_shared<audio::GstAudioPlayer>(clips, app.player, app.logging);
    std::cout << "[MAIN] " << player->clip_count() << " scare sound(s) ready" << std::endl;

    video::GstFrameSource source(app.stream, app.logging);
    core::ScareSystem system(source, tunables, player, app.system, app.logging);

    if (!system.connect()) {
        std::cerr << "[MAIN] cannot open stream " << app.stream.url << std::endl;
        return 1;
    }
    system.start();
    std::cout << "[MAIN] monitoring for motion..." << std::endl;

    ui::DisplayLoop::Actions actions;
    actions.toggle_pause = [&system]() { return system.toggle_pause(); };
    actions.test_sound = [&system]() { return system.test_trigger(); };
    actions.reload_sounds = [&player]() { return player->reload(); };
    actions.toggle_monitoring = [&system]() {
        if (system.running()) {
            system.stop();
            return false;
        }
        // Fresh session: reconnect once on request, no automatic retry.
        return system.connect() && system.start();
    };
    actions.poll_stats = [&system]() { return system.stats(); };

    ui::DisplayLoop display_loop(system.results(), tunables, actions, app.display, app.logging);
    display_loop.run(g_running);   // the only UI loop

    // Loop finished: stop processing, release the stream, wake any waiter.
    system.stop();
    system.results().stop();
    cv::destroyAllWindows();

    std::cout << "[MAIN] system stopped, " << system.stats().detection_count
              << " detection(s)" << std::endl;
    return 0;
}
