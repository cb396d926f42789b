#include "audio/clip_library.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace audio {

ClipLibrary::ClipLibrary(Config cfg, const LoggingConfig& log)
    : cfg_(std::move(cfg)), log_(log), rng_(std::random_device{}()) {
    std::lock_guard<std::mutex> lk(m_);
    clips_.push_back(make_fallback());
    fallback_ = true;
}

bool ClipLibrary::is_supported_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".mp3" || ext == ".wav" || ext == ".ogg";
}

Clip ClipLibrary::make_fallback() const {
    Clip c;
    c.name = "default tone";
    c.pcm = std::make_shared<const std::vector<std::int16_t>>(synthesize_tone(cfg_.tone));
    c.sample_rate = cfg_.tone.sample_rate;
    c.channels = cfg_.tone.channels;
    return c;
}

bool ClipLibrary::inspect(GstDiscoverer* discoverer, const std::string& path, std::string& why) const {
    GError* err = nullptr;
    gchar* uri = gst_filename_to_uri(path.c_str(), &err);
    if (!uri) {
        why = err ? err->message : "bad path";
        if (err) g_error_free(err);
        return false;
    }

    GstDiscovererInfo* info = gst_discoverer_discover_uri(discoverer, uri, &err);
    g_free(uri);

    bool ok = false;
    if (info && gst_discoverer_info_get_result(info) == GST_DISCOVERER_OK) {
        GList* streams = gst_discoverer_info_get_audio_streams(info);
        ok = streams != nullptr;
        gst_discoverer_stream_info_list_free(streams);
        if (!ok) why = "no audio stream";
    } else {
        why = err ? err->message : "cannot decode";
    }

    if (err) g_error_free(err);
    if (info) g_object_unref(info);
    return ok;
}

std::size_t ClipLibrary::load() {
    std::vector<Clip> found;
    std::error_code ec;
    const fs::path dir(cfg_.directory);

    if (!fs::is_directory(dir, ec)) {
        if (log_.audio_logger) {
            std::cerr << "[AUD] '" << cfg_.directory << "' not found, creating it; "
                      << "add mp3/wav/ogg files there" << std::endl;
        }
        fs::create_directories(dir, ec);
        if (ec && log_.audio_logger) {
            std::cerr << "[AUD] cannot create '" << cfg_.directory << "': " << ec.message() << std::endl;
        }
    } else {
        GError* err = nullptr;
        GstDiscoverer* discoverer = gst_discoverer_new(
                (GstClockTime)cfg_.discover_timeout_ms * GST_MSECOND, &err);
        if (!discoverer && log_.audio_logger) {
            std::cerr << "[AUD] cannot create discoverer: "
                      << (err ? err->message : "(null)") << std::endl;
        }
        if (err) g_error_free(err);

        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;

            const std::string path = it->path().string();
            if (!is_supported_extension(path)) continue;

            std::string why = "no discoverer";
            if (!discoverer || !inspect(discoverer, path, why)) {
                if (log_.audio_logger) {
                    std::cerr << "[AUD] failed to load " << it->path().filename().string()
                              << ": " << why << std::endl;
                }
                continue;
            }

            Clip c;
            c.name = it->path().filename().string();
            std::error_code abs_ec;
            c.path = fs::absolute(it->path(), abs_ec).string();
            if (abs_ec) c.path = path;
            found.push_back(std::move(c));
        }
        if (discoverer) g_object_unref(discoverer);

        std::sort(found.begin(), found.end(),
                  [](const Clip& a, const Clip& b) { return a.name < b.name; });
    }

    const bool fallback = found.empty();
    if (fallback) {
        found.push_back(make_fallback());
    }

    if (log_.audio_logger) {
        if (fallback) {
            std::cout << "[AUD] no sound files in '" << cfg_.directory << "', using default tone" << std::endl;
        } else {
            for (const auto& c : found) std::cout << "[AUD] loaded " << c.name << std::endl;
            std::cout << "[AUD] " << found.size() << " scare sound(s) loaded" << std::endl;
        }
    }

    std::lock_guard<std::mutex> lk(m_);
    clips_ = std::move(found);
    fallback_ = fallback;
    return clips_.size();
}

std::size_t ClipLibrary::size() const {
    std::lock_guard<std::mutex> lk(m_);
    return clips_.size();
}

bool ClipLibrary::using_fallback() const {
    std::lock_guard<std::mutex> lk(m_);
    return fallback_;
}

Clip ClipLibrary::pick() {
    std::lock_guard<std::mutex> lk(m_);
    std::uniform_int_distribution<std::size_t> dist(0, clips_.size() - 1);
    return clips_[dist(rng_)];
}

} // namespace audio
