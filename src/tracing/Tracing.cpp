#include "tracing/Tracing.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace SceneStitch {
namespace tracing {

struct Span::Impl {
    std::string name;
    std::chrono::steady_clock::time_point start;
    std::map<std::string, std::string> attrs;
    bool ended = false;
};

static std::mutex g_mutex;
static std::unique_ptr<std::ofstream> g_out;
static std::string g_outfile_path;

static std::string timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_buf;
#if defined(_WIN32)
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

void InitTracing(const std::string& outfile) {
    std::lock_guard<std::mutex> lk(g_mutex);
    std::filesystem::path new_path;
    if (!outfile.empty()) {
        new_path = outfile;
    } else {
        std::error_code ec;
        std::filesystem::path td = std::filesystem::temp_directory_path(ec);
        if (!ec) {
            new_path = td / "scenestitch-trace.log";
        } else {
            std::cerr << "Warning: unable to determine temp directory: " << ec.message() << ". Using current directory for trace file.\n";
            new_path = std::filesystem::path("scenestitch-trace.log");
        }
    }

    if (g_out) {
        if (g_outfile_path == new_path.string()) {
            return;
        }
        g_out->flush();
        g_out->close();
        g_out.reset();
        g_outfile_path.clear();
    }

    g_out = std::make_unique<std::ofstream>(new_path.string(), std::ios::app);
    if (!g_out->is_open()) {
        std::cerr << "Warning: could not open tracing file: " << new_path.string() << "\n";
        g_out.reset();
        return;
    }
    g_outfile_path = new_path.string();
}

void ShutdownTracing() {
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        g_out->flush();
        g_out->close();
        g_out.reset();
    }
    g_outfile_path.clear();
}

Span::Span(const char* name) : impl_(std::make_unique<Impl>()) {
    impl_->name = name ? name : "";
    impl_->start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        (*g_out) << timestamp() << " START " << impl_->name << " thread=" << std::this_thread::get_id() << "\n";
    }
}

Span::Span(const std::string& name) : Span(name.c_str()) {}

Span::~Span() {
    End();
}

void Span::addAttribute(const std::string& key, const std::string& value) {
    if (impl_ && !impl_->ended) {
        impl_->attrs[key] = value;
    }
}

void Span::End() {
    if (!impl_ || impl_->ended) return;
    impl_->ended = true;
    auto end = std::chrono::steady_clock::now();
    auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - impl_->start).count();
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        (*g_out) << timestamp() << " END " << impl_->name << " thread=" << std::this_thread::get_id() << " duration=" << dur << "ms";
        for (const auto& kv : impl_->attrs) {
            (*g_out) << " " << kv.first << "=" << kv.second;
        }
        (*g_out) << "\n";
    }
}

} // namespace tracing
} // namespace SceneStitch
