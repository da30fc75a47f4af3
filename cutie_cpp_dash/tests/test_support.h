#ifndef CUTIE_TEST_SUPPORT_H
#define CUTIE_TEST_SUPPORT_H

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <stdlib.h>

#include "surface.h"

namespace cutie {
namespace testing_support {

// Scratch directory removed with everything below it on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "cutie-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data())) {
            path_ = buf.data();
        }
    }
    ~TempDir() {
        std::error_code ec;
        if (!path_.empty()) {
            std::filesystem::remove_all(path_, ec);
        }
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& rel) const { return path_ + rel; }

    // Creates parent directories as needed.
    void write(const std::string& rel, const std::string& content) const {
        const std::filesystem::path p(path_ + rel);
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(path_ + rel, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::string path_;
};

// Records draw calls instead of putting anything on a terminal.
class RecordingSurface : public Surface {
public:
    explicit RecordingSurface(Size size = {480, 320}) : size_(size) {}

    Size size() const override { return size_; }
    void begin(const Theme& theme) override {
        ++begins;
        last_theme = theme.name();
        texts.clear();
    }
    void text(Point, const std::string& s, Ink, bool) override { texts.push_back(s); }
    void frame(const Rect&, Ink, const std::string&) override { ++frames; }
    void fill_rect(const Rect&, Ink) override { ++fills; }
    void scanlines() override { ++scanline_passes; }
    void present() override { ++presents; }

    bool saw_text(const std::string& s) const {
        for (const auto& t : texts) {
            if (t == s) return true;
        }
        return false;
    }

    int begins = 0;
    int frames = 0;
    int fills = 0;
    int scanline_passes = 0;
    int presents = 0;
    std::string last_theme;
    std::vector<std::string> texts;

private:
    Size size_;
};

}  // namespace testing_support
}  // namespace cutie

#endif  // CUTIE_TEST_SUPPORT_H
