// ==============================================================================
// discovery.cpp - MOD-0005: Поиск файлов описаний и списков
// ==============================================================================
//
// MOD-0005 io::discovery
//
// ==============================================================================

#include "unifilter/discovery.hpp"

#include "unifilter/platform.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace unifilter::io {

namespace fs = std::filesystem;

namespace {

/// Расширение без точки в нижнем регистре ("" если нет)
std::string normalized_extension(const fs::path& p) {
    std::string ext = platform::path_to_utf8(p.extension());
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

class Walker {
public:
    explicit Walker(const DiscoveryOptions& opt) : opt_(opt) {}

    void add_input(const fs::path& input) {
        std::error_code ec;
        const fs::file_status st = fs::status(input, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            fail("cannot stat " + platform::path_to_utf8(input) + ": " + ec.message());
            return;
        }
        if (!fs::exists(st)) {
            fail("specified path does not exist - " + platform::path_to_utf8(input));
            return;
        }

        if (fs::is_directory(st)) {
            walk(input);
        } else if (fs::is_regular_file(st)) {
            found_.push_back(input);
        }
    }

    std::vector<fs::path> take() {
        std::sort(found_.begin(), found_.end());
        found_.erase(std::unique(found_.begin(), found_.end()), found_.end());
        return std::move(found_);
    }

private:
    void walk(const fs::path& dir) {
        const auto options = opt_.skip_errors ? fs::directory_options::skip_permission_denied
                                              : fs::directory_options::none;
        std::error_code ec;
        fs::recursive_directory_iterator it(dir, options, ec);
        const fs::recursive_directory_iterator end;

        while (!ec && it != end) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec)) {
                if (!opt_.recursive) {
                    it.disable_recursion_pending();
                }
            } else if (it->is_regular_file(entry_ec) && accepts(it->path())) {
                found_.push_back(it->path());
            }
            it.increment(ec);
        }

        if (ec) {
            fail("failed to read directory " + platform::path_to_utf8(dir) + ": " + ec.message());
        }
    }

    bool accepts(const fs::path& file) const {
        return !opt_.extensions || opt_.extensions->count(normalized_extension(file)) > 0;
    }

    void fail(const std::string& message) const {
        if (!opt_.skip_errors) {
            throw std::runtime_error(message);
        }
        if (opt_.on_warning) {
            opt_.on_warning(message);
        }
    }

    const DiscoveryOptions& opt_;
    std::vector<fs::path> found_;
};

}  // namespace

std::unordered_set<std::string> descriptor_extensions() {
    return {"yml", "yaml", "json"};
}

std::unordered_set<std::string> list_extensions() {
    return {"txt", "list"};
}

std::vector<fs::path> discover_files(const std::vector<fs::path>& inputs,
                                     const DiscoveryOptions& opt) {
    Walker walker(opt);
    for (const auto& input : inputs) {
        walker.add_input(input);
    }
    // Порядок обхода директорий зависит от ОС
    return walker.take();
}

}  // namespace unifilter::io
