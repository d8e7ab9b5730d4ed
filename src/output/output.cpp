// ==============================================================================
// output.cpp - MOD-0003: Пользовательский вывод и журнал
// ==============================================================================
//
// MOD-0003 output
// Только этот модуль пишет в stdout/stderr; байты первичны, без std::endl.
//
// ==============================================================================

#include "unifilter/output.hpp"

#include "unifilter/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace unifilter::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";

const char* level_color(Level level) {
    switch (level) {
    case Level::Error:
        return "\x1b[31m";
    case Level::Warn:
        return "\x1b[33m";
    case Level::Info:
        return "\x1b[32m";
    case Level::Debug:
        return "\x1b[36m";
    case Level::Trace:
        return "\x1b[35m";
    }
    return "";
}

std::FILE* stream_file(Stream s) {
    return s == Stream::Stdout ? stdout : stderr;
}

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";  // │
constexpr const char* BOX_H = "\xe2\x94\x80";  // ─

struct Border {
    const char* left;
    const char* middle;
    const char* right;
};

constexpr Border TOP = {"\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"};     // ┌ ┬ ┐
constexpr Border HEADER = {"\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"};  // ├ ┼ ┤
constexpr Border BOTTOM = {"\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"};  // └ ┴ ┘

// Ширина в символах терминала: байты продолжения UTF-8 не считаются
std::size_t display_width(std::string_view s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    finish_progress_line();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    if (s == Stream::Stderr) {
        finish_progress_line();
    }
    std::fwrite(bytes.data(), 1, bytes.size(), stream_file(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Error:
        return true;
    case Level::Warn:
    case Level::Info:
        return !config_.quiet;
    case Level::Debug:
        return config_.verbose >= 1;
    case Level::Trace:
        return config_.verbose >= 2;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    std::string line;
    if (supports_color(Stream::Stderr)) {
        line += level_color(level);
        line += level_prefix(level);
        line += ANSI_RESET;
    } else {
        line += level_prefix(level);
    }
    line += ' ';
    line += message;
    line += '\n';
    write(Stream::Stderr, line);
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    std::string line(buffer.GetString(), buffer.GetSize());
    line += '\n';
    write(Stream::Stdout, line);
}

// ----------------------------------------------------------------------------
// Прогресс
// ----------------------------------------------------------------------------

void Writer::progress_begin(std::string_view label, std::size_t total) {
    finish_progress_line();
    progress_label_ = std::string(label);
    progress_total_ = total;
    progress_current_ = 0;
    progress_active_ = true;
}

void Writer::progress_tick(std::size_t current) {
    if (!progress_active_) {
        return;
    }
    progress_current_ = current;
    if (!enabled(Level::Info)) {
        return;
    }

    const std::size_t pct = progress_total_ == 0 ? 100 : current * 100 / progress_total_;
    std::string text = progress_label_ + ": " + std::to_string(current) + "/" +
                       std::to_string(progress_total_) + " (" + std::to_string(pct) + "%)";

    if (supports_color(Stream::Stderr)) {
        // TTY: перерисовать строку на месте
        std::string line = "\r";
        line += level_color(Level::Info);
        line += level_prefix(Level::Info);
        line += ANSI_RESET;
        line += ' ';
        line += text;
        std::fwrite(line.data(), 1, line.size(), stderr);
        std::fflush(stderr);
        progress_inline_ = true;
    } else {
        info(text);
    }
}

void Writer::progress_end() {
    if (!progress_active_) {
        return;
    }
    finish_progress_line();
    progress_active_ = false;
    progress_label_.clear();
    flush();
}

void Writer::finish_progress_line() {
    if (progress_inline_) {
        progress_inline_ = false;
        std::fputc('\n', stderr);
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(std::vector<std::string> headers) {
    headers_ = std::move(headers);
}

void Table::add_row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

void Table::set_align(std::size_t column, Align align) {
    if (column >= align_.size()) {
        align_.resize(column + 1, Align::Left);
    }
    align_[column] = align;
}

std::string Table::to_string() const {
    std::vector<std::size_t> widths(headers_.size(), 0);
    auto measure = [&widths](const std::vector<std::string>& cells) {
        if (cells.size() > widths.size()) {
            widths.resize(cells.size(), 0);
        }
        for (std::size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    measure(headers_);
    for (const auto& row : rows_) {
        measure(row);
    }

    auto border = [&widths](const Border& b) {
        std::string line = b.left;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            if (i > 0) {
                line += b.middle;
            }
            for (std::size_t j = 0; j < widths[i] + 2; ++j) {
                line += BOX_H;
            }
        }
        line += b.right;
        line += '\n';
        return line;
    };

    auto row_line = [&](const std::vector<std::string>& cells) {
        std::string line = BOX_V;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            const std::string empty;
            const std::string& cell = i < cells.size() ? cells[i] : empty;
            const std::size_t pad = widths[i] - display_width(cell);
            const bool right = i < align_.size() && align_[i] == Align::Right;

            line += ' ';
            if (right) {
                line.append(pad, ' ');
            }
            line += cell;
            if (!right) {
                line.append(pad, ' ');
            }
            line += ' ';
            line += BOX_V;
        }
        line += '\n';
        return line;
    };

    std::string out = border(TOP);
    if (!headers_.empty()) {
        out += row_line(headers_);
        out += border(HEADER);
    }
    for (const auto& row : rows_) {
        out += row_line(row);
    }
    out += border(BOTTOM);
    return out;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string_view level_prefix(Level level) {
    switch (level) {
    case Level::Error:
        return "[x]";
    case Level::Warn:
        return "[!]";
    case Level::Info:
        return "[+]";
    case Level::Debug:
        return "[*]";
    case Level::Trace:
        return "[~]";
    }
    return "[?]";
}

std::string format_message(Level level, std::string_view message) {
    std::string out(level_prefix(level));
    out += ' ';
    out += message;
    out += '\n';
    return out;
}

std::string format_field_length(std::string_view field, std::size_t max_length,
                                bool full_output) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        const bool space = c == '\n' || c == '\r' || c == '\t' || c == ' ';
        if (space && prev_space) {
            continue;
        }
        result += space ? ' ' : c;
        prev_space = space;
    }

    if (!full_output && max_length > 3 && result.size() > max_length) {
        result.resize(max_length - 3);
        result += "...";
    }
    return result;
}

bool supports_color(Stream s) {
    return s == Stream::Stdout ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace unifilter::output
