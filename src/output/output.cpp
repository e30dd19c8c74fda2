// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: пишем через fwrite, без std::endl.
//
// ==============================================================================

#include "duet/output.hpp"

#include "duet/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace duet::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    // stdout уходит в файл, если задан --output
    FILE* f = (s == Stream::Stdout && output_file_ != nullptr) ? output_file_ : get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, std::string_view message, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", message, Color::Green);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", message, Color::Yellow);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются даже при --quiet
    write_prefixed("[x] ", message, Color::Red);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", message, Color::Cyan);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", message, Color::Magenta);
}

void Writer::green_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Green);
    write(Stream::Stdout, "\n");
}

void Writer::yellow_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Yellow);
    write(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // В файл без ANSI кодов
    bool use_color = (s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                     (s == Stream::Stderr && supports_color(s));

    if (use_color) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    output_file_ = std::fopen(path_str.c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(const std::vector<size_t>& widths, const char* left,
                               const char* middle, const char* right) const {
    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        // padding (по пробелу с каждой стороны) + ширина содержимого
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<size_t>& widths,
                              const std::vector<std::string>& cells) const {
    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';
        std::string cell = (i < cells.size()) ? cells[i] : "";
        size_t width = display_width(cell);
        line += cell;
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    auto widths = column_widths();
    std::string result;

    result += format_line(widths, BOX_TL, BOX_TT, BOX_TR);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(widths, headers_);
        result += '\n';
        result += format_line(widths, BOX_LT, BOX_CROSS, BOX_RT);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(widths, row);
        result += '\n';
    }

    result += format_line(widths, BOX_BL, BOX_BT, BOX_BR);
    result += '\n';
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_cell(std::string_view field, size_t max_width) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (max_width > 3 && display_width(result) > max_width) {
        // Обрезаем по границе code point
        size_t keep = max_width - 3;
        size_t count = 0;
        size_t end = 0;
        for (; end < result.size(); ++end) {
            if ((static_cast<unsigned char>(result[end]) & 0xC0) != 0x80) {
                if (count == keep) {
                    break;
                }
                ++count;
            }
        }
        result = result.substr(0, end) + "...";
    }
    return result;
}

size_t display_width(std::string_view s) {
    size_t count = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace duet::output
