// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты пишутся через fwrite,
// без std::endl.
//
// ==============================================================================

#include <factguard/output.hpp>
#include <factguard/platform.hpp>

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace factguard::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

/// Отрезать не более max_chars символов, не разрывая UTF-8 последовательность
std::size_t utf8_prefix_bytes(std::string_view text, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) {
            if (chars == max_chars) {
                return i;
            }
            ++chars;
        }
    }
    return text.size();
}

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
    std::fwrite(bytes.data(), 1, bytes.size(), target(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::target(Stream s) const {
    // stdout перенаправляется в файл при --output
    if (s == Stream::Stdout) {
        return output_file_ != nullptr ? output_file_ : stdout;
    }
    return stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    write_colored(Stream::Stderr, prefix, color);
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются даже при --quiet
    write_prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose < 1) {
        return;
    }
    write_prefixed("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose < 2) {
        return;
    }
    write_prefixed("[~]", Color::Magenta, message);
}

void Writer::green_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Green);
    write(Stream::Stdout, "\n");
}

void Writer::yellow_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Yellow);
    write(Stream::Stdout, "\n");
}

void Writer::red_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Red);
    write(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // В файл - без ANSI кодов
    bool use_color = supports_color(s) && !(s == Stream::Stdout && output_file_ != nullptr);

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
    close_output_file();

    const auto& path = config_.output_path.value();
#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
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

std::vector<std::size_t> Table::widths() const {
    std::size_t columns = headers_.size();
    for (const auto& r : rows_) {
        columns = std::max(columns, r.size());
    }

    std::vector<std::size_t> result(columns, 0);

    auto widen = [&result](const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            result[i] = std::max(result[i], display_width(cells[i]));
        }
    };
    widen(headers_);
    for (const auto& r : rows_) {
        widen(r);
    }
    return result;
}

std::string Table::border(Edge edge, const std::vector<std::size_t>& widths) const {
    const char* left = edge == Edge::Top ? BOX_TL : edge == Edge::Middle ? BOX_LT : BOX_BL;
    const char* middle = edge == Edge::Top ? BOX_TT : edge == Edge::Middle ? BOX_CROSS : BOX_BT;
    const char* right = edge == Edge::Top ? BOX_TR : edge == Edge::Middle ? BOX_RT : BOX_BR;

    std::string line = left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < widths.size()) ? middle : right;
    }
    line += '\n';
    return line;
}

std::string Table::row(const std::vector<std::string>& cells,
                       const std::vector<std::size_t>& widths) const {
    std::string line = BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        std::string_view cell = i < cells.size() ? std::string_view(cells[i]) : "";
        line += ' ';
        line.append(cell);
        line.append(widths[i] - display_width(cell), ' ');
        line += ' ';
        line += BOX_V;
    }
    line += '\n';
    return line;
}

std::string Table::to_string() const {
    std::vector<std::size_t> w = widths();
    if (w.empty()) {
        return "";
    }

    std::string result = border(Edge::Top, w);
    if (!headers_.empty()) {
        result += row(headers_, w);
        result += border(Edge::Middle, w);
    }
    for (const auto& r : rows_) {
        result += row(r, w);
    }
    result += border(Edge::Bottom, w);
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_cell(std::string_view field, std::size_t limit) {
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

    if (limit > 3 && display_width(result) > limit) {
        result.resize(utf8_prefix_bytes(result, limit - 3));
        result += "...";
    }
    return result;
}

std::size_t display_width(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
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
        break;
    }
    return "";
}

bool supports_color(Stream s) {
    return platform::is_terminal(s == Stream::Stdout ? stdout : stderr);
}

}  // namespace factguard::output
