// ==============================================================================
// factguard/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (ядро в терминал не пишет)
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Таблицы (Unicode box-drawing) и JSON (RapidJSON)
// - Цветной вывод на TTY, вывод в файл (--output)
//
// ==============================================================================

#ifndef FACTGUARD_OUTPUT_HPP
#define FACTGUARD_OUTPUT_HPP

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace factguard::output {

enum class Stream { Stdout, Stderr };

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

struct OutputConfig {
    bool quiet = false;           // -q: подавить informational stderr
    int verbose = 0;              // -v: уровень подробности (0..2+)

    std::optional<std::filesystem::path> output_path;  // --output
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" при verbose >= 1
    void debug(std::string_view message);

    /// "[~] <message>" при verbose >= 2
    void trace(std::string_view message);

    void green_line(std::string_view message);
    void yellow_line(std::string_view message);
    void red_line(std::string_view message);

    /// JSON документ с отступами + перевод строки в stdout
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл вывода (output_path). false если не удалось
    bool open_output_file();
    void close_output_file();
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* target(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    void print(Writer& w) const;
    std::string to_string() const;

private:
    enum class Edge { Top, Middle, Bottom };

    std::vector<std::size_t> widths() const;
    std::string border(Edge edge, const std::vector<std::size_t>& widths) const;
    std::string row(const std::vector<std::string>& cells,
                    const std::vector<std::size_t>& widths) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Поле для ячейки таблицы: переводы строк и табы -> пробел, повторные
/// пробелы схлопываются, длиннее limit - обрезка с "..."
std::string format_cell(std::string_view field, std::size_t limit);

/// Ширина строки в символах (UTF-8 code points)
std::size_t display_width(std::string_view text);

std::string ansi_color_code(Color color);

bool supports_color(Stream s);

}  // namespace factguard::output

#endif  // FACTGUARD_OUTPUT_HPP
