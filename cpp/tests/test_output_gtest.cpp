// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Префиксы сообщений Writer, ячейки таблиц, таблицы, вывод в файл,
// JSON через RapidJSON.
//
// ==============================================================================

#include "factguard/output.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace factguard::output::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/// Конфигурация Writer со stdout во временный файл (имя теста + PID)
struct FileWriter {
    std::filesystem::path path;
    OutputConfig config;

    FileWriter() {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = std::filesystem::temp_directory_path() /
               (std::string("factguard_output_") + test_info->name() + "_" +
                std::to_string(
#ifdef _WIN32
                    GetCurrentProcessId()
#else
                    getpid()
#endif
                        ) +
                ".txt");
        config.output_path = path;
    }

    ~FileWriter() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

// ==============================================================================
// Форматирование сообщений
// ==============================================================================

TEST(OutputTest, Writer_MessagePrefixes) {
    // Arrange
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);

    // Act: stderr под тестом не терминал, ANSI кодов нет
    testing::internal::CaptureStderr();
    writer.info("loaded");
    writer.warn("careful");
    writer.error("failed");
    writer.debug("cache");
    writer.trace("variable");
    std::string err = testing::internal::GetCapturedStderr();

    // Assert
    EXPECT_EQ(err, "[+] loaded\n[!] careful\n[x] failed\n[*] cache\n[~] variable\n");
}

TEST(OutputTest, FormatCell_CollapsesWhitespace) {
    EXPECT_EQ(format_cell("a\n\tb   c", 100), "a b c");
}

TEST(OutputTest, FormatCell_TruncatesWithEllipsis) {
    EXPECT_EQ(format_cell("abcdefghij", 6), "abc...");
    EXPECT_EQ(format_cell("abcdef", 6), "abcdef");
}

TEST(OutputTest, FormatCell_TruncationKeepsUtf8Intact) {
    // 5 кириллических символов, лимит 4: один символ + "..."
    std::string result = format_cell("\xd0\xb0\xd0\xb1\xd0\xb2\xd0\xb3\xd0\xb4", 4);
    EXPECT_EQ(result, "\xd0\xb0...");
}

TEST(OutputTest, DisplayWidth_CountsCodePoints) {
    EXPECT_EQ(display_width(""), 0u);
    EXPECT_EQ(display_width("abc"), 3u);
    EXPECT_EQ(display_width("\xd1\x84\xd0\xb0\xd0\xba\xd1\x82"), 4u);  // "факт"
}

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\033[31m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
}

// ==============================================================================
// Table
// ==============================================================================

TEST(OutputTest, Table_Empty_RendersNothing) {
    Table table;
    EXPECT_EQ(table.to_string(), "");
}

TEST(OutputTest, Table_RendersBoxDrawing) {
    // Arrange
    Table table;
    table.set_headers({"#", "result"});
    table.add_row({"1", "true"});

    // Act
    std::string rendered = table.to_string();

    // Assert
    std::string expected =
        "\xe2\x94\x8c\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\xac"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x90\n"
        "\xe2\x94\x82 # \xe2\x94\x82 result \xe2\x94\x82\n"
        "\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\xbc"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\xa4\n"
        "\xe2\x94\x82 1 \xe2\x94\x82 true   \xe2\x94\x82\n"
        "\xe2\x94\x94\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\xb4"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x98\n";
    EXPECT_EQ(rendered, expected);
}

TEST(OutputTest, Table_ShortRowPadded) {
    // Arrange
    Table table;
    table.set_headers({"a", "bbbbb"});
    table.add_row({"x"});

    // Act
    std::string rendered = table.to_string();

    // Assert
    EXPECT_NE(rendered.find("\xe2\x94\x82 x \xe2\x94\x82       \xe2\x94\x82\n"), std::string::npos);
    EXPECT_NE(rendered.find("\xe2\x94\x82 a \xe2\x94\x82 bbbbb \xe2\x94\x82\n"), std::string::npos);
}

// ==============================================================================
// Writer
// ==============================================================================

TEST(OutputTest, Writer_OutputFile_ReceivesStdoutWithoutColor) {
    FileWriter fw;
    {
        Writer writer(fw.config);
        ASSERT_TRUE(writer.has_output_file());
        writer.write_line(Stream::Stdout, "plain");
        writer.green_line("active");
        writer.info("goes to stderr");
    }

    EXPECT_EQ(read_all(fw.path), "plain\nactive\n");
}

TEST(OutputTest, Writer_JsonPrettyToFile) {
    // Arrange
    FileWriter fw;
    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("truthy", true, doc.GetAllocator());

    // Act
    {
        Writer writer(fw.config);
        writer.write_json_pretty(doc);
    }

    // Assert
    EXPECT_EQ(read_all(fw.path), "{\n    \"truthy\": true\n}\n");
}

TEST(OutputTest, Writer_TablePrintedToFile) {
    FileWriter fw;
    Table table;
    table.set_headers({"h"});
    table.add_row({"v"});
    {
        Writer writer(fw.config);
        table.print(writer);
    }
    EXPECT_EQ(read_all(fw.path), table.to_string());
}

TEST(OutputTest, Writer_UnwritableOutputPath_NoFile) {
    OutputConfig config;
    config.output_path = "/nonexistent/factguard/out.txt";
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
    EXPECT_FALSE(writer.open_output_file());
}

TEST(OutputTest, Writer_CloseOutputFile) {
    FileWriter fw;
    Writer writer(fw.config);
    writer.close_output_file();
    EXPECT_FALSE(writer.has_output_file());
}

TEST(OutputTest, Writer_QuietSuppressesInfoNotError) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.info("hidden");
    writer.warn("hidden");
    writer.debug("hidden");
    writer.error("shown");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err.find("hidden"), std::string::npos);
    EXPECT_NE(err.find("shown"), std::string::npos);
}

TEST(OutputTest, Writer_VerbosityLevels) {
    OutputConfig config;
    config.verbose = 1;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.debug("debug-line");
    writer.trace("trace-line");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("debug-line"), std::string::npos);
    EXPECT_EQ(err.find("trace-line"), std::string::npos);
}

}  // namespace factguard::output::test
