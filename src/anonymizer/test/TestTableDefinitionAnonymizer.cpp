#include "TableDefinitionAnonymizer.hpp"
#include "AnonymizerError.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

namespace {

const fs::path test_dir = "anonymizer_test";

void reset_dir() {
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
}

std::string path_of(const std::string& name) {
    return (test_dir / name).string();
}

void write_file(const std::string& path, const std::string& data) {
    std::ofstream ofs(path, std::ios::binary);
    ofs << data;
}

std::string read_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

AnonymizerConfig make_config(const std::string& input, const std::string& output) {
    AnonymizerConfig config;
    config.input_file = path_of(input);
    config.output_file = path_of(output);
    return config;
}

}

void test_default_run() {
    reset_dir();
    write_file(path_of("in.sql"),
               "CREATE TABLE Customers (customer_id INT, customer_name VARCHAR(255));");

    TableDefinitionAnonymizer anonymizer(make_config("in.sql", "out.sql"));
    size_t replaced = anonymizer.run();

    assert(replaced == 2);
    assert(read_file(path_of("out.sql")) ==
           "CREATE TABLE Customers (column_1 INT, column_2 VARCHAR(255));");
    std::cout << "test_default_run passed.\n";
}

void test_no_match_output_identical() {
    reset_dir();
    write_file(path_of("in.sql"), "SELECT 1;\n");

    TableDefinitionAnonymizer anonymizer(make_config("in.sql", "out.sql"));
    assert(anonymizer.run() == 0);
    assert(read_file(path_of("out.sql")) == "SELECT 1;\n");
    std::cout << "test_no_match_output_identical passed.\n";
}

void test_custom_prefix_and_pattern() {
    reset_dir();
    write_file(path_of("in.sql"), "CREATE TABLE p (ssn CHAR(11), credit_card CHAR(16), note TEXT);");

    auto config = make_config("in.sql", "out.sql");
    config.column_name_pattern = "ssn|credit_card";
    config.column_prefix = "field_";
    TableDefinitionAnonymizer anonymizer(config);
    assert(anonymizer.run() == 2);
    assert(read_file(path_of("out.sql")) == "CREATE TABLE p (field_1 CHAR(11), field_2 CHAR(16), note TEXT);");
    std::cout << "test_custom_prefix_and_pattern passed.\n";
}

void test_line_endings_preserved() {
    reset_dir();
    write_file(path_of("in.sql"), "CREATE TABLE t (\r\n  a_id INT,\r\n  b_name TEXT\r\n);\r\n");

    TableDefinitionAnonymizer anonymizer(make_config("in.sql", "out.sql"));
    anonymizer.run();
    assert(read_file(path_of("out.sql")) == "CREATE TABLE t (\r\n  column_1 INT,\r\n  column_2 TEXT\r\n);\r\n");
    std::cout << "test_line_endings_preserved passed.\n";
}

void test_missing_input_file() {
    reset_dir();
    TableDefinitionAnonymizer anonymizer(make_config("missing.sql", "out.sql"));
    bool caught = false;
    try {
        anonymizer.run();
    } catch (const NotFoundError& e) {
        assert(e.path() == path_of("missing.sql"));
        caught = true;
    }
    assert(caught);
    assert(!fs::exists(path_of("out.sql")));
    std::cout << "test_missing_input_file passed.\n";
}

void test_invalid_pattern_writes_nothing() {
    reset_dir();
    write_file(path_of("in.sql"), "CREATE TABLE t (a_id INT);");
    write_file(path_of("existing.sql"), "previous content");

    auto config = make_config("in.sql", "out.sql");
    config.column_name_pattern = "([a-z";
    bool caught = false;
    try {
        TableDefinitionAnonymizer(config).run();
    } catch (const PatternError& e) {
        assert(e.pattern() == "([a-z");
        caught = true;
    }
    assert(caught);
    assert(!fs::exists(path_of("out.sql")));

    config.output_file = path_of("existing.sql");
    caught = false;
    try {
        TableDefinitionAnonymizer(config).run();
    } catch (const PatternError&) {
        caught = true;
    }
    assert(caught);
    assert(read_file(path_of("existing.sql")) == "previous content");
    std::cout << "test_invalid_pattern_writes_nothing passed.\n";
}

void test_missing_paths() {
    AnonymizerConfig config;
    config.input_file = "in.sql";
    bool caught = false;
    try {
        TableDefinitionAnonymizer(config).run();
    } catch (const ConfigError& e) {
        assert(std::string(e.what()) == "Input and output file paths must be specified.");
        caught = true;
    }
    assert(caught);
    std::cout << "test_missing_paths passed.\n";
}

void test_auto_encoding_matches_utf8() {
    reset_dir();
    const std::string input =
        "CREATE TABLE Customers (\n"
        "    customer_id INT PRIMARY KEY,\n"
        "    customer_name VARCHAR(255),\n"
        "    customer_phone VARCHAR(20)\n"
        ");\n";
    write_file(path_of("in.sql"), input);

    auto explicit_config = make_config("in.sql", "explicit.sql");
    TableDefinitionAnonymizer(explicit_config).run();

    auto auto_config = make_config("in.sql", "auto.sql");
    auto_config.encoding = "auto";
    TableDefinitionAnonymizer auto_anonymizer(auto_config);
    assert(!auto_anonymizer.resolve_encoding(input).empty());
    auto_anonymizer.run();

    assert(read_file(path_of("auto.sql")) == read_file(path_of("explicit.sql")));
    std::cout << "test_auto_encoding_matches_utf8 passed.\n";
}

void test_auto_encoding_empty_file_fails() {
    reset_dir();
    write_file(path_of("empty.sql"), "");

    auto config = make_config("empty.sql", "out.sql");
    config.encoding = "AUTO";
    bool caught = false;
    try {
        TableDefinitionAnonymizer(config).run();
    } catch (const ConfigError& e) {
        assert(std::string(e.what()) == "Unable to automatically detect file encoding.");
        caught = true;
    }
    assert(caught);
    assert(!fs::exists(path_of("out.sql")));
    std::cout << "test_auto_encoding_empty_file_fails passed.\n";
}

void test_explicit_encoding_used_as_is() {
    AnonymizerConfig config;
    config.encoding = "latin-1";
    TableDefinitionAnonymizer anonymizer(config);
    assert(anonymizer.resolve_encoding("anything") == "latin-1");
    std::cout << "test_explicit_encoding_used_as_is passed.\n";
}

void test_latin1_round_trip() {
    reset_dir();
    write_file(path_of("in.sql"), "CREATE TABLE caf\xE9 (caf\xE9_name TEXT, \xC9TAT_ID INT); -- r\xE9sum\xE9");

    auto config = make_config("in.sql", "out.sql");
    config.encoding = "latin-1";
    TableDefinitionAnonymizer(config).run();
    assert(read_file(path_of("out.sql")) == "CREATE TABLE caf\xE9 (column_1 TEXT, column_2 INT); -- r\xE9sum\xE9");
    std::cout << "test_latin1_round_trip passed.\n";
}

void test_undecodable_bytes_replaced() {
    reset_dir();
    write_file(path_of("in.sql"), "a_id \xFF INT");

    TableDefinitionAnonymizer(make_config("in.sql", "out.sql")).run();
    assert(read_file(path_of("out.sql")) == "column_1 \xEF\xBF\xBD INT");
    std::cout << "test_undecodable_bytes_replaced passed.\n";
}

void test_unknown_encoding_is_unexpected_error() {
    reset_dir();
    write_file(path_of("in.sql"), "a_id INT");

    auto config = make_config("in.sql", "out.sql");
    config.encoding = "klingon-8";
    bool caught = false;
    try {
        TableDefinitionAnonymizer(config).run();
    } catch (const AnonymizerError&) {
        assert(false && "unknown encoding must not be a categorized error");
    } catch (const std::exception&) {
        caught = true;
    }
    assert(caught);
    assert(!fs::exists(path_of("out.sql")));
    std::cout << "test_unknown_encoding_is_unexpected_error passed.\n";
}

void test_unwritable_output() {
    reset_dir();
    write_file(path_of("in.sql"), "a_id INT");

    auto config = make_config("in.sql", "missing_dir/out.sql");
    bool caught = false;
    try {
        TableDefinitionAnonymizer(config).run();
    } catch (const IoError& e) {
        assert(e.path() == config.output_file);
        caught = true;
    }
    assert(caught);
    std::cout << "test_unwritable_output passed.\n";
}

int main() {
    test_default_run();
    test_no_match_output_identical();
    test_custom_prefix_and_pattern();
    test_line_endings_preserved();
    test_missing_input_file();
    test_invalid_pattern_writes_nothing();
    test_missing_paths();
    test_auto_encoding_matches_utf8();
    test_auto_encoding_empty_file_fails();
    test_explicit_encoding_used_as_is();
    test_latin1_round_trip();
    test_undecodable_bytes_replaced();
    test_unknown_encoding_is_unexpected_error();
    test_unwritable_output();
    fs::remove_all(test_dir);
    std::cout << "All TableDefinitionAnonymizer tests passed.\n";
    return 0;
}
