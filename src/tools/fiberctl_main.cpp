#include "fibermeta/catalog/catalog_errors.hpp"
#include "fibermeta/catalog/catalog_store.hpp"
#include "fibermeta/catalog/partition_function_registry.hpp"
#include "fibermeta/storage/directory_manager.hpp"
#include "fibermeta/store/sqlite_store.hpp"
#include "fibermeta/tools/catalog_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using fibermeta::catalog::CatalogStore;
using fibermeta::tools::OutputFormat;

namespace {

struct ConnectionOptions final {
    std::string metaserver_uri = "fibermeta.db";
    std::string storage_root = "./fibermeta-store";
    std::int64_t busy_timeout_ms = 5000;
    std::string log_level = "warn";
    std::string format = "text";
};

// Owns the collaborators behind one initialized CatalogStore.
struct CatalogSession final {
    std::unique_ptr<fibermeta::store::SqliteStore> store{};
    std::unique_ptr<fibermeta::storage::LocalDirectoryManager> directories{};
    std::unique_ptr<CatalogStore> catalog{};
};

void check(std::error_code ec, const std::string& what)
{
    if (ec) {
        throw std::system_error{ec, what};
    }
}

// Whitespace-separated words of one REPL line; empty for a blank line.
std::vector<std::string> command_words(const char* line)
{
    std::istringstream stream{line};
    std::vector<std::string> words;
    for (std::string word; stream >> word;) {
        words.push_back(std::move(word));
    }
    return words;
}

std::int64_t parse_int64(std::string_view text, std::string_view what)
{
    std::int64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        throw std::runtime_error("invalid " + std::string{what} + ": " + std::string{text});
    }
    return value;
}

OutputFormat output_format(const ConnectionOptions& options)
{
    OutputFormat format = OutputFormat::Text;
    if (!fibermeta::tools::parse_output_format(options.format, format)) {
        throw std::runtime_error("unsupported format: " + options.format);
    }
    return format;
}

void configure_logging(const std::string& level)
{
    auto logger = spdlog::stderr_color_mt("fiberctl");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

fibermeta::catalog::SessionContext make_session()
{
    fibermeta::catalog::SessionContext session{};
    if (const char* user = std::getenv("USER"); user != nullptr) {
        session.user = user;
    }
    session.query_id = "fiberctl";
    return session;
}

CatalogSession open_catalog(const ConnectionOptions& options)
{
    CatalogSession session{};

    fibermeta::store::SqliteStoreConfig store_config{};
    store_config.uri = options.metaserver_uri;
    store_config.busy_timeout = std::chrono::milliseconds{options.busy_timeout_ms};
    session.store = std::make_unique<fibermeta::store::SqliteStore>(std::move(store_config));
    check(session.store->open(), "cannot open catalog store " + options.metaserver_uri);

    session.directories = std::make_unique<fibermeta::storage::LocalDirectoryManager>();

    CatalogStore::Config config{};
    config.store = session.store.get();
    config.directories = session.directories.get();
    config.storage_root = options.storage_root;
    session.catalog = std::make_unique<CatalogStore>(std::move(config));
    check(session.catalog->initialize(), "cannot initialize catalog");
    return session;
}

void show_databases(CatalogStore& catalog, OutputFormat format)
{
    std::vector<std::string> names;
    check(catalog.list_databases(names), "list databases");
    std::cout << fibermeta::tools::format_name_list("databases", names, format);
}

void show_tables(CatalogStore& catalog, const fibermeta::catalog::TableFilter& filter, OutputFormat format)
{
    std::vector<fibermeta::catalog::SchemaTableName> tables;
    check(catalog.list_tables(filter, tables), "list tables");
    std::cout << fibermeta::tools::format_tables(tables, format);
}

void describe_table(CatalogStore& catalog, const std::string& database, const std::string& table, OutputFormat format)
{
    fibermeta::catalog::TableLayout layout{};
    check(catalog.table_layout(database, table, layout), "describe " + database + "." + table);
    std::vector<fibermeta::catalog::ColumnHandle> columns;
    check(catalog.columns(database, table, columns), "columns of " + database + "." + table);
    std::cout << fibermeta::tools::format_table_description(layout, columns, format);
}

void show_functions(OutputFormat format)
{
    const auto names = fibermeta::catalog::PartitionFunctionRegistry::instance().names();
    std::cout << fibermeta::tools::format_name_list("functions", names, format);
}

// Accepts name:type or name:type:notnull.
fibermeta::catalog::ColumnDefinition parse_column_spec(std::string_view spec)
{
    fibermeta::catalog::ColumnDefinition column{};
    const auto first = spec.find(':');
    if (first == std::string_view::npos || first == 0U) {
        throw std::runtime_error("column must be name:type[:notnull], got " + std::string{spec});
    }
    column.name = std::string{spec.substr(0, first)};
    auto rest = spec.substr(first + 1U);
    const auto second = rest.find(':');
    if (second != std::string_view::npos) {
        const auto flag = rest.substr(second + 1U);
        if (flag != "notnull") {
            throw std::runtime_error("unknown column flag: " + std::string{flag});
        }
        column.nullable = false;
        rest = rest.substr(0, second);
    }
    column.type_text = std::string{rest};
    return column;
}

fibermeta::catalog::StorageFormat parse_storage(const std::string& text)
{
    fibermeta::catalog::StorageFormat format = fibermeta::catalog::StorageFormat::Parquet;
    if (!fibermeta::catalog::parse_storage_format(text, format)) {
        throw std::runtime_error("unsupported storage format: " + text);
    }
    return format;
}

void show_segments(CatalogStore& catalog,
                   const std::string& database,
                   const std::string& table,
                   const fibermeta::catalog::SegmentFilter& filter,
                   OutputFormat format)
{
    std::vector<fibermeta::catalog::FiberSegment> segments;
    check(catalog.list_fiber_segments(database, table, filter, segments), "segments of " + database + "." + table);
    std::cout << fibermeta::tools::format_segments(segments, format);
}

fibermeta::catalog::SegmentTime micros_to_time(std::int64_t micros)
{
    return fibermeta::catalog::SegmentTime{std::chrono::microseconds{micros}};
}

void print_repl_help()
{
    std::cout << "Commands:" << '\n';
    std::cout << "  databases                                   List databases" << '\n';
    std::cout << "  tables [schema] [table]                     List tables ('*' matches all)" << '\n';
    std::cout << "  describe <schema> <table>                   Show table layout and columns" << '\n';
    std::cout << "  create-database <name>                      Create a database" << '\n';
    std::cout << "  create-table <schema> <table> <col:type>... Create an unpartitioned table" << '\n';
    std::cout << "  functions                                   List partition functions" << '\n';
    std::cout << "  segments <schema> <table> [fiber-value]     List fiber segments" << '\n';
    std::cout << "  format json|text                            Switch output format" << '\n';
    std::cout << "  help                                        Show this help" << '\n';
    std::cout << "  quit | exit                                 Leave the shell" << '\n';
}

std::optional<std::string> wildcard_token(const std::vector<std::string>& tokens, std::size_t index)
{
    if (index >= tokens.size() || tokens[index] == "*") {
        return std::nullopt;
    }
    return tokens[index];
}

void run_repl_command(CatalogStore& catalog, const std::vector<std::string>& tokens, OutputFormat format)
{
    const auto& verb = tokens.front();
    if (verb == "databases") {
        show_databases(catalog, format);
    } else if (verb == "tables") {
        fibermeta::catalog::TableFilter filter{};
        filter.schema = wildcard_token(tokens, 1U);
        filter.table = wildcard_token(tokens, 2U);
        show_tables(catalog, filter, format);
    } else if (verb == "describe" && tokens.size() == 3U) {
        describe_table(catalog, tokens[1], tokens[2], format);
    } else if (verb == "create-database" && tokens.size() == 2U) {
        fibermeta::catalog::CreateDatabaseRequest request{};
        request.name = tokens[1];
        request.session = make_session();
        check(catalog.create_database(request), "create database " + request.name);
        std::cout << "created database " << request.name << '\n';
    } else if (verb == "create-table" && tokens.size() >= 4U) {
        fibermeta::catalog::CreateTableRequest request{};
        request.table = {tokens[1], tokens[2]};
        for (std::size_t index = 3U; index < tokens.size(); ++index) {
            request.columns.push_back(parse_column_spec(tokens[index]));
        }
        request.session = make_session();
        check(catalog.create_table(request), "create table " + tokens[1] + "." + tokens[2]);
        std::cout << "created table " << tokens[1] << '.' << tokens[2] << '\n';
    } else if (verb == "functions") {
        show_functions(format);
    } else if (verb == "segments" && (tokens.size() == 3U || tokens.size() == 4U)) {
        fibermeta::catalog::SegmentFilter filter{};
        if (tokens.size() == 4U) {
            filter.fiber_value = parse_int64(tokens[3], "fiber value");
        }
        show_segments(catalog, tokens[1], tokens[2], filter, format);
    } else {
        std::cout << "unrecognised command. Type 'help' for assistance." << '\n';
    }
}

void run_catalog_repl(CatalogStore& catalog, OutputFormat format)
{
    replxx::Replxx repl;
    while (true) {
        const char* line = repl.input("fibermeta> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        auto tokens = command_words(line);
        if (tokens.empty()) {
            continue;
        }
        repl.history_add(line);

        const auto& verb = tokens.front();
        if (verb == "quit" || verb == "exit") {
            break;
        }
        if (verb == "help") {
            print_repl_help();
            continue;
        }
        if (verb == "format" && tokens.size() == 2U) {
            if (!fibermeta::tools::parse_output_format(tokens[1], format)) {
                std::cout << "unknown format: " << tokens[1] << '\n';
            }
            continue;
        }

        try {
            run_repl_command(catalog, tokens, format);
        } catch (const std::system_error& error) {
            std::cout << fibermeta::tools::format_error(error.code(), format);
            if (format == OutputFormat::Json) {
                std::cout << '\n';
            }
        } catch (const std::exception& error) {
            std::cout << "error: " << error.what() << '\n';
        }
    }
}

}  // namespace

int main(int argc, char** argv)
{
    configure_logging("warn");

    CLI::App app{"Operator tooling for the fibermeta catalog"};
    app.require_subcommand(1);
    app.set_config("--config", "", "Read options from an INI or TOML file");

    ConnectionOptions options{};
    app.add_option("--metaserver-uri", options.metaserver_uri, "Catalog database file or SQLite URI")
        ->capture_default_str();
    app.add_option("--metaserver-store", options.storage_root, "Root directory for database and table storage")
        ->capture_default_str();
    app.add_option("--busy-timeout-ms", options.busy_timeout_ms, "How long to wait on a locked catalog store")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_option("--log-level", options.log_level, "trace, debug, info, warn, err, critical or off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "err", "critical", "off"}))
        ->each([](const std::string& level) { spdlog::set_level(spdlog::level::from_str(level)); })
        ->capture_default_str();
    app.add_option("-f,--format", options.format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}))
        ->capture_default_str();

    auto* bootstrap = app.add_subcommand("bootstrap", "Create the catalog tables if they are absent");
    bootstrap->callback([&]() {
        (void)open_catalog(options);
        std::cout << "catalog ready at " << options.metaserver_uri << '\n';
    });

    auto* databases = app.add_subcommand("databases", "List databases");
    databases->callback([&]() {
        auto session = open_catalog(options);
        show_databases(*session.catalog, output_format(options));
    });

    std::optional<std::string> tables_schema;
    std::optional<std::string> tables_name;
    auto* tables = app.add_subcommand("tables", "List tables");
    tables->add_option("--schema", tables_schema, "Only tables of this database");
    tables->add_option("--table", tables_name, "Only tables with this name");
    tables->callback([&]() {
        auto session = open_catalog(options);
        fibermeta::catalog::TableFilter filter{tables_schema, tables_name};
        show_tables(*session.catalog, filter, output_format(options));
    });

    std::string describe_schema;
    std::string describe_name;
    auto* describe = app.add_subcommand("describe", "Show a table's layout and columns");
    describe->add_option("schema", describe_schema, "Database name")->required();
    describe->add_option("table", describe_name, "Table name")->required();
    describe->callback([&]() {
        auto session = open_catalog(options);
        describe_table(*session.catalog, describe_schema, describe_name, output_format(options));
    });

    fibermeta::catalog::CreateDatabaseRequest database_request{};
    std::optional<std::string> database_comment;
    std::optional<std::string> database_owner;
    auto* create_database = app.add_subcommand("create-database", "Create a database and its storage directory");
    create_database->add_option("name", database_request.name, "Database name")->required();
    create_database->add_option("--comment", database_comment, "Defaults to 'db <name>'");
    create_database->add_option("--owner", database_owner, "Defaults to the session user");
    create_database->callback([&]() {
        auto session = open_catalog(options);
        database_request.comment = database_comment;
        database_request.owner = database_owner;
        database_request.session = make_session();
        check(session.catalog->create_database(database_request), "create database " + database_request.name);
        std::cout << "created database " << database_request.name << '\n';
    });

    fibermeta::catalog::CreateTableRequest table_request{};
    std::vector<std::string> column_specs;
    std::optional<std::string> fiber_key;
    std::optional<std::string> fiber_function;
    std::optional<std::string> time_key;
    std::string storage_format = "parquet";
    auto* create_table = app.add_subcommand("create-table", "Create a table and its storage directory");
    create_table->add_option("schema", table_request.table.schema, "Database name")->required();
    create_table->add_option("table", table_request.table.table, "Table name")->required();
    create_table->add_option("-c,--column", column_specs, "Column as name:type[:notnull]")->required();
    create_table->add_option("--fiber-key", fiber_key, "Column the partition function is applied to");
    create_table->add_option("--function", fiber_function, "Partition function name");
    create_table->add_option("--time-key", time_key, "Column holding the segment time");
    create_table->add_option("--storage", storage_format, "parquet or text")->capture_default_str();
    create_table->callback([&]() {
        auto session = open_catalog(options);
        for (const auto& spec : column_specs) {
            table_request.columns.push_back(parse_column_spec(spec));
        }
        table_request.fiber_key = fiber_key;
        table_request.fiber_function = fiber_function;
        table_request.time_key = time_key;
        table_request.format = parse_storage(storage_format);
        table_request.session = make_session();
        const auto qualified = table_request.table.schema + "." + table_request.table.table;
        check(session.catalog->create_table(table_request), "create table " + qualified);
        std::cout << "created table " << qualified << '\n';
    });

    auto* functions = app.add_subcommand("functions", "List registered partition functions");
    functions->callback([&]() { show_functions(output_format(options)); });

    std::string segments_schema;
    std::string segments_table;
    std::optional<std::string> segments_key;
    std::optional<std::int64_t> segments_int_key;
    std::optional<std::int64_t> segments_fiber;
    std::optional<std::int64_t> segments_from;
    std::optional<std::int64_t> segments_to;
    auto* segments = app.add_subcommand("segments", "List fiber segments that survive pruning");
    segments->add_option("schema", segments_schema, "Database name")->required();
    segments->add_option("table", segments_table, "Table name")->required();
    auto* key_option = segments->add_option("--key", segments_key, "Fiber key value (text)");
    segments->add_option("--int-key", segments_int_key, "Fiber key value (integer)")->excludes(key_option);
    segments->add_option("--fiber", segments_fiber, "Fiber value");
    segments->add_option("--from", segments_from, "Window start, microseconds since epoch");
    segments->add_option("--to", segments_to, "Window end, microseconds since epoch");
    segments->callback([&]() {
        auto session = open_catalog(options);
        fibermeta::catalog::SegmentFilter filter{};
        if (segments_key) {
            filter.fiber_key = fibermeta::catalog::FiberKeyValue{*segments_key};
        } else if (segments_int_key) {
            filter.fiber_key = fibermeta::catalog::FiberKeyValue{*segments_int_key};
        }
        filter.fiber_value = segments_fiber;
        if (segments_from) {
            filter.window_begin = micros_to_time(*segments_from);
        }
        if (segments_to) {
            filter.window_end = micros_to_time(*segments_to);
        }
        show_segments(*session.catalog, segments_schema, segments_table, filter, output_format(options));
    });

    auto* repl = app.add_subcommand("repl", "Start an interactive catalog shell");
    repl->callback([&]() {
        auto session = open_catalog(options);
        run_catalog_repl(*session.catalog, output_format(options));
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::system_error& error) {
        if (error.code() == fibermeta::catalog::CatalogErrc::CorruptedCatalog) {
            spdlog::critical("{}", error.what());
        }
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
