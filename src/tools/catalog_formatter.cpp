#include "fibermeta/tools/catalog_formatter.hpp"

#include "fibermeta/catalog/type_translator.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

// Short escape for the control and quoting characters JSON names; empty when
// the character needs a \u escape or none at all.
std::string_view short_escape(char ch) noexcept
{
    switch (ch) {
    case '"':
        return "\\\"";
    case '\\':
        return "\\\\";
    case '\b':
        return "\\b";
    case '\f':
        return "\\f";
    case '\n':
        return "\\n";
    case '\r':
        return "\\r";
    case '\t':
        return "\\t";
    default:
        return {};
    }
}

void append_json_string(std::string& out, std::string_view text)
{
    out.reserve(out.size() + text.size() + 2U);
    out += '"';
    for (const char ch : text) {
        if (const auto escape = short_escape(ch); !escape.empty()) {
            out += escape;
        } else if (static_cast<unsigned char>(ch) < 0x20U) {
            std::array<char, 7> unicode{};
            (void)std::snprintf(unicode.data(), unicode.size(), "\\u%04x", static_cast<unsigned>(ch));
            out += unicode.data();
        } else {
            out += ch;
        }
    }
    out += '"';
}

// Builds one flat JSON object; nested values are appended raw.
class JsonObjectWriter final {
public:
    explicit JsonObjectWriter(std::string& out)
        : out_{out}
    {
        out_.push_back('{');
    }

    void field(std::string_view name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        append_json_string(out_, name);
        out_.push_back(':');
    }

    void string_field(std::string_view name, std::string_view value)
    {
        field(name);
        append_json_string(out_, value);
    }

    void number_field(std::string_view name, auto value)
    {
        field(name);
        out_.append(std::to_string(value));
    }

    void bool_field(std::string_view name, bool value)
    {
        field(name);
        out_.append(value ? "true" : "false");
    }

    void null_field(std::string_view name)
    {
        field(name);
        out_.append("null");
    }

    void close() { out_.push_back('}'); }

private:
    std::string& out_;
    bool first_ = true;
};

void append_column_json(std::string& out, const fibermeta::catalog::ColumnHandle& column)
{
    JsonObjectWriter writer{out};
    writer.string_field("name", column.name);
    writer.string_field("type", fibermeta::catalog::format_data_type(column.type));
    writer.string_field("role", fibermeta::catalog::column_role_name(column.role));
    writer.number_field("ordinal", column.ordinal);
    writer.bool_field("nullable", column.nullable);
    writer.close();
}

}  // namespace

namespace fibermeta::tools {

bool parse_output_format(std::string_view text, OutputFormat& format) noexcept
{
    if (text == "text") {
        format = OutputFormat::Text;
        return true;
    }
    if (text == "json") {
        format = OutputFormat::Json;
        return true;
    }
    return false;
}

std::string format_segment_time(catalog::SegmentTime time)
{
    const auto seconds = std::chrono::floor<std::chrono::seconds>(time);
    const auto time_value = std::chrono::system_clock::to_time_t(seconds);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto micros = (time - seconds).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

std::string format_name_list(std::string_view key, const std::vector<std::string>& names, OutputFormat format)
{
    std::string out;
    if (format == OutputFormat::Text) {
        for (const auto& name : names) {
            out.append(name);
            out.push_back('\n');
        }
        return out;
    }

    JsonObjectWriter writer{out};
    writer.field(key);
    out.push_back('[');
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i != 0U) {
            out.push_back(',');
        }
        append_json_string(out, names[i]);
    }
    out.push_back(']');
    writer.close();
    return out;
}

std::string format_tables(const std::vector<catalog::SchemaTableName>& tables, OutputFormat format)
{
    std::string out;
    if (format == OutputFormat::Text) {
        for (const auto& table : tables) {
            out.append(table.schema);
            out.push_back('.');
            out.append(table.table);
            out.push_back('\n');
        }
        return out;
    }

    JsonObjectWriter writer{out};
    writer.field("tables");
    out.push_back('[');
    for (std::size_t i = 0; i < tables.size(); ++i) {
        if (i != 0U) {
            out.push_back(',');
        }
        JsonObjectWriter entry{out};
        entry.string_field("schema", tables[i].schema);
        entry.string_field("table", tables[i].table);
        entry.close();
    }
    out.push_back(']');
    writer.close();
    return out;
}

std::string format_table_description(const catalog::TableLayout& layout,
                                     const std::vector<catalog::ColumnHandle>& columns,
                                     OutputFormat format)
{
    const auto& handle = layout.handle;
    std::string out;
    if (format == OutputFormat::Text) {
        std::ostringstream stream;
        stream << "table " << handle.schema << '.' << handle.name << '\n';
        stream << "location " << handle.location << '\n';
        stream << "format " << catalog::storage_format_name(layout.format) << '\n';
        if (layout.fiber_column) {
            stream << "fiber key " << layout.fiber_column->name;
            if (layout.function) {
                stream << " via " << layout.function->name();
            }
            stream << '\n';
        }
        if (layout.time_column) {
            stream << "time key " << layout.time_column->name << '\n';
        }
        for (const auto& column : columns) {
            stream << "  " << column.ordinal << ' ' << column.name << ' ' << catalog::format_data_type(column.type);
            if (!column.nullable) {
                stream << " not null";
            }
            if (column.role != catalog::ColumnRole::Regular) {
                stream << " [" << catalog::column_role_name(column.role) << ']';
            }
            stream << '\n';
        }
        return stream.str();
    }

    JsonObjectWriter writer{out};
    writer.string_field("schema", handle.schema);
    writer.string_field("table", handle.name);
    writer.string_field("location", handle.location);
    writer.string_field("format", catalog::storage_format_name(layout.format));
    if (layout.fiber_column) {
        writer.string_field("fiber_key", layout.fiber_column->name);
    } else {
        writer.null_field("fiber_key");
    }
    if (layout.function) {
        writer.string_field("fiber_function", layout.function->name());
    } else {
        writer.null_field("fiber_function");
    }
    if (layout.time_column) {
        writer.string_field("time_key", layout.time_column->name);
    } else {
        writer.null_field("time_key");
    }
    writer.field("columns");
    out.push_back('[');
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i != 0U) {
            out.push_back(',');
        }
        append_column_json(out, columns[i]);
    }
    out.push_back(']');
    writer.close();
    return out;
}

std::string format_segments(const std::vector<catalog::FiberSegment>& segments, OutputFormat format)
{
    std::string out;
    if (format == OutputFormat::Text) {
        for (const auto& segment : segments) {
            out.append(std::to_string(segment.fiber_value));
            out.push_back(' ');
            out.append(format_segment_time(segment.time_begin));
            out.push_back(' ');
            out.append(format_segment_time(segment.time_end));
            out.push_back(' ');
            out.append(segment.path);
            out.push_back('\n');
        }
        return out;
    }

    JsonObjectWriter writer{out};
    writer.field("segments");
    out.push_back('[');
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i != 0U) {
            out.push_back(',');
        }
        const auto& segment = segments[i];
        JsonObjectWriter entry{out};
        entry.number_field("id", segment.id);
        entry.number_field("fiber_id", segment.fiber_id);
        entry.number_field("fiber_value", segment.fiber_value);
        entry.string_field("time_begin", format_segment_time(segment.time_begin));
        entry.string_field("time_end", format_segment_time(segment.time_end));
        entry.string_field("path", segment.path);
        entry.close();
    }
    out.push_back(']');
    writer.close();
    return out;
}

std::string format_error(std::error_code ec, OutputFormat format)
{
    if (format == OutputFormat::Text) {
        return "error: " + ec.message() + " (" + ec.category().name() + ":" + std::to_string(ec.value()) + ")\n";
    }

    std::string out;
    JsonObjectWriter writer{out};
    writer.string_field("category", ec.category().name());
    writer.number_field("code", ec.value());
    writer.string_field("message", ec.message());
    writer.close();
    return out;
}

}  // namespace fibermeta::tools
