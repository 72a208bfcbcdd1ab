#pragma once

#include "fibermeta/catalog/catalog_records.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fibermeta::tools {

enum class OutputFormat {
    Text,
    Json
};

[[nodiscard]] bool parse_output_format(std::string_view text, OutputFormat& format) noexcept;

// `key` names the JSON array; text output is one name per line.
[[nodiscard]] std::string format_name_list(std::string_view key,
                                           const std::vector<std::string>& names,
                                           OutputFormat format);

[[nodiscard]] std::string format_tables(const std::vector<catalog::SchemaTableName>& tables, OutputFormat format);

[[nodiscard]] std::string format_table_description(const catalog::TableLayout& layout,
                                                   const std::vector<catalog::ColumnHandle>& columns,
                                                   OutputFormat format);

[[nodiscard]] std::string format_segments(const std::vector<catalog::FiberSegment>& segments, OutputFormat format);

[[nodiscard]] std::string format_error(std::error_code ec, OutputFormat format);

[[nodiscard]] std::string format_segment_time(catalog::SegmentTime time);

}  // namespace fibermeta::tools
