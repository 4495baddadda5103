#pragma once

#include "tabula/config.hpp"
#include "tabula/content.hpp"
#include "tabula/table.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace tabula::cli
{

struct DocumentOptions
{
    config::Config config;
    // Overrides the configured placeholder and enables padding.
    std::optional<std::string> fill_text;
    bool list_rows = false;
    bool print_json = false;
    bool verbose = false;
};

// Combiner selected by the optional "separator" key of a merge/expand
// operation. Without a separator the default combiner is used.
ContentAppender appender_for(const nlohmann::json &operation);

// Applies one operation object to the table. Throws tabula::Error for
// table failures and nlohmann::json::exception for malformed operations;
// std::invalid_argument when the "op" name is unknown.
void apply_operation(Table &table, const nlohmann::json &operation);

// Applies every operation of the array in order and returns how many were
// applied. Progress goes to log when it is not null.
std::size_t apply_operations(Table &table, const nlohmann::json &operations, std::ostream *log = nullptr);

// Builds the table of a document: table description plus "operations",
// then padding when enabled by the options.
Table build_table(const nlohmann::json &document, const DocumentOptions &options, std::ostream *log = nullptr);

// One line per row view: "row 2 (header): A2 'x', B2 'y'".
std::string describe_row(const RowView &row);

void render_table(const Table &table, const DocumentOptions &options, std::ostream &out);

// Reads, builds and renders one file. Errors are reported on err in the
// "tabula-draw: file: message" form; returns false when the file failed.
bool process_file(const std::filesystem::path &path,
                  const DocumentOptions &options,
                  std::ostream *out,
                  std::ostream *err);

} // namespace tabula::cli
