#include "tabula/cli/table_script.hpp"

#include "tabula/drawing.hpp"
#include "tabula/error.hpp"
#include "tabula/json.hpp"

#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tabula::cli
{
namespace
{
constexpr const char *kToolName = "tabula-draw";

StyleMap styles_of(const nlohmann::json &object)
{
    if (!object.contains("styles"))
        return {};
    return object.at("styles").get<StyleMap>();
}

std::optional<std::string> nature_of(const nlohmann::json &object)
{
    if (!object.contains("nature"))
        return std::nullopt;
    return object.at("nature").get<std::string>();
}

CellContent content_of(const nlohmann::json &object)
{
    if (!object.contains("content"))
        return {};
    return object.at("content").get<CellContent>();
}

template <typename View>
void insert_into(View &view, const nlohmann::json &operation)
{
    view.insert_cell(content_of(operation),
                     styles_of(operation),
                     nature_of(operation),
                     operation.value("width", 1),
                     operation.value("height", 1));
}

void log_line(std::ostream *log, const std::string &message)
{
    if (log)
        (*log) << kToolName << ": " << message << '\n';
}
} // namespace

ContentAppender appender_for(const nlohmann::json &operation)
{
    if (!operation.contains("separator"))
        return {};
    return joining_appender(operation.at("separator").get<std::string>());
}

void apply_operation(Table &table, const nlohmann::json &operation)
{
    const std::string name = operation.at("op").get<std::string>();
    if (name == "insert_row")
    {
        insert_into(table.row(operation.at("row").get<int>()), operation);
    }
    else if (name == "insert_col")
    {
        insert_into(table.col(operation.at("col").get<int>()), operation);
    }
    else if (name == "set")
    {
        const Coord at = operation.at("at").get<Coord>();
        table.set(at, cell_from_json(operation.at("cell"), table.nature()));
    }
    else if (name == "delete")
    {
        table.erase(operation.at("at").get<Coord>());
    }
    else if (name == "merge")
    {
        table.merge(operation.at("start").get<Coord>(), operation.at("end").get<Coord>(), appender_for(operation));
    }
    else if (name == "expand")
    {
        table.expand(operation.at("at").get<Coord>(),
                     operation.value("width", 0),
                     operation.value("height", 0),
                     appender_for(operation));
    }
    else if (name == "fill_missing")
    {
        if (operation.contains("box"))
            table.fill_missing(operation.at("box").get<Box>(), content_of(operation), styles_of(operation),
                               nature_of(operation));
        else
            table.fill_missing(content_of(operation), styles_of(operation), nature_of(operation));
    }
    else
    {
        throw std::invalid_argument("unknown operation '" + name + "'");
    }
}

std::size_t apply_operations(Table &table, const nlohmann::json &operations, std::ostream *log)
{
    std::size_t applied = 0;
    for (const auto &operation : operations)
    {
        apply_operation(table, operation);
        ++applied;
        log_line(log, "applied " + operation.at("op").get<std::string>() + " (" + std::to_string(table.size()) +
                          " cells)");
    }
    return applied;
}

Table build_table(const nlohmann::json &document, const DocumentOptions &options, std::ostream *log)
{
    nlohmann::json description = document;
    if (!description.contains("nature"))
        description["nature"] = options.config.default_nature;

    Table table = table_from_json(description);
    log_line(log, "loaded " + std::to_string(table.size()) + " cells");

    if (document.contains("operations"))
        apply_operations(table, document.at("operations"), log);

    const bool fill = options.fill_text.has_value() || options.config.fill.enabled;
    if (fill)
    {
        const std::string placeholder = options.fill_text.value_or(options.config.fill.placeholder);
        const std::size_t before = table.size();
        table.fill_missing(CellContent(placeholder), {}, options.config.fill.nature);
        log_line(log, "filled " + std::to_string(table.size() - before) + " missing cells");
    }
    return table;
}

std::string describe_row(const RowView &row)
{
    std::ostringstream out;
    out << "row " << row.pos() << " (" << row.nature() << "):";
    bool first = true;
    for (const Cell *cell : row.owned_cells())
    {
        out << (first ? " " : ", ") << cell->box().to_string() << " '" << cell->text() << "'";
        first = false;
    }
    return out.str();
}

void render_table(const Table &table, const DocumentOptions &options, std::ostream &out)
{
    if (options.print_json)
    {
        nlohmann::json j = table;
        out << j.dump(2) << '\n';
        return;
    }

    draw(table.grid(), [&out](const std::string &line) { out << line << '\n'; }, options.config.tiles);

    if (options.list_rows)
    {
        for (auto it = table.rows_begin(); it != table.rows_end(); ++it)
            out << describe_row(*it) << '\n';
    }
}

bool process_file(const std::filesystem::path &path,
                  const DocumentOptions &options,
                  std::ostream *out,
                  std::ostream *err)
{
    auto report = [&](const std::string &message) {
        if (err)
            (*err) << kToolName << ": " << path.string() << ": " << message << '\n';
    };

    std::ifstream stream(path);
    if (!stream)
    {
        report("cannot open file");
        return false;
    }

    try
    {
        nlohmann::json document = nlohmann::json::parse(stream);
        Table table = build_table(document, options, options.verbose ? err : nullptr);
        if (out)
            render_table(table, options, *out);
        return true;
    }
    catch (const Error &error)
    {
        report(error.what());
    }
    catch (const nlohmann::json::exception &error)
    {
        report(std::string("invalid document: ") + error.what());
    }
    catch (const std::exception &error)
    {
        report(error.what());
    }
    return false;
}

} // namespace tabula::cli
