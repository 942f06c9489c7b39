#include "export_command.hpp"

namespace boxhunt::cli {

void ExportCommand::setup(CLI::App& app) {
    app.add_option("-f,--format", format_, "Output format: csv or json (default: csv)");

    app.add_option("-o,--output", output_, "Output file (default: next to the metadata file)");

    app.add_option("--site", site_, "Export a website collection (URL or domain)");
}

int ExportCommand::execute(CommandContext& ctx) {
    auto format = parse_export_format(format_);
    if (!format.ok()) {
        return report_error(format.error());
    }

    auto collection = select_collection(ctx.config, site_);
    if (!collection.ok()) {
        return report_error(collection.error());
    }

    int exit_code = BOXHUNT_EXIT_SUCCESS;
    auto harvester = open_harvester(ctx, collection.value(), exit_code);
    if (!harvester) return exit_code;

    auto path = harvester->export_metadata(format.value(), output_);
    if (!path.ok()) {
        std::cerr << "Export failed\n";
        return report_error(path.error());
    }

    std::cout << "Metadata exported to: " << path->string() << "\n";
    return BOXHUNT_EXIT_SUCCESS;
}

}  // namespace boxhunt::cli
