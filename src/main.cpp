#include "image/image.hpp"
#include "lib.hpp"
#include "repair/repair.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define RET_OK 0
#define RET_ERROR 1

struct {
    fs::path src;
    bool dryRun = false;
} fix_icons_opts;

struct {
    fs::path src;
} image_ensure_valid_opts;

template <typename T>
int core(int argc, T **argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("iconfix"));

    CLI::App app{"Repairs mislabeled icons and removes white backgrounds"};
    int ret = RET_OK;

    std::string log_level = "info";
    app.add_option("--loglevel", log_level, "(trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    const auto subcmd_fix_icons = app.add_subcommand("fix_icons", "Repair::Run")->fallthrough();
    subcmd_fix_icons->add_option("-s,--src", fix_icons_opts.src, "root directory")->required();
    subcmd_fix_icons->add_flag("--dry-run", fix_icons_opts.dryRun, "report changes without writing");

    const auto subcmd_image_ensure_valid = app.add_subcommand("image_check", "Image::EnsureValid")->fallthrough();
    subcmd_image_ensure_valid->add_option("-s,--src", image_ensure_valid_opts.src)->required();

    try {
        app.require_subcommand(1);
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        std::cerr << app.help() << std::endl;
        return app.exit(e);
    }

    spdlog::level::level_enum lvl;
    if (log_level == "trace")    lvl = spdlog::level::trace;
    else if (log_level == "debug")   lvl = spdlog::level::debug;
    else if (log_level == "info")    lvl = spdlog::level::info;
    else if (log_level == "warn")    lvl = spdlog::level::warn;
    else if (log_level == "error")   lvl = spdlog::level::err;
    else if (log_level == "critical")lvl = spdlog::level::critical;
    else if (log_level == "off")     lvl = spdlog::level::off;
    else {
        spdlog::warn("Unknown log level '{}', defaulting to 'info'.", log_level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);

    try {
        if (subcmd_fix_icons->parsed()) {
            Image::Initialize();
            Repair::Options opts;
            opts.DryRun = fix_icons_opts.dryRun;
            const auto counters = Repair::Run(fix_icons_opts.src, opts);
            std::cout << fmt::format("Fixed {} corrupt files. Added transparency to {} files.",
                                     counters.FilesRepaired, counters.FilesMadeTransparent)
                      << std::endl;
        } else if (subcmd_image_ensure_valid->parsed()) {
            Image::Initialize();
            Image::EnsureValid(image_ensure_valid_opts.src);
        } else {
            throw std::runtime_error("No subcommand specified.");
        }
    } catch (const std::exception &e) {
        spdlog::error(e.what());
        ret = RET_ERROR;
    }
    return ret;
}

#ifdef _WIN32
int wmain(const int argc, wchar_t **argv) {
    return core(argc, argv);
}
#else
int main(const int argc, char **argv) {
    return core(argc, argv);
}
#endif
