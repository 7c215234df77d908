// OpenCM command-line tool: validate, inspect, normalize and catalog .opencm.json files.

#include <opencm_loaders/catalog.hpp>
#include <opencm_loaders/errors.hpp>
#include <opencm_loaders/json_loader.hpp>
#include <opencm_loaders/json_writer.hpp>
#include <opencm_loaders/sample_model.hpp>
#include <opencm_logging/logger.hpp>
#include <cstdio>
#include <string>
#include <vector>

namespace {

const int exit_ok = 0;
const int exit_failed = 1;
const int exit_usage = 2;

struct Options {
    std::string command;
    std::vector<std::string> args;
    std::string log_file;
    spdlog::level::level_enum level = spdlog::level::warn;
    bool help = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: opencm <command> [options]\n"
        "\n"
        "commands:\n"
        "  validate <file>        check a model and report errors and warnings\n"
        "  show <file>            load a model and print its structure\n"
        "  normalize <in> <out>   load a model and write it back in canonical form\n"
        "  list <dir>             list every .opencm.json model in a directory\n"
        "  sample <out>           write the Porter's Five Forces sample model\n"
        "\n"
        "options:\n"
        "  --log-file <path>      write log output to a file\n"
        "  --verbose              log debug messages\n"
        "  --quiet                log errors only\n"
        "  --help                 show this message\n");
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--verbose") {
            opts.level = spdlog::level::debug;
        } else if (arg == "--quiet") {
            opts.level = spdlog::level::err;
        } else if (arg == "--log-file") {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "--log-file requires a path\n");
                return false;
            }
            opts.log_file = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            (void)fprintf(stderr, "unknown option: %s\n", arg.c_str());
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    return true;
}

bool expect_args(const Options& opts, std::size_t count) {
    if (opts.args.size() == count) return true;
    (void)fprintf(stderr, "'%s' expects %zu argument(s), got %zu\n",
        opts.command.c_str(), count, opts.args.size());
    return false;
}

int run_validate(const std::string& path) {
    const auto result = opencm_loaders::validate_model_file(path);
    for (const auto& e : result.errors)
        (void)printf("error: %s\n", e.c_str());
    for (const auto& w : result.warnings)
        (void)printf("warning: %s\n", w.c_str());
    (void)printf("%s: %s (%zu errors, %zu warnings)\n", path.c_str(),
        result.ok ? "valid" : "INVALID", result.errors.size(), result.warnings.size());
    return result.ok ? exit_ok : exit_failed;
}

int run_show(const std::string& path) {
    const auto model = opencm_loaders::load_model_file(path);
    (void)printf("%s\n", model.summary().c_str());
    (void)printf("id: %s  version: %s\n", model.id.c_str(), model.version.c_str());
    if (!model.description.empty())
        (void)printf("%s\n", model.description.c_str());

    (void)printf("\nvariables:\n");
    for (const auto& [name, v] : model.variables) {
        (void)printf("  %-28s %-12s [%g, %g] %s%s\n", name.c_str(), opencm_model::to_string(v.kind).c_str(),
            v.domain.first, v.domain.second, v.unit.c_str(), v.observed ? "" : " (latent)");
    }
    (void)printf("\nedges:\n");
    for (const auto& e : model.edges) {
        (void)printf("  %s -> %s  %s %+.2f%s\n", e.source.c_str(), e.target.c_str(),
            e.kind_name().c_str(), e.strength, e.is_learned ? " (learned)" : "");
    }
    if (!model.equations.empty()) {
        (void)printf("\nequations:\n");
        for (const auto& [target, eq] : model.equations)
            (void)printf("  %s := %s  [%s]\n", target.c_str(), eq.expression.c_str(), eq.kind_name().c_str());
    }
    if (!model.assumptions.empty()) {
        (void)printf("\nassumptions:\n");
        for (const auto& a : model.assumptions)
            (void)printf("  - %s\n", a.c_str());
    }
    return exit_ok;
}

int run_normalize(const std::string& in, const std::string& out) {
    const auto model = opencm_loaders::load_model_file(in);
    const std::string written = opencm_loaders::save_model_file(model, out);
    (void)printf("%s\n", written.c_str());
    return exit_ok;
}

int run_list(const std::string& dir) {
    const auto entries = opencm_loaders::scan_model_directory(dir);
    std::size_t invalid = 0;
    for (const auto& e : entries) {
        if (e.valid) {
            (void)printf("%-32s %-14s %3zu vars %3zu edges  %s\n", e.model_id.c_str(), e.domain.c_str(),
                e.variable_count, e.edge_count, e.name.c_str());
        } else {
            ++invalid;
            (void)printf("%-32s INVALID  %s\n", e.path.c_str(), e.first_error.c_str());
        }
    }
    (void)printf("%zu models, %zu invalid\n", entries.size(), invalid);
    return invalid == 0 ? exit_ok : exit_failed;
}

int run_sample(const std::string& out) {
    const std::string written = opencm_loaders::save_model_file(opencm_loaders::generate_sample_model(), out);
    (void)printf("%s\n", written.c_str());
    return exit_ok;
}

int dispatch(const Options& opts) {
    if (opts.command == "validate" && expect_args(opts, 1)) return run_validate(opts.args[0]);
    if (opts.command == "show" && expect_args(opts, 1)) return run_show(opts.args[0]);
    if (opts.command == "normalize" && expect_args(opts, 2)) return run_normalize(opts.args[0], opts.args[1]);
    if (opts.command == "list" && expect_args(opts, 1)) return run_list(opts.args[0]);
    if (opts.command == "sample" && expect_args(opts, 1)) return run_sample(opts.args[0]);
    print_usage();
    return exit_usage;
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return exit_usage;
    }
    if (opts.help || opts.command.empty()) {
        print_usage();
        return opts.help ? exit_ok : exit_usage;
    }

    if (!opts.log_file.empty() && !opencm_logging::init_file_logging(opts.log_file, opts.level))
        (void)fprintf(stderr, "warning: logging to %s unavailable, using console\n", opts.log_file.c_str());
    opencm_logging::set_level(opts.level);

    try {
        return dispatch(opts);
    } catch (const opencm_loaders::ModelValidationError& e) {
        (void)fprintf(stderr, "%s\n", e.what());
        return exit_failed;
    } catch (const opencm_loaders::LoadError& e) {
        (void)fprintf(stderr, "error: %s\n", e.what());
        return exit_failed;
    }
}
