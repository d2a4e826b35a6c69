/**
 * @file main_sandbox.cpp
 * @brief 命令行入口
 *
 *   pybox [--config FILE] [--result FILE] exec <file|->
 *   pybox [--config FILE] [--result FILE] install <name> [version]
 *   pybox [--config FILE] features
 *
 * 配置文件默认取 $PYBOX_CONFIG，都没有时使用内置默认值。
 * 退出码：0 SUCCESS，1 其它结果，2 用法或配置错误。
 */

#include "pybox.h"

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace pybox;

namespace {

constexpr int EXIT_OUTCOME = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
    std::string config_path;
    std::string result_path;
    std::string command;
    std::vector<std::string> args;
};

void print_usage(const char *prog) {
    std::cerr << "usage: " << prog << " [--config FILE] [--result FILE] exec <file|->\n"
              << "       " << prog << " [--config FILE] [--result FILE] install <name> [version]\n"
              << "       " << prog << " [--config FILE] features\n";
}

Result<CommandLine> parse_command_line(int argc, char **argv) {
    CommandLine cl;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--result") {
            if (i + 1 >= argc) {
                return Error(ErrorCode::MALFORMED_INPUT, arg + " needs a value");
            }
            (arg == "--config" ? cl.config_path : cl.result_path) = argv[++i];
        } else if (starts_with(arg, "--")) {
            return Error(ErrorCode::MALFORMED_INPUT, "unknown option " + arg);
        } else {
            break;
        }
    }
    if (i >= argc) {
        return Error(ErrorCode::MALFORMED_INPUT, "missing command");
    }
    cl.command = argv[i++];
    cl.args.assign(argv + i, argv + argc);

    if (cl.command == "exec" && cl.args.size() == 1) return cl;
    if (cl.command == "install" && (cl.args.size() == 1 || cl.args.size() == 2)) return cl;
    if (cl.command == "features" && cl.args.empty()) return cl;
    return Error(ErrorCode::MALFORMED_INPUT, "bad arguments for '" + cl.command + "'");
}

Result<SandboxSettings> load_configuration(const CommandLine &cl) {
    std::string path = cl.config_path;
    if (path.empty()) {
        const char *env = std::getenv("PYBOX_CONFIG");
        if (env) path = env;
    }
    if (path.empty()) return SandboxSettings();
    return load_settings(path);
}

Result<std::string> read_source(const std::string &arg) {
    if (arg != "-") return read_file(arg);
    std::string code((std::istreambuf_iterator<char>(std::cin)),
                     std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
        return Error(ErrorCode::FILE_READ_ERROR, "cannot read standard input");
    }
    return code;
}

void init_cgroups(const SandboxSettings &settings) {
    if (!settings.execution.use_cgroup) return;
    auto r = sandbox::CgroupManager::instance().initialize();
    if (!r.ok()) {
        SLOG_WARN << "cgroup v2 disabled: " << r.error().message();
    }
}

} // namespace

int main(int argc, char **argv) {
    auto cl = parse_command_line(argc, argv);
    if (!cl.ok()) {
        std::cerr << "pybox: " << cl.error().message() << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    const CommandLine &cmd = cl.value();

    auto settings = load_configuration(cmd);
    if (!settings.ok()) {
        std::cerr << "pybox: " << settings.error().to_string() << std::endl;
        return EXIT_USAGE;
    }
    init_logging(settings.value().logging);

    if (cmd.command == "features") {
        sandbox::check_sandbox_features();
        sandbox_log().flush_all();
        return 0;
    }

    init_cgroups(settings.value());

    auto coordinator = SandboxCoordinator::create(settings.value());
    if (!coordinator.ok()) {
        std::cerr << "pybox: " << coordinator.error().to_string() << std::endl;
        return EXIT_USAGE;
    }

    ExecutionOutcome outcome;
    if (cmd.command == "exec") {
        auto source = read_source(cmd.args[0]);
        if (!source.ok()) {
            std::cerr << "pybox: " << source.error().message() << std::endl;
            return EXIT_USAGE;
        }
        outcome = coordinator.value()->execute_code(source.value());
    } else {
        std::optional<std::string> version;
        if (cmd.args.size() == 2) version = cmd.args[1];
        outcome = coordinator.value()->install_package(cmd.args[0], version);
    }

    if (cmd.result_path.empty()) {
        write_outcome(std::cout, outcome);
    } else {
        auto written = write_outcome_file(cmd.result_path, outcome);
        if (!written.ok()) {
            std::cerr << "pybox: " << written.error().to_string() << std::endl;
            sandbox_log().flush_all();
            return EXIT_USAGE;
        }
    }

    sandbox_log().flush_all();
    return outcome.success() ? 0 : EXIT_OUTCOME;
}
