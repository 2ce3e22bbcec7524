/*
 * kilnd - build & execution orchestrator daemon
 * Builds compiler images and runs submissions in isolated containers
 */

#include "build_manager.h"
#include "config.h"
#include "docker_runtime.h"
#include "errors.h"
#include "execution_manager.h"
#include "file_state_store.h"
#include "file_utils.h"
#include "orchestrator.h"
#include "reaper.h"
#include "record_codec.h"
#include "spool_job_queue.h"
#include "staging.h"
#include "worker_pool.h"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace kiln;
namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

void print_usage() {
    std::cout << "Usage: kilnd [options] [command]\n"
              << "\n"
              << "Commands:\n"
              << "  serve                              Run workers and reaper (default)\n"
              << "  enqueue build <compiler_id>        Queue an image build\n"
              << "  enqueue run <job_id>               Queue a submission for execution\n"
              << "  status compiler <id>               Print a compiler record as JSON\n"
              << "  status submission <job_id>         Print a submission record as JSON\n"
              << "  rebuild <compiler_id>              Reset to pending and queue a build\n"
              << "  retire <compiler_id>               Delete a compiler and queue image cleanup\n"
              << "  register <id> <Dockerfile> [--timeout S] [--memory M] [--cpus C] -- <cmd...>\n"
              << "  submit <compiler_id> <code_file> [--file <path>]...\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>        JSON configuration file\n"
              << "  --workers <n>          Worker threads\n"
              << "  --state-dir <dir>      Record store directory\n"
              << "  --queue-dir <dir>      Job spool directory\n"
              << "  --staging-root <dir>   Uploaded file staging directory\n"
              << "  --runtime <name>       OCI runtime passed to docker (e.g. runsc)\n"
              << std::endl;
}

struct CommandLine {
    Config config;
    std::vector<std::string> args;          // Positional arguments
    std::vector<std::string> files;         // submit --file
    std::vector<std::string> run_command;   // register, after "--"
    std::optional<int> timeout_seconds;
    std::optional<std::string> memory_limit;
    std::optional<std::string> cpu_limit;
};

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    std::string config_path;
    std::optional<int> workers;
    std::optional<std::string> state_dir, queue_dir, staging_root, runtime;

    auto value = [&](int& i) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigError(std::string("missing value for ") + argv[i]);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--") {
            for (i++; i < argc; i++) {
                cli.run_command.push_back(argv[i]);
            }
            break;
        } else if (arg == "--config") {
            config_path = value(i);
        } else if (arg == "--workers") {
            workers = std::stoi(value(i));
        } else if (arg == "--state-dir") {
            state_dir = value(i);
        } else if (arg == "--queue-dir") {
            queue_dir = value(i);
        } else if (arg == "--staging-root") {
            staging_root = value(i);
        } else if (arg == "--runtime") {
            runtime = value(i);
        } else if (arg == "--file") {
            cli.files.push_back(value(i));
        } else if (arg == "--timeout") {
            cli.timeout_seconds = std::stoi(value(i));
        } else if (arg == "--memory") {
            cli.memory_limit = value(i);
        } else if (arg == "--cpus") {
            cli.cpu_limit = value(i);
        } else if (arg == "--help" || arg == "-h") {
            cli.args = {"help"};
            return cli;
        } else if (arg.rfind("--", 0) == 0) {
            throw ConfigError("unknown option " + arg);
        } else {
            cli.args.push_back(arg);
        }
    }

    // File first, then flags
    if (!config_path.empty()) {
        cli.config = Config::load(config_path);
    }
    if (workers) cli.config.worker_count = *workers;
    if (state_dir) cli.config.state_dir = *state_dir;
    if (queue_dir) cli.config.queue_dir = *queue_dir;
    if (staging_root) cli.config.staging_root = *staging_root;
    if (runtime) cli.config.oci_runtime = *runtime;
    cli.config.validate();
    return cli;
}

DockerOptions docker_options(const Config& config) {
    DockerOptions options;
    options.binary = config.docker_binary;
    options.oci_runtime = config.oci_runtime;
    options.scratch_size = config.scratch_size;
    options.pids_limit = config.pids_limit;
    return options;
}

int serve(const Config& config) {
    std::cout << "🔥 kilnd - Build & Execution Orchestrator" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "State:    " << config.state_dir << std::endl;
    std::cout << "Queue:    " << config.queue_dir << std::endl;
    std::cout << "Staging:  " << config.staging_root << std::endl;
    std::cout << "Workers:  " << config.worker_count
              << " (max " << config.max_concurrent_executions << " concurrent executions)" << std::endl;
    std::cout << "Runtime:  " << (config.oci_runtime.empty() ? "docker default" : config.oci_runtime)
              << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    FileStateStore store(config.state_dir);
    SpoolJobQueue queue(config.queue_dir, std::chrono::milliseconds(config.queue_poll_interval_ms));
    StagingArea staging(config.staging_root);
    DockerImageBuilder builder(docker_options(config));
    DockerContainerRunner runner(docker_options(config));

    BuildSettings build_settings;
    build_settings.image_prefix = config.image_prefix;
    build_settings.build_timeout = config.build_timeout();
    build_settings.log_max_bytes = config.build_log_max_bytes;
    build_settings.error_max_bytes = config.build_error_max_bytes;
    BuildManager builds(store, builder, build_settings);

    ExecutionSettings exec_settings;
    exec_settings.files_mount_path = config.files_mount_path;
    exec_settings.output_max_bytes = config.output_max_bytes;
    exec_settings.infra_retry_limit = config.infra_retry_limit;
    ExecutionManager executions(store, runner, staging, exec_settings);

    Orchestrator orchestrator(store, builds, executions,
                              config.max_concurrent_executions, config.job_retry_limit);

    ReaperSettings reaper_settings;
    reaper_settings.build_timeout = config.build_timeout();
    reaper_settings.orphan_grace = config.orphan_grace();
    reaper_settings.log_max_bytes = config.build_log_max_bytes;
    Reaper reaper(store, queue, staging, orchestrator.build_locks(), orchestrator.in_flight(),
                  reaper_settings);

    WorkerPoolSettings pool_settings;
    pool_settings.worker_count = config.worker_count;
    pool_settings.poll_interval = std::chrono::milliseconds(config.queue_poll_interval_ms);
    pool_settings.reaper_interval = std::chrono::seconds(config.reaper_interval_seconds);
    WorkerPool pool(queue, orchestrator, &reaper, pool_settings);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    pool.start();
    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[kilnd] Shutting down, waiting for in-flight jobs..." << std::endl;
    queue.shutdown();
    pool.stop();
    return 0;
}

int enqueue(const Config& config, const std::vector<std::string>& args) {
    if (args.size() != 3 || (args[1] != "build" && args[1] != "run")) {
        print_usage();
        return 2;
    }
    SpoolJobQueue queue(config.queue_dir);
    Job job = args[1] == "build" ? Job::build(args[2]) : Job::execute(args[2]);
    queue.enqueue(job);
    std::cout << "Queued " << job.describe() << std::endl;
    return 0;
}

int status(const Config& config, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        print_usage();
        return 2;
    }
    FileStateStore store(config.state_dir);
    if (args[1] == "compiler") {
        auto compiler = store.get_compiler(args[2]);
        if (!compiler) throw NotFoundError("compiler " + args[2]);
        std::cout << write_json(to_json(*compiler), true) << std::endl;
    } else if (args[1] == "submission") {
        auto submission = store.get_submission(args[2]);
        if (!submission) throw NotFoundError("submission " + args[2]);
        std::cout << write_json(to_json(*submission), true) << std::endl;
    } else {
        print_usage();
        return 2;
    }
    return 0;
}

int rebuild(const Config& config, const std::string& compiler_id) {
    FileStateStore store(config.state_dir);
    SpoolJobQueue queue(config.queue_dir);

    bool reset = store.update_compiler(compiler_id, [](Compiler& compiler) {
        if (compiler.build_status == BuildStatus::BUILDING) {
            return false;
        }
        compiler.build_status = BuildStatus::PENDING;
        return true;
    });
    if (!reset) {
        if (!store.get_compiler(compiler_id)) throw NotFoundError("compiler " + compiler_id);
        throw ConflictError("compiler " + compiler_id + " is already building");
    }
    queue.enqueue(Job::build(compiler_id));
    std::cout << "Queued rebuild of " << compiler_id << std::endl;
    return 0;
}

int retire(const Config& config, const std::string& compiler_id) {
    FileStateStore store(config.state_dir);
    SpoolJobQueue queue(config.queue_dir);

    auto compiler = store.get_compiler(compiler_id);
    if (!compiler) throw NotFoundError("compiler " + compiler_id);
    if (compiler->build_status == BuildStatus::BUILDING) {
        throw ConflictError("compiler " + compiler_id + " is building; retry when it settles");
    }

    store.remove_compiler(compiler_id);
    if (!compiler->image_tag.empty()) {
        queue.enqueue(Job::cleanup(compiler_id, compiler->image_tag));
    }
    std::cout << "Retired " << compiler_id << std::endl;
    return 0;
}

int register_compiler(const Config& config, const CommandLine& cli) {
    if (cli.args.size() != 3 || cli.run_command.empty()) {
        print_usage();
        return 2;
    }
    FileStateStore store(config.state_dir);
    SpoolJobQueue queue(config.queue_dir);

    Compiler compiler;
    compiler.id = cli.args[1];
    compiler.name = cli.args[1];
    compiler.dockerfile_content = FileUtils::read_file(cli.args[2]);
    compiler.run_command = cli.run_command;
    if (cli.timeout_seconds) compiler.timeout_seconds = *cli.timeout_seconds;
    if (cli.memory_limit) compiler.memory_limit = *cli.memory_limit;
    if (cli.cpu_limit) compiler.cpu_limit = *cli.cpu_limit;

    if (auto existing = store.get_compiler(compiler.id)) {
        if (existing->build_status == BuildStatus::BUILDING) {
            throw ConflictError("compiler " + compiler.id + " is building");
        }
        compiler.created_at = existing->created_at;
        compiler.image_tag = existing->image_tag;
        compiler.built_at = existing->built_at;
    }
    store.put_compiler(compiler);
    queue.enqueue(Job::build(compiler.id));
    std::cout << "Registered " << compiler.id << "; build queued" << std::endl;
    return 0;
}

int submit(const Config& config, const CommandLine& cli) {
    if (cli.args.size() != 3) {
        print_usage();
        return 2;
    }
    FileStateStore store(config.state_dir);
    SpoolJobQueue queue(config.queue_dir);
    StagingArea staging(config.staging_root);

    Submission submission;
    submission.job_id = FileUtils::generate_uuid();
    submission.language = cli.args[1];
    submission.code = FileUtils::read_file(cli.args[2]);

    if (!cli.files.empty()) {
        for (const auto& path : cli.files) {
            submission.uploaded_files.push_back(staging.stage_file(
                submission.job_id, fs::path(path).filename().string(), FileUtils::read_file(path)));
        }
        submission.files_directory = (staging.root() / submission.job_id).string();
    }

    store.put_submission(submission);
    queue.enqueue(Job::execute(submission.job_id));
    std::cout << submission.job_id << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CommandLine cli = parse_command_line(argc, argv);
        const auto& args = cli.args;
        std::string command = args.empty() ? "serve" : args[0];

        if (command == "serve") {
            return serve(cli.config);
        } else if (command == "enqueue") {
            return enqueue(cli.config, args);
        } else if (command == "status") {
            return status(cli.config, args);
        } else if (command == "rebuild" && args.size() == 2) {
            return rebuild(cli.config, args[1]);
        } else if (command == "retire" && args.size() == 2) {
            return retire(cli.config, args[1]);
        } else if (command == "register") {
            return register_compiler(cli.config, cli);
        } else if (command == "submit") {
            return submit(cli.config, cli);
        }
        print_usage();
        return command == "help" ? 0 : 2;
    } catch (const NotFoundError& e) {
        std::cerr << "[kilnd] " << e.what() << std::endl;
        return 3;
    } catch (const ConflictError& e) {
        std::cerr << "[kilnd] " << e.what() << std::endl;
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[kilnd] " << e.what() << std::endl;
        return 1;
    }
}
