#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "evaluation/state_machine.hpp"
#include "exercise/loader.hpp"
#include "server/rabbitmq.hpp"
#include "server/service.hpp"
#include "worker.hpp"
using namespace std;
using json = nlohmann::json;
namespace po = boost::program_options;

static grader::worker_pool* running_pool = nullptr;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    if (running_pool) running_pool->stop();
}

static unique_ptr<grader::server::job_queue> make_queue(const grader::queue_config& config) {
    if (config.type == "rabbitmq")
        return make_unique<grader::server::rabbitmq_job_queue>(*config.rabbitmq, config.retry);
    return make_unique<grader::server::memory_job_queue>();
}

static grader::exercise_identity identity_from(const po::variables_map& vm) {
    grader::exercise_identity identity;
    for (const char* key : {"agency", "department", "name", "version", "hash"})
        if (!vm.count(key)) throw po::required_option(key);
    identity.agency = vm["agency"].as<string>();
    identity.department = vm["department"].as<string>();
    identity.name = vm["name"].as<string>();
    identity.version = vm["version"].as<string>();
    identity.directory_hash = vm["hash"].as<string>();
    identity.assert_safe();
    return identity;
}

static string require(const po::variables_map& vm, const char* key) {
    if (!vm.count(key)) throw po::required_option(key);
    return vm[key].as<string>();
}

static int serve(const grader::grader_config& config) {
    grader::server::storage store(config.data_dir);
    grader::harness harness(config.harness);
    grader::server::curl_transport transport(config.callback.timeout, config.callback.unix_socket);
    grader::server::callback_client callback(config.callback, transport);
    grader::job_processor processor(store, harness, callback);
    auto queue = make_queue(config.queue);

    if (config.queue.type == "memory")
        LOG(WARNING) << "Serving an in-process queue, no submission can be received from other processes";

    grader::worker_pool pool(
        *queue, [&](const grader::server::evaluation_job& job) { processor.process(job); },
        config.workers, config.poll_interval);
    running_pool = &pool;
    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    pool.start();
    pool.join();
    running_pool = nullptr;
    LOG(INFO) << "All workers stopped after " << pool.processed() << " jobs";
    return EXIT_SUCCESS;
}

static int evaluate(const grader::grader_config& config, const po::variables_map& vm) {
    filesystem::path exercise_dir = require(vm, "exercise-dir");
    filesystem::path working_dir;
    if (vm.count("working-dir"))
        working_dir = vm["working-dir"].as<string>();
    else
        working_dir = filesystem::temp_directory_path() / ("grader-" + grader::server::generate_job_id());

    grader::harness harness(config.harness);
    grader::verdict_metadata metadata;
    metadata.job_id = grader::server::generate_job_id();
    metadata.submission_id = vm.count("submission-id") ? vm["submission-id"].as<string>() : "local";

    json payload;
    try {
        grader::loaded_exercise exercise = grader::load_exercise(exercise_dir);
        metadata.identity.name = exercise.definition.name;
        metadata.identity.version = exercise.definition.version;

        grader::state_machine machine(move(exercise.definition), harness);
        grader::evaluation_options opts;
        opts.exercise_dir = exercise_dir;
        opts.submission_file = require(vm, "file");
        opts.working_dir = working_dir;
        opts.dry_run = vm.count("dry-run") > 0;
        opts.on_progress = [](const string& state, int64_t executed) {
            LOG(INFO) << "State " << state << " finished, " << executed << " states executed";
        };
        payload = grader::make_result_payload(machine.evaluate(opts), metadata);
    } catch (grader::configuration_error& e) {
        LOG(ERROR) << "Configuration error: " << e.what() << ", path " << e.partial.path_trace();
        payload = grader::make_failure_payload(grader::failure_type::ESE, e.what(), metadata, &e.partial);
    } catch (grader::schema_validation_error& e) {
        LOG(ERROR) << "Invalid exercise definition: " << e.what();
        payload = grader::make_failure_payload(grader::failure_type::ESE, e.what(), metadata);
    }

    cout << payload.dump(4) << endl;
    LOG(INFO) << "Working directory kept in " << working_dir;
    return payload["overall_result"]["success"].get<bool>() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);

    // 默认情况下，假设 limitrace 与 grader 编译在同一目录
    if (!getenv("LIMITRACE")) {
        filesystem::path limitrace(filesystem::weakly_canonical(current).parent_path() / "limitrace");
        if (filesystem::exists(limitrace)) {
            set_env("LIMITRACE", limitrace.string());
        }
    }

    po::options_description desc("grader options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "serve, submit, upload, exists, result or evaluate")
        ("config,c", po::value<string>(), "load configuration from the json file")
        ("data-dir", po::value<string>(), "set the directory to store exercise definitions, submissions and results. You can either pass it from environ DATADIR")
        ("limitrace", po::value<string>(), "set the path of limitrace executable. You can either pass it from environ LIMITRACE")
        ("workers,w", po::value<size_t>(), "set the number of workers (serve)")
        ("agency", po::value<string>(), "agency of the exercise")
        ("department", po::value<string>(), "department of the exercise")
        ("name", po::value<string>(), "name of the exercise")
        ("version", po::value<string>(), "version of the exercise")
        ("hash", po::value<string>(), "directory hash of the exercise")
        ("bundle", po::value<string>(), "zip archive or directory of the exercise definition (upload)")
        ("file,f", po::value<string>(), "submission file (submit, evaluate)")
        ("submission-id", po::value<string>(), "submission id (submit, result, evaluate)")
        ("token", po::value<string>(), "api token for submission. You can either pass it from environ JUDGE_API_TOKEN")
        ("exercise-dir", po::value<string>(), "directory of the exercise definition (evaluate)")
        ("working-dir", po::value<string>(), "working directory of the evaluation, defaults to a new temporary directory (evaluate)")
        ("dry-run", "skip destructive states (evaluate)")
        ("help", "display this help text");
    // clang-format on

    pos.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "Grader: evaluate submissions through exercise defined state machines" << endl
             << "Environment Variables:" << endl
             << "\tLIMITRACE: location of limitrace" << endl
             << "\tDATADIR: data directory" << endl
             << "\tJUDGE_API_TOKEN: api token for submission" << endl
             << "Usage: " << argv[0] << " <command> [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    grader::grader_config config = grader::load_config(vm.count("config") ? vm["config"].as<string>() : "");
    if (vm.count("data-dir")) config.data_dir = vm["data-dir"].as<string>();
    if (vm.count("limitrace")) config.harness.limitrace = vm["limitrace"].as<string>();
    if (vm.count("workers")) config.workers = vm["workers"].as<size_t>();

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    string command = vm["command"].as<string>();
    if (command == "serve" || command == "evaluate")
        CHECK(!config.harness.limitrace.empty())
            << "LIMITRACE environment variable should be specified. This env points out where the limitrace executable locates in.";

    try {
        if (command == "evaluate")
            return evaluate(config, vm);

        CHECK(!config.data_dir.empty()) << "Data directory should be specified by --data-dir or DATADIR";
        filesystem::create_directories(config.data_dir);

        if (command == "serve")
            return serve(config);

        grader::server::storage store(config.data_dir);
        auto queue = make_queue(config.queue);
        grader::server::judge_service service(store, *queue, config.api_token);

        if (command == "submit") {
            CHECK(config.queue.type != "memory") << "Submitting requires a rabbitmq queue shared with the serving process";
            grader::server::submit_request request;
            request.identity = identity_from(vm);
            request.submission_file = require(vm, "file");
            request.submission_id = grader::assert_safe_component(require(vm, "submission-id"));
            request.token = vm.count("token") ? vm["token"].as<string>() : config.api_token;
            cout << json(service.submit(request)).dump(4) << endl;
        } else if (command == "upload") {
            grader::server::upload_response response = service.upload(identity_from(vm), require(vm, "bundle"));
            cout << json(response).dump(4) << endl;
            return response.success ? EXIT_SUCCESS : EXIT_FAILURE;
        } else if (command == "exists") {
            grader::exercise_identity identity = identity_from(vm);
            json result = {{"result", {{"identity", identity}, {"exists", service.exists(identity)}}}};
            cout << result.dump(4) << endl;
        } else if (command == "result") {
            auto payload = service.result(grader::assert_safe_component(require(vm, "submission-id")));
            if (!payload) {
                cerr << "Result not found" << endl;
                return EXIT_FAILURE;
            }
            cout << json({{"evaluation_result_json", *payload}}).dump(4) << endl;
        } else {
            cerr << "Unrecognized command " << command << endl
                 << endl;
            cerr << desc << endl;
            return EXIT_FAILURE;
        }
    } catch (po::error& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (grader::grader_exception& e) {
        LOG(ERROR) << e;
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
