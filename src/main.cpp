#include <curl/curl.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <regex>
#include <set>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/sandbox.hpp"
#include "judge/verdict.hpp"
#include "server/callback.hpp"
#include "server/config.hpp"
#include "server/intake.hpp"
#include "server/memory_queue.hpp"
#include "server/rabbitmq.hpp"
#include "server/redis.hpp"
#include "server/state_store.hpp"
#include "worker.hpp"
using namespace std;
using namespace codejudge;

struct cpuset {
    string literal;
    set<unsigned> ids;
    cpu_set_t cpuset;
};

void validate(boost::any& v, const vector<string>& values, cpuset*, int) {
    using namespace boost::program_options;
    static regex matcher("^([0-9]+)(-([0-9]+))?$");
    validators::check_first_occurrence(v);

    cpuset result;
    CPU_ZERO(&result.cpuset);

    string const& s = validators::get_single_string(values);
    result.literal = s;
    vector<string> splitted;
    boost::split(splitted, s, boost::is_any_of(","));
    for (auto& token : splitted) {
        smatch matches;
        if (!regex_search(token, matches, matcher))
            throw validation_error(validation_error::invalid_option_value);
        unsigned begin = boost::lexical_cast<unsigned>(matches[1].str());
        unsigned end = matches[3].str().empty() ? begin : boost::lexical_cast<unsigned>(matches[3].str());
        if (begin > end || end >= CPU_SETSIZE)
            throw validation_error(validation_error::invalid_option_value);
        for (unsigned i = begin; i <= end; ++i) {
            result.ids.insert(i);
            CPU_SET(i, &result.cpuset);
        }
    }
    v = result;
}

void stopHandler(int /* signum */) {
    stop_workers();
}

/**
 * @brief 按照配置打开消息队列
 * 进程内队列被所有 worker 共享；AMQP 的 channel 不是线程安全的，每个 worker 使用独立的连接。
 */
struct queue_pool {
    explicit queue_pool(const server::queue_config& config) : config(config) {
        if (config.type == "memory")
            shared = make_unique<server::memory_queue>(config.visibility_timeout, config.max_receives);
    }

    server::message_queue& open(bool write, uint16_t prefetch) {
        if (shared) return *shared;
        owned.push_back(make_unique<server::rabbitmq>(config.broker, write, prefetch));
        return *owned.back();
    }

private:
    server::queue_config config;
    unique_ptr<server::memory_queue> shared;
    vector<unique_ptr<server::message_queue>> owned;
};

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load deployment configuration (queues, redis, callback, judge) from the given JSON file. In-process queues and store are used if absent.")
        ("executors", po::value<size_t>(), "set the number of executor workers, default to the number of --cores, or 1")
        ("cores", po::value<cpuset>(), "set the cores the executors can make use of, one executor is bound to each core")
        ("callbacks", po::value<size_t>()->default_value(1), "set the number of callback workers")
        ("submit", po::value<vector<string>>()->multitoken(), "accept submissions from the given JSON payload files before starting workers")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs. You can either pass it from environ RUNDIR")
        ("chroot-dir", po::value<string>(), "set the chroot directory, run directory should be inside it. You can either pass it from environ CHROOTDIR")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete workspaces to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codejudge: Judge submissions from the submission queue, deliver verdicts to callbacks" << endl
             << "This app requires root privilege" << endl
             << "Environment Variables:" << endl
             << "\tRUNGUARD: location of runguard, default to the runguard beside this executable" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        DEBUG = true;
    }

    if (getuid() != 0) {
        cerr << "You should run this program in privileged mode" << endl;
        if (!DEBUG) return EXIT_FAILURE;
    }

    if (getenv("RUNGUARD")) {
        RUNGUARD = filesystem::path(getenv("RUNGUARD"));
    } else if (filesystem::exists(bin_dir / "runguard")) {
        RUNGUARD = bin_dir / "runguard";
    }

    if (vm.count("run-dir")) {
        RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(RUN_DIR);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR << " does not exist";
    RUN_DIR = filesystem::canonical(RUN_DIR);
    // 用户程序不能列出其他提交的工作区
    filesystem::permissions(RUN_DIR, filesystem::perms::owner_all | filesystem::perms::group_exec | filesystem::perms::others_exec);

    if (vm.count("chroot-dir")) {
        CHROOT_DIR = filesystem::path(vm.at("chroot-dir").as<string>());
    } else if (getenv("CHROOTDIR")) {
        CHROOT_DIR = filesystem::path(getenv("CHROOTDIR"));
    }
    if (!CHROOT_DIR.empty()) {
        CHECK(filesystem::is_directory(CHROOT_DIR))
            << "Chroot directory " << CHROOT_DIR << " does not exist";
        CHROOT_DIR = filesystem::canonical(CHROOT_DIR);
        auto relative = RUN_DIR.lexically_relative(CHROOT_DIR);
        CHECK(!relative.empty() && *relative.begin() != "..")
            << "Run directory " << RUN_DIR << " should be inside chroot directory " << CHROOT_DIR;
    }

    if (vm.count("run-user")) {
        RUN_USER = vm["run-user"].as<string>();
    } else if (getenv("RUNUSER")) {
        RUN_USER = getenv("RUNUSER");
    }

    if (vm.count("run-group")) {
        RUN_GROUP = vm["run-group"].as<string>();
    } else if (getenv("RUNGROUP")) {
        RUN_GROUP = getenv("RUNGROUP");
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    server::daemon_config config;
    config.submission_queue.type = "memory";
    config.result_queue.type = "memory";
    if (vm.count("config")) {
        string path = vm["config"].as<string>();
        CHECK(filesystem::is_regular_file(path))
            << "Configuration file " << path << " does not exist";
        try {
            nlohmann::json::parse(read_file_content(path)).get_to(config);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << path << " is malformed: " << e.what();
        }
    }

    try {
        DEFAULT_COMPARE_POLICY = parse_compare_policy(config.judge.compare_policy);
    } catch (std::exception& e) {
        LOG(FATAL) << "Configuration judge.comparePolicy: " << e.what();
    }
    COMPILE_TIME_LIMIT = config.judge.compile_time_limit;
    OUTPUT_LIMIT = config.judge.output_limit;

    unique_ptr<server::state_store> store;
    if (config.redis_config) {
        store = make_unique<server::redis_state_store>(*config.redis_config);
    } else {
        if (config.submission_queue.type != "memory")
            LOG(WARNING) << "Using in-process state store with an AMQP submission queue, records will not be shared with other processes";
        store = make_unique<server::memory_state_store>();
    }

    queue_pool submission_queues(config.submission_queue);
    queue_pool result_queues(config.result_queue);

    if (vm.count("submit")) {
        server::intake intake(*store, submission_queues.open(true, 0));
        for (auto& file : vm["submit"].as<vector<string>>()) {
            try {
                auto ack = intake.accept(nlohmann::json::parse(read_file_content(file)));
                cout << ack.sub_id << endl;
            } catch (std::exception& e) {
                LOG(ERROR) << "Submission " << file << " rejected: " << e.what();
            }
        }
    }

    vector<optional<size_t>> cores;
    if (vm.count("cores")) {
        for (unsigned i : vm["cores"].as<cpuset>().ids)
            cores.emplace_back(i);
    }
    size_t executors = cores.empty() ? 1 : cores.size();
    if (vm.count("executors"))
        executors = vm["executors"].as<size_t>();
    size_t callbacks = vm["callbacks"].as<size_t>();

    if (executors == 0 && callbacks == 0)
        return EXIT_SUCCESS;

    signal(SIGINT, stopHandler);
    signal(SIGTERM, stopHandler);

    if (callbacks > 0)
        curl_global_init(CURL_GLOBAL_ALL);

    vector<unique_ptr<sandbox_executor>> sandboxes;
    vector<unique_ptr<judge_pipeline>> pipelines;
    vector<unique_ptr<server::callback_worker>> callback_workers;
    server::curl_callback_sender sender(config.callback.timeout);
    vector<thread> worker_threads;
    bool started = true;

    try {
        for (size_t i = 0; i < executors; ++i) {
            optional<size_t> core = i < cores.size() ? cores[i] : nullopt;
            sandboxes.push_back(make_unique<sandbox_executor>(core ? to_string(*core) : ""));
            pipelines.push_back(make_unique<judge_pipeline>(
                submission_queues.open(false, 1), result_queues.open(true, 0),
                *store, *sandboxes.back(), DEFAULT_COMPARE_POLICY));
            worker_threads.push_back(start_worker(i, *pipelines.back(), core));
        }

        for (size_t i = 0; i < callbacks; ++i) {
            callback_workers.push_back(make_unique<server::callback_worker>(
                result_queues.open(false, (uint16_t)config.callback.batch_size), sender, config.callback));
            worker_threads.push_back(start_callback_worker(i, *callback_workers.back()));
        }
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to start workers: " << e.what() << endl
                   << boost::diagnostic_information(e);
        stop_workers();
        started = false;
    }

    for (auto& th : worker_threads)
        th.join();

    LOG(INFO) << "All workers stopped";
    if (callbacks > 0)
        curl_global_cleanup();
    return started ? EXIT_SUCCESS : EXIT_FAILURE;
}
