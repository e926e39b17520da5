#include <glog/logging.h>
#include <math.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "run.hpp"

using namespace std;

struct seconds_value {
    double value;
};

struct bytes_value {
    int64_t value;
};

void validate(boost::any &v, const vector<string> &values, seconds_value *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const &s = validators::get_single_string(values);
    double result;
    try {
        result = boost::lexical_cast<double>(s);
    } catch (boost::bad_lexical_cast &) {
        throw validation_error(validation_error::invalid_option_value);
    }
    if (!isfinite(result) || result < 0)
        throw validation_error(validation_error::invalid_option_value);

    v = seconds_value{result};
}

void validate(boost::any &v, const vector<string> &values, bytes_value *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const &s = validators::get_single_string(values);
    if (s.empty() || s[0] == '-')
        throw validation_error(validation_error::invalid_option_value);
    try {
        v = bytes_value{boost::lexical_cast<int64_t>(s)};
    } catch (boost::bad_lexical_cast &) {
        throw validation_error(validation_error::invalid_option_value);
    }
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    // stderr 属于被限制的命令，只有致命错误才输出到 stderr
    FLAGS_logtostderr = false;
    FLAGS_stderrthreshold = google::GLOG_FATAL;

    namespace po = boost::program_options;
    po::options_description desc("limitrace options");
    po::positional_options_description pos;
    po::variables_map vm;

    struct limitrace_options opt;

    // clang-format off
    desc.add_options()
        ("wall-time,T", po::value<seconds_value>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("cpu-time,t", po::value<seconds_value>(), "set maximum CPU time (user + system, floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<bytes_value>(), "set maximum resident memory of the command in bytes")
        ("as-limit,a", po::value<bytes_value>(), "set maximum virtual memory of the command in bytes")
        ("cpus,c", po::value<int>(), "restrict the command to the given number of CPUs")
        ("no-network,n", "run the command without network access")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "limitrace: Run a command under wall time, CPU time and memory limits," << endl
                 << "then append resource statistics to standard error." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }
        if (vm.count("version")) {
            cout << "limitrace" << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 127;
    }

    if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<seconds_value>().value;
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<seconds_value>().value;
    if (vm.count("memory-limit")) opt.memory_limit = vm["memory-limit"].as<bytes_value>().value;
    if (vm.count("as-limit")) opt.as_limit = vm["as-limit"].as<bytes_value>().value;
    if (vm.count("cpus")) {
        opt.cpus = vm["cpus"].as<int>();
        if (opt.cpus <= 0) {
            cerr << "limitrace: --cpus must be positive" << endl;
            return 127;
        }
    }
    opt.disable_network = vm.count("no-network") > 0;
    opt.command = vm["cmd"].as<vector<string>>();

    try {
        return runit(opt);
    } catch (std::exception &e) {
        cerr << "limitrace: " << e.what() << endl;
        return 127;
    }
}
