#include "limits.hpp"
#include <fmt/core.h>
#include <math.h>
#include <sched.h>
#include <sys/resource.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <system_error>

using namespace std;
namespace fs = std::filesystem;

static void set_rlimit(int resource, rlim_t soft, rlim_t hard, const char *name) {
    struct rlimit lim;
    lim.rlim_cur = soft;
    lim.rlim_max = hard;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, system_category(), fmt::format("setting rlimit {}", name));
}

/**
 * 只保留当前可用 CPU 集合中的前 count 个
 */
static void restrict_cpus(int count) {
    cpu_set_t available, chosen;
    if (sched_getaffinity(0, sizeof(available), &available) != 0)
        throw system_error(errno, system_category(), "getting cpu affinity");

    CPU_ZERO(&chosen);
    int picked = 0;
    for (int cpu = 0; cpu < CPU_SETSIZE && picked < count; ++cpu)
        if (CPU_ISSET(cpu, &available)) CPU_SET(cpu, &chosen), ++picked;

    if (sched_setaffinity(0, sizeof(chosen), &chosen) != 0)
        throw system_error(errno, system_category(), fmt::format("restricting command to {} cpus", count));
}

void set_restrictions(const struct limitrace_options &opt) {
    if (opt.use_cpu_limit) {
        // SIGXCPU at soft limit, SIGKILL one second later if the signal is ignored
        rlim_t soft = (rlim_t)ceil(opt.cpu_limit);
        if (soft == 0) soft = 1;
        set_rlimit(RLIMIT_CPU, soft, soft + 1, "CPU");
    }

    // 栈空间不设限制，内存由 RSS 采样控制
    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY, "STACK");

    set_rlimit(RLIMIT_CORE, 0, 0, "CORE");

    if (opt.cpus > 0) restrict_cpus(opt.cpus);
}

void isolate_network() {
    // 非特权用户需要先进入新的 user namespace 才能创建 network namespace
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0)
        throw system_error(errno, system_category(), "unable to create network namespace");
}

bool sample_memory(pid_t pid, memory_sample &sample) {
    ifstream fin(fmt::format("/proc/{}/status", pid));
    if (!fin) return false;

    bool found = false;
    string line;
    while (getline(fin, line)) {
        string key;
        int64_t value;
        istringstream ss(line);
        ss >> key >> value;
        if (!ss) continue;
        if (key == "VmRSS:") sample.rss_bytes = value * 1024, found = true;
        else if (key == "VmSize:") sample.as_bytes = value * 1024, found = true;
    }
    return found;
}

/**
 * 读取 /proc/<pid>/stat 中的父进程号，进程名可能包含空格和括号，因此从最后一个 ')' 之后开始解析
 */
static bool read_parent(pid_t pid, pid_t &ppid) {
    ifstream fin(fmt::format("/proc/{}/stat", pid));
    string content;
    if (!fin || !getline(fin, content)) return false;

    size_t pos = content.rfind(')');
    if (pos == string::npos) return false;

    istringstream ss(content.substr(pos + 1));
    char state;
    ss >> state >> ppid;
    return (bool)ss;
}

vector<pid_t> list_descendants(pid_t root) {
    multimap<pid_t, pid_t> children;
    error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const string name = it->path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != string::npos) continue;

        pid_t pid = stoi(name), ppid;
        if (read_parent(pid, ppid)) children.emplace(ppid, pid);
    }

    vector<pid_t> result;
    vector<pid_t> pending = {root};
    while (!pending.empty()) {
        pid_t parent = pending.back();
        pending.pop_back();
        auto range = children.equal_range(parent);
        for (auto it = range.first; it != range.second; ++it) {
            result.push_back(it->second);
            pending.push_back(it->second);
        }
    }
    return result;
}

memory_sample sample_descendants(pid_t root) {
    memory_sample total;
    for (pid_t pid : list_descendants(root)) {
        memory_sample sample;
        if (sample_memory(pid, sample)) {
            total.rss_bytes += sample.rss_bytes;
            total.as_bytes += sample.as_bytes;
        }
    }
    return total;
}
